#pragma once

#include <filesystem>

#include "rag_core/errors.hpp"

namespace rag_core {

enum class LockMode { Shared, Exclusive };

/*
Advisory flock(2) lock on a sibling lock file. Held for one load-mutate-save
cycle: ingest takes it exclusively, queries take it shared.

An exclusive lock creates the lock file (and its directory) when missing. A
shared lock never writes: if the lock file does not exist yet, or cannot be
opened because the store is read-only, it is not acquired and held() is false.
*/
class StoreLock {
 public:
  // blocking=false throws StoreLockError instead of waiting for a held lock
  StoreLock(const std::filesystem::path &lock_path, LockMode mode, bool blocking = true);
  ~StoreLock();

  StoreLock(const StoreLock &) = delete;
  StoreLock &operator=(const StoreLock &) = delete;

  StoreLock(StoreLock &&other) noexcept;
  StoreLock &operator=(StoreLock &&other) noexcept;

  LockMode mode() const {
    return mode_;
  }
  bool held() const {
    return fd_ >= 0;
  }

  void release() noexcept;

 private:
  int fd_;
  LockMode mode_;
};

}  // namespace rag_core
