#include "rag_core/db/store_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <system_error>

namespace rag_core {

StoreLock::StoreLock(const std::filesystem::path &lock_path, LockMode mode, bool blocking)
    : fd_(-1), mode_(mode) {
  if (mode == LockMode::Shared) {
    // Readers never create the lock file or its directory
    fd_ = ::open(lock_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
      int saved_errno = errno;
      if (saved_errno == ENOENT || saved_errno == ENOTDIR) {
        return;  // no writer has run yet
      }
      if (saved_errno == EACCES || saved_errno == EROFS) {
        std::cerr << "Warning: cannot open lock file " << lock_path.string() << " ("
                  << std::strerror(saved_errno) << "). Reading without a lock." << std::endl;
        return;
      }
      throw StoreLockError("Failed to open lock file " + lock_path.string() + ": " +
                           std::strerror(saved_errno));
    }
  } else {
    if (lock_path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(lock_path.parent_path(), ec);
      if (ec) {
        throw StoreLockError("Failed to create lock directory " +
                             lock_path.parent_path().string() + ": " + ec.message());
      }
    }

    fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      throw StoreLockError("Failed to open lock file " + lock_path.string() + ": " +
                           std::strerror(errno));
    }
  }

  int operation = (mode == LockMode::Exclusive) ? LOCK_EX : LOCK_SH;
  if (!blocking) {
    operation |= LOCK_NB;
  }

  int rc;
  do {
    rc = ::flock(fd_, operation);
  } while (rc != 0 && errno == EINTR);

  if (rc != 0) {
    int saved_errno = errno;
    ::close(fd_);
    fd_ = -1;
    if (saved_errno == EWOULDBLOCK) {
      throw StoreLockError("Index is locked by another process: " + lock_path.string());
    }
    throw StoreLockError("Failed to lock " + lock_path.string() + ": " +
                         std::strerror(saved_errno));
  }
}

StoreLock::~StoreLock() {
  release();
}

StoreLock::StoreLock(StoreLock &&other) noexcept : fd_(other.fd_), mode_(other.mode_) {
  other.fd_ = -1;
}

StoreLock &StoreLock::operator=(StoreLock &&other) noexcept {
  if (this != &other) {
    release();
    fd_ = other.fd_;
    mode_ = other.mode_;
    other.fd_ = -1;
  }
  return *this;
}

void StoreLock::release() noexcept {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace rag_core
