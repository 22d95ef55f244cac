#include <gtest/gtest.h>

#include <filesystem>
#include <utility>

#include "common/utilities_test.hpp"
#include "rag_core/db/store_lock.hpp"

namespace rag_core {

class StoreLockTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = rag_tests::TestUtilities::create_temp_test_dir();
    lock_path_ = temp_dir_ / "faiss.index.lock";
  }

  void TearDown() override {
    rag_tests::TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  std::filesystem::path temp_dir_;
  std::filesystem::path lock_path_;
};

TEST_F(StoreLockTest, CreatesLockFile) {
  StoreLock lock(lock_path_, LockMode::Exclusive);

  EXPECT_TRUE(lock.held());
  EXPECT_EQ(lock.mode(), LockMode::Exclusive);
  EXPECT_TRUE(std::filesystem::exists(lock_path_));
}

TEST_F(StoreLockTest, ExclusiveLockBlocksSecondExclusive) {
  StoreLock first(lock_path_, LockMode::Exclusive);

  EXPECT_THROW(StoreLock second(lock_path_, LockMode::Exclusive, /*blocking*/ false),
               StoreLockError);
}

TEST_F(StoreLockTest, ExclusiveLockBlocksShared) {
  StoreLock writer(lock_path_, LockMode::Exclusive);

  EXPECT_THROW(StoreLock reader(lock_path_, LockMode::Shared, /*blocking*/ false),
               StoreLockError);
}

TEST_F(StoreLockTest, SharedLocksCoexist) {
  rag_tests::TestUtilities::write_file(lock_path_, "");
  StoreLock first(lock_path_, LockMode::Shared);
  StoreLock second(lock_path_, LockMode::Shared, /*blocking*/ false);

  EXPECT_TRUE(first.held());
  EXPECT_TRUE(second.held());
}

TEST_F(StoreLockTest, ReleaseAllowsReacquire) {
  {
    StoreLock scoped(lock_path_, LockMode::Exclusive);
  }
  StoreLock again(lock_path_, LockMode::Exclusive, /*blocking*/ false);
  EXPECT_TRUE(again.held());

  again.release();
  EXPECT_FALSE(again.held());
  StoreLock third(lock_path_, LockMode::Exclusive, /*blocking*/ false);
  EXPECT_TRUE(third.held());
}

TEST_F(StoreLockTest, MoveTransfersOwnership) {
  StoreLock original(lock_path_, LockMode::Exclusive);
  StoreLock moved(std::move(original));

  EXPECT_FALSE(original.held());
  EXPECT_TRUE(moved.held());
  EXPECT_THROW(StoreLock other(lock_path_, LockMode::Exclusive, /*blocking*/ false),
               StoreLockError);
}

TEST_F(StoreLockTest, ExclusiveCreatesMissingParentDirectory) {
  auto nested = temp_dir_ / "a" / "b" / "faiss.index.lock";
  StoreLock lock(nested, LockMode::Exclusive);

  EXPECT_TRUE(std::filesystem::exists(nested));
}

TEST_F(StoreLockTest, SharedLockWithoutLockFileCreatesNothing) {
  auto nested = temp_dir_ / "a" / "faiss.index.lock";
  StoreLock reader(nested, LockMode::Shared);

  EXPECT_FALSE(reader.held());
  EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "a"));
  EXPECT_TRUE(std::filesystem::is_empty(temp_dir_));

  // Nothing is held, so a writer can still proceed
  StoreLock writer(nested, LockMode::Exclusive, /*blocking*/ false);
  EXPECT_TRUE(writer.held());
}

TEST_F(StoreLockTest, SharedLockDoesNotModifyExistingLockFile) {
  rag_tests::TestUtilities::write_file(lock_path_, "");
  auto written = std::filesystem::last_write_time(lock_path_);

  StoreLock reader(lock_path_, LockMode::Shared);

  EXPECT_TRUE(reader.held());
  EXPECT_EQ(std::filesystem::last_write_time(lock_path_), written);
}

TEST_F(StoreLockTest, UnopenableLockPathThrows) {
  auto blocker = temp_dir_ / "blocker";
  rag_tests::TestUtilities::write_file(blocker, "x");

  EXPECT_THROW(StoreLock lock(blocker / "faiss.index.lock", LockMode::Exclusive), StoreLockError);
}

}  // namespace rag_core
