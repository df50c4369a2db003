#define BOOST_TEST_MODULE file_operations

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <fcntl.h>

#include "operations/file.hpp"
#include "test_doubles.hpp"
#include "vfs/fs/errno.hpp"

using namespace streamfs;
using streamfs::testing::FakeCompletionWaiter;
using streamfs::testing::FakeStorageClient;
using streamfs::testing::patternByte;
using streamfs::testing::patternData;

namespace {

struct StateFixture {
  StateFixture() {
    auto fake = std::make_unique<FakeStorageClient>();
    client = fake.get();
    client->addDirectory("/");
    client->addDirectory("/dir");
    client->addFile("/dir/a.bin", patternData(100));
    client->addFile("/dir/pending.bin", patternData(10), false);

    Config config;
    config.storage.root = "/unused";
    state = std::make_unique<State>(std::move(config), std::move(fake),
                                    std::make_unique<FakeCompletionWaiter>(false));
  }

  FileOperations operations() { return FileOperations(*state); }

  FakeStorageClient *client;
  std::unique_ptr<State> state;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(file_operations, StateFixture)

BOOST_AUTO_TEST_CASE(test_getattr_reports_read_only_modes) {
  struct stat file_stat {};
  BOOST_REQUIRE_EQUAL(operations().getattr("/dir/a.bin", &file_stat), 0);
  BOOST_CHECK(S_ISREG(file_stat.st_mode));
  BOOST_CHECK_EQUAL(file_stat.st_mode & 0777, 0444u);
  BOOST_CHECK_EQUAL(file_stat.st_size, 100);

  struct stat dir_stat {};
  BOOST_REQUIRE_EQUAL(operations().getattr("/dir", &dir_stat), 0);
  BOOST_CHECK(S_ISDIR(dir_stat.st_mode));
  BOOST_CHECK_EQUAL(dir_stat.st_mode & 0777, 0555u);
}

BOOST_AUTO_TEST_CASE(test_getattr_errors) {
  struct stat stbuf {};
  BOOST_CHECK_EQUAL(operations().getattr("/nope", &stbuf), -ENOENT);

  client->setFailStatus(true);
  BOOST_CHECK_EQUAL(operations().getattr("/dir/a.bin", &stbuf), -EIO);
}

BOOST_AUTO_TEST_CASE(test_list_directory) {
  std::vector<storage::FileStatus> entries;
  BOOST_REQUIRE_EQUAL(operations().listDirectory("/dir", entries), 0);
  BOOST_CHECK_EQUAL(entries.size(), 2u);

  std::vector<storage::FileStatus> ignored;
  BOOST_CHECK_EQUAL(operations().listDirectory("/nope", ignored), -ENOENT);
  BOOST_CHECK_EQUAL(operations().listDirectory("/dir/a.bin", ignored),
                    -ENOTDIR);
}

BOOST_AUTO_TEST_CASE(test_open_read_release) {
  auto ops = operations();

  uint64_t fh = 0;
  BOOST_REQUIRE_EQUAL(ops.open("/dir/a.bin", O_RDONLY, fh), 0);
  BOOST_CHECK_NE(fh, 0u);
  BOOST_CHECK_EQUAL(state->handles_.size(), 1u);

  std::vector<char> buffer(50);
  BOOST_CHECK_EQUAL(ops.read(fh, buffer, 50, 80), 20);
  for (size_t i = 0; i < 20; ++i) {
    BOOST_CHECK_EQUAL(buffer[i], patternByte(80 + i));
  }
  BOOST_CHECK_EQUAL(ops.read(fh, buffer, 50, 100), 0);
  BOOST_CHECK_EQUAL(ops.flush(fh), 0);

  BOOST_CHECK_EQUAL(ops.release(fh), 0);
  BOOST_CHECK_EQUAL(state->handles_.size(), 0u);
  BOOST_CHECK_EQUAL(client->calls().closes.load(), 1);

  BOOST_CHECK_EQUAL(ops.read(fh, buffer, 50, 0), -EBADF);
  BOOST_CHECK_EQUAL(ops.release(fh), -EBADF);
}

BOOST_AUTO_TEST_CASE(test_handles_are_distinct) {
  auto ops = operations();

  uint64_t first = 0;
  uint64_t second = 0;
  BOOST_REQUIRE_EQUAL(ops.open("/dir/a.bin", O_RDONLY, first), 0);
  BOOST_REQUIRE_EQUAL(ops.open("/dir/a.bin", O_RDONLY, second), 0);
  BOOST_CHECK_NE(first, second);

  BOOST_CHECK_EQUAL(ops.release(first), 0);
  std::vector<char> buffer(10);
  BOOST_CHECK_EQUAL(ops.read(second, buffer, 10, 0), 10);
  BOOST_CHECK_EQUAL(ops.release(second), 0);
}

BOOST_AUTO_TEST_CASE(test_open_rejections_map_to_errno) {
  auto ops = operations();
  uint64_t fh = 0;

  BOOST_CHECK_EQUAL(ops.open("/nope", O_RDONLY, fh), -EPERM);
  BOOST_CHECK_EQUAL(ops.open("/dir/a.bin", O_WRONLY, fh), -EPERM);
  BOOST_CHECK_EQUAL(ops.open("/dir/a.bin", O_RDONLY | O_TRUNC, fh), -EPERM);
  BOOST_CHECK_EQUAL(ops.open("/dir/pending.bin", O_RDONLY, fh), -EPERM);

  client->calls().fail_open = true;
  BOOST_CHECK_EQUAL(ops.open("/dir/a.bin", O_RDONLY, fh), -EIO);

  client->calls().fail_open = false;
  client->setFailStatus(true);
  BOOST_CHECK_EQUAL(ops.open("/dir/a.bin", O_RDONLY, fh), -EIO);

  BOOST_CHECK_EQUAL(state->handles_.size(), 0u);
}

BOOST_AUTO_TEST_CASE(test_mutations_are_rejected) {
  auto ops = operations();
  uint64_t fh = 0;
  BOOST_REQUIRE_EQUAL(ops.open("/dir/a.bin", O_RDONLY, fh), 0);

  const std::vector<char> data(4, 'x');
  BOOST_CHECK_EQUAL(ops.write(fh, data, data.size(), 0), -EPERM);
  BOOST_CHECK_EQUAL(ops.truncate("/dir/a.bin", 0, fh), -EPERM);
  BOOST_CHECK_EQUAL(ops.truncate("/dir/a.bin", 0, std::nullopt), -EPERM);

  BOOST_CHECK_EQUAL(ops.write(fh + 1, data, data.size(), 0), -EBADF);
  BOOST_CHECK_EQUAL(ops.truncate("/dir/a.bin", 0, fh + 1), -EBADF);
  BOOST_CHECK_EQUAL(ops.flush(fh + 1), -EBADF);

  BOOST_CHECK_EQUAL(ops.release(fh), 0);
}

BOOST_AUTO_TEST_CASE(test_backend_read_failure_is_eio) {
  auto ops = operations();
  uint64_t fh = 0;
  BOOST_REQUIRE_EQUAL(ops.open("/dir/a.bin", O_RDONLY, fh), 0);

  client->calls().fail_read = true;
  std::vector<char> buffer(10);
  BOOST_CHECK_EQUAL(ops.read(fh, buffer, 10, 0), -EIO);
  BOOST_CHECK_EQUAL(ops.release(fh), 0);
}

BOOST_AUTO_TEST_CASE(test_failed_close_still_releases_handle) {
  auto ops = operations();
  uint64_t fh = 0;
  BOOST_REQUIRE_EQUAL(ops.open("/dir/a.bin", O_RDONLY, fh), 0);

  client->calls().fail_close = true;
  BOOST_CHECK_EQUAL(ops.release(fh), -EIO);
  BOOST_CHECK_EQUAL(state->handles_.size(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_CASE(test_error_kinds_map_to_errno) {
  BOOST_CHECK_EQUAL(toErrno(Error::contract("x")), -EINVAL);
  BOOST_CHECK_EQUAL(toErrno(Error::unsupported("x")), -EPERM);
  BOOST_CHECK_EQUAL(toErrno(Error::backend("x")), -EIO);
}

BOOST_AUTO_TEST_CASE(test_fill_stat_uses_modification_time) {
  storage::FileStatus status;
  status.length = 42;
  status.last_modified = 1700000000;

  struct stat stbuf {};
  fillStat(status, &stbuf);
  BOOST_CHECK_EQUAL(stbuf.st_size, 42);
  BOOST_CHECK_EQUAL(stbuf.st_mtime, 1700000000);
  BOOST_CHECK_EQUAL(stbuf.st_nlink, 1u);
}
