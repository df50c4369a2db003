#define BOOST_TEST_MODULE completion_waiter

#include <boost/test/unit_test.hpp>

#include <chrono>

#include "storage/completion_waiter.hpp"
#include "test_doubles.hpp"

using namespace std::chrono_literals;
using streamfs::storage::FileStatus;
using streamfs::storage::PollingCompletionWaiter;
using streamfs::testing::FakeStorageClient;
using streamfs::testing::patternData;

namespace {

FileStatus incomplete(const std::string &path) {
  FileStatus status;
  status.path = path;
  status.completed = false;
  return status;
}

} // namespace

BOOST_AUTO_TEST_CASE(test_returns_once_file_completes) {
  FakeStorageClient client;
  client.addFile("/f", patternData(10));
  client.queueStatus(incomplete("/f"));
  client.queueStatus(incomplete("/f"));

  PollingCompletionWaiter waiter(client, 2s, 1ms);
  BOOST_CHECK(waiter.waitForCompletion("/f"));
  BOOST_CHECK_EQUAL(client.calls().status_lookups.load(), 3);
}

BOOST_AUTO_TEST_CASE(test_gives_up_after_timeout) {
  FakeStorageClient client;
  client.addFile("/f", patternData(10), false);

  PollingCompletionWaiter waiter(client, 30ms, 5ms);
  const auto started = std::chrono::steady_clock::now();
  BOOST_CHECK(!waiter.waitForCompletion("/f"));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  BOOST_CHECK(elapsed >= 30ms);
  BOOST_CHECK_GE(client.calls().status_lookups.load(), 2);
}

BOOST_AUTO_TEST_CASE(test_zero_timeout_checks_once) {
  FakeStorageClient client;
  client.addFile("/f", patternData(10), false);

  PollingCompletionWaiter waiter(client, 0ms, 5ms);
  BOOST_CHECK(!waiter.waitForCompletion("/f"));
  BOOST_CHECK_EQUAL(client.calls().status_lookups.load(), 1);
}

BOOST_AUTO_TEST_CASE(test_gives_up_when_file_disappears) {
  FakeStorageClient client;
  client.queueStatus(incomplete("/f"));

  PollingCompletionWaiter waiter(client, 2s, 1ms);
  BOOST_CHECK(!waiter.waitForCompletion("/f"));
  BOOST_CHECK_EQUAL(client.calls().status_lookups.load(), 2);
}

BOOST_AUTO_TEST_CASE(test_gives_up_on_status_error) {
  FakeStorageClient client;
  client.addFile("/f", patternData(10), false);
  client.setFailStatus(true);

  PollingCompletionWaiter waiter(client, 2s, 1ms);
  BOOST_CHECK(!waiter.waitForCompletion("/f"));
  BOOST_CHECK_EQUAL(client.calls().status_lookups.load(), 1);
}
