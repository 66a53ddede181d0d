#include "csmap/utils/completion_latch.hpp"

#include <atomic>
#include <chrono>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/csmap/common/async_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");

  // Suppress Bazel test sharding warnings
  setenv("TEST_SHARD_INDEX", "0", 0);
  setenv("TEST_TOTAL_SHARDS", "1", 0);
  setenv("TEST_SHARD_STATUS_FILE", "", 0);

  return Catch::Session().run(argc, argv);
}

using csmap::test::RunAsyncTest;
using csmap::utils::CompletionLatch;

TEST_CASE("CompletionLatch with zero count completes immediately",
          "[completion_latch]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    CompletionLatch latch(executor, 0);

    co_await latch.AsyncWait(asio::use_awaitable);
    co_return;
  });
}

TEST_CASE("CompletionLatch completes after the last count down",
          "[completion_latch]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    CompletionLatch latch(executor, 3);
    std::atomic<int> finished{0};

    for (int i = 0; i < 3; ++i) {
      asio::co_spawn(
          executor,
          [&latch, &finished, executor,
           delay = 10 * (i + 1)]() -> asio::awaitable<void> {
            asio::steady_timer timer(executor);
            timer.expires_after(std::chrono::milliseconds(delay));
            co_await timer.async_wait(asio::use_awaitable);
            finished.fetch_add(1, std::memory_order_relaxed);
            latch.CountDown();
          },
          asio::detached);
    }

    co_await latch.AsyncWait(asio::use_awaitable);

    // All tasks counted down before the waiter resumed
    REQUIRE(finished.load() == 3);
    co_return;
  });
}

TEST_CASE("CompletionLatch counted down from pool threads",
          "[completion_latch]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    constexpr int kTasks = 100;
    asio::thread_pool pool(4);
    CompletionLatch latch(executor, kTasks);
    std::atomic<int> finished{0};

    for (int i = 0; i < kTasks; ++i) {
      asio::post(pool, [&latch, &finished]() {
        finished.fetch_add(1, std::memory_order_relaxed);
        latch.CountDown();
      });
    }

    co_await latch.AsyncWait(asio::use_awaitable);

    REQUIRE(finished.load() == kTasks);
    pool.join();
    co_return;
  });
}

TEST_CASE("CompletionLatch wait after completion returns immediately",
          "[completion_latch]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    CompletionLatch latch(executor, 2);

    latch.CountDown();
    latch.CountDown();
    // Extra count downs are ignored
    latch.CountDown();

    co_await latch.AsyncWait(asio::use_awaitable);
    co_await latch.AsyncWait(asio::use_awaitable);
    co_return;
  });
}
