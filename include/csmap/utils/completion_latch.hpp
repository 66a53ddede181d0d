#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

#include <asio/any_completion_handler.hpp>
#include <asio/any_io_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>

namespace csmap::utils {

// Join point for a fan-out of N tasks with a single waiter.
//
// Workers call CountDown() once each, from any thread. The waiter's
// AsyncWait() completes once the count reaches zero, immediately when it
// already has (including a latch created with a count of zero).
//
// State lives behind a shared_ptr so handlers posted to the strand stay
// valid even if the latch goes away first.
class CompletionLatch {
 public:
  CompletionLatch(asio::any_io_executor executor, size_t count)
      : state_(std::make_shared<State>(executor, count)) {
  }

  ~CompletionLatch() = default;

  CompletionLatch(const CompletionLatch&) = delete;
  auto operator=(const CompletionLatch&) -> CompletionLatch& = delete;
  CompletionLatch(CompletionLatch&&) = delete;
  auto operator=(CompletionLatch&&) -> CompletionLatch& = delete;

  auto CountDown() -> void {
    asio::post(state_->strand, [state = state_]() {
      if (state->remaining == 0) {
        return;
      }
      --state->remaining;
      if (state->remaining == 0 && state->waiter) {
        auto handler = std::move(*state->waiter);
        state->waiter.reset();
        asio::post(state->executor, std::move(handler));
      }
    });
  }

  // Example:
  //   co_await latch.AsyncWait(asio::use_awaitable);
  template <typename CompletionToken>
  auto AsyncWait(CompletionToken&& token) {
    return asio::async_initiate<CompletionToken, void()>(
        [state = state_](auto handler) {
          asio::post(state->strand, [state, h = std::move(handler)]() mutable {
            if (state->remaining == 0) {
              asio::post(state->executor, std::move(h));
            } else {
              state->waiter.emplace(std::move(h));
            }
          });
        },
        std::forward<CompletionToken>(token));
  }

 private:
  struct State {
    State(asio::any_io_executor exec, size_t count)
        : executor(exec), strand(asio::make_strand(exec)), remaining(count) {
    }

    asio::any_io_executor executor;
    // Protects remaining and waiter
    asio::strand<asio::any_io_executor> strand;
    size_t remaining;
    std::optional<asio::any_completion_handler<void()>> waiter;
  };

  std::shared_ptr<State> state_;
};

}  // namespace csmap::utils
