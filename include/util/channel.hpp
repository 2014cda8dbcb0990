#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace bacnet {
namespace util {

/**
 * Bounded single-producer / single-consumer channel
 *
 * MakeChannel<T>(capacity) returns a connected Sender/Receiver pair.
 *
 * - FIFO: items are received in the order they were sent
 * - Bounded: Send() blocks while `capacity` items are queued
 * - Closing: destroying (or Close()-ing) either end closes the channel.
 *   After the Sender is gone the Receiver drains what is queued and then
 *   reports end-of-stream. After the Receiver is gone every Send() returns
 *   false and queued items are discarded.
 *
 * Usage:
 *   auto [tx, rx] = MakeChannel<int>(16);
 *   std::thread producer([tx = std::move(tx)]() mutable {
 *     for (int i = 0; i < 3; ++i) if (!tx.Send(i)) return;
 *   });
 *   while (auto v = rx.Recv()) { ... }
 */
template <typename T>
class Sender;
template <typename T>
class Receiver;

namespace detail {

template <typename T>
struct ChannelState {
  explicit ChannelState(size_t cap) : capacity(cap) {}

  std::mutex mutex;
  std::condition_variable not_empty;
  std::condition_variable not_full;
  std::deque<T> items;
  size_t capacity;
  bool sender_closed = false;
  bool receiver_closed = false;
};

} // namespace detail

template <typename T>
class Sender {
public:
  Sender() = default;
  ~Sender() { Close(); }

  Sender(const Sender&) = delete;
  Sender& operator=(const Sender&) = delete;
  Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}
  Sender& operator=(Sender&& other) noexcept {
    if (this != &other) {
      Close();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  /**
   * Queue a value, waiting for room if the channel is full
   * Returns false (value dropped) if the receiver has been closed
   */
  bool Send(T value) {
    if (!state_) return false;
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->not_full.wait(lock, [this] {
      return state_->receiver_closed || state_->items.size() < state_->capacity;
    });
    if (state_->receiver_closed) {
      return false;
    }
    state_->items.push_back(std::move(value));
    lock.unlock();
    state_->not_empty.notify_one();
    return true;
  }

  /**
   * True once the receiving end is gone
   */
  bool IsClosed() const {
    if (!state_) return true;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->receiver_closed;
  }

  /**
   * Signal end-of-stream. Idempotent.
   */
  void Close() {
    if (!state_) return;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->sender_closed = true;
    }
    state_->not_empty.notify_all();
    state_.reset();
  }

private:
  template <typename U>
  friend std::pair<Sender<U>, Receiver<U>> MakeChannel(size_t capacity);

  explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
class Receiver {
public:
  Receiver() = default;
  ~Receiver() { Close(); }

  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;
  Receiver(Receiver&& other) noexcept : state_(std::move(other.state_)) {}
  Receiver& operator=(Receiver&& other) noexcept {
    if (this != &other) {
      Close();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  /**
   * Wait for the next item
   * Returns std::nullopt once the sender is closed and the queue is drained
   */
  std::optional<T> Recv() {
    if (!state_) return std::nullopt;
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->not_empty.wait(lock, [this] {
      return state_->sender_closed || !state_->items.empty();
    });
    return PopLocked(lock);
  }

  /**
   * Wait up to `timeout` for the next item
   * Returns std::nullopt on timeout or end-of-stream; use IsFinished() to
   * tell them apart
   */
  template <typename Rep, typename Period>
  std::optional<T> RecvFor(std::chrono::duration<Rep, Period> timeout) {
    if (!state_) return std::nullopt;
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->not_empty.wait_for(lock, timeout, [this] {
      return state_->sender_closed || !state_->items.empty();
    });
    return PopLocked(lock);
  }

  /**
   * Non-blocking receive
   */
  std::optional<T> TryRecv() {
    if (!state_) return std::nullopt;
    std::unique_lock<std::mutex> lock(state_->mutex);
    return PopLocked(lock);
  }

  /**
   * True when the sender is closed and nothing is left to receive
   */
  bool IsFinished() const {
    if (!state_) return true;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->sender_closed && state_->items.empty();
  }

  size_t Size() const {
    if (!state_) return 0;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->items.size();
  }

  /**
   * Drop the receiving end: pending and future items are discarded and a
   * blocked Send() is released. Idempotent.
   */
  void Close() {
    if (!state_) return;
    std::deque<T> discarded;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->receiver_closed = true;
      discarded.swap(state_->items);
    }
    state_->not_full.notify_all();
    state_.reset();
  }

private:
  template <typename U>
  friend std::pair<Sender<U>, Receiver<U>> MakeChannel(size_t capacity);

  explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {}

  // Caller holds state_->mutex through `lock`
  std::optional<T> PopLocked(std::unique_lock<std::mutex>& lock) {
    if (state_->items.empty()) {
      return std::nullopt;
    }
    std::optional<T> value(std::move(state_->items.front()));
    state_->items.pop_front();
    lock.unlock();
    state_->not_full.notify_one();
    return value;
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> MakeChannel(size_t capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("channel capacity must be at least 1");
  }
  auto state = std::make_shared<detail::ChannelState<T>>(capacity);
  return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace util
} // namespace bacnet
