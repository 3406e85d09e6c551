/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace rudel::core {

// Multi-producer queue drained by one consumer. pop() blocks until an item
// arrives or the channel is closed and empty.
template <class T>
class Channel {
public:
  void push(T v) {
    {
      std::lock_guard lk(mtx_);
      q_.push_back(std::move(v));
    }
    cv_.notify_one();
  }

  void close() {
    {
      std::lock_guard lk(mtx_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  std::optional<T> pop() {
    std::unique_lock lk(mtx_);
    cv_.wait(lk, [&] { return closed_ || !q_.empty(); });
    if (q_.empty()) return std::nullopt;
    T v = std::move(q_.front());
    q_.pop_front();
    return v;
  }

private:
  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<T> q_;
  bool closed_ = false;
};

// Counting semaphore whose acquire gives up when the stop token fires.
class AdmissionGate {
public:
  explicit AdmissionGate(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

  AdmissionGate(const AdmissionGate&) = delete;
  AdmissionGate& operator=(const AdmissionGate&) = delete;

  bool acquire(std::stop_token st) {
    std::unique_lock lk(mtx_);
    if (!cv_.wait(lk, st, [&] { return in_use_ < capacity_; }) || st.stop_requested()) return false;
    ++in_use_;
    if (in_use_ > peak_) peak_ = in_use_;
    return true;
  }

  void release() {
    {
      std::lock_guard lk(mtx_);
      if (in_use_) --in_use_;
    }
    cv_.notify_one();
  }

  std::size_t peak() const {
    std::lock_guard lk(mtx_);
    return peak_;
  }

  class Slot {
  public:
    Slot() = default;
    explicit Slot(AdmissionGate* g) : g_(g) {}
    ~Slot() { if (g_) g_->release(); }

    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot(Slot&& o) noexcept : g_(std::exchange(o.g_, nullptr)) {}
    Slot& operator=(Slot&& o) noexcept {
      if (this != &o) {
        if (g_) g_->release();
        g_ = std::exchange(o.g_, nullptr);
      }
      return *this;
    }

    explicit operator bool() const noexcept { return g_ != nullptr; }

  private:
    AdmissionGate* g_ = nullptr;
  };

  Slot enter(std::stop_token st) { return acquire(st) ? Slot(this) : Slot(); }

private:
  const std::size_t capacity_;
  mutable std::mutex mtx_;
  std::condition_variable_any cv_;
  std::size_t in_use_ = 0;
  std::size_t peak_ = 0;
};

// Returns false when woken by the stop token before the duration elapsed.
inline bool sleep_for(std::stop_token st, std::chrono::milliseconds d) {
  std::mutex m;
  std::condition_variable_any cv;
  std::unique_lock lk(m);
  (void)cv.wait_for(lk, st, d, [] { return false; });
  return !st.stop_requested();
}

} // namespace rudel::core
