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

#include "core/status.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace rudel::core {

// Fixed-size FIFO worker pool for device jobs. Cancellation never drops a
// queued task: every task still runs and sees a stopped token, so each job
// reports its own terminal state. A stop on the parent token cancels the pool.
class ThreadPool {
public:
  using Fn = std::function<void(std::stop_token)>;

  explicit ThreadPool(std::size_t workers, std::stop_token parent = {});
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // label names the task in failure reports, usually a device address.
  Status submit(std::string label, Fn fn) noexcept;

  void request_cancel() noexcept { stop_.request_stop(); }
  bool cancelled() const noexcept { return stop_.stop_requested(); }

  // Blocks until the queue is empty and no task is running. Returns the first
  // task that escaped with an exception, if any.
  Status wait() noexcept;

  // Lets the workers exit once the queue drains; later submits fail.
  void shutdown() noexcept;

private:
  struct Task {
    std::string label;
    Fn fn;
  };

  struct Relay {
    std::stop_source* target;
    void operator()() const noexcept { target->request_stop(); }
  };

  void worker_loop_() noexcept;
  void run_(Task& t) noexcept;

  std::stop_source stop_;
  std::optional<std::stop_callback<Relay>> relay_;

  mutable std::mutex mtx_;
  std::condition_variable cv_work_;
  std::condition_variable cv_idle_;
  std::deque<Task> q_;
  std::size_t running_ = 0;
  bool closing_ = false;
  Status first_error_{};

  std::vector<std::thread> workers_;
};

} // namespace rudel::core
