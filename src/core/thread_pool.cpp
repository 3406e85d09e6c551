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

#include "core/thread_pool.hpp"

#include <exception>
#include <new>
#include <utility>

#include <spdlog/spdlog.h>

namespace rudel::core {

ThreadPool::ThreadPool(std::size_t workers, std::stop_token parent) {
  if (parent.stop_possible()) relay_.emplace(parent, Relay{&stop_});

  workers_.reserve(workers ? workers : 1);
  for (std::size_t i = 0; i < (workers ? workers : 1); ++i) workers_.emplace_back([this] { worker_loop_(); });
}

ThreadPool::~ThreadPool() {
  shutdown();
  for (auto& w : workers_) {
    if (w.joinable()) w.join();
  }
  relay_.reset();
}

Status ThreadPool::submit(std::string label, Fn fn) noexcept {
  if (!fn) return Status::Failf(Errc::InvalidArgument, "{}: empty task", label);
  try {
    std::lock_guard lk(mtx_);
    if (closing_) return Status::Failf(Errc::Cancelled, "{}: pool is shutting down", label);
    q_.push_back(Task{std::move(label), std::move(fn)});
  } catch (const std::bad_alloc&) {
    return Status::Fail("ThreadPool: out of memory queueing a task");
  }
  cv_work_.notify_one();
  return Status::Ok();
}

void ThreadPool::shutdown() noexcept {
  {
    std::lock_guard lk(mtx_);
    closing_ = true;
  }
  cv_work_.notify_all();
}

Status ThreadPool::wait() noexcept {
  std::unique_lock lk(mtx_);
  cv_idle_.wait(lk, [&] { return q_.empty() && running_ == 0; });
  return first_error_;
}

void ThreadPool::run_(Task& t) noexcept {
  try {
    t.fn(stop_.get_token());
  } catch (const std::exception& e) {
    spdlog::error("{}: worker task threw: {}", t.label, e.what());
    std::lock_guard lk(mtx_);
    if (first_error_.ok) first_error_ = Status::Failf("{}: {}", t.label, e.what());
  }
}

void ThreadPool::worker_loop_() noexcept {
  for (;;) {
    Task t;
    {
      std::unique_lock lk(mtx_);
      cv_work_.wait(lk, [&] { return closing_ || !q_.empty(); });
      if (q_.empty()) return;

      t = std::move(q_.front());
      q_.pop_front();
      ++running_;
    }

    run_(t);

    {
      std::lock_guard lk(mtx_);
      --running_;
      if (q_.empty() && running_ == 0) cv_idle_.notify_all();
    }
  }
}

} // namespace rudel::core
