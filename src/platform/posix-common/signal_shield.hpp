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

#include <functional>
#include <optional>
#include <stop_token>
#include <thread>

#include <signal.h>

namespace rudel::posix_common {

struct Interrupt {
  int signo = 0;
  const char* name = "";
  unsigned count = 0;   // interrupts so far, this one included
};

// Blocks SIGINT, SIGTERM and SIGHUP in the calling thread and every thread it
// starts afterwards, and turns them into a stop request on the given source.
// Enable it before spawning workers so none of them can receive the signal.
class SignalShield {
public:
  using Callback = std::function<void(const Interrupt&)>;

  SignalShield(SignalShield&&) noexcept = default;
  SignalShield& operator=(SignalShield&&) = delete;
  SignalShield(const SignalShield&) = delete;
  SignalShield& operator=(const SignalShield&) = delete;

  ~SignalShield();

  static std::optional<SignalShield> enable(std::stop_source stop, Callback cb);

private:
  SignalShield(sigset_t old_mask, std::jthread watcher);

  sigset_t old_mask_{};
  std::jthread watcher_;
};

} // namespace rudel::posix_common
