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

#include "platform/posix-common/signal_shield.hpp"

#include <cerrno>
#include <ctime>
#include <utility>

#include <pthread.h>

#include <spdlog/spdlog.h>

namespace rudel::posix_common {

namespace {

constexpr long kWatchSliceNs = 200'000'000;

sigset_t shielded() {
  sigset_t set{};
  sigemptyset(&set);
  for (int s : {SIGINT, SIGTERM, SIGHUP}) sigaddset(&set, s);
  return set;
}

const char* signal_name(int signo) {
  switch (signo) {
    case SIGINT: return "SIGINT";
    case SIGTERM: return "SIGTERM";
    case SIGHUP: return "SIGHUP";
    default: return "signal";
  }
}

void watch(std::stop_token st, std::stop_source target, SignalShield::Callback cb) {
  const sigset_t set = shielded();
  const timespec slice{0, kWatchSliceNs};
  unsigned count = 0;

  while (!st.stop_requested()) {
    const int signo = ::sigtimedwait(&set, nullptr, &slice);
    if (signo < 0) {
      if (errno != EAGAIN && errno != EINTR) spdlog::debug("sigtimedwait: errno {}", errno);
      continue;
    }

    target.request_stop();
    if (cb) cb(Interrupt{signo, signal_name(signo), ++count});
  }
}

} // namespace

SignalShield::SignalShield(sigset_t old_mask, std::jthread watcher)
  : old_mask_(old_mask), watcher_(std::move(watcher)) {}

SignalShield::~SignalShield() {
  if (!watcher_.joinable()) return;   // moved from
  watcher_.request_stop();
  watcher_.join();
  (void)::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
}

std::optional<SignalShield> SignalShield::enable(std::stop_source stop, Callback cb) {
  // A device that vanishes mid-write must not kill the process.
  ::signal(SIGPIPE, SIG_IGN);

  const sigset_t set = shielded();
  sigset_t old{};
  if (const int rc = ::pthread_sigmask(SIG_BLOCK, &set, &old); rc != 0) {
    spdlog::warn("pthread_sigmask: error {}", rc);
    return std::nullopt;
  }

  std::jthread watcher(watch, std::move(stop), std::move(cb));
  return SignalShield(old, std::move(watcher));
}

} // namespace rudel::posix_common
