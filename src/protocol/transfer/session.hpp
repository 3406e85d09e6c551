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

#include "core/ble_adapter.hpp"
#include "core/ble_link.hpp"
#include "protocol/transfer/payload.hpp"
#include "protocol/transfer/session_machine.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>

namespace rudel::transfer {

struct SessionCfg {
  std::uint32_t window = 1;
  std::uint32_t retry_budget = 5;
  std::uint32_t preferred_chunk = 180;

  std::chrono::milliseconds connect_timeout{10'000};
  std::chrono::milliseconds negotiate_timeout{5'000};
  std::chrono::milliseconds ack_timeout{3'000};
  std::chrono::milliseconds finalize_timeout{15'000};

  // Longest single notification wait; bounds how late a cancel is noticed.
  std::chrono::milliseconds poll_slice{50};
};

// Drives one session from Disconnected to a terminal phase over a fresh link.
// A DeviceSession runs once; a retry builds a new one.
class DeviceSession {
public:
  using OnChange = std::function<void(const SessionState&)>;

  DeviceSession(core::IAdapter& adapter,
                core::Device device,
                std::shared_ptr<const Payload> payload,
                const SessionCfg& cfg,
                OnChange on_change = {});

  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;

  // Returns the terminal state. The link is released before returning.
  SessionState run(std::stop_token st) noexcept;

  const SessionState& state() const noexcept { return state_; }
  const core::Device& device() const noexcept { return device_; }

private:
  void apply_(const Event& e);
  std::optional<Event> execute_(const Effect& fx, std::stop_token st) noexcept;
  Event await_reply_(std::chrono::steady_clock::time_point until, std::stop_token st) noexcept;
  std::chrono::milliseconds deadline_for_phase_() const noexcept;

  core::IAdapter& adapter_;
  core::Device device_;
  std::shared_ptr<const Payload> payload_;
  SessionCfg cfg_;
  Context ctx_;
  OnChange on_change_;

  SessionState state_{};
  std::deque<Effect> pending_;
  std::unique_ptr<core::ILink> link_;

  // Deadline of the reply currently awaited. Rearmed only on progress, so
  // replies the machine ignores do not extend it.
  std::chrono::steady_clock::time_point reply_deadline_{};
  bool rearm_ = true;
};

} // namespace rudel::transfer
