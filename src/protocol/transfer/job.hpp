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
#include "core/status.hpp"
#include "protocol/transfer/payload.hpp"
#include "protocol/transfer/session_machine.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace rudel::transfer {

// Terminal record of one job, handed to the aggregator.
struct JobOutcome {
  std::size_t index = 0;   // discovery order
  core::Device device;

  bool ok = false;
  core::Errc code = core::Errc::None;
  std::string reason;

  std::uint32_t total_bytes = 0;
  std::uint32_t bytes_acked = 0;
  std::uint32_t cursor = 0;
  std::uint32_t chunk_count = 0;
  std::uint32_t retransmits = 0;
  unsigned attempts = 0;   // sessions started, 0 when cancelled while queued

  std::chrono::milliseconds elapsed{0};
};

// One payload bound to one device. Only the worker running the job touches it.
struct TransferJob {
  std::size_t index = 0;
  core::Device device;
  std::shared_ptr<const Payload> payload;

  SessionState state{};
  unsigned attempts = 0;
  std::uint32_t retransmits = 0;   // summed over every session of the job
  core::Status last_error{};

  std::chrono::steady_clock::time_point started{};

  TransferJob(std::size_t idx, core::Device dev, std::shared_ptr<const Payload> p)
    : index(idx), device(std::move(dev)), payload(std::move(p)) {}

  bool complete() const noexcept { return std::holds_alternative<phase::Complete>(state.phase); }

  JobOutcome outcome() const {
    JobOutcome o;
    o.index = index;
    o.device = device;
    o.ok = complete();
    if (const auto* f = std::get_if<phase::Failed>(&state.phase)) {
      o.code = f->code;
      o.reason = f->detail;
    }
    o.total_bytes = payload ? payload->size() : 0;
    o.bytes_acked = acked_bytes(state.progress, o.total_bytes);
    o.cursor = state.progress.cursor;
    o.chunk_count = state.progress.chunk_count;
    o.retransmits = retransmits;
    o.attempts = attempts;
    if (started != std::chrono::steady_clock::time_point{}) {
      o.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    }
    return o;
  }
};

// Failures worth a brand-new session: the link never carried protocol traffic.
inline bool is_transient(core::Errc code, bool negotiated) noexcept {
  if (code == core::Errc::ConnectTimeout) return true;
  if (code == core::Errc::LinkDropped) return !negotiated;
  return false;
}

} // namespace rudel::transfer
