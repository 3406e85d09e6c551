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
#include "protocol/transfer/wire.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rudel::transfer {

// Object-transfer state machine for one device. step() is pure: it never
// touches a link, it only says what the driver has to do next.

struct Context {
  std::uint32_t total_length = 0;
  Digest digest{};
  std::uint32_t window = 1;          // max chunks sent but not acknowledged
  std::uint32_t retry_budget = 5;    // NACKs tolerated for one chunk
  std::uint32_t preferred_chunk = 180;
};

struct Progress {
  std::uint32_t cursor = 0;          // next unacknowledged sequence
  std::uint32_t next_to_send = 0;
  std::uint32_t sent_high = 0;       // one past the highest sequence ever sent
  std::uint32_t attempts = 0;        // NACKs seen for the chunk at the cursor
  std::uint32_t chunks_sent = 0;     // chunk frames written, retransmissions included
  std::uint32_t retransmits = 0;
  std::uint32_t link_max = 0;        // usable bytes per data write
  std::uint32_t chunk_size = 0;
  std::uint32_t chunk_count = 0;
  std::uint32_t token = 0;
  bool negotiated = false;
};

namespace phase {
struct Disconnected {};
struct Connecting {};
struct Negotiating {};
struct Ready {};
struct Transferring {};
struct Verifying {};
struct Complete {};
struct Failed {
  core::Errc code = core::Errc::Generic;
  std::string detail;
};
} // namespace phase

using Phase = std::variant<phase::Disconnected, phase::Connecting, phase::Negotiating, phase::Ready,
                           phase::Transferring, phase::Verifying, phase::Complete, phase::Failed>;

struct SessionState {
  Phase phase{phase::Disconnected{}};
  Progress progress{};
};

namespace event {
struct Start {};
struct LinkUp { std::uint32_t max_write = 0; };
struct ConnectFailed { core::Errc code = core::Errc::ConnectTimeout; std::string detail; };
struct BeginOk { std::uint16_t chunk_size = 0; std::uint32_t token = 0; };
struct BeginReject { std::uint8_t reason = 0; };
struct Proceed {};
struct Acked { std::uint32_t sequence = 0; };
struct Nacked { std::uint32_t sequence = 0; };
struct FinalizeOk { std::optional<Digest> digest; };
struct FinalizeFail { std::uint8_t reason = 0; };
struct Timeout {};
struct LinkLost { std::string detail; };
struct Malformed { std::string detail; };
struct Cancel {};
} // namespace event

using Event = std::variant<event::Start, event::LinkUp, event::ConnectFailed, event::BeginOk, event::BeginReject,
                           event::Proceed, event::Acked, event::Nacked, event::FinalizeOk, event::FinalizeFail,
                           event::Timeout, event::LinkLost, event::Malformed, event::Cancel>;

namespace effect {
struct Connect {};
struct SendBegin {};
struct SendChunk { std::uint32_t sequence = 0; bool retransmit = false; };
struct SendFinalize { std::uint32_t token = 0; };
struct Disconnect {};
} // namespace effect

using Effect = std::variant<effect::Connect, effect::SendBegin, effect::SendChunk, effect::SendFinalize, effect::Disconnect>;

struct Transition {
  SessionState state;
  std::vector<Effect> effects;
};

Transition step(SessionState s, const Event& e, const Context& ctx);

Event from_reply(const Reply& r);

std::string_view phase_name(const Phase& p) noexcept;
std::string_view event_name(const Event& e) noexcept;

inline bool is_terminal(const Phase& p) noexcept {
  return std::holds_alternative<phase::Complete>(p) || std::holds_alternative<phase::Failed>(p);
}

// Connecting..Verifying: the phases that hold (or are acquiring) a connection.
inline bool is_active(const Phase& p) noexcept {
  return !std::holds_alternative<phase::Disconnected>(p) && !is_terminal(p);
}

inline std::uint32_t acked_bytes(const Progress& pr, std::uint32_t total_length) noexcept {
  const std::uint64_t b = static_cast<std::uint64_t>(pr.cursor) * pr.chunk_size;
  return b > total_length ? total_length : static_cast<std::uint32_t>(b);
}

} // namespace rudel::transfer
