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

#include "protocol/transfer/session_machine.hpp"
#include "protocol/transfer/payload.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace rudel::transfer {

namespace {

using core::Errc;

bool holds_link(const Phase& p) noexcept {
  return std::holds_alternative<phase::Negotiating>(p) || std::holds_alternative<phase::Ready>(p) ||
         std::holds_alternative<phase::Transferring>(p) || std::holds_alternative<phase::Verifying>(p);
}

Transition fail(SessionState s, Errc code, std::string detail) {
  Transition t;
  const bool had_link = holds_link(s.phase);
  s.phase = phase::Failed{code, std::move(detail)};
  t.state = std::move(s);
  if (had_link) t.effects.emplace_back(effect::Disconnect{});
  return t;
}

Transition stay(SessionState s) { return Transition{std::move(s), {}}; }

// Queues chunks from next_to_send until the window is full or the object ends.
void fill_window(Progress& pr, const Context& ctx, std::vector<Effect>& out) {
  const std::uint32_t w = std::max<std::uint32_t>(ctx.window, 1);
  while (pr.next_to_send < pr.chunk_count && pr.next_to_send - pr.cursor < w) {
    const bool again = pr.next_to_send < pr.sent_high;
    out.emplace_back(effect::SendChunk{pr.next_to_send, again});
    ++pr.chunks_sent;
    if (again) ++pr.retransmits;
    ++pr.next_to_send;
    pr.sent_high = std::max(pr.sent_high, pr.next_to_send);
  }
}

Transition enter_verifying(SessionState s) {
  Transition t;
  const std::uint32_t token = s.progress.token;
  s.phase = phase::Verifying{};
  t.state = std::move(s);
  t.effects.emplace_back(effect::SendFinalize{token});
  return t;
}

Transition on_ack(SessionState s, std::uint32_t n, const Context& ctx) {
  auto& pr = s.progress;
  if (n < pr.cursor) return stay(std::move(s));
  if (n >= pr.next_to_send) {
    return fail(std::move(s), Errc::ProtocolError, fmt::format("ACK {} for a chunk never sent (next {})", n, pr.next_to_send));
  }

  pr.cursor = n + 1;
  pr.attempts = 0;
  if (pr.cursor == pr.chunk_count) return enter_verifying(std::move(s));

  Transition t;
  fill_window(pr, ctx, t.effects);
  t.state = std::move(s);
  return t;
}

Transition on_nack(SessionState s, std::uint32_t n, const Context& ctx) {
  auto& pr = s.progress;
  if (n != pr.cursor) return stay(std::move(s));

  ++pr.attempts;
  if (pr.attempts > ctx.retry_budget) {
    return fail(std::move(s), Errc::ChunkRetryExhausted,
                fmt::format("chunk {} rejected {} times (budget {})", n, pr.attempts, ctx.retry_budget));
  }

  // The device drops everything after a rejected chunk; resend from it.
  pr.next_to_send = pr.cursor;
  Transition t;
  fill_window(pr, ctx, t.effects);
  t.state = std::move(s);
  return t;
}

Transition on_begin_ok(SessionState s, const event::BeginOk& ok, const Context& ctx) {
  auto& pr = s.progress;
  if (ok.chunk_size == 0) return fail(std::move(s), Errc::ProtocolError, "BEGIN_OK with zero chunk size");

  std::uint32_t size = std::min<std::uint32_t>(ctx.preferred_chunk, ok.chunk_size);
  if (pr.link_max) {
    if (pr.link_max <= kChunkHeaderSize) {
      return fail(std::move(s), Errc::ProtocolError, fmt::format("link write size {} cannot carry a chunk", pr.link_max));
    }
    size = std::min<std::uint32_t>(size, pr.link_max - static_cast<std::uint32_t>(kChunkHeaderSize));
  }
  if (size == 0) return fail(std::move(s), Errc::ProtocolError, "negotiated chunk size is zero");

  pr.chunk_size = size;
  pr.chunk_count = static_cast<std::uint32_t>((static_cast<std::uint64_t>(ctx.total_length) + size - 1) / size);
  pr.token = ok.token;
  pr.negotiated = true;
  s.phase = phase::Ready{};
  return stay(std::move(s));
}

} // namespace

Transition step(SessionState s, const Event& e, const Context& ctx) {
  if (is_terminal(s.phase)) return stay(std::move(s));

  // Events every live phase handles the same way.
  if (std::holds_alternative<event::Cancel>(e)) return fail(std::move(s), Errc::Cancelled, "cancelled");
  if (const auto* lost = std::get_if<event::LinkLost>(&e)) return fail(std::move(s), Errc::LinkDropped, lost->detail);
  if (const auto* bad = std::get_if<event::Malformed>(&e)) return fail(std::move(s), Errc::ProtocolError, bad->detail);

  const auto unexpected = [&](SessionState st) {
    const auto where = phase_name(st.phase);
    return fail(std::move(st), Errc::ProtocolError, fmt::format("unexpected {} while {}", event_name(e), where));
  };

  if (std::holds_alternative<phase::Disconnected>(s.phase)) {
    if (!std::holds_alternative<event::Start>(e)) return unexpected(std::move(s));
    s.phase = phase::Connecting{};
    return Transition{std::move(s), {effect::Connect{}}};
  }

  if (std::holds_alternative<phase::Connecting>(s.phase)) {
    if (const auto* up = std::get_if<event::LinkUp>(&e)) {
      s.progress.link_max = up->max_write;
      s.phase = phase::Negotiating{};
      return Transition{std::move(s), {effect::SendBegin{}}};
    }
    if (const auto* cf = std::get_if<event::ConnectFailed>(&e)) return fail(std::move(s), cf->code, cf->detail);
    if (std::holds_alternative<event::Timeout>(e)) return fail(std::move(s), Errc::ConnectTimeout, "no link within the connect deadline");
    return unexpected(std::move(s));
  }

  if (std::holds_alternative<phase::Negotiating>(s.phase)) {
    if (const auto* ok = std::get_if<event::BeginOk>(&e)) return on_begin_ok(std::move(s), *ok, ctx);
    if (const auto* rj = std::get_if<event::BeginReject>(&e)) {
      return fail(std::move(s), Errc::NegotiationRejected,
                  fmt::format("BEGIN rejected: {} ({})", reason_name(rj->reason), rj->reason));
    }
    if (std::holds_alternative<event::Timeout>(e)) return fail(std::move(s), Errc::ResponseTimeout, "no reply to BEGIN");
    return unexpected(std::move(s));
  }

  if (std::holds_alternative<phase::Ready>(s.phase)) {
    if (!std::holds_alternative<event::Proceed>(e)) return unexpected(std::move(s));
    if (s.progress.chunk_count == 0) return enter_verifying(std::move(s));
    s.phase = phase::Transferring{};
    Transition t;
    fill_window(s.progress, ctx, t.effects);
    t.state = std::move(s);
    return t;
  }

  if (std::holds_alternative<phase::Transferring>(s.phase)) {
    if (const auto* a = std::get_if<event::Acked>(&e)) return on_ack(std::move(s), a->sequence, ctx);
    if (const auto* n = std::get_if<event::Nacked>(&e)) return on_nack(std::move(s), n->sequence, ctx);
    if (std::holds_alternative<event::Timeout>(e)) {
      const auto cur = s.progress.cursor;
      return fail(std::move(s), Errc::ResponseTimeout, fmt::format("no ACK for chunk {}", cur));
    }
    return unexpected(std::move(s));
  }

  // Verifying
  if (const auto* ok = std::get_if<event::FinalizeOk>(&e)) {
    if (ok->digest && *ok->digest != ctx.digest) {
      return fail(std::move(s), Errc::DigestMismatch,
                  fmt::format("device digest {} does not match payload", digest_hex(*ok->digest).substr(0, 16)));
    }
    s.phase = phase::Complete{};
    return Transition{std::move(s), {effect::Disconnect{}}};
  }
  if (const auto* ff = std::get_if<event::FinalizeFail>(&e)) {
    return fail(std::move(s), Errc::DigestMismatch,
                fmt::format("FINALIZE rejected: {} ({})", reason_name(ff->reason), ff->reason));
  }
  if (std::holds_alternative<event::Timeout>(e)) return fail(std::move(s), Errc::FinalizeTimeout, "no reply to FINALIZE");
  // Late duplicates of already acknowledged chunks are harmless here.
  if (const auto* a = std::get_if<event::Acked>(&e); a && a->sequence < s.progress.cursor) return stay(std::move(s));
  if (const auto* n = std::get_if<event::Nacked>(&e); n && n->sequence < s.progress.cursor) return stay(std::move(s));
  return unexpected(std::move(s));
}

Event from_reply(const Reply& r) {
  if (const auto* ok = std::get_if<reply::BeginOk>(&r)) return event::BeginOk{ok->chunk_size, ok->token};
  if (const auto* rj = std::get_if<reply::BeginReject>(&r)) return event::BeginReject{rj->reason};
  if (const auto* a = std::get_if<reply::Ack>(&r)) return event::Acked{a->sequence};
  if (const auto* n = std::get_if<reply::Nack>(&r)) return event::Nacked{n->sequence};
  if (const auto* f = std::get_if<reply::FinalizeOk>(&r)) return event::FinalizeOk{f->digest};
  return event::FinalizeFail{std::get<reply::FinalizeFail>(r).reason};
}

std::string_view phase_name(const Phase& p) noexcept {
  static constexpr std::string_view names[] = {
    "Disconnected", "Connecting", "Negotiating", "Ready", "Transferring", "Verifying", "Complete", "Failed",
  };
  return names[p.index()];
}

std::string_view event_name(const Event& e) noexcept {
  static constexpr std::string_view names[] = {
    "Start", "LinkUp", "ConnectFailed", "BEGIN_OK", "BEGIN_REJECT", "Proceed", "ACK", "NACK",
    "FINALIZE_OK", "FINALIZE_FAIL", "Timeout", "LinkLost", "Malformed", "Cancel",
  };
  return names[e.index()];
}

} // namespace rudel::transfer
