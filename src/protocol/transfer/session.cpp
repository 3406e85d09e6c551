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

#include "protocol/transfer/session.hpp"

#include "protocol/transfer/chunker.hpp"
#include "protocol/transfer/wire.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace rudel::transfer {

namespace {

using core::Characteristic;
using Clock = std::chrono::steady_clock;

} // namespace

DeviceSession::DeviceSession(core::IAdapter& adapter,
                             core::Device device,
                             std::shared_ptr<const Payload> payload,
                             const SessionCfg& cfg,
                             OnChange on_change)
  : adapter_(adapter)
  , device_(std::move(device))
  , payload_(std::move(payload))
  , cfg_(cfg)
  , on_change_(std::move(on_change))
{
  ctx_.total_length = payload_->size();
  ctx_.digest = payload_->digest();
  ctx_.window = cfg_.window;
  ctx_.retry_budget = cfg_.retry_budget;
  ctx_.preferred_chunk = cfg_.preferred_chunk;
}

void DeviceSession::apply_(const Event& e) {
  const auto before_phase = state_.phase.index();
  const auto before_name = phase_name(state_.phase);
  const auto before_cursor = state_.progress.cursor;
  const auto before_sent = state_.progress.chunks_sent;

  auto t = step(state_, e, ctx_);
  state_ = std::move(t.state);

  if (is_terminal(state_.phase)) pending_.clear();
  for (auto& fx : t.effects) pending_.push_back(std::move(fx));

  const bool moved = state_.phase.index() != before_phase;
  if (moved) {
    if (const auto* f = std::get_if<phase::Failed>(&state_.phase)) {
      spdlog::debug("{}: {} -> Failed({}) on {}: {}", device_.address, before_name, core::errc_name(f->code), event_name(e), f->detail);
    } else {
      spdlog::debug("{}: {} -> {} on {}", device_.address, before_name, phase_name(state_.phase), event_name(e));
    }
  }

  const bool progressed = moved || state_.progress.cursor != before_cursor || state_.progress.chunks_sent != before_sent;
  if (progressed) rearm_ = true;
  if (on_change_ && progressed) on_change_(state_);
}

std::chrono::milliseconds DeviceSession::deadline_for_phase_() const noexcept {
  if (std::holds_alternative<phase::Negotiating>(state_.phase)) return cfg_.negotiate_timeout;
  if (std::holds_alternative<phase::Verifying>(state_.phase)) return cfg_.finalize_timeout;
  if (std::holds_alternative<phase::Connecting>(state_.phase)) return cfg_.connect_timeout;
  return cfg_.ack_timeout;
}

std::optional<Event> DeviceSession::execute_(const Effect& fx, std::stop_token st) noexcept {
  if (std::holds_alternative<effect::Connect>(fx)) {
    if (st.stop_requested()) return event::Cancel{};

    auto r = adapter_.connect(device_, cfg_.connect_timeout);
    if (!r) return event::ConnectFailed{r.st.code, std::move(r.st.msg)};

    link_ = std::move(r.value);
    spdlog::debug("{}: connected, max write {} bytes", device_.address, link_->max_write());
    return event::LinkUp{static_cast<std::uint32_t>(link_->max_write())};
  }

  if (std::holds_alternative<effect::Disconnect>(fx)) {
    link_.reset();
    return std::nullopt;
  }

  if (!link_) return event::LinkLost{"write without a link"};

  if (std::holds_alternative<effect::SendBegin>(fx)) {
    const auto frame = encode_begin(ctx_.total_length, ctx_.digest);
    auto w = link_->write(Characteristic::Control, frame);
    if (!w) return event::LinkLost{fmt::format("BEGIN write failed: {}", w.msg)};
    spdlog::debug("{}: BEGIN len={} digest={}", device_.address, ctx_.total_length, payload_->digest_hex().substr(0, 16));
    return std::nullopt;
  }

  if (const auto* sc = std::get_if<effect::SendChunk>(&fx)) {
    // Cancellation is honoured between chunks, never inside one.
    if (st.stop_requested()) return event::Cancel{};

    const Chunker chunker(payload_->bytes(), state_.progress.chunk_size);
    const Chunk c = chunker.chunk(sc->sequence);
    const auto frame = encode_chunk(c.sequence, c.crc32, c.bytes);

    auto w = link_->write(Characteristic::Data, frame);
    if (!w) return event::LinkLost{fmt::format("CHUNK {} write failed: {}", c.sequence, w.msg)};
    if (sc->retransmit) spdlog::debug("{}: resent chunk {} ({} bytes)", device_.address, c.sequence, c.bytes.size());
    return std::nullopt;
  }

  if (const auto* sf = std::get_if<effect::SendFinalize>(&fx)) {
    const auto frame = encode_finalize(sf->token);
    auto w = link_->write(Characteristic::Control, frame);
    if (!w) return event::LinkLost{fmt::format("FINALIZE write failed: {}", w.msg)};
    spdlog::debug("{}: FINALIZE token={:#010x}", device_.address, sf->token);
    return std::nullopt;
  }

  return std::nullopt;
}

Event DeviceSession::await_reply_(Clock::time_point until, std::stop_token st) noexcept {
  for (;;) {
    if (st.stop_requested()) return event::Cancel{};
    if (!link_) return event::LinkLost{"link released"};

    const auto now = Clock::now();
    if (now >= until) return event::Timeout{};

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
    left = std::clamp(left, std::chrono::milliseconds{1}, std::max(cfg_.poll_slice, std::chrono::milliseconds{1}));

    auto r = link_->await_notification(Characteristic::Control, left);
    if (!r) return event::LinkLost{std::move(r.st.msg)};
    if (r.value.timed_out) continue;

    auto rep = decode_reply(r.value.bytes);
    if (!rep) {
      spdlog::warn("{}: {}", device_.address, rep.st.msg);
      return event::Malformed{std::move(rep.st.msg)};
    }

    if (const auto* ok = std::get_if<reply::BeginOk>(&rep.value)) {
      spdlog::debug("{}: BEGIN_OK chunk={} token={:#010x}", device_.address, ok->chunk_size, ok->token);
    } else if (const auto* nk = std::get_if<reply::Nack>(&rep.value)) {
      spdlog::debug("{}: NACK {}", device_.address, nk->sequence);
    }
    return from_reply(rep.value);
  }
}

SessionState DeviceSession::run(std::stop_token st) noexcept {
  try {
    apply_(event::Start{});

    while (!is_terminal(state_.phase)) {
      while (!pending_.empty()) {
        const Effect fx = std::move(pending_.front());
        pending_.pop_front();
        if (auto ev = execute_(fx, st)) apply_(*ev);
      }
      if (is_terminal(state_.phase)) break;

      if (std::holds_alternative<phase::Ready>(state_.phase)) {
        apply_(event::Proceed{});
        continue;
      }

      if (rearm_) {
        reply_deadline_ = Clock::now() + deadline_for_phase_();
        rearm_ = false;
      }
      apply_(await_reply_(reply_deadline_, st));
    }
  } catch (const std::exception& e) {
    spdlog::error("{}: session aborted: {}", device_.address, e.what());
    state_.phase = phase::Failed{core::Errc::Generic, e.what()};
  }

  link_.reset();
  return state_;
}

} // namespace rudel::transfer
