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
#include "protocol/transfer/wire.hpp"

#include <cstdint>
#include <cstdio>
#include <vector>

using namespace rudel;
using namespace rudel::transfer;

static int g_pass = 0;
static int g_fail = 0;

static void check(const char* label, bool ok) {
  if (ok) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static Digest digest_of(unsigned seed) {
  Digest d{};
  for (std::size_t i = 0; i < d.size(); ++i) d[i] = static_cast<std::byte>(seed + i);
  return d;
}

static Context ctx_for(std::uint32_t len, std::uint32_t window = 1, std::uint32_t budget = 5, std::uint32_t chunk = 100) {
  Context c;
  c.total_length = len;
  c.digest = digest_of(1);
  c.window = window;
  c.retry_budget = budget;
  c.preferred_chunk = chunk;
  return c;
}

// Feeds events in order, keeping every effect emitted along the way.
struct Driver {
  Context ctx;
  SessionState s{};
  std::vector<Effect> effects;

  Driver& feed(const Event& e) {
    auto t = step(s, e, ctx);
    s = std::move(t.state);
    for (auto& fx : t.effects) effects.push_back(std::move(fx));
    return *this;
  }

  template <class P> bool in() const { return std::holds_alternative<P>(s.phase); }

  core::Errc failed_code() const {
    const auto* f = std::get_if<phase::Failed>(&s.phase);
    return f ? f->code : core::Errc::None;
  }

  std::vector<std::uint32_t> chunks() const {
    std::vector<std::uint32_t> out;
    for (const auto& fx : effects)
      if (const auto* c = std::get_if<effect::SendChunk>(&fx)) out.push_back(c->sequence);
    return out;
  }

  bool last_is_disconnect() const {
    return !effects.empty() && std::holds_alternative<effect::Disconnect>(effects.back());
  }

  // Start .. Transferring with the given device chunk and link size.
  void open(std::uint16_t device_chunk = 512, std::uint32_t link_max = 244) {
    feed(event::Start{});
    feed(event::LinkUp{link_max});
    feed(event::BeginOk{device_chunk, 0xABCD});
    feed(event::Proceed{});
  }
};

// ----- happy path -----

static void test_scenario_a() {
  Driver d{ctx_for(1000)};
  d.feed(event::Start{});
  check("a_connecting", d.in<phase::Connecting>() && std::holds_alternative<effect::Connect>(d.effects.back()));
  d.feed(event::LinkUp{244});
  check("a_negotiating", d.in<phase::Negotiating>() && std::holds_alternative<effect::SendBegin>(d.effects.back()));
  d.feed(event::BeginOk{512, 0x1234});
  check("a_ready", d.in<phase::Ready>() && d.s.progress.chunk_size == 100 && d.s.progress.chunk_count == 10);
  d.feed(event::Proceed{});
  check("a_transferring", d.in<phase::Transferring>());

  for (std::uint32_t i = 0; i < 10; ++i) d.feed(event::Acked{i});
  check("a_verifying", d.in<phase::Verifying>());
  const auto* fin = std::get_if<effect::SendFinalize>(&d.effects.back());
  check("a_finalize_token", fin && fin->token == 0x1234);

  d.feed(event::FinalizeOk{d.ctx.digest});
  check("a_complete", d.in<phase::Complete>() && d.last_is_disconnect());
  check("a_frames", d.chunks() == std::vector<std::uint32_t>({0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
  check("a_no_retransmit", d.s.progress.retransmits == 0 && d.s.progress.cursor == 10);
  check("a_acked_bytes", acked_bytes(d.s.progress, 1000) == 1000);
}

static void test_chunk_size_negotiation() {
  Driver small_link{ctx_for(1000, 1, 5, 180)};
  small_link.open(512, 60);
  check("size_link_bound", small_link.s.progress.chunk_size == 52);

  Driver small_dev{ctx_for(1000, 1, 5, 180)};
  small_dev.open(64, 244);
  check("size_device_bound", small_dev.s.progress.chunk_size == 64);

  Driver pref{ctx_for(1000, 1, 5, 180)};
  pref.open(512, 244);
  check("size_preferred", pref.s.progress.chunk_size == 180 && pref.s.progress.chunk_count == 6);

  Driver tiny{ctx_for(1000)};
  tiny.feed(event::Start{}).feed(event::LinkUp{8}).feed(event::BeginOk{512, 1});
  check("size_link_too_small", tiny.failed_code() == core::Errc::ProtocolError && tiny.last_is_disconnect());

  Driver zero{ctx_for(1000)};
  zero.feed(event::Start{}).feed(event::LinkUp{244}).feed(event::BeginOk{0, 1});
  check("size_zero_grant", zero.failed_code() == core::Errc::ProtocolError);
}

static void test_empty_object() {
  Driver d{ctx_for(0)};
  d.feed(event::Start{}).feed(event::LinkUp{244}).feed(event::BeginOk{100, 7}).feed(event::Proceed{});
  check("empty_goes_verifying", d.in<phase::Verifying>() && d.chunks().empty());
  d.feed(event::FinalizeOk{});
  check("empty_complete", d.in<phase::Complete>());
}

// ----- NACK handling -----

static void test_scenario_b_window_1() {
  Driver d{ctx_for(1000)};
  d.open();
  for (std::uint32_t i = 0; i < 4; ++i) d.feed(event::Acked{i});
  d.feed(event::Nacked{4});
  d.feed(event::Nacked{4});
  check("b_attempts", d.s.progress.attempts == 2);
  for (std::uint32_t i = 4; i < 10; ++i) d.feed(event::Acked{i});
  d.feed(event::FinalizeOk{d.ctx.digest});

  const auto frames = d.chunks();
  std::size_t fours = 0;
  for (auto f : frames) fours += f == 4;
  check("b_complete", d.in<phase::Complete>());
  check("b_twelve_frames", frames.size() == 12);
  check("b_chunk4_thrice", fours == 3);
  check("b_retransmits", d.s.progress.retransmits == 2);
}

static void test_scenario_c_budget() {
  Driver d{ctx_for(1000)};
  d.open();
  for (std::uint32_t i = 0; i < 4; ++i) d.feed(event::Acked{i});
  for (int k = 0; k < 5; ++k) d.feed(event::Nacked{4});
  check("c_still_going", d.in<phase::Transferring>() && d.s.progress.attempts == 5);
  d.feed(event::Nacked{4});
  check("c_exhausted", d.failed_code() == core::Errc::ChunkRetryExhausted);
  check("c_cursor_frozen", d.s.progress.cursor == 4);
  check("c_disconnect", d.last_is_disconnect());
  check("c_acked_bytes", acked_bytes(d.s.progress, 1000) == 400);
}

static void test_ack_resets_attempts() {
  Driver d{ctx_for(1000, 1, 2)};
  d.open();
  d.feed(event::Nacked{0}).feed(event::Nacked{0}).feed(event::Acked{0});
  check("reset_after_ack", d.s.progress.attempts == 0 && d.in<phase::Transferring>());
  d.feed(event::Nacked{1}).feed(event::Nacked{1});
  check("fresh_budget", d.in<phase::Transferring>());
}

static void test_stale_and_bogus_acks() {
  Driver d{ctx_for(1000)};
  d.open();
  d.feed(event::Acked{0}).feed(event::Acked{1});
  const auto sent = d.chunks().size();

  d.feed(event::Acked{0});
  check("stale_ack_ignored", d.in<phase::Transferring>() && d.s.progress.cursor == 2 && d.chunks().size() == sent);

  d.feed(event::Nacked{0});
  check("stale_nack_ignored", d.s.progress.attempts == 0 && d.chunks().size() == sent);

  d.feed(event::Acked{9});
  check("ack_beyond_sent", d.failed_code() == core::Errc::ProtocolError);
}

// ----- sliding window -----

static void test_window_4() {
  Driver d{ctx_for(1000, 4)};
  d.open();
  check("w4_initial_burst", d.chunks() == std::vector<std::uint32_t>({0, 1, 2, 3}));
  check("w4_outstanding", d.s.progress.next_to_send - d.s.progress.cursor == 4);

  // Cumulative ACK releases three slots at once.
  d.feed(event::Acked{2});
  check("w4_cumulative", d.s.progress.cursor == 3 && d.chunks().size() == 7);
  check("w4_bound", d.s.progress.next_to_send - d.s.progress.cursor <= 4);

  // NACK at the cursor rewinds: 3..6 go again.
  d.feed(event::Nacked{3});
  const auto frames = d.chunks();
  check("w4_rewind", frames.size() == 11 && frames[7] == 3 && frames[10] == 6);
  check("w4_retransmits", d.s.progress.retransmits == 4);

  d.feed(event::Nacked{5});
  check("w4_nack_past_cursor_ignored", d.s.progress.attempts == 1 && d.chunks().size() == 11);

  for (std::uint32_t i = 3; i < 10; ++i) d.feed(event::Acked{i});
  check("w4_verifying", d.in<phase::Verifying>());
  d.feed(event::Acked{8});
  check("w4_late_ack_in_verify", d.in<phase::Verifying>());
  d.feed(event::FinalizeOk{});
  check("w4_complete", d.in<phase::Complete>());
}

// ----- failure mapping -----

static void test_negotiation_failures() {
  Driver rj{ctx_for(1000)};
  rj.feed(event::Start{}).feed(event::LinkUp{244}).feed(event::BeginReject{static_cast<std::uint8_t>(Reason::Busy)});
  check("reject", rj.failed_code() == core::Errc::NegotiationRejected && rj.last_is_disconnect());

  Driver to{ctx_for(1000)};
  to.feed(event::Start{}).feed(event::LinkUp{244}).feed(event::Timeout{});
  check("begin_timeout", to.failed_code() == core::Errc::ResponseTimeout);
  check("begin_timeout_not_negotiated", !to.s.progress.negotiated);

  Driver cf{ctx_for(1000)};
  cf.feed(event::Start{}).feed(event::ConnectFailed{core::Errc::ConnectTimeout, "gone"});
  check("connect_failed", cf.failed_code() == core::Errc::ConnectTimeout && cf.effects.size() == 1);

  Driver ua{ctx_for(1000)};
  ua.feed(event::Start{}).feed(event::ConnectFailed{core::Errc::AdapterUnavailable, "off"});
  check("adapter_unavailable_passthrough", ua.failed_code() == core::Errc::AdapterUnavailable);
}

static void test_transfer_failures() {
  Driver ack_to{ctx_for(1000)};
  ack_to.open();
  ack_to.feed(event::Timeout{});
  check("ack_timeout", ack_to.failed_code() == core::Errc::ResponseTimeout);

  Driver lost{ctx_for(1000)};
  lost.open();
  lost.feed(event::Acked{0}).feed(event::LinkLost{"gone"});
  check("link_lost", lost.failed_code() == core::Errc::LinkDropped && lost.s.progress.negotiated);

  Driver bad{ctx_for(1000)};
  bad.open();
  bad.feed(event::Malformed{"junk"});
  check("malformed", bad.failed_code() == core::Errc::ProtocolError);

  Driver cancel{ctx_for(1000)};
  cancel.open();
  cancel.feed(event::Acked{0}).feed(event::Cancel{});
  check("cancel", cancel.failed_code() == core::Errc::Cancelled && cancel.last_is_disconnect());
  check("cancel_keeps_cursor", cancel.s.progress.cursor == 1);

  Driver unexpected{ctx_for(1000)};
  unexpected.open();
  unexpected.feed(event::BeginOk{100, 1});
  check("unexpected_event", unexpected.failed_code() == core::Errc::ProtocolError);
}

static void test_verification() {
  auto to_verify = [](Driver& d) {
    d.open();
    for (std::uint32_t i = 0; i < 10; ++i) d.feed(event::Acked{i});
  };

  Driver mismatch{ctx_for(1000)};
  to_verify(mismatch);
  mismatch.feed(event::FinalizeOk{digest_of(99)});
  check("digest_mismatch", mismatch.failed_code() == core::Errc::DigestMismatch);

  Driver rejected{ctx_for(1000)};
  to_verify(rejected);
  rejected.feed(event::FinalizeFail{static_cast<std::uint8_t>(Reason::DigestMismatch)});
  check("finalize_fail", rejected.failed_code() == core::Errc::DigestMismatch);

  Driver slow{ctx_for(1000)};
  to_verify(slow);
  slow.feed(event::Timeout{});
  check("finalize_timeout", slow.failed_code() == core::Errc::FinalizeTimeout);
}

static void test_terminal_is_absorbing() {
  Driver d{ctx_for(1000)};
  d.feed(event::Start{}).feed(event::Cancel{});
  const auto n = d.effects.size();
  d.feed(event::LinkUp{244}).feed(event::Acked{0}).feed(event::Start{});
  check("absorbing_failed", d.failed_code() == core::Errc::Cancelled && d.effects.size() == n);
  check("cancel_before_link_no_disconnect", !d.last_is_disconnect());
}

static void test_names() {
  check("phase_name", phase_name(Phase{phase::Verifying{}}) == "Verifying");
  check("event_name", event_name(Event{event::Nacked{}}) == "NACK");
  check("from_reply", std::holds_alternative<event::Acked>(from_reply(Reply{reply::Ack{3}})));
  check("is_active", is_active(Phase{phase::Connecting{}}) && !is_active(Phase{phase::Disconnected{}}) &&
                     !is_active(Phase{phase::Complete{}}));
}

int main() {
  test_scenario_a();
  test_chunk_size_negotiation();
  test_empty_object();
  test_scenario_b_window_1();
  test_scenario_c_budget();
  test_ack_resets_attempts();
  test_stale_and_bogus_acks();
  test_window_4();
  test_negotiation_failures();
  test_transfer_failures();
  test_verification();
  test_terminal_is_absorbing();
  test_names();

  std::fprintf(stdout, "session_machine: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
