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

#include "protocol/transfer/results.hpp"

#include <cstdio>
#include <string>

#include <fmt/format.h>

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

static JobOutcome outcome(std::size_t idx, bool ok, core::Errc code = core::Errc::None) {
  JobOutcome o;
  o.index = idx;
  o.device.address = fmt::format("AA:BB:CC:DD:EE:{:02X}", idx);
  o.ok = ok;
  o.code = ok ? core::Errc::None : code;
  o.attempts = 1;
  return o;
}

static void test_record_and_counts() {
  ResultAggregator agg(4);
  check("record_0", agg.record(outcome(2, true)).ok);
  check("record_1", agg.record(outcome(0, false, core::Errc::ConnectTimeout)).ok);
  check("not_done_yet", !agg.done());
  check("record_2", agg.record(outcome(3, false, core::Errc::ConnectTimeout)).ok);
  check("record_3", agg.record(outcome(1, false, core::Errc::DigestMismatch)).ok);
  check("done", agg.done());

  auto s = agg.finalize();
  check("totals", s->expected == 4 && s->total == 4 && s->succeeded == 1 && s->failed == 3);
  check("by_kind", s->by_kind.size() == 2 && s->by_kind.at(core::Errc::ConnectTimeout) == 2 &&
                   s->by_kind.at(core::Errc::DigestMismatch) == 1);
  check("successes_not_in_kinds", s->by_kind.count(core::Errc::None) == 0);

  bool ordered = s->devices.size() == 4;
  for (std::size_t i = 0; ordered && i < 4; ++i) ordered = s->devices[i].index == i;
  check("discovery_order", ordered);
  check("not_all_ok", !s->all_ok());
}

static void test_duplicates_rejected() {
  ResultAggregator agg(2);
  check("dup_first", agg.record(outcome(0, true)).ok);

  auto again = outcome(0, false, core::Errc::LinkDropped);
  again.device.address = "aa:bb:cc:dd:ee:00";
  auto st = agg.record(again);
  check("dup_rejected", !st.ok);
  check("dup_unchanged", agg.snapshot().total == 1 && agg.snapshot().failed == 0);
}

static void test_sealed() {
  ResultAggregator agg(2);
  check("sealed_first", agg.record(outcome(0, true)).ok);
  auto s1 = agg.finalize();
  check("sealed_rejects", !agg.record(outcome(1, true)).ok);
  auto s2 = agg.finalize();
  check("sealed_same_summary", s1 == s2 && s2->total == 1);
  check("sealed_partial_not_ok", !s2->all_ok());
}

static void test_all_ok() {
  ResultAggregator agg(3);
  for (std::size_t i = 0; i < 3; ++i) (void)agg.record(outcome(i, true));
  check("all_ok", agg.finalize()->all_ok());

  ResultAggregator empty(0);
  check("empty_not_ok", !empty.finalize()->all_ok());
}

static void test_snapshot_while_recording() {
  ResultAggregator agg(3);
  (void)agg.record(outcome(1, true));
  const Summary snap = agg.snapshot();
  (void)agg.record(outcome(0, true));
  check("snapshot_is_copy", snap.total == 1 && agg.snapshot().total == 2);
}

int main() {
  test_record_and_counts();
  test_duplicates_rejected();
  test_sealed();
  test_all_ok();
  test_snapshot_while_recording();

  std::fprintf(stdout, "results: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
