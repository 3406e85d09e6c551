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
#include "protocol/transfer/job.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace rudel::transfer {

struct Summary {
  std::size_t expected = 0;
  std::size_t total = 0;       // outcomes recorded
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::map<core::Errc, std::size_t> by_kind;
  std::vector<JobOutcome> devices;   // discovery order

  bool all_ok() const noexcept { return expected == total && failed == 0 && total > 0; }
};

// Collects terminal outcomes as they stream in. Thread-safe; snapshot() may be
// called while recording is still going on.
class ResultAggregator {
public:
  explicit ResultAggregator(std::size_t expected = 0) { sum_.expected = expected; }

  // Fails when the device was already recorded or the aggregator is sealed.
  core::Status record(JobOutcome o);

  Summary snapshot() const;
  bool done() const;

  // Seals the aggregator; later record() calls fail.
  std::shared_ptr<const Summary> finalize();

private:
  mutable std::mutex mtx_;
  Summary sum_;
  std::shared_ptr<const Summary> sealed_;
};

} // namespace rudel::transfer
