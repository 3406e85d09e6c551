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

#include "core/str.hpp"

#include <algorithm>
#include <utility>

namespace rudel::transfer {

core::Status ResultAggregator::record(JobOutcome o) {
  std::lock_guard lk(mtx_);
  if (sealed_) return core::Status::Failf("outcome for {} after the summary was sealed", o.device.address);

  const bool dup = std::any_of(sum_.devices.begin(), sum_.devices.end(), [&](const JobOutcome& d) {
    return core::eq_ci(d.device.address, o.device.address);
  });
  if (dup) return core::Status::Failf("duplicate outcome for {}", o.device.address);

  ++sum_.total;
  if (o.ok) {
    ++sum_.succeeded;
  } else {
    ++sum_.failed;
    ++sum_.by_kind[o.code];
  }

  const auto pos = std::upper_bound(sum_.devices.begin(), sum_.devices.end(), o.index,
                                    [](std::size_t idx, const JobOutcome& d) { return idx < d.index; });
  sum_.devices.insert(pos, std::move(o));
  return core::Status::Ok();
}

Summary ResultAggregator::snapshot() const {
  std::lock_guard lk(mtx_);
  return sum_;
}

bool ResultAggregator::done() const {
  std::lock_guard lk(mtx_);
  return sum_.total >= sum_.expected;
}

std::shared_ptr<const Summary> ResultAggregator::finalize() {
  std::lock_guard lk(mtx_);
  if (!sealed_) sealed_ = std::make_shared<const Summary>(sum_);
  return sealed_;
}

} // namespace rudel::transfer
