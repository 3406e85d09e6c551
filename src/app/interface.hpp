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
#include "protocol/transfer/job.hpp"
#include "protocol/transfer/session_machine.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rudel::app {

// Live per-device table on a TTY; plain log lines otherwise. Every method may
// be called from any thread.
class FleetInterface {
public:
  explicit FleetInterface(bool is_tty_enabled);
  ~FleetInterface();

  FleetInterface(const FleetInterface&) = delete;
  FleetInterface& operator=(const FleetInterface&) = delete;

  void stage(std::string stage);
  void discovered(const core::Device& dev);

  void plan(const std::vector<core::Device>& devices, std::uint32_t payload_size);
  void session(std::size_t index, const transfer::SessionState& st);
  void retry(std::size_t index, unsigned attempt, std::chrono::milliseconds wait, const std::string& detail);
  void outcome(const transfer::JobOutcome& o);

  void notice(std::string msg);
  void fail(std::string msg);
  void done(std::string msg);

  bool tty() const noexcept { return tty_; }

private:
  enum class RowState { Wait, Live, Retry, Done, Failed };

  struct Row {
    core::Device device;
    RowState state = RowState::Wait;
    std::string phase = "queued";
    std::uint32_t acked = 0;
    std::uint32_t retransmits = 0;
    std::string detail;
  };

  struct Tally {
    std::size_t ok = 0, failed = 0, live = 0;
    std::uint64_t acked = 0, total = 0;
  };

  Tally tally_() const;
  void sample_rate_(std::uint64_t total_acked);

  void redraw_(bool force);
  void log_progress_(const Tally& t);
  void paint_(const Tally& t);

  bool tty_ = false, color_ = false, utf8_ = false;

  mutable std::mutex mtx_;

  std::string stage_;
  std::size_t seen_ = 0;

  std::vector<Row> rows_;
  std::uint32_t payload_size_ = 0;

  std::string notice_line_, status_line_;
  bool fatal_ = false;

  std::chrono::steady_clock::time_point start_{}, last_rate_ts_{}, last_redraw_{};
  std::uint64_t last_rate_bytes_ = 0;
  double ema_rate_bps_ = 0.0;
};

} // namespace rudel::app
