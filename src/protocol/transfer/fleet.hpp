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
#include "core/sync.hpp"
#include "protocol/transfer/job.hpp"
#include "protocol/transfer/payload.hpp"
#include "protocol/transfer/results.hpp"
#include "protocol/transfer/session.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace rudel::transfer {

struct Cfg {
  SessionCfg session{};

  std::size_t connection_limit = 3;
  std::chrono::milliseconds scan_window{5'000};
  std::size_t max_devices = 0; // 0: no limit

  unsigned job_retries = 2;
  std::chrono::milliseconds retry_backoff{500};

  bool abort_on_first_failure = false;
};

struct Ui {
  std::function<void(const core::Device&)> on_device;
  std::function<void(const std::vector<core::Device>&, std::uint32_t)> on_plan;

  // Called from worker threads.
  std::function<void(std::size_t, const SessionState&)> on_session;
  std::function<void(std::size_t, unsigned, std::chrono::milliseconds, const std::string&)> on_retry;

  // Called on the thread running push().
  std::function<void(const JobOutcome&)> on_outcome;
  std::function<void(const std::string&)> on_error;
  std::function<void()> on_done;
};

struct FleetReport {
  core::Status status{};   // run-level failure; per-device failures live in the summary
  std::shared_ptr<const Summary> summary;
  std::size_t peak_sessions = 0;
};

class FleetOrchestrator {
public:
  FleetOrchestrator(core::IAdapter& adapter, Cfg cfg, Ui ui = {});

  // Scan, filter and dedupe by address in discovery order.
  core::Result<std::vector<core::Device>> discover(const core::ScanFilter& filter, std::stop_token st) noexcept;

  // One job per device; returns once every job is terminal.
  FleetReport push(const std::vector<core::Device>& devices, std::shared_ptr<const Payload> payload, std::stop_token st) noexcept;

  FleetReport run(const core::ScanFilter& filter, std::shared_ptr<const Payload> payload, std::stop_token st) noexcept;

  const Cfg& cfg() const noexcept { return cfg_; }

private:
  JobOutcome run_job_(TransferJob& job, core::AdmissionGate& gate, std::stop_token st) noexcept;

  core::IAdapter& adapter_;
  Cfg cfg_;
  Ui ui_;
};

} // namespace rudel::transfer
