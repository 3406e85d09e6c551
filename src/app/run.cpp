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

#include "app/run.hpp"

#include "app/interface.hpp"

#include "platform/platform_all.hpp"

#include "protocol/transfer/fleet.hpp"
#include "protocol/transfer/payload.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rudel::app {

namespace {

platform::BluezCfg bluez_cfg(const Options& opt) {
  platform::BluezCfg c;
  c.adapter = opt.adapter;
  c.service_uuid = opt.service_uuid;
  c.control_uuid = opt.control_uuid;
  c.data_uuid = opt.data_uuid;
  return c;
}

core::Result<platform::SingleInstanceLock> lock_adapter(const Options& opt) {
  auto lock = platform::SingleInstanceLock::try_acquire(platform::SingleInstanceLock::name_for_adapter(opt.adapter));
  if (!lock) {
    if (lock.st.code == core::Errc::Generic) {
      spdlog::error("Another rudelctl instance is already driving {}", opt.adapter);
    } else {
      spdlog::error("Cannot take the instance lock for {}: {}", opt.adapter, lock.st.msg);
    }
  }
  return lock;
}

std::string outcome_line(const transfer::JobOutcome& o) {
  const std::string who = o.device.name.empty() ? o.device.address : fmt::format("{} ({})", o.device.address, o.device.name);
  if (o.ok) {
    return fmt::format("{}: OK {} bytes in {:.1f}s, {} byte chunks, {} retransmit(s)", who, o.total_bytes,
                       static_cast<double>(o.elapsed.count()) / 1000.0, o.device.max_chunk, o.retransmits);
  }
  return fmt::format("{}: FAILED {} {}/{} bytes acknowledged: {}", who, core::errc_name(o.code), o.bytes_acked,
                     o.total_bytes, o.reason.empty() ? "-" : o.reason);
}

void print_summary(const transfer::Summary& s) {
  for (const auto& o : s.devices) {
    if (o.ok) spdlog::info("{}", outcome_line(o));
    else spdlog::error("{}", outcome_line(o));
  }

  std::string kinds;
  for (const auto& [code, count] : s.by_kind) {
    kinds += fmt::format("{}{}={}", kinds.empty() ? "" : ", ", core::errc_name(code), count);
  }
  spdlog::info("Summary: {} device(s), {} succeeded, {} failed{}", s.total, s.succeeded, s.failed,
               kinds.empty() ? "" : " (" + kinds + ")");
}

} // namespace

RunResult run_push(const Options& opt) {
  auto lock = lock_adapter(opt);
  if (!lock) return RunResult::OtherInstanceRunning;

  auto pl = transfer::Payload::load(*opt.payload);
  if (!pl) { spdlog::error("{}", pl.st.msg); return RunResult::IOFail; }
  spdlog::info("Payload {}: {} bytes, blake3 {}", pl.value->name(), pl.value->size(), pl.value->digest_hex());

  std::stop_source stop;
  std::shared_ptr<const transfer::Summary> summary;
  core::Status status;
  std::size_t peak = 0;

  {
    FleetInterface ui(!opt.verbose);

    // Enabled before the adapter so every worker thread inherits the mask.
    auto shield = platform::SignalShield::enable(stop, [&](const platform::Interrupt& in) {
      ui.notice(fmt::format("{} received ({}x): letting in-flight chunks finish, then disconnecting", in.name, in.count));
    });
    if (!shield) spdlog::warn("Signal handling unavailable; interrupts will not cancel cleanly");

    auto ar = platform::BluezAdapter::open(bluez_cfg(opt));
    if (!ar) { ui.fail(ar.st.msg); return RunResult::AdapterUnavailable; }

    transfer::Ui hooks;
    hooks.on_device  = [&](const core::Device& d) { ui.discovered(d); };
    hooks.on_plan    = [&](const std::vector<core::Device>& d, std::uint32_t size) { ui.stage("Pushing"); ui.plan(d, size); };
    hooks.on_session = [&](std::size_t i, const transfer::SessionState& s) { ui.session(i, s); };
    hooks.on_retry   = [&](std::size_t i, unsigned a, std::chrono::milliseconds w, const std::string& d) { ui.retry(i, a, w, d); };
    hooks.on_outcome = [&](const transfer::JobOutcome& o) { ui.outcome(o); };
    hooks.on_error   = [&](const std::string& msg) { ui.fail(msg); };

    ui.stage(fmt::format("Scanning on {} for {} ms", opt.adapter, opt.fleet.scan_window.count()));

    transfer::FleetOrchestrator fleet(*ar.value, opt.fleet, std::move(hooks));
    auto rep = fleet.run(opt.filter, std::move(pl.value), stop.get_token());

    summary = rep.summary;
    status = std::move(rep.status);
    peak = rep.peak_sessions;

    if (status.ok && summary) {
      if (summary->all_ok()) ui.done(fmt::format("All {} device(s) updated", summary->total));
      else if (summary->total) ui.fail(fmt::format("{} of {} device(s) failed", summary->failed, summary->total));
    }
  }

  if (!status.ok) {
    spdlog::error("{}", status.msg);
    if (status.code == core::Errc::AdapterUnavailable) {
      if (summary && summary->total) print_summary(*summary);
      return RunResult::AdapterUnavailable;
    }
  }

  if (!summary || summary->expected == 0) {
    spdlog::error("No matching devices found.");
    return stop.stop_requested() ? RunResult::Cancelled : RunResult::NoDevices;
  }

  print_summary(*summary);
  spdlog::debug("Peak concurrent sessions: {}", peak);

  if (summary->all_ok()) return RunResult::Success;
  return stop.stop_requested() ? RunResult::Cancelled : RunResult::DeviceFailures;
}

RunResult run_scan(const Options& opt) {
  auto lock = lock_adapter(opt);
  if (!lock) return RunResult::OtherInstanceRunning;

  std::stop_source stop;
  auto shield = platform::SignalShield::enable(stop, [](const platform::Interrupt& in) {
    spdlog::warn("{} received, ending the scan", in.name);
  });
  if (!shield) spdlog::warn("Signal handling unavailable; interrupts will not cancel cleanly");

  auto ar = platform::BluezAdapter::open(bluez_cfg(opt));
  if (!ar) { spdlog::error("{}", ar.st.msg); return RunResult::AdapterUnavailable; }

  spdlog::info("Scanning on {} for {} ms", opt.adapter, opt.fleet.scan_window.count());

  transfer::FleetOrchestrator fleet(*ar.value, opt.fleet);
  auto devs = fleet.discover(opt.filter, stop.get_token());
  if (!devs) {
    spdlog::error("{}", devs.st.msg);
    return devs.st.code == core::Errc::AdapterUnavailable ? RunResult::AdapterUnavailable : RunResult::IOFail;
  }

  for (const auto& d : devs.value) {
    std::cout << fmt::format("{}  {:>4}  {}{}\n", d.address, d.rssi, d.name.empty() ? "-" : d.name,
                             d.firmware.empty() ? "" : "  fw=" + d.firmware);
  }
  std::cout << std::flush;

  if (devs.value.empty()) {
    spdlog::error("No matching devices found.");
    return RunResult::NoDevices;
  }
  spdlog::info("{} device(s) found", devs.value.size());
  return RunResult::Success;
}

RunResult run_flash(const Options& opt) {
  platform::EspflashProvisioner prov(opt.espflash_tool);
  auto st = prov.flash(opt.port, *opt.image);
  if (!st.ok) {
    spdlog::error("{}", st.msg);
    return st.code == core::Errc::InvalidArgument ? RunResult::InvalidUsage : RunResult::IOFail;
  }
  spdlog::info("Flashed {} to {}", opt.image->string(), opt.port);
  return RunResult::Success;
}

RunResult run(const Options& opt) {
  switch (opt.command) {
    case Command::Push:  return run_push(opt);
    case Command::Scan:  return run_scan(opt);
    case Command::Flash: return run_flash(opt);
    case Command::None:  break;
  }
  std::cerr << usage_text();
  return RunResult::InvalidUsage;
}

} // namespace rudel::app
