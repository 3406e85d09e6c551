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

#include "protocol/transfer/fleet.hpp"

#include "core/str.hpp"
#include "core/thread_pool.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include <spdlog/spdlog.h>

namespace rudel::transfer {

namespace {

using core::Errc;

std::chrono::milliseconds backoff_for(std::chrono::milliseconds base, unsigned attempt) noexcept {
  const unsigned shift = std::min(attempt ? attempt - 1 : 0u, 10u);
  return base * (1u << shift);
}

} // namespace

FleetOrchestrator::FleetOrchestrator(core::IAdapter& adapter, Cfg cfg, Ui ui)
  : adapter_(adapter), cfg_(std::move(cfg)), ui_(std::move(ui))
{
  if (cfg_.connection_limit == 0) cfg_.connection_limit = 1;
}

core::Result<std::vector<core::Device>>
FleetOrchestrator::discover(const core::ScanFilter& filter, std::stop_token st) noexcept {
  using R = core::Result<std::vector<core::Device>>;

  std::vector<core::Device> found;
  std::mutex mtx;

  auto on_device = [&](const core::Device& d) {
    if (!filter.matches(d)) return;
    std::lock_guard lk(mtx);
    const bool seen = std::any_of(found.begin(), found.end(),
                                  [&](const core::Device& x) { return core::eq_ci(x.address, d.address); });
    if (seen) return;
    found.push_back(d);
    spdlog::debug("Discovered {}", d.describe());
    if (ui_.on_device) ui_.on_device(d);
  };

  auto sst = adapter_.scan(filter, cfg_.scan_window, on_device, st);
  if (!sst.ok) {
    if (sst.code == Errc::None || sst.code == Errc::Generic) sst.code = Errc::AdapterUnavailable;
    return R::Fail(std::move(sst));
  }

  std::lock_guard lk(mtx);
  if (cfg_.max_devices && found.size() > cfg_.max_devices) {
    spdlog::info("{} devices matched, keeping the first {}", found.size(), cfg_.max_devices);
    found.resize(cfg_.max_devices);
  }
  return R::Ok(std::move(found));
}

JobOutcome FleetOrchestrator::run_job_(TransferJob& job, core::AdmissionGate& gate, std::stop_token st) noexcept {
  try {
    job.started = std::chrono::steady_clock::now();

    for (;;) {
      {
        auto slot = gate.enter(st);
        if (!slot) {
          job.state.phase = phase::Failed{Errc::Cancelled, job.attempts ? "cancelled while waiting to retry"
                                                                         : "cancelled before connecting"};
          break;
        }

        ++job.attempts;
        DeviceSession session(adapter_, job.device, job.payload, cfg_.session,
                              [&](const SessionState& s) { if (ui_.on_session) ui_.on_session(job.index, s); });
        job.state = session.run(st);
        job.retransmits += job.state.progress.retransmits;
        if (job.state.progress.negotiated) job.device.max_chunk = static_cast<std::uint16_t>(job.state.progress.chunk_size);
      }

      if (job.complete()) break;

      const auto& f = std::get<phase::Failed>(job.state.phase);
      job.last_error = core::Status::Fail(f.code, f.detail);
      if (!is_transient(f.code, job.state.progress.negotiated) || job.attempts > cfg_.job_retries) break;

      const auto wait = backoff_for(cfg_.retry_backoff, job.attempts);
      spdlog::warn("{}: {} ({}), retrying in {} ms ({}/{})", job.device.address, core::errc_name(f.code), f.detail,
                   wait.count(), job.attempts, cfg_.job_retries);
      if (ui_.on_retry) ui_.on_retry(job.index, job.attempts, wait, f.detail);

      // The slot is already released; backing off does not block admission.
      if (!core::sleep_for(st, wait)) {
        job.state.phase = phase::Failed{Errc::Cancelled, "cancelled while waiting to retry"};
        break;
      }
    }
    return job.outcome();
  } catch (const std::exception& e) {
    JobOutcome o;
    o.index = job.index;
    o.device = job.device;
    o.code = Errc::Generic;
    o.reason = e.what();
    o.attempts = job.attempts;
    return o;
  }
}

FleetReport FleetOrchestrator::push(const std::vector<core::Device>& devices,
                                    std::shared_ptr<const Payload> payload,
                                    std::stop_token st) noexcept
{
  FleetReport rep;
  const std::size_t n = devices.size();
  ResultAggregator agg(n);

  if (!payload) {
    rep.status = core::Status::Fail(Errc::InvalidArgument, "push: no payload");
    rep.summary = agg.finalize();
    return rep;
  }
  if (n == 0) {
    rep.summary = agg.finalize();
    return rep;
  }

  if (ui_.on_plan) ui_.on_plan(devices, payload->size());

  std::vector<TransferJob> jobs;
  jobs.reserve(n);
  for (std::size_t i = 0; i < n; ++i) jobs.emplace_back(i, devices[i], payload);

  core::AdmissionGate gate(cfg_.connection_limit);
  core::Channel<JobOutcome> done;

  core::ThreadPool pool(std::min(n, cfg_.connection_limit), st);

  for (auto& job : jobs) {
    auto sst = pool.submit(job.device.address, [this, &gate, &done, j = &job](std::stop_token tok) {
      done.push(run_job_(*j, gate, tok));
    });
    if (!sst.ok) {
      job.state.phase = phase::Failed{Errc::Cancelled, sst.msg};
      done.push(job.outcome());
    }
  }

  core::Status fatal{};
  for (std::size_t k = 0; k < n; ++k) {
    auto o = done.pop();
    if (!o) break;

    if (!o->ok) {
      if (o->code == Errc::AdapterUnavailable && fatal.ok) {
        fatal = core::Status::Failf(Errc::AdapterUnavailable, "adapter unavailable: {}", o->reason);
        spdlog::error("{}; cancelling the fleet", fatal.msg);
        if (ui_.on_error) ui_.on_error(fatal.msg);
        pool.request_cancel();
      } else if (cfg_.abort_on_first_failure && o->code != Errc::Cancelled && !pool.cancelled()) {
        spdlog::warn("{} failed ({}); aborting the remaining transfers", o->device.address, core::errc_name(o->code));
        pool.request_cancel();
      }
    }

    if (ui_.on_outcome) ui_.on_outcome(*o);
    auto rs = agg.record(std::move(*o));
    if (!rs.ok) spdlog::error("{}", rs.msg);
  }

  auto wst = pool.wait();
  if (!wst.ok) spdlog::error("Worker failure: {}", wst.msg);
  pool.shutdown();

  rep.status = std::move(fatal);
  rep.summary = agg.finalize();
  rep.peak_sessions = gate.peak();
  if (ui_.on_done) ui_.on_done();
  return rep;
}

FleetReport FleetOrchestrator::run(const core::ScanFilter& filter, std::shared_ptr<const Payload> payload, std::stop_token st) noexcept {
  auto devs = discover(filter, st);
  if (!devs) {
    FleetReport rep;
    rep.status = devs.st;
    rep.summary = ResultAggregator(0).finalize();
    if (ui_.on_error) ui_.on_error(devs.st.msg);
    return rep;
  }
  return push(devs.value, std::move(payload), st);
}

} // namespace rudel::transfer
