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

#include "sim/sim_device.hpp"

#include "core/str.hpp"
#include "core/sync.hpp"
#include "protocol/transfer/chunker.hpp"
#include "protocol/transfer/payload.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <thread>
#include <utility>

namespace rudel::sim {

using transfer::Reason;

Record SimDevice::record() const {
  std::lock_guard lk(mtx_);
  return rec_;
}

class SimLink final : public core::ILink {
public:
  SimLink(SimAdapter& adapter, SimDevice& dev, std::uint32_t token)
    : adapter_(adapter), dev_(dev), token_(token) {
    adapter_.link_opened_();
  }

  ~SimLink() override { adapter_.link_closed_(); }

  std::size_t max_write() const noexcept override { return dev_.script_.link_max_write; }

  core::Status write(core::Characteristic c, std::span<const std::byte> data) noexcept override {
    {
      std::lock_guard lk(mtx_);
      if (dropped_) return core::Status::Fail(core::Errc::LinkDropped, "link is down");
    }
    if (data.size() > max_write()) {
      return core::Status::Failf(core::Errc::LinkDropped, "write of {} bytes exceeds link limit {}", data.size(), max_write());
    }
    return c == core::Characteristic::Control ? on_control_(data) : on_data_(data);
  }

  core::Result<core::Notification> await_notification(core::Characteristic c, std::chrono::milliseconds timeout) noexcept override {
    using R = core::Result<core::Notification>;
    if (c != core::Characteristic::Control) return R::Fail(core::Errc::InvalidArgument, "only control notifies");

    const auto until = std::chrono::steady_clock::now() + timeout;
    const auto& repeat = dev_.script_.repeat_last_ack;

    std::unique_lock lk(mtx_);
    for (;;) {
      if (!queue_.empty()) {
        core::Notification n;
        n.bytes = std::move(queue_.front());
        queue_.pop_front();
        return R::Ok(std::move(n));
      }
      if (dropped_) return R::Fail(core::Errc::LinkDropped, "peer disconnected");

      const auto now = std::chrono::steady_clock::now();
      if (repeat && last_ack_ && now >= next_repeat_) {
        queue_.push_back(transfer::encode_ack(*last_ack_));
        next_repeat_ = now + *repeat;
        continue;
      }
      if (now >= until) return R::Ok(core::Notification{true, {}});

      auto wake = until;
      if (repeat && last_ack_) wake = std::min(wake, next_repeat_);
      cv_.wait_until(lk, wake, [&] { return !queue_.empty() || dropped_; });
    }
  }

private:
  void notify_(std::vector<std::byte> frame) {
    {
      std::lock_guard lk(mtx_);
      queue_.push_back(std::move(frame));
    }
    cv_.notify_all();
  }

  void drop_() {
    {
      std::lock_guard lk(mtx_);
      dropped_ = true;
    }
    cv_.notify_all();
  }

  core::Status on_control_(std::span<const std::byte> data) {
    const auto& sc = dev_.script_;
    auto req = transfer::decode_request(data);
    if (!req) return core::Status::Ok();   // a real peripheral ignores garbage

    if (const auto* b = std::get_if<transfer::request::Begin>(&req.value)) {
      {
        std::lock_guard lk(dev_.mtx_);
        ++dev_.rec_.begins;
        dev_.rec_.received.clear();
        dev_.rec_.stored = false;
        if (dev_.begin_drops_left_) {
          --dev_.begin_drops_left_;
          drop_();
          return core::Status::Fail(core::Errc::LinkDropped, "peer vanished during BEGIN");
        }
      }
      declared_ = b->total_length;
      digest_ = b->digest;
      expected_ = 0;

      if (sc.reject) { notify_(transfer::encode_begin_reject(*sc.reject)); return core::Status::Ok(); }
      if (sc.silent_begin) return core::Status::Ok();
      granted_ = sc.device_chunk;
      notify_(transfer::encode_begin_ok(granted_, token_));
      return core::Status::Ok();
    }

    const auto& f = std::get<transfer::request::Finalize>(req.value);
    std::vector<std::byte> got;
    {
      std::lock_guard lk(dev_.mtx_);
      ++dev_.rec_.finalizes;
      got = dev_.rec_.received;
    }
    if (sc.silent_finalize) return core::Status::Ok();
    if (f.token != token_) { notify_(transfer::encode_finalize_fail(Reason::BadToken)); return core::Status::Ok(); }

    const auto digest = transfer::blake3_digest(got);
    if (got.size() != declared_ || digest != digest_ || sc.finalize_fail) {
      notify_(transfer::encode_finalize_fail(Reason::DigestMismatch));
      return core::Status::Ok();
    }

    if (sc.corrupt_digest) {
      auto bad = digest;
      bad[0] ^= std::byte{0xFF};
      notify_(transfer::encode_finalize_ok(&bad));
      return core::Status::Ok();
    }

    {
      std::lock_guard lk(dev_.mtx_);
      dev_.rec_.stored = true;
    }
    notify_(sc.omit_digest ? transfer::encode_finalize_ok() : transfer::encode_finalize_ok(&digest));
    return core::Status::Ok();
  }

  core::Status on_data_(std::span<const std::byte> data) {
    const auto& sc = dev_.script_;
    if (sc.chunk_delay.count() > 0) std::this_thread::sleep_for(sc.chunk_delay);

    auto ch = transfer::decode_chunk(data);
    if (!ch) return core::Status::Ok();

    const std::uint32_t seq = ch.value.sequence;
    bool nack = false;
    {
      std::lock_guard lk(dev_.mtx_);
      dev_.rec_.chunk_frames.push_back(seq);

      if (sc.drop_at_chunk && *sc.drop_at_chunk == seq) {
        drop_();
        return core::Status::Ok();
      }

      // Go-back-N receiver: anything but the next expected chunk is discarded.
      if (seq != expected_) return core::Status::Ok();

      if (transfer::crc32(ch.value.bytes) != ch.value.crc32 || ch.value.bytes.size() > granted_) {
        nack = true;
      } else if (auto it = dev_.nacks_left_.find(seq); it != dev_.nacks_left_.end() && it->second > 0) {
        --it->second;
        nack = true;
      } else {
        dev_.rec_.received.insert(dev_.rec_.received.end(), ch.value.bytes.begin(), ch.value.bytes.end());
        ++expected_;
      }
    }

    if (nack) { notify_(transfer::encode_nack(seq)); return core::Status::Ok(); }
    if (sc.silent_from_chunk && seq >= *sc.silent_from_chunk) return core::Status::Ok();
    {
      std::lock_guard lk(mtx_);
      last_ack_ = seq;
      if (sc.repeat_last_ack) next_repeat_ = std::chrono::steady_clock::now() + *sc.repeat_last_ack;
    }
    notify_(transfer::encode_ack(seq));
    return core::Status::Ok();
  }

  SimAdapter& adapter_;
  SimDevice& dev_;
  const std::uint32_t token_;

  std::uint32_t declared_ = 0;
  transfer::Digest digest_{};
  std::uint32_t expected_ = 0;
  std::uint16_t granted_ = 0;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<std::vector<std::byte>> queue_;
  bool dropped_ = false;
  std::optional<std::uint32_t> last_ack_;
  std::chrono::steady_clock::time_point next_repeat_{};
};

SimDevice& SimAdapter::add(core::Device dev, Script script) {
  auto d = std::make_unique<SimDevice>(std::move(dev), std::move(script));
  d->connect_failures_left_ = d->script_.connect_failures;
  d->begin_drops_left_ = d->script_.drop_on_begin;
  d->nacks_left_ = d->script_.nacks;
  devices_.push_back(std::move(d));
  return *devices_.back();
}

SimDevice& SimAdapter::add(std::string address, std::string name, Script script) {
  core::Device d;
  d.address = std::move(address);
  d.name = std::move(name);
  d.rssi = -60;
  d.services = {std::string(transfer::kServiceUuid)};
  return add(std::move(d), std::move(script));
}

SimDevice* SimAdapter::find(const std::string& address) {
  for (auto& d : devices_) {
    if (core::eq_ci(d->dev_.address, address)) return d.get();
  }
  return nullptr;
}

core::Status SimAdapter::scan(const core::ScanFilter&, std::chrono::milliseconds window,
                              const OnDevice& on_device, std::stop_token st) noexcept {
  if (unavailable_) return core::Status::Fail(core::Errc::AdapterUnavailable, "simulated adapter is off");

  for (unsigned r = 0; r < repeats_; ++r) {
    for (const auto& d : devices_) {
      if (st.stop_requested()) return core::Status::Ok();
      on_device(d->dev_);
    }
  }
  if (scan_delay_.count() > 0) (void)core::sleep_for(st, std::min(window, scan_delay_));
  return core::Status::Ok();
}

core::Result<std::unique_ptr<core::ILink>> SimAdapter::connect(const core::Device& dev, std::chrono::milliseconds) noexcept {
  using R = core::Result<std::unique_ptr<core::ILink>>;
  if (unavailable_) return R::Fail(core::Errc::AdapterUnavailable, "simulated adapter is off");

  SimDevice* d = find(dev.address);
  if (!d) return R::Failf(core::Errc::ConnectTimeout, "{} is out of range", dev.address);

  if (d->script_.connect_delay.count() > 0) std::this_thread::sleep_for(d->script_.connect_delay);

  std::uint32_t token = 0;
  {
    std::lock_guard lk(d->mtx_);
    ++d->rec_.connects;
    if (d->script_.adapter_lost_on_connect) return R::Fail(core::Errc::AdapterUnavailable, "simulated adapter vanished");
    if (d->connect_failures_left_) {
      --d->connect_failures_left_;
      return R::Failf(core::Errc::ConnectTimeout, "{} did not answer", dev.address);
    }
    ++d->rec_.sessions;
    token = 0x5EED0000u + d->rec_.sessions;
  }

  return R::Ok(std::make_unique<SimLink>(*this, *d, token));
}

void SimAdapter::link_opened_() noexcept {
  const auto now = ++live_;
  auto peak = peak_.load();
  while (now > peak && !peak_.compare_exchange_weak(peak, now)) {}
}

void SimAdapter::link_closed_() noexcept {
  --live_;
}

} // namespace rudel::sim
