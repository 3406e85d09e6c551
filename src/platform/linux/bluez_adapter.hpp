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
#include "core/ble_link.hpp"
#include "core/status.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>

struct sd_bus;

namespace rudel::bluez {

struct BusDeleter {
  void operator()(sd_bus* b) const noexcept;
};
using BusPtr = std::unique_ptr<sd_bus, BusDeleter>;

struct BluezCfg {
  std::string adapter = "hci0";

  std::string service_uuid;
  std::string control_uuid;
  std::string data_uuid;

  // Upper bound for a single GATT write round trip.
  std::chrono::milliseconds write_timeout{5'000};
};

// org.bluez over the system bus. scan() runs on the adapter's own bus; every
// link opens a private bus connection so sessions never share sd-bus state.
class BluezAdapter final : public core::IAdapter {
public:
  static core::Result<std::unique_ptr<BluezAdapter>> open(BluezCfg cfg) noexcept;

  core::Status scan(const core::ScanFilter& filter, std::chrono::milliseconds window,
                    const OnDevice& on_device, std::stop_token st) noexcept override;

  core::Result<std::unique_ptr<core::ILink>> connect(const core::Device& dev, std::chrono::milliseconds timeout) noexcept override;

  const BluezCfg& cfg() const noexcept { return cfg_; }

private:
  BluezAdapter(BluezCfg cfg, BusPtr bus);

  core::Status check_powered_() noexcept;

  BluezCfg cfg_;
  std::string adapter_path_;

  std::mutex bus_mtx_;
  BusPtr bus_;
};

// "AA:BB:CC:DD:EE:FF" -> "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"
std::string device_path(const std::string& adapter_path, const std::string& address);

// Firmware marker taken from one ManufacturerData entry: the payload itself
// when it is printable ASCII, otherwise "<company>:<hex payload>". Empty data
// gives an empty marker.
std::string firmware_marker(std::uint16_t company, std::span<const std::byte> data);

} // namespace rudel::bluez
