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

#include "core/ble_link.hpp"
#include "core/status.hpp"
#include "core/str.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace rudel::core {

struct Device {
  std::string address;   // "AA:BB:CC:DD:EE:FF"
  std::string name;
  std::int16_t rssi = 0;
  std::uint16_t max_chunk = 0; // negotiated chunk size; 0 until a session negotiates
  std::string firmware;
  std::vector<std::string> services;

  std::string describe() const {
    return fmt::format("{} [{}] rssi={}{}", address, name.empty() ? "-" : name, rssi,
                       firmware.empty() ? "" : (" fw=" + firmware));
  }
};

struct ScanFilter {
  std::optional<std::string> name_glob;
  std::optional<std::string> service_uuid;
  std::vector<std::string> addresses;

  bool matches(const Device& d) const {
    if (name_glob && !glob_match_ci(*name_glob, d.name)) return false;

    // A device that advertises no services cannot be shown to carry ours.
    if (service_uuid) {
      const bool has = std::any_of(d.services.begin(), d.services.end(),
                                   [&](const std::string& s) { return eq_ci(s, *service_uuid); });
      if (!has) return false;
    }

    if (!addresses.empty()) {
      const bool has = std::any_of(addresses.begin(), addresses.end(),
                                   [&](const std::string& a) { return eq_ci(a, d.address); });
      if (!has) return false;
    }
    return true;
  }
};

class IAdapter {
 public:
  using OnDevice = std::function<void(const Device&)>;

  virtual ~IAdapter() = default;

  // Reports devices as they are seen during the window; a stop request ends
  // the window early. Fails with Errc::AdapterUnavailable when the radio
  // cannot be used at all.
  virtual Status scan(const ScanFilter& filter, std::chrono::milliseconds window,
                      const OnDevice& on_device, std::stop_token st) noexcept = 0;

  virtual Result<std::unique_ptr<ILink>> connect(const Device& dev, std::chrono::milliseconds timeout) noexcept = 0;
};

} // namespace rudel::core
