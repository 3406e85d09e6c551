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
#include "protocol/transfer/fleet.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rudel::app {

enum class Command { None, Push, Scan, Flash };

struct Options {
    bool help = false;
    bool version = false;
    bool verbose = false;

    Command command = Command::None;

    std::optional<std::filesystem::path> payload;   // push
    std::optional<std::filesystem::path> image;     // flash
    std::string port;                               // flash
    std::string espflash_tool = "espflash";

    core::ScanFilter filter;
    transfer::Cfg fleet;

    std::string adapter = "hci0";
    std::string service_uuid;
    std::string control_uuid;
    std::string data_uuid;
};

core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

} // namespace rudel::app
