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

#include "app/cli.hpp"

namespace rudel::app {

enum class RunResult : int {
  Success = 0,
  DeviceFailures = 1,
  InvalidUsage = 2,
  NoDevices = 3,
  IOFail = 4,
  AdapterUnavailable = 5,
  OtherInstanceRunning = 6,
  Cancelled = 130,
};

RunResult run_push(const Options& opt);
RunResult run_scan(const Options& opt);
RunResult run_flash(const Options& opt);

RunResult run(const Options& opt);

} // namespace rudel::app
