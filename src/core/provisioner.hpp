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

#include "core/status.hpp"

#include <filesystem>
#include <string>

namespace rudel::core {

// First-time firmware install over a serial port. The image is opaque here.
class IProvisioner {
public:
  virtual ~IProvisioner() = default;
  virtual Status flash(const std::string& serial_port, const std::filesystem::path& image) noexcept = 0;
};

} // namespace rudel::core
