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

#include "core/provisioner.hpp"

#include <string>
#include <utility>
#include <vector>

namespace rudel::posix_common {

// Runs `espflash flash --port <tty> <image>` and forwards its output to the log.
class EspflashProvisioner final : public core::IProvisioner {
public:
  explicit EspflashProvisioner(std::string tool = "espflash", std::vector<std::string> extra_args = {})
    : tool_(std::move(tool)), extra_(std::move(extra_args)) {}

  core::Status flash(const std::string& serial_port, const std::filesystem::path& image) noexcept override;

  std::vector<std::string> command_line(const std::string& serial_port, const std::filesystem::path& image) const;

private:
  std::string tool_;
  std::vector<std::string> extra_;
};

} // namespace rudel::posix_common
