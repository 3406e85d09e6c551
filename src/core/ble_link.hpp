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

#include <chrono>
#include <cstddef>
#include <span>
#include <vector>

namespace rudel::core {

enum class Characteristic { Control, Data };

struct Notification {
  bool timed_out = false;
  std::vector<std::byte> bytes;
};

// One live GATT connection. Destroying the link disconnects it.
class ILink {
 public:
  virtual ~ILink() = default;

  // Usable bytes per characteristic write (ATT MTU minus header).
  virtual std::size_t max_write() const noexcept = 0;

  // Returns once the write completed; a failure means the link is unusable.
  virtual Status write(Characteristic c, std::span<const std::byte> data) noexcept = 0;

  // Ok + timed_out when nothing arrived in time; Fail when the link dropped.
  virtual Result<Notification> await_notification(Characteristic c, std::chrono::milliseconds timeout) noexcept = 0;
};

} // namespace rudel::core
