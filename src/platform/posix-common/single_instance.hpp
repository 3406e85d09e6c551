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
#include "platform/posix-common/filehandle.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace rudel::posix_common {

// Held as a bound abstract unix socket; the kernel drops it when the process
// exits, however it exits.
class SingleInstanceLock {
public:
  SingleInstanceLock() = default;

  SingleInstanceLock(SingleInstanceLock&&) noexcept = default;
  SingleInstanceLock& operator=(SingleInstanceLock&&) noexcept = default;

  // Errc::Generic when another process holds the name, Errc::Io otherwise.
  static core::Result<SingleInstanceLock> try_acquire(std::string name) noexcept;

  // One lock per radio: two controllers must never drive the same adapter.
  static std::string name_for_adapter(std::string_view adapter) { return "rudelctl-" + std::string(adapter); }

  const std::string& name() const noexcept { return name_; }
  bool held() const noexcept { return fd_.valid(); }

private:
  SingleInstanceLock(FileHandle fd, std::string name) : fd_(std::move(fd)), name_(std::move(name)) {}

  FileHandle fd_;
  std::string name_;
};

} // namespace rudel::posix_common
