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
#include "protocol/transfer/wire.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace rudel::transfer {

// Object pushed to every device of a run. The digest is computed once here and
// never again; sessions share the instance read-only.
class Payload {
public:
  static core::Result<std::shared_ptr<const Payload>> load(const std::filesystem::path& path) noexcept;
  static core::Result<std::shared_ptr<const Payload>> from_bytes(std::vector<std::byte> bytes, std::string name = "<memory>") noexcept;

  std::span<const std::byte> bytes() const noexcept { return bytes_; }
  std::uint32_t size() const noexcept { return static_cast<std::uint32_t>(bytes_.size()); }
  const Digest& digest() const noexcept { return digest_; }
  const std::string& name() const noexcept { return name_; }

  std::string digest_hex() const;

private:
  Payload(std::vector<std::byte> bytes, std::string name);

  std::vector<std::byte> bytes_;
  Digest digest_{};
  std::string name_;
};

Digest blake3_digest(std::span<const std::byte> bytes) noexcept;
std::string digest_hex(const Digest& d);

} // namespace rudel::transfer
