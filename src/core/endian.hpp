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

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstring>
#include <span>

namespace rudel::core {

// Every multi-byte field on the wire is little-endian. The conversion is its
// own inverse, so one swap serves both directions.
template <std::integral T>
constexpr T swap_unless_little(T v) noexcept {
  if constexpr (sizeof(T) == 1 || std::endian::native == std::endian::little) return v;
  else return std::byteswap(v);
}

template <std::integral T>
constexpr T le_to_host(T v) noexcept { return swap_unless_little(v); }

template <std::integral T>
constexpr T host_to_le(T v) noexcept { return swap_unless_little(v); }

// Unaligned field access; dst/src must hold sizeof(T) bytes.
template <std::integral T>
void store_le(std::span<std::byte> dst, T v) noexcept {
  const T wire = host_to_le(v);
  std::memcpy(dst.data(), &wire, sizeof wire);
}

template <std::integral T>
T load_le(std::span<const std::byte> src) noexcept {
  T wire{};
  std::memcpy(&wire, src.data(), sizeof wire);
  return le_to_host(wire);
}

} // namespace rudel::core
