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

#include "protocol/transfer/chunker.hpp"

#include <algorithm>

#include <zlib.h>

namespace rudel::transfer {

std::uint32_t crc32(std::span<const std::byte> bytes) noexcept {
  uLong c = ::crc32(0L, Z_NULL, 0);
  // zlib takes uInt lengths; chunks are small but feed in slices anyway.
  constexpr std::size_t kSlice = 1u << 30;
  std::size_t off = 0;
  while (off < bytes.size()) {
    const std::size_t n = std::min(kSlice, bytes.size() - off);
    c = ::crc32(c, reinterpret_cast<const Bytef*>(bytes.data() + off), static_cast<uInt>(n));
    off += n;
  }
  return static_cast<std::uint32_t>(c);
}

Chunker::Chunker(std::span<const std::byte> payload, std::uint32_t chunk_size) noexcept
  : data_(payload), size_(chunk_size ? chunk_size : 1)
{
  const std::uint64_t total = data_.size();
  count_ = static_cast<std::uint32_t>((total + size_ - 1) / size_);
}

Chunk Chunker::chunk(std::uint32_t sequence) const noexcept {
  const std::uint64_t off = static_cast<std::uint64_t>(sequence) * size_;
  const std::uint64_t len = std::min<std::uint64_t>(size_, data_.size() - off);

  Chunk c;
  c.sequence = sequence;
  c.offset = static_cast<std::uint32_t>(off);
  c.bytes = data_.subspan(static_cast<std::size_t>(off), static_cast<std::size_t>(len));
  c.crc32 = crc32(c.bytes);
  return c;
}

} // namespace rudel::transfer
