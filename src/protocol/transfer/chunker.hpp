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

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>

namespace rudel::transfer {

// CRC-32/ISO-HDLC, identical to zlib's crc32().
std::uint32_t crc32(std::span<const std::byte> bytes) noexcept;

struct Chunk {
  std::uint32_t sequence = 0;
  std::uint32_t offset = 0;
  std::span<const std::byte> bytes;
  std::uint32_t crc32 = 0;
};

// Chunk k is a pure function of (bytes, chunk size, k); nothing is stored, so a
// retransmission simply asks for the same sequence again.
class Chunker {
public:
  Chunker(std::span<const std::byte> payload, std::uint32_t chunk_size) noexcept;

  std::uint32_t chunk_size() const noexcept { return size_; }
  std::uint32_t count() const noexcept { return count_; }

  // Caller guarantees sequence < count().
  Chunk chunk(std::uint32_t sequence) const noexcept;

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Chunk;
    using difference_type = std::ptrdiff_t;

    iterator() = default;
    iterator(const Chunker* c, std::uint32_t seq) noexcept : c_(c), seq_(seq) {}

    Chunk operator*() const noexcept { return c_->chunk(seq_); }
    iterator& operator++() noexcept { ++seq_; return *this; }
    iterator operator++(int) noexcept { auto t = *this; ++seq_; return t; }
    bool operator==(const iterator& o) const noexcept { return seq_ == o.seq_; }

  private:
    const Chunker* c_ = nullptr;
    std::uint32_t seq_ = 0;
  };

  iterator begin() const noexcept { return {this, 0}; }
  iterator from(std::uint32_t sequence) const noexcept { return {this, sequence < count_ ? sequence : count_}; }
  iterator end() const noexcept { return {this, count_}; }

private:
  std::span<const std::byte> data_;
  std::uint32_t size_ = 0;
  std::uint32_t count_ = 0;
};

} // namespace rudel::transfer
