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

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace rudel::transfer {

inline constexpr std::string_view kServiceUuid = "7ab30000-6f1d-4c53-9d0e-2a5b1c7d9e10";
inline constexpr std::string_view kControlUuid = "7ab30001-6f1d-4c53-9d0e-2a5b1c7d9e10";
inline constexpr std::string_view kDataUuid    = "7ab30002-6f1d-4c53-9d0e-2a5b1c7d9e10";

inline constexpr std::size_t kDigestSize = 32;
using Digest = std::array<std::byte, kDigestSize>;

enum class Opcode : std::uint8_t {
  // controller -> device (control characteristic)
  Begin        = 0x01,
  Finalize     = 0x02,

  // device -> controller (control characteristic notifications)
  BeginOk      = 0x81,
  BeginReject  = 0x82,
  Ack          = 0x83,
  Nack         = 0x84,
  FinalizeOk   = 0x85,
  FinalizeFail = 0x86,
};

enum class Reason : std::uint8_t {
  Unspecified    = 0,
  Busy           = 1,
  TooLarge       = 2,
  Duplicate      = 3,
  BadToken       = 4,
  DigestMismatch = 5,
  StorageError   = 6,
};

std::string_view reason_name(std::uint8_t r) noexcept;

#pragma pack(push, 1)
struct BeginBox {
  std::uint8_t  op;
  std::uint32_t total_length;
  std::uint8_t  digest[kDigestSize];
};

struct FinalizeBox {
  std::uint8_t  op;
  std::uint32_t token;
};

struct ChunkHeader {
  std::uint32_t sequence;
  std::uint32_t crc32;
};

struct BeginOkBox {
  std::uint8_t  op;
  std::uint16_t chunk_size;
  std::uint32_t token;
};

struct SeqBox {
  std::uint8_t  op;
  std::uint32_t sequence;
};

struct ReasonBox {
  std::uint8_t op;
  std::uint8_t reason;
};
#pragma pack(pop)
static_assert(sizeof(BeginBox) == 37);
static_assert(sizeof(FinalizeBox) == 5);
static_assert(sizeof(ChunkHeader) == 8);
static_assert(sizeof(BeginOkBox) == 7);
static_assert(sizeof(SeqBox) == 5);
static_assert(sizeof(ReasonBox) == 2);

inline constexpr std::size_t kChunkHeaderSize = sizeof(ChunkHeader);

namespace reply {
struct BeginOk      { std::uint16_t chunk_size = 0; std::uint32_t token = 0; };
struct BeginReject  { std::uint8_t reason = 0; };
struct Ack          { std::uint32_t sequence = 0; };
struct Nack         { std::uint32_t sequence = 0; };
struct FinalizeOk   { std::optional<Digest> digest; };
struct FinalizeFail { std::uint8_t reason = 0; };
} // namespace reply

using Reply = std::variant<reply::BeginOk, reply::BeginReject, reply::Ack, reply::Nack,
                           reply::FinalizeOk, reply::FinalizeFail>;

namespace request {
struct Begin    { std::uint32_t total_length = 0; Digest digest{}; };
struct Finalize { std::uint32_t token = 0; };
} // namespace request

using Request = std::variant<request::Begin, request::Finalize>;

struct ChunkFrame {
  std::uint32_t sequence = 0;
  std::uint32_t crc32 = 0;
  std::span<const std::byte> bytes;
};

std::vector<std::byte> encode_begin(std::uint32_t total_length, const Digest& digest);
std::vector<std::byte> encode_finalize(std::uint32_t token);
std::vector<std::byte> encode_chunk(std::uint32_t sequence, std::uint32_t crc32, std::span<const std::byte> bytes);

std::vector<std::byte> encode_begin_ok(std::uint16_t chunk_size, std::uint32_t token);
std::vector<std::byte> encode_begin_reject(Reason r);
std::vector<std::byte> encode_ack(std::uint32_t sequence);
std::vector<std::byte> encode_nack(std::uint32_t sequence);
std::vector<std::byte> encode_finalize_ok(const Digest* device_digest = nullptr);
std::vector<std::byte> encode_finalize_fail(Reason r);

// Controller side.
core::Result<Reply> decode_reply(std::span<const std::byte> frame) noexcept;

// Device side; used by the simulated peripheral.
core::Result<Request> decode_request(std::span<const std::byte> frame) noexcept;
core::Result<ChunkFrame> decode_chunk(std::span<const std::byte> frame) noexcept;

} // namespace rudel::transfer
