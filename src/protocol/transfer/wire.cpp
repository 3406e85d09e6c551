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

#include "protocol/transfer/wire.hpp"

#include "core/endian.hpp"

#include <cstring>

namespace rudel::transfer {

namespace {

using core::host_to_le;
using core::le_to_host;

template <class Box>
std::vector<std::byte> box_bytes(const Box& b) {
  const auto raw = std::as_bytes(std::span{&b, 1});
  return {raw.begin(), raw.end()};
}

template <class Box>
Box read_box(std::span<const std::byte> frame) noexcept {
  Box b{};
  std::memcpy(&b, frame.data(), sizeof(Box));
  return b;
}

constexpr std::uint8_t op_u8(Opcode op) noexcept { return static_cast<std::uint8_t>(op); }

core::Status short_frame(std::string_view what, std::size_t got, std::size_t need) {
  return core::Status::Failf(core::Errc::ProtocolError, "{} frame too short ({} < {} bytes)", what, got, need);
}

} // namespace

std::string_view reason_name(std::uint8_t r) noexcept {
  switch (static_cast<Reason>(r)) {
    case Reason::Unspecified:    return "unspecified";
    case Reason::Busy:           return "busy";
    case Reason::TooLarge:       return "payload too large";
    case Reason::Duplicate:      return "duplicate or stale";
    case Reason::BadToken:       return "bad token";
    case Reason::DigestMismatch: return "digest mismatch";
    case Reason::StorageError:   return "storage error";
  }
  return "unknown";
}

std::vector<std::byte> encode_begin(std::uint32_t total_length, const Digest& digest) {
  BeginBox b{};
  b.op = op_u8(Opcode::Begin);
  b.total_length = host_to_le(total_length);
  std::memcpy(b.digest, digest.data(), kDigestSize);
  return box_bytes(b);
}

std::vector<std::byte> encode_finalize(std::uint32_t token) {
  FinalizeBox b{};
  b.op = op_u8(Opcode::Finalize);
  b.token = host_to_le(token);
  return box_bytes(b);
}

std::vector<std::byte> encode_chunk(std::uint32_t sequence, std::uint32_t crc32, std::span<const std::byte> bytes) {
  ChunkHeader h{};
  h.sequence = host_to_le(sequence);
  h.crc32 = host_to_le(crc32);

  std::vector<std::byte> out(kChunkHeaderSize + bytes.size());
  std::memcpy(out.data(), &h, kChunkHeaderSize);
  if (!bytes.empty()) std::memcpy(out.data() + kChunkHeaderSize, bytes.data(), bytes.size());
  return out;
}

std::vector<std::byte> encode_begin_ok(std::uint16_t chunk_size, std::uint32_t token) {
  BeginOkBox b{};
  b.op = op_u8(Opcode::BeginOk);
  b.chunk_size = host_to_le(chunk_size);
  b.token = host_to_le(token);
  return box_bytes(b);
}

std::vector<std::byte> encode_begin_reject(Reason r) {
  return box_bytes(ReasonBox{op_u8(Opcode::BeginReject), static_cast<std::uint8_t>(r)});
}

std::vector<std::byte> encode_ack(std::uint32_t sequence) {
  return box_bytes(SeqBox{op_u8(Opcode::Ack), host_to_le(sequence)});
}

std::vector<std::byte> encode_nack(std::uint32_t sequence) {
  return box_bytes(SeqBox{op_u8(Opcode::Nack), host_to_le(sequence)});
}

std::vector<std::byte> encode_finalize_ok(const Digest* device_digest) {
  std::vector<std::byte> out{std::byte{op_u8(Opcode::FinalizeOk)}};
  if (device_digest) out.insert(out.end(), device_digest->begin(), device_digest->end());
  return out;
}

std::vector<std::byte> encode_finalize_fail(Reason r) {
  return box_bytes(ReasonBox{op_u8(Opcode::FinalizeFail), static_cast<std::uint8_t>(r)});
}

core::Result<Reply> decode_reply(std::span<const std::byte> frame) noexcept {
  using R = core::Result<Reply>;
  if (frame.empty()) return R::Fail(core::Errc::ProtocolError, "empty control frame");

  const auto op = static_cast<Opcode>(std::to_integer<std::uint8_t>(frame[0]));
  switch (op) {
    case Opcode::BeginOk: {
      if (frame.size() < sizeof(BeginOkBox)) return R::Fail(short_frame("BEGIN_OK", frame.size(), sizeof(BeginOkBox)));
      const auto b = read_box<BeginOkBox>(frame);
      return R::Ok(reply::BeginOk{le_to_host(b.chunk_size), le_to_host(b.token)});
    }
    case Opcode::BeginReject: {
      if (frame.size() < sizeof(ReasonBox)) return R::Fail(short_frame("BEGIN_REJECT", frame.size(), sizeof(ReasonBox)));
      return R::Ok(reply::BeginReject{read_box<ReasonBox>(frame).reason});
    }
    case Opcode::Ack: {
      if (frame.size() < sizeof(SeqBox)) return R::Fail(short_frame("ACK", frame.size(), sizeof(SeqBox)));
      return R::Ok(reply::Ack{le_to_host(read_box<SeqBox>(frame).sequence)});
    }
    case Opcode::Nack: {
      if (frame.size() < sizeof(SeqBox)) return R::Fail(short_frame("NACK", frame.size(), sizeof(SeqBox)));
      return R::Ok(reply::Nack{le_to_host(read_box<SeqBox>(frame).sequence)});
    }
    case Opcode::FinalizeOk: {
      reply::FinalizeOk ok;
      if (frame.size() == 1) return R::Ok(std::move(ok));
      if (frame.size() < 1 + kDigestSize) return R::Fail(short_frame("FINALIZE_OK", frame.size(), 1 + kDigestSize));
      Digest d{};
      std::memcpy(d.data(), frame.data() + 1, kDigestSize);
      ok.digest = d;
      return R::Ok(std::move(ok));
    }
    case Opcode::FinalizeFail: {
      if (frame.size() < sizeof(ReasonBox)) return R::Fail(short_frame("FINALIZE_FAIL", frame.size(), sizeof(ReasonBox)));
      return R::Ok(reply::FinalizeFail{read_box<ReasonBox>(frame).reason});
    }
    default:
      break;
  }
  return R::Failf(core::Errc::ProtocolError, "unknown control opcode 0x{:02x}", std::to_integer<unsigned>(frame[0]));
}

core::Result<Request> decode_request(std::span<const std::byte> frame) noexcept {
  using R = core::Result<Request>;
  if (frame.empty()) return R::Fail(core::Errc::ProtocolError, "empty control frame");

  const auto op = static_cast<Opcode>(std::to_integer<std::uint8_t>(frame[0]));
  if (op == Opcode::Begin) {
    if (frame.size() < sizeof(BeginBox)) return R::Fail(short_frame("BEGIN", frame.size(), sizeof(BeginBox)));
    const auto b = read_box<BeginBox>(frame);
    request::Begin rq;
    rq.total_length = le_to_host(b.total_length);
    std::memcpy(rq.digest.data(), b.digest, kDigestSize);
    return R::Ok(rq);
  }
  if (op == Opcode::Finalize) {
    if (frame.size() < sizeof(FinalizeBox)) return R::Fail(short_frame("FINALIZE", frame.size(), sizeof(FinalizeBox)));
    return R::Ok(request::Finalize{le_to_host(read_box<FinalizeBox>(frame).token)});
  }
  return R::Failf(core::Errc::ProtocolError, "unknown request opcode 0x{:02x}", std::to_integer<unsigned>(frame[0]));
}

core::Result<ChunkFrame> decode_chunk(std::span<const std::byte> frame) noexcept {
  using R = core::Result<ChunkFrame>;
  if (frame.size() < kChunkHeaderSize) return R::Fail(short_frame("CHUNK", frame.size(), kChunkHeaderSize));

  const auto h = read_box<ChunkHeader>(frame);
  ChunkFrame c;
  c.sequence = le_to_host(h.sequence);
  c.crc32 = le_to_host(h.crc32);
  c.bytes = frame.subspan(kChunkHeaderSize);
  return R::Ok(c);
}

} // namespace rudel::transfer
