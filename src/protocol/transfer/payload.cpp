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

#include "protocol/transfer/payload.hpp"

#include <fstream>
#include <limits>
#include <system_error>
#include <utility>

#include <blake3.h>
#include <spdlog/spdlog.h>

namespace rudel::transfer {

namespace {

constexpr std::uint64_t kMaxPayload = std::numeric_limits<std::uint32_t>::max();

} // namespace

Digest blake3_digest(std::span<const std::byte> bytes) noexcept {
  blake3_hasher h;
  blake3_hasher_init(&h);
  if (!bytes.empty()) blake3_hasher_update(&h, bytes.data(), bytes.size());

  Digest out{};
  blake3_hasher_finalize(&h, reinterpret_cast<std::uint8_t*>(out.data()), out.size());
  return out;
}

std::string digest_hex(const Digest& d) {
  static constexpr char hex[] = "0123456789abcdef";
  std::string out(d.size() * 2, '0');
  for (std::size_t i = 0; i < d.size(); ++i) {
    const auto b = std::to_integer<unsigned>(d[i]);
    out[2 * i + 0] = hex[(b >> 4) & 0x0F];
    out[2 * i + 1] = hex[b & 0x0F];
  }
  return out;
}

Payload::Payload(std::vector<std::byte> bytes, std::string name)
  : bytes_(std::move(bytes)), digest_(blake3_digest(bytes_)), name_(std::move(name)) {}

std::string Payload::digest_hex() const { return transfer::digest_hex(digest_); }

core::Result<std::shared_ptr<const Payload>> Payload::from_bytes(std::vector<std::byte> bytes, std::string name) noexcept {
  using R = core::Result<std::shared_ptr<const Payload>>;
  if (bytes.size() > kMaxPayload) {
    return R::Failf(core::Errc::InvalidArgument, "{}: {} bytes exceeds the 32-bit transfer length limit", name, bytes.size());
  }
  try {
    return R::Ok(std::shared_ptr<const Payload>(new Payload(std::move(bytes), std::move(name))));
  } catch (const std::bad_alloc&) {
    return R::Fail(core::Errc::Io, "out of memory while loading payload");
  }
}

core::Result<std::shared_ptr<const Payload>> Payload::load(const std::filesystem::path& path) noexcept {
  using R = core::Result<std::shared_ptr<const Payload>>;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) return R::Failf(core::Errc::Io, "payload is not a regular file: {}", path.string());

  const auto sz = std::filesystem::file_size(path, ec);
  if (ec) return R::Failf(core::Errc::Io, "stat failed: {}: {}", path.string(), ec.message());
  if (sz > kMaxPayload) {
    return R::Failf(core::Errc::InvalidArgument, "{}: {} bytes exceeds the 32-bit transfer length limit", path.string(), sz);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) return R::Failf(core::Errc::Io, "cannot open: {}", path.string());

  std::vector<std::byte> buf;
  try {
    buf.resize(static_cast<std::size_t>(sz));
  } catch (const std::bad_alloc&) {
    return R::Failf(core::Errc::Io, "out of memory reading {}", path.string());
  }

  if (!buf.empty()) {
    in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (in.gcount() != static_cast<std::streamsize>(buf.size())) {
      return R::Failf(core::Errc::Io, "short read: {} ({} of {} bytes)", path.string(), in.gcount(), buf.size());
    }
  }

  auto r = from_bytes(std::move(buf), path.filename().string());
  if (r) spdlog::debug("Payload {}: {} bytes, blake3 {}", path.string(), r.value->size(), r.value->digest_hex());
  return r;
}

} // namespace rudel::transfer
