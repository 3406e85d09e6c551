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

#include "core/endian.hpp"
#include "protocol/transfer/wire.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <vector>

using namespace rudel;
using namespace rudel::transfer;

static int g_pass = 0;
static int g_fail = 0;

template <class T>
static void check_eq(const char* label, T got, T expected) {
  if (got == expected) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static void check(const char* label, bool ok) { check_eq(label, ok, true); }

static std::vector<std::byte> bytes(std::initializer_list<unsigned> v) {
  std::vector<std::byte> out;
  for (unsigned b : v) out.push_back(static_cast<std::byte>(b));
  return out;
}

static Digest sample_digest() {
  Digest d{};
  for (std::size_t i = 0; i < d.size(); ++i) d[i] = static_cast<std::byte>(0xA0 + i);
  return d;
}

// ----- little-endian helpers -----

static void test_store_load_le() {
  std::array<std::byte, 4> buf{};
  core::store_le<std::uint32_t>(buf, 0x04030201u);
  check("store_le_u32_bytes", buf[0] == std::byte{0x01} && buf[1] == std::byte{0x02} &&
                              buf[2] == std::byte{0x03} && buf[3] == std::byte{0x04});
  check_eq("load_le_u32", core::load_le<std::uint32_t>(buf), std::uint32_t{0x04030201});

  const auto two = bytes({0x34, 0x12});
  check_eq("load_le_u16", core::load_le<std::uint16_t>(two), std::uint16_t{0x1234});

  constexpr auto v = core::le_to_host(std::uint32_t{0x12345678});
  check_eq("constexpr_le_to_host", core::host_to_le(v), std::uint32_t{0x12345678});
}

// ----- controller requests -----

static void test_begin_layout() {
  const auto f = encode_begin(1000, sample_digest());
  check_eq("begin_size", f.size(), std::size_t{37});
  check_eq("begin_op", std::to_integer<unsigned>(f[0]), 0x01u);
  check_eq("begin_len", core::load_le<std::uint32_t>(std::span(f).subspan(1, 4)), std::uint32_t{1000});
  check("begin_digest", std::memcmp(f.data() + 5, sample_digest().data(), 32) == 0);

  auto rq = decode_request(f);
  check("begin_decodes", rq.st.ok);
  const auto* b = rq ? std::get_if<request::Begin>(&rq.value) : nullptr;
  check("begin_is_begin", b != nullptr);
  if (b) {
    check_eq("begin_decoded_len", b->total_length, std::uint32_t{1000});
    check("begin_decoded_digest", b->digest == sample_digest());
  }
}

static void test_finalize_layout() {
  const auto f = encode_finalize(0xCAFEBABE);
  check("finalize_bytes", f == bytes({0x02, 0xBE, 0xBA, 0xFE, 0xCA}));
}

static void test_chunk_layout() {
  const auto payload = bytes({0xDE, 0xAD});
  const auto f = encode_chunk(7, 0x11223344, payload);
  check("chunk_bytes", f == bytes({0x07, 0, 0, 0, 0x44, 0x33, 0x22, 0x11, 0xDE, 0xAD}));

  auto c = decode_chunk(f);
  check("chunk_decodes", c.st.ok);
  if (c) {
    check_eq("chunk_seq", c.value.sequence, std::uint32_t{7});
    check_eq("chunk_crc", c.value.crc32, std::uint32_t{0x11223344});
    check_eq("chunk_len", c.value.bytes.size(), std::size_t{2});
  }

  const auto hdr_only = encode_chunk(0, 0, {});
  check_eq("chunk_empty_body", hdr_only.size(), kChunkHeaderSize);
  check("chunk_short", !decode_chunk(bytes({1, 2, 3})).st.ok);
}

// ----- device replies -----

static void test_reply_decoding() {
  auto ok = decode_reply(bytes({0x81, 0xB4, 0x00, 0x78, 0x56, 0x34, 0x12}));
  const auto* bo = ok ? std::get_if<reply::BeginOk>(&ok.value) : nullptr;
  check("begin_ok", bo && bo->chunk_size == 180 && bo->token == 0x12345678u);

  auto rj = decode_reply(bytes({0x82, 0x01}));
  const auto* r = rj ? std::get_if<reply::BeginReject>(&rj.value) : nullptr;
  check("begin_reject", r && r->reason == 1);

  auto ack = decode_reply(bytes({0x83, 0x09, 0, 0, 0}));
  const auto* a = ack ? std::get_if<reply::Ack>(&ack.value) : nullptr;
  check("ack", a && a->sequence == 9);

  auto nack = decode_reply(bytes({0x84, 0x04, 0, 0, 0}));
  const auto* n = nack ? std::get_if<reply::Nack>(&nack.value) : nullptr;
  check("nack", n && n->sequence == 4);

  auto fo = decode_reply(bytes({0x85}));
  const auto* f = fo ? std::get_if<reply::FinalizeOk>(&fo.value) : nullptr;
  check("finalize_ok_bare", f && !f->digest);

  const auto d = sample_digest();
  auto fod = decode_reply(encode_finalize_ok(&d));
  const auto* fd = fod ? std::get_if<reply::FinalizeOk>(&fod.value) : nullptr;
  check("finalize_ok_digest", fd && fd->digest && *fd->digest == d);

  auto ff = decode_reply(encode_finalize_fail(Reason::DigestMismatch));
  const auto* fl = ff ? std::get_if<reply::FinalizeFail>(&ff.value) : nullptr;
  check("finalize_fail", fl && fl->reason == 5);
}

static void test_device_encoders_match_layout() {
  check("enc_begin_ok", encode_begin_ok(180, 0x12345678) == bytes({0x81, 0xB4, 0x00, 0x78, 0x56, 0x34, 0x12}));
  check("enc_ack", encode_ack(0x01020304) == bytes({0x83, 0x04, 0x03, 0x02, 0x01}));
  check("enc_nack", encode_nack(4) == bytes({0x84, 0x04, 0, 0, 0}));
  check("enc_reject", encode_begin_reject(Reason::TooLarge) == bytes({0x82, 0x02}));
  check("enc_finalize_ok_bare", encode_finalize_ok() == bytes({0x85}));
}

static void test_malformed_frames() {
  auto expect_protocol = [](const char* label, std::vector<std::byte> f) {
    auto r = decode_reply(f);
    check(label, !r.st.ok && r.st.code == core::Errc::ProtocolError);
  };
  expect_protocol("empty", {});
  expect_protocol("unknown_op", bytes({0x7F, 0, 0, 0, 0}));
  expect_protocol("request_op_as_reply", bytes({0x01}));
  expect_protocol("short_begin_ok", bytes({0x81, 0xB4, 0x00}));
  expect_protocol("short_ack", bytes({0x83, 0x01}));
  expect_protocol("short_reject", bytes({0x82}));
  expect_protocol("truncated_digest", bytes({0x85, 0x01, 0x02}));

  check("short_begin_request", decode_request(bytes({0x01, 0x10})).st.code == core::Errc::ProtocolError);
  check("unknown_request", decode_request(bytes({0x83, 0, 0, 0, 0})).st.code == core::Errc::ProtocolError);
}

static void test_reason_names() {
  check("reason_busy", reason_name(1) == "busy");
  check("reason_unknown", !reason_name(200).empty());
}

int main() {
  test_store_load_le();
  test_begin_layout();
  test_finalize_layout();
  test_chunk_layout();
  test_reply_decoding();
  test_device_encoders_match_layout();
  test_malformed_frames();
  test_reason_names();

  std::fprintf(stdout, "wire: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
