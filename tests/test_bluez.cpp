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
#include "platform/linux/bluez_adapter.hpp"

#include <array>
#include <cstddef>
#include <cstdio>
#include <string>

using namespace rudel;
using namespace rudel::bluez;

static int g_pass = 0;
static int g_fail = 0;

static void check(const char* label, bool ok) {
  if (ok) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

template <std::size_t N>
static std::array<std::byte, N> bytes(const unsigned char (&v)[N]) {
  std::array<std::byte, N> out{};
  for (std::size_t i = 0; i < N; ++i) out[i] = static_cast<std::byte>(v[i]);
  return out;
}

static void test_device_path() {
  check("path_upper", device_path("/org/bluez/hci0", "aa:bb:cc:00:11:ff") == "/org/bluez/hci0/dev_AA_BB_CC_00_11_FF");
  check("path_adapter", device_path("/org/bluez/hci1", "AA:BB:CC:DD:EE:FF") == "/org/bluez/hci1/dev_AA_BB_CC_DD_EE_FF");
}

static void test_firmware_marker() {
  const unsigned char text[] = {'v', '1', '.', '4', '.', '2'};
  check("fw_text", firmware_marker(0x02E5, bytes(text)) == "v1.4.2");

  const unsigned char raw[] = {0x01, 0x04, 0x02, 0xFF};
  check("fw_binary", firmware_marker(0x02E5, bytes(raw)) == "02e5:010402ff");

  const unsigned char mixed[] = {'v', '1', 0x00};
  check("fw_nul_is_binary", firmware_marker(0x0059, bytes(mixed)) == "0059:763100");

  check("fw_empty", firmware_marker(0x02E5, {}).empty());
}

int main() {
  test_device_path();
  test_firmware_marker();

  std::fprintf(stdout, "bluez: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
