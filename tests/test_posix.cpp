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

#include "platform/posix-common/espflash_provisioner.hpp"
#include "platform/posix-common/filehandle.hpp"
#include "platform/posix-common/single_instance.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <unistd.h>

using namespace rudel;
using namespace rudel::posix_common;

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

static std::filesystem::path temp_image() {
  auto p = std::filesystem::temp_directory_path() / fmt::format("rudel_posix_{}.img", ::getpid());
  std::ofstream(p, std::ios::binary) << "image";
  return p;
}

static void test_instance_lock() {
  const auto name = fmt::format("rudelctl-test-{}", ::getpid());

  auto first = SingleInstanceLock::try_acquire(name);
  check("lock_first", first.st.ok && first.value.held() && first.value.name() == name);

  auto second = SingleInstanceLock::try_acquire(name);
  check("lock_second_refused", !second.st.ok && second.st.code == core::Errc::Generic);

  {
    SingleInstanceLock moved = std::move(first.value);
    check("lock_moved", moved.held());
  }
  auto third = SingleInstanceLock::try_acquire(name);
  check("lock_released", third.st.ok);

  check("lock_bad_name", SingleInstanceLock::try_acquire("").st.code == core::Errc::InvalidArgument);
  check("adapter_lock_name", SingleInstanceLock::name_for_adapter("hci1") == "rudelctl-hci1");
}

static void test_pipe() {
  auto p = FileHandle::pipe();
  check("pipe_ok", p.st.ok && p.value.first.valid() && p.value.second.valid());

  const char msg[] = "hello";
  check("pipe_write", ::write(p.value.second.get(), msg, 5) == 5);
  p.value.second.close();

  char buf[16] = {};
  auto n = p.value.first.read_some(buf);
  check("pipe_read", n.st.ok && n.value == 5 && std::string(buf, 5) == "hello");
  auto eof = p.value.first.read_some(buf);
  check("pipe_eof", eof.st.ok && eof.value == 0);
}

static void test_espflash_command_line() {
  EspflashProvisioner prov("espflash", {"--baud", "921600"});
  const auto argv = prov.command_line("/dev/ttyACM0", "fw.bin");
  const std::vector<std::string> want{"espflash", "flash", "--port", "/dev/ttyACM0", "--baud", "921600", "fw.bin"};
  check("espflash_argv", argv == want);
}

static void test_espflash_errors() {
  const auto img = temp_image();

  EspflashProvisioner prov("espflash");
  check("espflash_no_port", prov.flash("", img).code == core::Errc::InvalidArgument);
  check("espflash_no_image", prov.flash("/dev/ttyACM0", "/nonexistent/rudel.img").code == core::Errc::Io);

  EspflashProvisioner missing("rudel-no-such-tool-xyz");
  check("espflash_missing_tool", !missing.flash("/dev/ttyACM0", img).ok);

  // Stand-in tools: the exit status decides the outcome.
  EspflashProvisioner ok_tool("true");
  check("tool_exit_zero", ok_tool.flash("/dev/ttyACM0", img).ok);
  EspflashProvisioner bad_tool("false");
  check("tool_exit_nonzero", !bad_tool.flash("/dev/ttyACM0", img).ok);

  std::error_code ec;
  std::filesystem::remove(img, ec);
}

int main() {
  test_instance_lock();
  test_pipe();
  test_espflash_command_line();
  test_espflash_errors();

  std::fprintf(stdout, "posix: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
