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

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace rudel::posix_common {

namespace {

class SpawnActions {
public:
  SpawnActions() { ok_ = ::posix_spawn_file_actions_init(&fa_) == 0; }
  ~SpawnActions() { if (ok_) ::posix_spawn_file_actions_destroy(&fa_); }

  SpawnActions(const SpawnActions&) = delete;
  SpawnActions& operator=(const SpawnActions&) = delete;

  bool ok() const noexcept { return ok_; }
  posix_spawn_file_actions_t* get() noexcept { return &fa_; }

private:
  posix_spawn_file_actions_t fa_{};
  bool ok_ = false;
};

// Splits the child's combined output into lines for the log.
void pump_lines(const FileHandle& rd, std::string_view tool) {
  std::array<char, 1024> buf{};
  std::string line;
  for (;;) {
    auto n = rd.read_some(buf);
    if (!n) {
      spdlog::warn("[{}] {}", tool, n.st.msg);
      break;
    }
    if (n.value == 0) break;
    for (std::size_t i = 0; i < n.value; ++i) {
      const char c = buf[i];
      if (c == '\n' || c == '\r') {
        if (!line.empty()) spdlog::info("[{}] {}", tool, line);
        line.clear();
      } else {
        line.push_back(c);
      }
    }
  }
  if (!line.empty()) spdlog::info("[{}] {}", tool, line);
}

} // namespace

std::vector<std::string> EspflashProvisioner::command_line(const std::string& serial_port,
                                                           const std::filesystem::path& image) const {
  std::vector<std::string> argv{tool_, "flash", "--port", serial_port};
  argv.insert(argv.end(), extra_.begin(), extra_.end());
  argv.push_back(image.string());
  return argv;
}

core::Status EspflashProvisioner::flash(const std::string& serial_port, const std::filesystem::path& image) noexcept {
  try {
    std::error_code ec;
    if (serial_port.empty()) return core::Status::Fail(core::Errc::InvalidArgument, "no serial port given");
    if (!std::filesystem::is_regular_file(image, ec)) {
      return core::Status::Failf(core::Errc::Io, "firmware image not found: {}", image.string());
    }

    auto pp = FileHandle::pipe();
    if (!pp) return pp.st;
    FileHandle rd = std::move(pp.value.first);
    FileHandle wr = std::move(pp.value.second);

    SpawnActions fa;
    if (!fa.ok()) return core::Status::Fail(core::Errc::Io, "posix_spawn_file_actions_init failed");
    if (::posix_spawn_file_actions_adddup2(fa.get(), wr.get(), STDOUT_FILENO) != 0 ||
        ::posix_spawn_file_actions_adddup2(fa.get(), wr.get(), STDERR_FILENO) != 0) {
      return core::Status::Fail(core::Errc::Io, "cannot redirect child output");
    }

    const auto args = command_line(serial_port, image);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    spdlog::info("Running: {}", fmt::join(args, " "));

    pid_t pid = -1;
    const int rc = ::posix_spawnp(&pid, tool_.c_str(), fa.get(), nullptr, argv.data(), environ);
    if (rc != 0) return core::Status::Failf(core::Errc::Io, "cannot start {}: {}", tool_, std::strerror(rc));

    wr.close();
    pump_lines(rd, tool_);

    int wstatus = 0;
    while (::waitpid(pid, &wstatus, 0) < 0) {
      if (errno != EINTR) return core::Status::Failf(core::Errc::Io, "waitpid: {}", std::strerror(errno));
    }

    if (WIFEXITED(wstatus) && WEXITSTATUS(wstatus) == 0) return core::Status::Ok();
    if (WIFEXITED(wstatus)) return core::Status::Failf("{} exited with status {}", tool_, WEXITSTATUS(wstatus));
    if (WIFSIGNALED(wstatus)) return core::Status::Failf("{} killed by signal {}", tool_, WTERMSIG(wstatus));
    return core::Status::Failf("{} ended abnormally", tool_);
  } catch (const std::exception& e) {
    return core::Status::Failf(core::Errc::Io, "flash: {}", e.what());
  }
}

} // namespace rudel::posix_common
