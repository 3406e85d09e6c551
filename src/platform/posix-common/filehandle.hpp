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

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <span>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace rudel::posix_common {

// Owning file descriptor. Every syscall wrapper reports errno through Status.
class FileHandle {
public:
  FileHandle() = default;
  explicit FileHandle(int fd) : fd_(fd) {}

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  FileHandle(FileHandle&& o) noexcept : fd_(std::exchange(o.fd_, -1)) {}
  FileHandle& operator=(FileHandle&& o) noexcept {
    if (this != &o) {
      close();
      fd_ = std::exchange(o.fd_, -1);
    }
    return *this;
  }

  ~FileHandle() { close(); }

  void close() noexcept {
    if (fd_ >= 0) ::close(std::exchange(fd_, -1));
  }

  int get() const noexcept { return fd_; }
  bool valid() const noexcept { return fd_ >= 0; }

  // Close-on-exec pipe as {read end, write end}.
  static core::Result<std::pair<FileHandle, FileHandle>> pipe() noexcept {
    using R = core::Result<std::pair<FileHandle, FileHandle>>;
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) return R::Failf(core::Errc::Io, "pipe2: {}", std::strerror(errno));
    return R::Ok({FileHandle{fds[0]}, FileHandle{fds[1]}});
  }

  static core::Result<FileHandle> unix_datagram() noexcept {
    using R = core::Result<FileHandle>;
    const int fd = ::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return R::Failf(core::Errc::Io, "socket(AF_UNIX, SOCK_DGRAM): {}", std::strerror(errno));
    return R::Ok(FileHandle{fd});
  }

  // Binds to "\0<name>" in the abstract namespace. EADDRINUSE comes back as
  // Errc::Generic so callers can tell a held name from a real error.
  core::Status bind_abstract(std::string_view name) const noexcept {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (name.empty() || name.size() + 1 > sizeof(addr.sun_path)) {
      return core::Status::Failf(core::Errc::InvalidArgument, "bad socket name '{}'", name);
    }
    std::memcpy(addr.sun_path + 1, name.data(), name.size());
    const auto len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + 1 + name.size());

    if (::bind(fd_, reinterpret_cast<const sockaddr*>(&addr), len) == 0) return core::Status::Ok();
    if (errno == EADDRINUSE) return core::Status::Failf("'{}' is held by another process", name);
    return core::Status::Failf(core::Errc::Io, "bind '{}': {}", name, std::strerror(errno));
  }

  // Retries EINTR. A zero count is end of file.
  core::Result<std::size_t> read_some(std::span<char> buf) const noexcept {
    using R = core::Result<std::size_t>;
    for (;;) {
      const ssize_t n = ::read(fd_, buf.data(), buf.size());
      if (n >= 0) return R::Ok(static_cast<std::size_t>(n));
      if (errno != EINTR) return R::Failf(core::Errc::Io, "read(fd={}): {}", fd_, std::strerror(errno));
    }
  }

private:
  int fd_ = -1;
};

} // namespace rudel::posix_common
