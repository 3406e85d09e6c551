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

#include "platform/posix-common/single_instance.hpp"

#include <spdlog/spdlog.h>

namespace rudel::posix_common {

core::Result<SingleInstanceLock> SingleInstanceLock::try_acquire(std::string name) noexcept {
  using R = core::Result<SingleInstanceLock>;

  auto sock = FileHandle::unix_datagram();
  if (!sock) return R::Fail(std::move(sock.st));

  if (auto st = sock.value.bind_abstract(name); !st.ok) return R::Fail(std::move(st));

  spdlog::debug("Holding instance lock '{}'", name);
  return R::Ok(SingleInstanceLock{std::move(sock.value), std::move(name)});
}

} // namespace rudel::posix_common
