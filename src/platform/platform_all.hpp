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

#if defined(RUDEL_PLATFORM_LINUX)
  #include "platform/posix-common/espflash_provisioner.hpp"
  #include "platform/posix-common/signal_shield.hpp"
  #include "platform/posix-common/single_instance.hpp"

  #include "platform/linux/bluez_adapter.hpp"

namespace rudel::platform {
using namespace bluez;
using namespace posix_common;
} // namespace rudel::platform

#else
  #error "Unsupported platform"
#endif
