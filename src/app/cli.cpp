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

#include "app/cli.hpp"
#include "app/version.hpp"
#include "protocol/transfer/wire.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <functional>
#include <cstdint>
#include <limits>
#include <string_view>

namespace rudel::app {

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static core::Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                        std::string_view a, std::string_view opt) noexcept
{
  if (auto ov = opt_value(a, opt)) return core::Result<std::string_view>::Ok(*ov);
  if (i + 1 >= argc) return core::Result<std::string_view>::Fail(core::Errc::InvalidArgument, std::string(opt) + " requires value");
  return core::Result<std::string_view>::Ok(std::string_view(argv[++i]));
}

static core::Result<std::uint64_t> read_uint_value(int& i, int argc, char** argv,
                                                   std::string_view a, std::string_view opt,
                                                   std::uint64_t lo, std::uint64_t hi) noexcept
{
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return core::Result<std::uint64_t>::Fail(std::move(vr.st));

  std::uint64_t v = 0;
  const auto* first = vr.value.data();
  const auto* last = first + vr.value.size();
  const auto [p, ec] = std::from_chars(first, last, v);
  if (ec != std::errc{} || p != last) {
    return core::Result<std::uint64_t>::Failf(core::Errc::InvalidArgument, "{}: not a number: {}", opt, vr.value);
  }
  if (v < lo || v > hi) {
    return core::Result<std::uint64_t>::Failf(core::Errc::InvalidArgument, "{} must be within {}..{}", opt, lo, hi);
  }
  return core::Result<std::uint64_t>::Ok(v);
}

static void split_addresses(std::string_view list, std::vector<std::string>& out) {
  while (!list.empty()) {
    const auto comma = list.find(',');
    const auto item = list.substr(0, comma);
    if (!item.empty()) out.emplace_back(item);
    if (comma == std::string_view::npos) break;
    list.remove_prefix(comma + 1);
  }
}

std::string usage_text() {
  std::string out;
  out.reserve(3072);

  out += "rudelctl v";
  out += rudel::app::version_string();
  out += "\n\n";

  out += R"(Usage:
  rudelctl push <payload> [filter] [transfer options]
  rudelctl scan [filter]
  rudelctl flash --port <tty> <image>

Filter:
  --name <glob>                match advertised name (case-insensitive, * and ?)
  --address <addr>[,<addr>]    only these addresses (repeatable)
  --max-devices <n>            stop after the first n matches in discovery order
  --scan-time <ms>             discovery window (default 5000)

Transfer:
  --window <1..8>              chunks in flight per device (default 1)
  --chunk <16..512>            preferred chunk payload size (default 180)
  --limit <n>                  concurrent connections (default 3)
  --retry-budget <n>           NACKs tolerated per chunk (default 5)
  --connect-timeout <ms>       (default 10000)
  --negotiate-timeout <ms>     (default 5000)
  --ack-timeout <ms>           (default 3000)
  --finalize-timeout <ms>      (default 15000)
  --retries <n>                fresh sessions after a transient failure (default 2)
  --backoff <ms>               first retry delay, doubled per retry (default 500)
  --abort-on-failure           cancel the fleet on the first device failure

Bluetooth:
  --adapter <name>             (default hci0)
  --service <uuid>             transfer service, also used to filter discovery
  --control-uuid <uuid>
  --data-uuid <uuid>

Provisioning:
  --port <tty>                 serial port of the device to flash
  --espflash <path>            espflash binary (default: espflash from PATH)

Options:
  --help, -h
  --version
  --verbose, -v                enable verbose logging
)";
  return out;
}

core::Result<Options> parse_cli(int argc, char** argv) noexcept {
  using R = core::Result<Options>;
  try {
    Options o;
    o.service_uuid = std::string(transfer::kServiceUuid);
    o.control_uuid = std::string(transfer::kControlUuid);
    o.data_uuid = std::string(transfer::kDataUuid);

    constexpr std::uint64_t kMaxMs = 24ull * 3600 * 1000;
    constexpr std::uint64_t kMaxU32 = std::numeric_limits<std::uint32_t>::max();

    auto ms = [](std::uint64_t v) { return std::chrono::milliseconds(static_cast<std::int64_t>(v)); };

    std::vector<std::string_view> positional;

    for (int i = 1; i < argc; ++i) {
      std::string_view a = argv[i];

      if (a == "--help" || a == "-h") { o.help = true; continue; }
      if (a == "--version") { o.version = true; continue; }

      if (a == "--verbose" || a == "-v") {
        o.verbose = true;
        spdlog::set_level(spdlog::level::debug);
        continue;
      }

      if (a == "--abort-on-failure") { o.fleet.abort_on_first_failure = true; continue; }

      if (is_opt(a, "--name")) {
        auto vr = read_string_value(i, argc, argv, a, "--name");
        if (!vr) return R::Fail(std::move(vr.st));
        o.filter.name_glob = std::string(vr.value);
        continue;
      }
      if (is_opt(a, "--address")) {
        auto vr = read_string_value(i, argc, argv, a, "--address");
        if (!vr) return R::Fail(std::move(vr.st));
        split_addresses(vr.value, o.filter.addresses);
        continue;
      }

      struct StrOpt { std::string_view name; std::string* dst; };
      const StrOpt str_opts[] = {
        {"--adapter", &o.adapter},
        {"--service", &o.service_uuid},
        {"--control-uuid", &o.control_uuid},
        {"--data-uuid", &o.data_uuid},
        {"--port", &o.port},
        {"--espflash", &o.espflash_tool},
      };
      bool matched = false;
      for (const auto& so : str_opts) {
        if (!is_opt(a, so.name)) continue;
        auto vr = read_string_value(i, argc, argv, a, so.name);
        if (!vr) return R::Fail(std::move(vr.st));
        if (vr.value.empty()) return R::Failf(core::Errc::InvalidArgument, "{} must not be empty", so.name);
        *so.dst = std::string(vr.value);
        matched = true;
        break;
      }
      if (matched) continue;

      struct NumOpt {
        std::string_view name;
        std::uint64_t lo, hi;
        std::function<void(std::uint64_t)> set;
      };
      const NumOpt num_opts[] = {
        {"--window", 1, 8, [&](std::uint64_t v) { o.fleet.session.window = static_cast<std::uint32_t>(v); }},
        {"--chunk", 16, 512, [&](std::uint64_t v) { o.fleet.session.preferred_chunk = static_cast<std::uint32_t>(v); }},
        {"--limit", 1, 64, [&](std::uint64_t v) { o.fleet.connection_limit = static_cast<std::size_t>(v); }},
        {"--retry-budget", 0, kMaxU32, [&](std::uint64_t v) { o.fleet.session.retry_budget = static_cast<std::uint32_t>(v); }},
        {"--max-devices", 1, kMaxU32, [&](std::uint64_t v) { o.fleet.max_devices = static_cast<std::size_t>(v); }},
        {"--retries", 0, 100, [&](std::uint64_t v) { o.fleet.job_retries = static_cast<unsigned>(v); }},
        {"--scan-time", 100, kMaxMs, [&](std::uint64_t v) { o.fleet.scan_window = ms(v); }},
        {"--backoff", 0, kMaxMs, [&](std::uint64_t v) { o.fleet.retry_backoff = ms(v); }},
        {"--connect-timeout", 1, kMaxMs, [&](std::uint64_t v) { o.fleet.session.connect_timeout = ms(v); }},
        {"--negotiate-timeout", 1, kMaxMs, [&](std::uint64_t v) { o.fleet.session.negotiate_timeout = ms(v); }},
        {"--ack-timeout", 1, kMaxMs, [&](std::uint64_t v) { o.fleet.session.ack_timeout = ms(v); }},
        {"--finalize-timeout", 1, kMaxMs, [&](std::uint64_t v) { o.fleet.session.finalize_timeout = ms(v); }},
      };
      for (const auto& no : num_opts) {
        if (!is_opt(a, no.name)) continue;
        auto vr = read_uint_value(i, argc, argv, a, no.name, no.lo, no.hi);
        if (!vr) return R::Fail(std::move(vr.st));
        no.set(vr.value);
        matched = true;
        break;
      }
      if (matched) continue;

      if (a.size() > 1 && a.starts_with("-")) {
        return R::Fail(core::Errc::InvalidArgument, "Unknown option: " + std::string(a));
      }

      positional.push_back(a);
    }

    if (o.help || o.version) return R::Ok(std::move(o));

    if (positional.empty()) return R::Fail(core::Errc::InvalidArgument, "no command given (push, scan or flash)");

    const std::string_view cmd = positional.front();
    const std::size_t args = positional.size() - 1;

    if (cmd == "push") {
      if (args != 1) return R::Fail(core::Errc::InvalidArgument, "push takes exactly one payload file");
      o.command = Command::Push;
      o.payload = std::filesystem::path(std::string(positional[1]));
    } else if (cmd == "scan") {
      if (args != 0) return R::Fail(core::Errc::InvalidArgument, "scan takes no positional arguments");
      o.command = Command::Scan;
    } else if (cmd == "flash") {
      if (args != 1) return R::Fail(core::Errc::InvalidArgument, "flash takes exactly one image file");
      if (o.port.empty()) return R::Fail(core::Errc::InvalidArgument, "flash requires --port <tty>");
      o.command = Command::Flash;
      o.image = std::filesystem::path(std::string(positional[1]));
    } else {
      return R::Fail(core::Errc::InvalidArgument, "Unknown command: " + std::string(cmd));
    }

    if (o.command != Command::Flash && !o.port.empty()) {
      return R::Fail(core::Errc::InvalidArgument, "--port is only valid with flash");
    }

    o.filter.service_uuid = o.service_uuid;
    return R::Ok(std::move(o));
  } catch (const std::exception& e) {
    return R::Failf(core::Errc::Generic, "argument parsing: {}", e.what());
  }
}

} // namespace rudel::app
