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

#include "app/interface.hpp"
#include "app/version.hpp"
#include "core/str.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <string_view>

#include <sys/ioctl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rudel::app {

namespace {

// Without a TTY, aggregate progress is logged at most this often.
constexpr auto kLogInterval = std::chrono::seconds(2);
constexpr auto kFrameInterval = std::chrono::milliseconds(33);

enum class Tone { Plain, Dim, Title, Info, Busy, Good, Bad, Header };

std::string_view sgr(Tone t) {
  switch (t) {
    case Tone::Plain:  return "";
    case Tone::Dim:    return "\x1b[2;90m";
    case Tone::Title:  return "\x1b[1;90m";
    case Tone::Info:   return "\x1b[34m";
    case Tone::Busy:   return "\x1b[33m";
    case Tone::Good:   return "\x1b[32m";
    case Tone::Bad:    return "\x1b[31m";
    case Tone::Header: return "\x1b[1;36m";
  }
  return "";
}

bool stdout_is_tty() { return ::isatty(STDOUT_FILENO) == 1; }

bool locale_is_utf8() {
  for (const char* var : {"LC_ALL", "LC_CTYPE", "LANG"}) {
    const char* v = std::getenv(var);
    if (!v || !*v) continue;
    const auto l = core::to_lower(v);
    return l.find("utf-8") != std::string::npos || l.find("utf8") != std::string::npos;
  }
  return false;
}

struct Extent {
  int rows = 24;
  int cols = 80;
};

Extent terminal_extent() {
  winsize ws{};
  if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0 || !ws.ws_col) return {};
  return {ws.ws_row, ws.ws_col};
}

std::string human_bytes(std::uint64_t n) {
  static constexpr std::string_view units[] = {"B", "KB", "MB", "GB"};
  if (n < 1024) return fmt::format("{}B", n);
  double v = static_cast<double>(n);
  std::size_t u = 0;
  while (v >= 1024.0 && u + 1 < std::size(units)) { v /= 1024.0; ++u; }
  return v >= 10.0 ? fmt::format("{:.1f}{}", v, units[u]) : fmt::format("{:.2f}{}", v, units[u]);
}

std::string human_rate(double bytes_per_sec) {
  return bytes_per_sec < 1.0 ? std::string("0B/s") : human_bytes(static_cast<std::uint64_t>(bytes_per_sec)) + "/s";
}

// Column-aware text cell. Counts one column per UTF-8 code point when the
// terminal speaks UTF-8, one per byte otherwise.
class Cells {
public:
  explicit Cells(bool utf8) : utf8_(utf8) {}

  std::size_t width(std::string_view s) const {
    if (!utf8_) return s.size();
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(),
                                                  [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
  }

  std::string fit(std::string_view s, std::size_t cols) const {
    if (!cols) return {};
    if (width(s) <= cols) return std::string(s);
    const std::string_view ellipsis = utf8_ ? "…" : "...";
    const std::size_t ell_w = utf8_ ? 1 : 3;
    if (cols <= ell_w) return std::string(s.substr(0, prefix_bytes_(s, cols)));
    return std::string(s.substr(0, prefix_bytes_(s, cols - ell_w))) + std::string(ellipsis);
  }

  std::string left(std::string_view s, std::size_t cols) const {
    auto f = fit(s, cols);
    f.append(cols - std::min(cols, width(f)), ' ');
    return f;
  }

  std::string right(std::string_view s, std::size_t cols) const {
    auto f = fit(s, cols);
    return std::string(cols - std::min(cols, width(f)), ' ') + f;
  }

  std::string bar(double frac, std::size_t cols) const {
    const auto filled = static_cast<std::size_t>(std::llround(std::clamp(frac, 0.0, 1.0) * static_cast<double>(cols)));
    std::string out;
    for (std::size_t i = 0; i < cols; ++i) {
      if (utf8_) out += i < filled ? "█" : "░";
      else out += i < filled ? '=' : '-';
    }
    return out;
  }

private:
  std::size_t prefix_bytes_(std::string_view s, std::size_t cols) const {
    if (!utf8_) return std::min(cols, s.size());
    std::size_t seen = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
      if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) continue;
      if (seen == cols) return i;
      ++seen;
    }
    return s.size();
  }

  bool utf8_;
};

} // namespace

FleetInterface::FleetInterface(bool is_tty_enabled) {
  if (is_tty_enabled && stdout_is_tty()) {
    tty_ = true;
    const char* no_color = std::getenv("NO_COLOR");
    color_ = !(no_color && *no_color);
    utf8_ = locale_is_utf8();
  }
  start_ = last_rate_ts_ = last_redraw_ = std::chrono::steady_clock::now();

  // Alternate screen, cursor hidden.
  if (tty_) { std::fputs("\x1b[?1049h\x1b[?25l", stdout); std::fflush(stdout); }
}

FleetInterface::~FleetInterface() {
  std::string last;
  bool fatal = false;
  {
    std::lock_guard lk(mtx_);
    last = status_line_;
    fatal = fatal_;
  }

  if (tty_) { std::fputs("\x1b[?25h\x1b[?1049l", stdout); std::fflush(stdout); }
  if (!last.empty()) fmt::print(fatal ? stderr : stdout, "{}\n", last);
}

void FleetInterface::stage(std::string stage) {
  std::lock_guard lk(mtx_);
  stage_ = std::move(stage);
  if (!tty_) spdlog::info("{}", stage_);
  redraw_(true);
}

void FleetInterface::discovered(const core::Device& dev) {
  std::lock_guard lk(mtx_);
  ++seen_;
  if (!tty_) spdlog::info("Found {}", dev.describe());
  redraw_(false);
}

void FleetInterface::plan(const std::vector<core::Device>& devices, std::uint32_t payload_size) {
  std::lock_guard lk(mtx_);
  rows_.assign(devices.size(), Row{});
  for (std::size_t i = 0; i < devices.size(); ++i) rows_[i].device = devices[i];
  payload_size_ = payload_size;

  last_rate_ts_ = std::chrono::steady_clock::now();
  last_rate_bytes_ = 0;
  ema_rate_bps_ = 0.0;

  if (!tty_) spdlog::info("Pushing {} to {} device(s)", human_bytes(payload_size_), rows_.size());
  redraw_(true);
}

void FleetInterface::session(std::size_t index, const transfer::SessionState& st) {
  std::lock_guard lk(mtx_);
  if (index >= rows_.size()) return;
  auto& r = rows_[index];

  const std::string_view phase = transfer::phase_name(st.phase);
  const bool changed = phase != r.phase;

  r.phase = phase;
  r.acked = transfer::acked_bytes(st.progress, payload_size_);
  r.retransmits = st.progress.retransmits;
  if (transfer::is_active(st.phase)) r.state = RowState::Live;

  if (!tty_ && changed) spdlog::info("[{}] {}", r.device.address, phase);

  sample_rate_(tally_().acked);
  redraw_(changed);
}

void FleetInterface::retry(std::size_t index, unsigned attempt, std::chrono::milliseconds wait, const std::string& detail) {
  std::lock_guard lk(mtx_);
  if (index >= rows_.size()) return;
  auto& r = rows_[index];
  r.state = RowState::Retry;
  r.phase = fmt::format("retry {} in {}ms", attempt, wait.count());
  r.acked = 0;
  r.detail = detail;
  if (!tty_) spdlog::warn("[{}] {}; retry {} in {}ms", r.device.address, detail, attempt, wait.count());
  redraw_(true);
}

void FleetInterface::outcome(const transfer::JobOutcome& o) {
  std::lock_guard lk(mtx_);
  if (o.index >= rows_.size()) return;
  auto& r = rows_[o.index];
  r.state = o.ok ? RowState::Done : RowState::Failed;
  r.phase = o.ok ? "Complete" : std::string(core::errc_name(o.code));
  r.acked = o.bytes_acked;
  r.retransmits = o.retransmits;
  r.detail = o.reason;
  redraw_(true);
}

void FleetInterface::notice(std::string msg) {
  std::lock_guard lk(mtx_);
  notice_line_ = std::move(msg);
  if (!tty_) spdlog::warn("{}", notice_line_);
  redraw_(true);
}

void FleetInterface::fail(std::string msg) {
  std::lock_guard lk(mtx_);
  fatal_ = true;
  status_line_ = std::move(msg);
  redraw_(true);
}

void FleetInterface::done(std::string msg) {
  std::lock_guard lk(mtx_);
  fatal_ = false;
  status_line_ = std::move(msg);
  redraw_(true);
}

FleetInterface::Tally FleetInterface::tally_() const {
  Tally t;
  for (const auto& r : rows_) {
    t.ok += r.state == RowState::Done;
    t.failed += r.state == RowState::Failed;
    t.live += r.state == RowState::Live;
    t.acked += r.acked;
  }
  t.total = static_cast<std::uint64_t>(payload_size_) * rows_.size();
  return t;
}

// Smoothed fleet throughput; a retry rewinds a row, so the sum can shrink.
void FleetInterface::sample_rate_(std::uint64_t total_acked) {
  const auto now = std::chrono::steady_clock::now();
  if (total_acked < last_rate_bytes_) {
    last_rate_bytes_ = total_acked;
    last_rate_ts_ = now;
    return;
  }
  const double dt = std::chrono::duration<double>(now - last_rate_ts_).count();
  if (dt < 0.2) return;

  const double inst = static_cast<double>(total_acked - last_rate_bytes_) / dt;
  ema_rate_bps_ = ema_rate_bps_ > 0.0 ? 0.9 * ema_rate_bps_ + 0.1 * inst : inst;
  last_rate_ts_ = now;
  last_rate_bytes_ = total_acked;
}

void FleetInterface::redraw_(bool force) {
  const auto now = std::chrono::steady_clock::now();
  const auto t = tally_();

  if (!tty_) {
    if (rows_.empty() || now - last_redraw_ < kLogInterval) return;
    last_redraw_ = now;
    log_progress_(t);
    return;
  }

  if (!force && now - last_redraw_ < kFrameInterval) return;
  last_redraw_ = now;
  paint_(t);
}

void FleetInterface::log_progress_(const Tally& t) {
  spdlog::info("Fleet: {} done, {} failed, {} live of {}  {}/{}  {}", t.ok, t.failed, t.live, rows_.size(),
               human_bytes(t.acked), human_bytes(t.total), human_rate(ema_rate_bps_));
}

void FleetInterface::paint_(const Tally& t) {
  const Extent ext = terminal_extent();
  const auto cols = static_cast<std::size_t>(std::max(60, ext.cols));
  const int rows = std::max(12, ext.rows);
  const Cells cells(utf8_);

  fmt::memory_buffer out;
  fmt::format_to(std::back_inserter(out), "\x1b[H\x1b[J");
  int used = 0;

  auto line = [&](Tone tone, std::string_view text) {
    const auto fitted = cells.fit(text, cols);
    if (color_ && tone != Tone::Plain) fmt::format_to(std::back_inserter(out), "{}{}\x1b[0m\n", sgr(tone), fitted);
    else fmt::format_to(std::back_inserter(out), "{}\n", fitted);
    ++used;
  };

  line(Tone::Title, "rudelctl v" + version_string());

  std::string stage = fmt::format("Stage: {}", stage_.empty() ? "-" : stage_);
  if (rows_.empty() && !fatal_) {
    static constexpr char spin[] = {'|', '/', '-', '\\'};
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_).count();
    stage += fmt::format("  seen {}  {}", seen_, spin[(ms / 120) % 4]);
  }
  line(Tone::Info, stage);

  {
    const double frac = t.total ? static_cast<double>(t.acked) / static_cast<double>(t.total) : 0.0;
    const auto head = fmt::format("Fleet: {:3}% ", static_cast<int>(frac * 100.0));
    const auto tail = fmt::format("  {}/{}  {}  ok {} fail {} live {}", human_bytes(t.acked), human_bytes(t.total),
                                  human_rate(ema_rate_bps_), t.ok, t.failed, t.live);
    const std::size_t text_w = cells.width(head) + cells.width(tail);
    const std::size_t bar_w = text_w + 10 < cols ? cols - text_w : 10;
    line(fatal_ || t.failed ? Tone::Bad : (t.total ? Tone::Good : Tone::Dim), head + cells.bar(frac, bar_w) + tail);
  }

  if (!notice_line_.empty()) line(Tone::Dim, notice_line_);
  if (!status_line_.empty()) line(fatal_ ? Tone::Bad : Tone::Good, status_line_);

  const int room = rows - used - 1;
  if (room > 1 && !rows_.empty()) {
    // Narrow terminals drop the bar first, then the name.
    const bool show_bar = cols >= 100;
    const bool show_name = cols >= 80;

    auto table_row = [&](std::string_view st, std::string_view addr, std::string_view name, std::string_view state,
                         std::string_view bar, std::string_view bytes, std::string_view retx) {
      std::string l = cells.left(st, 4) + " " + cells.left(addr, 17) + " ";
      if (show_name) l += cells.left(name, 14) + " ";
      l += cells.left(state, 20) + " ";
      if (show_bar) l += cells.left(bar, 12) + " ";
      return l + cells.right(bytes, 18) + " " + cells.right(retx, 5);
    };

    line(Tone::Header, table_row("STAT", "ADDRESS", "NAME", "STATE", "", "BYTES", "RETX"));

    const std::size_t fits = static_cast<std::size_t>(std::max(1, room - 1));
    const std::size_t shown = std::min(rows_.size(), fits);
    for (std::size_t i = 0; i < shown; ++i) {
      const auto& r = rows_[i];
      Tone tone = Tone::Dim;
      std::string_view tag = "WAIT";
      switch (r.state) {
        case RowState::Wait:   break;
        case RowState::Live:   tone = Tone::Busy; tag = "LIVE"; break;
        case RowState::Retry:  tone = Tone::Busy; tag = "RTRY"; break;
        case RowState::Done:   tone = Tone::Good; tag = "DONE"; break;
        case RowState::Failed: tone = Tone::Bad;  tag = "FAIL"; break;
      }
      const double frac = payload_size_ ? static_cast<double>(r.acked) / payload_size_ : 0.0;
      const std::string state = r.state == RowState::Failed && !r.detail.empty() ? r.phase + ": " + r.detail : r.phase;
      line(tone, table_row(tag, r.device.address, r.device.name, state, cells.bar(frac, 12),
                           human_bytes(r.acked) + "/" + human_bytes(payload_size_), fmt::to_string(r.retransmits)));
    }
    if (rows_.size() > shown) line(Tone::Dim, fmt::format("{} more not shown", rows_.size() - shown));
  }

  std::fwrite(out.data(), 1, out.size(), stdout);
  std::fflush(stdout);
}

} // namespace rudel::app
