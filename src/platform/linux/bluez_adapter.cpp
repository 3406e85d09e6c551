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
#include "core/str.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <deque>
#include <optional>
#include <set>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <systemd/sd-bus.h>

namespace rudel::bluez {

void BusDeleter::operator()(sd_bus* b) const noexcept {
  if (b) sd_bus_flush_close_unref(b);
}

namespace {

constexpr const char* kBluez = "org.bluez";
constexpr const char* kAdapterIface = "org.bluez.Adapter1";
constexpr const char* kDeviceIface = "org.bluez.Device1";
constexpr const char* kCharIface = "org.bluez.GattCharacteristic1";
constexpr const char* kPropsIface = "org.freedesktop.DBus.Properties";
constexpr const char* kObjMgrIface = "org.freedesktop.DBus.ObjectManager";

// ATT_MTU 23 minus the 3 byte write header.
constexpr std::size_t kDefaultMaxWrite = 20;

constexpr auto kPollSlice = std::chrono::milliseconds(100);
constexpr auto kScanRefresh = std::chrono::milliseconds(250);

struct MsgDeleter {
  void operator()(sd_bus_message* m) const noexcept { sd_bus_message_unref(m); }
};
using MsgPtr = std::unique_ptr<sd_bus_message, MsgDeleter>;

struct SlotDeleter {
  void operator()(sd_bus_slot* s) const noexcept { sd_bus_slot_unref(s); }
};
using SlotPtr = std::unique_ptr<sd_bus_slot, SlotDeleter>;

class BusError {
public:
  BusError() = default;
  ~BusError() { sd_bus_error_free(&err_); }

  BusError(const BusError&) = delete;
  BusError& operator=(const BusError&) = delete;

  sd_bus_error* get() noexcept { return &err_; }

  bool is(const char* name) const noexcept { return sd_bus_error_has_name(&err_, name); }

  std::string describe(int r) const {
    if (err_.message) return err_.message;
    if (err_.name) return err_.name;
    return std::strerror(-r);
  }

private:
  sd_bus_error err_ = SD_BUS_ERROR_NULL;
};

std::uint64_t usec(std::chrono::milliseconds ms) noexcept {
  return ms.count() <= 0 ? 1 : static_cast<std::uint64_t>(ms.count()) * 1000u;
}

// Subset of BlueZ properties this tool reads. Unknown keys are skipped.
struct Props {
  std::optional<std::string> address;
  std::optional<std::string> name;
  std::optional<std::string> alias;
  std::optional<std::int16_t> rssi;
  std::optional<std::string> uuid;
  std::vector<std::string> uuids;
  std::optional<std::uint16_t> mtu;
  std::optional<bool> connected;
  std::optional<bool> services_resolved;
  std::optional<std::vector<std::byte>> value;
  std::string firmware;
};

struct ManagedObject {
  std::string path;
  std::string iface;
  Props props;
};

int read_string_variant(sd_bus_message* m, const char* contents, std::optional<std::string>& out) {
  int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, contents);
  if (r < 0) return r;
  const char* s = nullptr;
  r = sd_bus_message_read(m, "s", &s);
  if (r < 0) return r;
  out = s ? s : "";
  return sd_bus_message_exit_container(m);
}

// Reads one `{sv}` entry body (key already consumed).
int read_prop(sd_bus_message* m, std::string_view key, Props& p) {
  char type = 0;
  const char* contents = nullptr;
  int r = sd_bus_message_peek_type(m, &type, &contents);
  if (r < 0) return r;
  const std::string_view sig = contents ? contents : "";

  if (sig == "s") {
    if (key == "Address") return read_string_variant(m, contents, p.address);
    if (key == "Name") return read_string_variant(m, contents, p.name);
    if (key == "Alias") return read_string_variant(m, contents, p.alias);
    if (key == "UUID") return read_string_variant(m, contents, p.uuid);
  }

  if (sig == "n" && key == "RSSI") {
    std::int16_t v = 0;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, contents)) < 0) return r;
    if ((r = sd_bus_message_read(m, "n", &v)) < 0) return r;
    p.rssi = v;
    return sd_bus_message_exit_container(m);
  }

  if (sig == "q" && key == "MTU") {
    std::uint16_t v = 0;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, contents)) < 0) return r;
    if ((r = sd_bus_message_read(m, "q", &v)) < 0) return r;
    p.mtu = v;
    return sd_bus_message_exit_container(m);
  }

  if (sig == "b" && (key == "Connected" || key == "ServicesResolved")) {
    int v = 0;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, contents)) < 0) return r;
    if ((r = sd_bus_message_read(m, "b", &v)) < 0) return r;
    (key == "Connected" ? p.connected : p.services_resolved) = (v != 0);
    return sd_bus_message_exit_container(m);
  }

  if (sig == "as" && key == "UUIDs") {
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, contents)) < 0) return r;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s")) < 0) return r;
    const char* s = nullptr;
    while ((r = sd_bus_message_read(m, "s", &s)) > 0) p.uuids.emplace_back(s);
    if (r < 0) return r;
    if ((r = sd_bus_message_exit_container(m)) < 0) return r;
    return sd_bus_message_exit_container(m);
  }

  if (sig == "ay" && key == "Value") {
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, contents)) < 0) return r;
    const void* data = nullptr;
    std::size_t len = 0;
    if ((r = sd_bus_message_read_array(m, 'y', &data, &len)) < 0) return r;
    const auto* b = static_cast<const std::byte*>(data);
    p.value = std::vector<std::byte>(b, b + len);
    return sd_bus_message_exit_container(m);
  }

  if (sig == "a{qv}" && key == "ManufacturerData") {
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, contents)) < 0) return r;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{qv}")) < 0) return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "qv")) > 0) {
      std::uint16_t company = 0;
      if ((r = sd_bus_message_read(m, "q", &company)) < 0) return r;

      const char* inner = nullptr;
      if ((r = sd_bus_message_peek_type(m, nullptr, &inner)) < 0) return r;
      if (inner && std::string_view(inner) == "ay") {
        if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay")) < 0) return r;
        const void* data = nullptr;
        std::size_t len = 0;
        if ((r = sd_bus_message_read_array(m, 'y', &data, &len)) < 0) return r;
        // First entry wins; devices advertise a single one.
        if (p.firmware.empty()) p.firmware = firmware_marker(company, {static_cast<const std::byte*>(data), len});
        if ((r = sd_bus_message_exit_container(m)) < 0) return r;
      } else if ((r = sd_bus_message_skip(m, "v")) < 0) {
        return r;
      }
      if ((r = sd_bus_message_exit_container(m)) < 0) return r;
    }
    if (r < 0) return r;
    if ((r = sd_bus_message_exit_container(m)) < 0) return r;
    return sd_bus_message_exit_container(m);
  }

  return sd_bus_message_skip(m, "v");
}

// a{sv}
int read_prop_dict(sd_bus_message* m, Props& p) {
  int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
  if (r < 0) return r;
  while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0) {
    const char* key = nullptr;
    if ((r = sd_bus_message_read(m, "s", &key)) < 0) return r;
    if ((r = read_prop(m, key, p)) < 0) return r;
    if ((r = sd_bus_message_exit_container(m)) < 0) return r;
  }
  if (r < 0) return r;
  return sd_bus_message_exit_container(m);
}

core::Result<std::vector<ManagedObject>> managed_objects(sd_bus* bus, std::string_view path_prefix) {
  using R = core::Result<std::vector<ManagedObject>>;
  BusError err;
  sd_bus_message* raw = nullptr;
  int r = sd_bus_call_method(bus, kBluez, "/", kObjMgrIface, "GetManagedObjects", err.get(), &raw, "");
  MsgPtr reply{raw};
  if (r < 0) return R::Failf(core::Errc::AdapterUnavailable, "GetManagedObjects: {}", err.describe(r));

  std::vector<ManagedObject> out;
  auto bad = [&](int rc) { return R::Failf(core::Errc::ProtocolError, "GetManagedObjects reply: {}", std::strerror(-rc)); };

  sd_bus_message* m = reply.get();
  if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}")) < 0) return bad(r);
  while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0) {
    const char* path = nullptr;
    if ((r = sd_bus_message_read(m, "o", &path)) < 0) return bad(r);
    const std::string_view pv = path ? path : "";

    if (pv.substr(0, path_prefix.size()) != path_prefix) {
      if ((r = sd_bus_message_skip(m, "a{sa{sv}}")) < 0) return bad(r);
      if ((r = sd_bus_message_exit_container(m)) < 0) return bad(r);
      continue;
    }

    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0) return bad(r);
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0) {
      const char* iface = nullptr;
      if ((r = sd_bus_message_read(m, "s", &iface)) < 0) return bad(r);
      const std::string_view iv = iface ? iface : "";
      if (iv == kDeviceIface || iv == kCharIface) {
        ManagedObject obj{std::string(pv), std::string(iv), {}};
        if ((r = read_prop_dict(m, obj.props)) < 0) return bad(r);
        out.push_back(std::move(obj));
      } else {
        if ((r = sd_bus_message_skip(m, "a{sv}")) < 0) return bad(r);
      }
      if ((r = sd_bus_message_exit_container(m)) < 0) return bad(r);
    }
    if (r < 0) return bad(r);
    if ((r = sd_bus_message_exit_container(m)) < 0) return bad(r);
    if ((r = sd_bus_message_exit_container(m)) < 0) return bad(r);
  }
  if (r < 0) return bad(r);
  if ((r = sd_bus_message_exit_container(m)) < 0) return bad(r);

  return R::Ok(std::move(out));
}

core::Result<BusPtr> open_system_bus() {
  sd_bus* raw = nullptr;
  const int r = sd_bus_open_system(&raw);
  if (r < 0) {
    return core::Result<BusPtr>::Failf(core::Errc::AdapterUnavailable, "cannot open system bus: {}", std::strerror(-r));
  }
  return core::Result<BusPtr>::Ok(BusPtr{raw});
}

class BluezLink final : public core::ILink {
public:
  BluezLink(BusPtr bus, std::string device_path, BluezCfg cfg)
    : bus_(std::move(bus)), device_path_(std::move(device_path)), cfg_(std::move(cfg)) {}

  ~BluezLink() override { teardown_(); }

  BluezLink(const BluezLink&) = delete;
  BluezLink& operator=(const BluezLink&) = delete;

  core::Status open(std::chrono::steady_clock::time_point deadline) {
    sd_bus_slot* slot = nullptr;
    int r = sd_bus_match_signal(bus_.get(), &slot, kBluez, nullptr, kPropsIface, "PropertiesChanged",
                                &BluezLink::on_properties_changed, this);
    if (r < 0) return core::Status::Failf(core::Errc::Io, "PropertiesChanged match: {}", std::strerror(-r));
    match_.reset(slot);

    {
      BusError err;
      sd_bus_message* raw_call = nullptr;
      r = sd_bus_message_new_method_call(bus_.get(), &raw_call, kBluez, device_path_.c_str(), kDeviceIface, "Connect");
      MsgPtr call{raw_call};
      if (r < 0) return core::Status::Failf(core::Errc::Io, "Connect: {}", std::strerror(-r));

      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      sd_bus_message* raw_reply = nullptr;
      r = sd_bus_call(bus_.get(), call.get(), usec(left), err.get(), &raw_reply);
      MsgPtr reply{raw_reply};
      if (r < 0) {
        if (err.is("org.bluez.Error.NotReady")) {
          return core::Status::Failf(core::Errc::AdapterUnavailable, "adapter not ready: {}", err.describe(r));
        }
        if (!err.is("org.bluez.Error.AlreadyConnected")) {
          return core::Status::Failf(core::Errc::ConnectTimeout, "connect: {}", err.describe(r));
        }
      }
    }
    connected_ = true;

    // GATT objects appear only after service discovery.
    for (;;) {
      BusError err;
      int resolved = 0;
      r = sd_bus_get_property_trivial(bus_.get(), kBluez, device_path_.c_str(), kDeviceIface, "ServicesResolved",
                                      err.get(), 'b', &resolved);
      if (r >= 0 && resolved) break;
      if (std::chrono::steady_clock::now() >= deadline) {
        return core::Status::Fail(core::Errc::ConnectTimeout, "services not resolved in time");
      }
      std::this_thread::sleep_for(kPollSlice);
    }

    auto objs = managed_objects(bus_.get(), device_path_ + "/");
    if (!objs) return objs.st;

    std::optional<std::uint16_t> mtu;
    for (const auto& o : objs.value) {
      if (o.iface != kCharIface || !o.props.uuid) continue;
      if (core::eq_ci(*o.props.uuid, cfg_.control_uuid)) {
        control_path_ = o.path;
        if (o.props.mtu) mtu = o.props.mtu;
      } else if (core::eq_ci(*o.props.uuid, cfg_.data_uuid)) {
        data_path_ = o.path;
        if (o.props.mtu) mtu = o.props.mtu;
      }
    }
    if (control_path_.empty() || data_path_.empty()) {
      return core::Status::Fail(core::Errc::ProtocolError, "transfer characteristics not found");
    }
    if (mtu && *mtu > 3) max_write_ = static_cast<std::size_t>(*mtu) - 3;

    BusError err;
    r = sd_bus_call_method(bus_.get(), kBluez, control_path_.c_str(), kCharIface, "StartNotify", err.get(), nullptr, "");
    if (r < 0) return core::Status::Failf(core::Errc::LinkDropped, "StartNotify: {}", err.describe(r));
    notifying_ = true;

    spdlog::debug("{}: linked, control={} data={} max_write={}", device_path_, control_path_, data_path_, max_write_);
    return core::Status::Ok();
  }

  std::size_t max_write() const noexcept override { return max_write_; }

  core::Status write(core::Characteristic c, std::span<const std::byte> data) noexcept override {
    if (!connected_) return core::Status::Fail(core::Errc::LinkDropped, "link is down");

    const bool control = c == core::Characteristic::Control;
    const std::string& path = control ? control_path_ : data_path_;

    sd_bus_message* raw_call = nullptr;
    int r = sd_bus_message_new_method_call(bus_.get(), &raw_call, kBluez, path.c_str(), kCharIface, "WriteValue");
    MsgPtr call{raw_call};
    if (r >= 0) r = sd_bus_message_append_array(call.get(), 'y', data.data(), data.size());
    if (r >= 0) r = sd_bus_message_open_container(call.get(), SD_BUS_TYPE_ARRAY, "{sv}");
    if (r >= 0) r = sd_bus_message_append(call.get(), "{sv}", "type", "s", control ? "request" : "command");
    if (r >= 0) r = sd_bus_message_append(call.get(), "{sv}", "offset", "q", std::uint16_t{0});
    if (r >= 0) r = sd_bus_message_close_container(call.get());
    if (r < 0) return core::Status::Failf(core::Errc::Io, "WriteValue: {}", std::strerror(-r));

    BusError err;
    sd_bus_message* raw_reply = nullptr;
    r = sd_bus_call(bus_.get(), call.get(), usec(cfg_.write_timeout), err.get(), &raw_reply);
    MsgPtr reply{raw_reply};
    if (r < 0) {
      connected_ = false;
      return core::Status::Failf(core::Errc::LinkDropped, "write failed: {}", err.describe(r));
    }
    return core::Status::Ok();
  }

  core::Result<core::Notification> await_notification(core::Characteristic c, std::chrono::milliseconds timeout) noexcept override {
    using R = core::Result<core::Notification>;
    if (c != core::Characteristic::Control) return R::Fail(core::Errc::InvalidArgument, "only the control characteristic notifies");

    try {
      const auto deadline = std::chrono::steady_clock::now() + timeout;
      for (;;) {
        int r = 0;
        while ((r = sd_bus_process(bus_.get(), nullptr)) > 0) {}
        if (r < 0) {
          connected_ = false;
          return R::Failf(core::Errc::LinkDropped, "bus: {}", std::strerror(-r));
        }

        if (!queue_.empty()) {
          core::Notification n;
          n.bytes = std::move(queue_.front());
          queue_.pop_front();
          return R::Ok(std::move(n));
        }
        if (!connected_) return R::Fail(core::Errc::LinkDropped, "device disconnected");

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return R::Ok(core::Notification{true, {}});

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        r = sd_bus_wait(bus_.get(), usec(left));
        if (r < 0 && r != -EINTR) {
          connected_ = false;
          return R::Failf(core::Errc::LinkDropped, "bus wait: {}", std::strerror(-r));
        }
      }
    } catch (const std::exception& e) {
      return R::Failf(core::Errc::Generic, "notification: {}", e.what());
    }
  }

private:
  static int on_properties_changed(sd_bus_message* m, void* userdata, sd_bus_error*) {
    auto* self = static_cast<BluezLink*>(userdata);
    const char* path = sd_bus_message_get_path(m);
    if (!path) return 0;
    const std::string_view pv = path;

    const char* iface = nullptr;
    if (sd_bus_message_read(m, "s", &iface) < 0 || !iface) return 0;

    Props p;
    if (read_prop_dict(m, p) < 0) {
      spdlog::warn("{}: unreadable PropertiesChanged on {}", self->device_path_, pv);
      return 0;
    }

    if (pv == self->control_path_ && std::string_view(iface) == kCharIface && p.value) {
      self->queue_.push_back(std::move(*p.value));
    } else if (pv == self->device_path_ && std::string_view(iface) == kDeviceIface && p.connected && !*p.connected) {
      spdlog::debug("{}: disconnected by peer", self->device_path_);
      self->connected_ = false;
    }
    return 0;
  }

  void teardown_() noexcept {
    if (!bus_) return;
    if (notifying_) {
      BusError err;
      const int r = sd_bus_call_method(bus_.get(), kBluez, control_path_.c_str(), kCharIface, "StopNotify", err.get(), nullptr, "");
      if (r < 0) spdlog::debug("{}: StopNotify: {}", device_path_, err.describe(r));
    }
    BusError err;
    const int r = sd_bus_call_method(bus_.get(), kBluez, device_path_.c_str(), kDeviceIface, "Disconnect", err.get(), nullptr, "");
    if (r < 0) spdlog::debug("{}: Disconnect: {}", device_path_, err.describe(r));
    match_.reset();
    bus_.reset();
  }

  BusPtr bus_;
  SlotPtr match_;
  std::string device_path_;
  BluezCfg cfg_;

  std::string control_path_;
  std::string data_path_;
  std::size_t max_write_ = kDefaultMaxWrite;

  bool connected_ = false;
  bool notifying_ = false;
  std::deque<std::vector<std::byte>> queue_;
};

} // namespace

std::string device_path(const std::string& adapter_path, const std::string& address) {
  std::string p = adapter_path + "/dev_";
  for (char c : address) p.push_back(c == ':' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  return p;
}

std::string firmware_marker(std::uint16_t company, std::span<const std::byte> data) {
  if (data.empty()) return {};

  const bool text = std::all_of(data.begin(), data.end(), [](std::byte b) {
    const auto c = std::to_integer<unsigned char>(b);
    return c >= 0x20 && c < 0x7F;
  });
  if (text) return std::string(reinterpret_cast<const char*>(data.data()), data.size());

  std::string out = fmt::format("{:04x}:", company);
  for (std::byte b : data) out += fmt::format("{:02x}", std::to_integer<unsigned>(b));
  return out;
}

BluezAdapter::BluezAdapter(BluezCfg cfg, BusPtr bus)
  : cfg_(std::move(cfg)), adapter_path_("/org/bluez/" + cfg_.adapter), bus_(std::move(bus)) {}

core::Result<std::unique_ptr<BluezAdapter>> BluezAdapter::open(BluezCfg cfg) noexcept {
  using R = core::Result<std::unique_ptr<BluezAdapter>>;
  try {
    auto bus = open_system_bus();
    if (!bus) return R::Fail(bus.st);
    std::unique_ptr<BluezAdapter> a{new BluezAdapter(std::move(cfg), std::move(bus.value))};
    if (auto s = a->check_powered_(); !s) return R::Fail(std::move(s));
    return R::Ok(std::move(a));
  } catch (const std::exception& e) {
    return R::Failf(core::Errc::AdapterUnavailable, "bluez: {}", e.what());
  }
}

core::Status BluezAdapter::check_powered_() noexcept {
  BusError err;
  int powered = 0;
  const int r = sd_bus_get_property_trivial(bus_.get(), kBluez, adapter_path_.c_str(), kAdapterIface, "Powered",
                                            err.get(), 'b', &powered);
  if (r < 0) {
    return core::Status::Failf(core::Errc::AdapterUnavailable, "adapter {} not present: {}", cfg_.adapter, err.describe(r));
  }
  if (!powered) return core::Status::Failf(core::Errc::AdapterUnavailable, "adapter {} is powered off", cfg_.adapter);
  return core::Status::Ok();
}

core::Status BluezAdapter::scan(const core::ScanFilter& filter, std::chrono::milliseconds window,
                                const OnDevice& on_device, std::stop_token st) noexcept {
  try {
    std::lock_guard lk(bus_mtx_);
    RUDEL_TRY(check_powered_());

    sd_bus* bus = bus_.get();
    const char* path = adapter_path_.c_str();

    {
      sd_bus_message* raw = nullptr;
      int r = sd_bus_message_new_method_call(bus, &raw, kBluez, path, kAdapterIface, "SetDiscoveryFilter");
      MsgPtr call{raw};
      if (r >= 0) r = sd_bus_message_open_container(call.get(), SD_BUS_TYPE_ARRAY, "{sv}");
      if (r >= 0) r = sd_bus_message_append(call.get(), "{sv}", "Transport", "s", "le");
      if (r >= 0) r = sd_bus_message_append(call.get(), "{sv}", "DuplicateData", "b", 0);
      if (r >= 0 && filter.service_uuid) {
        r = sd_bus_message_open_container(call.get(), SD_BUS_TYPE_DICT_ENTRY, "sv");
        if (r >= 0) r = sd_bus_message_append(call.get(), "s", "UUIDs");
        if (r >= 0) r = sd_bus_message_open_container(call.get(), SD_BUS_TYPE_VARIANT, "as");
        if (r >= 0) r = sd_bus_message_append(call.get(), "as", 1, filter.service_uuid->c_str());
        if (r >= 0) r = sd_bus_message_close_container(call.get());
        if (r >= 0) r = sd_bus_message_close_container(call.get());
      }
      if (r >= 0) r = sd_bus_message_close_container(call.get());
      if (r < 0) return core::Status::Failf(core::Errc::Io, "SetDiscoveryFilter: {}", std::strerror(-r));

      BusError err;
      sd_bus_message* raw_reply = nullptr;
      r = sd_bus_call(bus, call.get(), 0, err.get(), &raw_reply);
      MsgPtr reply{raw_reply};
      if (r < 0) spdlog::warn("SetDiscoveryFilter: {}", err.describe(r));
    }

    {
      BusError err;
      const int r = sd_bus_call_method(bus, kBluez, path, kAdapterIface, "StartDiscovery", err.get(), nullptr, "");
      if (r < 0 && !err.is("org.bluez.Error.InProgress")) {
        return core::Status::Failf(core::Errc::AdapterUnavailable, "StartDiscovery: {}", err.describe(r));
      }
    }

    std::set<std::string> seen;
    core::Status result = core::Status::Ok();
    const auto deadline = std::chrono::steady_clock::now() + window;

    while (!st.stop_requested()) {
      auto objs = managed_objects(bus, adapter_path_ + "/dev_");
      if (!objs) {
        result = objs.st;
        break;
      }

      for (const auto& o : objs.value) {
        // Entries without RSSI are cached from an earlier session, not heard now.
        if (o.iface != kDeviceIface || !o.props.address || !o.props.rssi) continue;
        if (!seen.insert(core::to_lower(*o.props.address)).second) continue;

        core::Device d;
        d.address = *o.props.address;
        d.name = o.props.name ? *o.props.name : (o.props.alias ? *o.props.alias : std::string{});
        d.rssi = *o.props.rssi;
        d.services = o.props.uuids;
        d.firmware = o.props.firmware;
        on_device(d);
      }

      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) break;
      std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kScanRefresh, deadline - now));
    }

    BusError err;
    const int r = sd_bus_call_method(bus, kBluez, path, kAdapterIface, "StopDiscovery", err.get(), nullptr, "");
    if (r < 0) spdlog::debug("StopDiscovery: {}", err.describe(r));

    return result;
  } catch (const std::exception& e) {
    return core::Status::Failf(core::Errc::Generic, "scan: {}", e.what());
  }
}

core::Result<std::unique_ptr<core::ILink>> BluezAdapter::connect(const core::Device& dev, std::chrono::milliseconds timeout) noexcept {
  using R = core::Result<std::unique_ptr<core::ILink>>;
  try {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    auto bus = open_system_bus();
    if (!bus) return R::Fail(bus.st);

    auto link = std::make_unique<BluezLink>(std::move(bus.value), device_path(adapter_path_, dev.address), cfg_);
    if (auto s = link->open(deadline); !s) return R::Fail(std::move(s));
    return R::Ok(std::move(link));
  } catch (const std::exception& e) {
    return R::Failf(core::Errc::Generic, "connect {}: {}", dev.address, e.what());
  }
}

} // namespace rudel::bluez
