#include "hid_transport.hpp"
#include "qoob_discovery.hpp"
#include <hidapi.h>
#include <cerrno>
#include <cwchar>

namespace qoob {
namespace hid {

namespace {

std::string narrow(const wchar_t* wide) {
  std::string out;
  if (!wide) {
    return out;
  }
  for (; *wide; ++wide) {
    // USB string descriptors of this device are plain ASCII
    out.push_back(*wide < 0x80 ? static_cast<char>(*wide) : '?');
  }
  return out;
}

// hidapi's hidraw backend leaves errno from the failed open() call
Error open_error(const std::string& what) {
  switch (errno) {
    case EACCES:
    case EPERM:
      return make_error(ErrorCode::PermissionDenied, Stage::Discovery,
                        what + ": permission denied (is the udev rule installed?)");
    case EBUSY:
      return make_error(ErrorCode::Busy, Stage::Discovery, what + ": device busy");
    default:
      return make_error(ErrorCode::DeviceNotFound, Stage::Discovery, what + ": cannot open");
  }
}

bool init_hidapi(Error& error) {
  if (hid_init() != 0) {
    error = make_error(ErrorCode::IoError, Stage::Discovery, "hid_init failed");
    return false;
  }
  return true;
}

} // namespace

// ================================================================
// Enumeration
// ================================================================

Library::Library() {
  if (init_hidapi(error_)) {
    error_ = Error{};
  }
}

Library::~Library() {
  if (error_.ok()) {
    hid_exit();
  }
}

std::vector<DeviceCandidate> enumerate(uint16_t vendor_id, uint16_t product_id, Error& error) {
  std::vector<DeviceCandidate> out;
  if (!init_hidapi(error)) {
    return out;
  }
  error = Error{};

  hid_device_info* devs = hid_enumerate(vendor_id, product_id);
  for (hid_device_info* cur = devs; cur; cur = cur->next) {
    DeviceCandidate c;
    c.path = cur->path ? cur->path : "";
    c.vendor_id = cur->vendor_id;
    c.product_id = cur->product_id;
    c.release = cur->release_number;
    c.manufacturer = narrow(cur->manufacturer_string);
    c.product = narrow(cur->product_string);
    c.serial = narrow(cur->serial_number);
#if defined(HID_API_VERSION) && HID_API_VERSION >= HID_API_MAKE_VERSION(0, 13, 0)
    c.usb = cur->bus_type == HID_API_BUS_USB;
#endif
    out.push_back(std::move(c));
  }
  hid_free_enumeration(devs);
  return out;
}

// ================================================================
// HidTransport
// ================================================================

HidTransport::HidTransport(hid_device_* handle, uint8_t report_id)
  : handle_(handle), report_id_(report_id) {}

HidTransport::~HidTransport() {
  close();
}

std::unique_ptr<HidTransport> HidTransport::open(uint16_t vendor_id, uint16_t product_id,
                                                 uint8_t report_id, Error& error) {
  auto candidates = enumerate(vendor_id, product_id, error);
  if (error) {
    return nullptr;
  }
  auto selected = discovery::select(candidates);
  if (!selected.ok) {
    error = selected.error;
    return nullptr;
  }
  return open_path(selected.candidate.path, report_id, error);
}

std::unique_ptr<HidTransport> HidTransport::open_path(const std::string& path,
                                                      uint8_t report_id, Error& error) {
  if (!init_hidapi(error)) {
    return nullptr;
  }

  errno = 0;
  hid_device* handle = hid_open_path(path.c_str());
  if (!handle) {
    error = open_error(path);
    return nullptr;
  }
  error = Error{};
  return std::unique_ptr<HidTransport>(new HidTransport(handle, report_id));
}

std::string HidTransport::last_error() const {
  return handle_ ? narrow(hid_error(handle_)) : std::string();
}

Error HidTransport::send(const Frame& frame) {
  if (!handle_) {
    return make_error(ErrorCode::NotConnected);
  }

  int res = hid_write(handle_, frame.data(), frame.size());
  if (res < 0) {
    return make_error(ErrorCode::IoError, Stage::None, "hid_write: " + last_error());
  }
  if (static_cast<size_t>(res) != frame.size()) {
    return short_transfer(static_cast<size_t>(res), frame.size());
  }
  return Error{};
}

Error HidTransport::receive(Frame& frame, size_t expected_len,
                            std::chrono::milliseconds /*timeout*/) {
  if (!handle_) {
    return make_error(ErrorCode::NotConnected);
  }

  frame.assign(expected_len, 0x00);
  if (!frame.empty()) {
    frame[0] = report_id_;
  }

  int res = hid_get_feature_report(handle_, frame.data(), frame.size());
  if (res < 0) {
    // hidraw reports an expired control transfer as ETIMEDOUT
    if (errno == ETIMEDOUT) {
      return make_error(ErrorCode::Timeout, Stage::None, "feature report timed out");
    }
    return make_error(ErrorCode::IoError, Stage::None, "hid_get_feature_report: " + last_error());
  }
  if (static_cast<size_t>(res) != expected_len) {
    frame.resize(static_cast<size_t>(res));
    return short_transfer(static_cast<size_t>(res), expected_len);
  }
  return Error{};
}

void HidTransport::close() {
  if (handle_) {
    hid_close(handle_);
    handle_ = nullptr;
  }
}

// ================================================================
// connect
// ================================================================

Connection connect(const ProtocolTable& table, const std::string& path) {
  Connection conn;

  std::vector<DeviceCandidate> all;
  for (const KnownDevice& known : table.known_devices) {
    auto found = enumerate(known.vendor_id, known.product_id, conn.error);
    if (conn.error) {
      return conn;
    }
    all.insert(all.end(), found.begin(), found.end());
  }
  auto candidates = discovery::filter(all, table);

  if (!path.empty()) {
    conn.candidate.path = path;
    for (const auto& c : candidates) {
      if (c.path == path) {
        conn.candidate = c;
        break;
      }
    }
  } else {
    auto selected = discovery::select(candidates);
    if (!selected.ok) {
      conn.error = selected.error;
      return conn;
    }
    conn.candidate = selected.candidate;
  }

  auto transport = HidTransport::open_path(conn.candidate.path, table.report_id.value_or(0),
                                           conn.error);
  if (transport) {
    conn.transport = std::move(transport);
  }
  return conn;
}

} // namespace hid
} // namespace qoob
