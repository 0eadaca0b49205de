#ifndef QOOB_HID_TRANSPORT_HPP
#define QOOB_HID_TRANSPORT_HPP

/*
  USB HID transport (hidapi)

  Host -> device frames go out with hid_write(); the device answers through
  feature reports (hid_get_feature_report), never interrupt-in reports, so
  receive() is a feature-report fetch. hidapi gives no timeout for feature
  reports; the kernel's control-transfer timeout applies instead.
*/

#include "qoob.hpp"
#include "protocol_table.hpp"
#include <memory>
#include <string>
#include <vector>

struct hid_device_;

namespace qoob {
namespace hid {

/// Initialises hidapi for its lifetime and shuts it down (hid_exit) after.
/// Must outlive every HidTransport.
class Library {
public:
  Library();
  ~Library();

  Library(const Library&) = delete;
  Library& operator=(const Library&) = delete;

  /// IoError if hid_init failed
  const Error& error() const { return error_; }

private:
  Error error_;
};

/// List HID devices with the given ids. Reads the host's device list only.
/// Sets `error` (IoError) if hidapi cannot be initialised.
std::vector<DeviceCandidate> enumerate(uint16_t vendor_id, uint16_t product_id, Error& error);

class HidTransport : public Transport {
public:
  ~HidTransport() override;

  HidTransport(const HidTransport&) = delete;
  HidTransport& operator=(const HidTransport&) = delete;

  /// Open the single device with these ids.
  /// DeviceNotFound, MultipleDevices, PermissionDenied or Busy on failure.
  static std::unique_ptr<HidTransport> open(uint16_t vendor_id, uint16_t product_id,
                                            uint8_t report_id, Error& error);

  /// Open a device by its OS path (from enumerate())
  static std::unique_ptr<HidTransport> open_path(const std::string& path,
                                                 uint8_t report_id, Error& error);

  Error send(const Frame& frame) override;
  Error receive(Frame& frame, size_t expected_len,
                std::chrono::milliseconds timeout) override;
  void close() override;
  bool is_open() const override { return handle_ != nullptr; }

private:
  HidTransport(hid_device_* handle, uint8_t report_id);

  std::string last_error() const;

  hid_device_* handle_{nullptr};
  uint8_t report_id_{0};
};

/// An opened device together with what discovery knew about it
struct Connection {
  Error error;
  std::unique_ptr<Transport> transport;
  DeviceCandidate candidate;
};

/// Enumerate, select and open a device matching `table`.
/// An empty `path` requires exactly one matching device.
Connection connect(const ProtocolTable& table, const std::string& path = {});

} // namespace hid
} // namespace qoob

#endif // QOOB_HID_TRANSPORT_HPP
