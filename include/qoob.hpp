#ifndef QOOB_HPP
#define QOOB_HPP

/**
 * @file qoob.hpp
 * @brief Qoob Pro modchip flashing – core types and transport abstraction
 *
 * The Qoob Pro exposes its 2 MiB flash to the host through an undocumented
 * HID protocol recovered from the vendor's Windows flasher. There is no public
 * specification; every constant used by this library comes from captured
 * traffic and is kept in the versioned protocol table (protocol_table.hpp).
 *
 * ============================================================================
 * WIRE OVERVIEW (protocol table qoob_pro_v1)
 * ============================================================================
 *
 * Every transfer is one 65-byte HID report, report id 0:
 *
 *   Host -> device (hid_write):
 *     [0x00] [opcode] [operands ...........................] (zero padded)
 *
 *   Device -> host (get_feature_report):
 *     [0x00] [?] [status / data ...........................]
 *
 * Bulk data (read/write) travels in 63-byte chunks at offset 2 of
 * consecutive reports following the command report.
 *
 * FLASH GEOMETRY:
 * - 32 sectors of 64 KiB (erase granularity), erase value 0xFF
 * - at most 0x8000 bytes per read/write command (page)
 *
 * SESSION RULES:
 * - one request in flight at a time, no pipelining
 * - flash is only reachable while the host holds the bus (Bus command),
 *   which keeps the GameCube off the flash
 *
 * High-level layout:
 * 1) Identifiers and geometry
 * 2) Device description
 * 3) Timing parameters
 * 4) Transport abstraction
 * 5) Byte helpers
 */

#include "qoob_error.hpp"
#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>
#include <chrono>

namespace qoob {

using Frame = std::vector<uint8_t>;

// ============================================================================
// 1) Identifiers and geometry
// ============================================================================

constexpr uint16_t kQoobVendorId  = 0x03eb;  ///< Atmel Corp.
constexpr uint16_t kQoobProductId = 0x0001;  ///< Not listed in usb.ids

/**
 * @brief Flash layout as reported by (or known for) a device
 *
 * Pages are the write/read granularity of one command, sectors the erase
 * granularity. sector_size is always a multiple of page_size.
 */
struct Geometry {
  uint32_t total_size{0};
  uint32_t sector_size{0};
  uint32_t page_size{0};
  uint8_t erase_value{0xFF};

  uint32_t sector_count() const { return sector_size ? total_size / sector_size : 0; }
  uint32_t pages_per_sector() const { return page_size ? sector_size / page_size : 0; }

  /// True if [address, address + length) lies inside the flash
  bool contains(uint32_t address, uint32_t length) const {
    return address <= total_size && length <= total_size - address;
  }

  bool operator==(const Geometry& o) const {
    return total_size == o.total_size && sector_size == o.sector_size &&
           page_size == o.page_size && erase_value == o.erase_value;
  }
  bool operator!=(const Geometry& o) const { return !(*this == o); }
};

// ============================================================================
// 2) Device description
// ============================================================================

/// A device seen on the host bus, before it is opened
struct DeviceCandidate {
  std::string path;          ///< OS device path (e.g. /dev/hidraw3)
  uint16_t vendor_id{0};
  uint16_t product_id{0};
  uint16_t release{0};       ///< bcdDevice
  bool usb{true};            ///< false for HID devices on Bluetooth, I2C or SPI
  std::string manufacturer;
  std::string product;
  std::string serial;
};

/// Result of the identification handshake, cached for the session
struct DeviceInfo {
  uint16_t vendor_id{0};
  uint16_t product_id{0};
  uint16_t protocol_version{0};
  std::string manufacturer;
  std::string product;
  std::string serial;
  std::string path;
  Geometry geometry;
};

// ============================================================================
// 3) Timing parameters
// ============================================================================

/**
 * @brief Deadlines used by the session and the programmer
 *
 * The vendor tool polls the status report back to back; poll_interval
 * of zero keeps that behaviour.
 */
struct Timings {
  std::chrono::milliseconds response{std::chrono::milliseconds(1000)};  ///< Per response frame
  std::chrono::milliseconds poll_interval{std::chrono::milliseconds(0)};
  std::chrono::milliseconds erase{std::chrono::milliseconds(10000)};    ///< One sector erase
  std::chrono::milliseconds bus{std::chrono::milliseconds(2000)};       ///< Bus acquire/release
};

// ============================================================================
// 4) Transport abstraction
// ============================================================================

// Raw frame channel to one device. Blocking; the caller guarantees that no
// two operations overlap on the same transport.
class Transport {
public:
  virtual ~Transport() = default;

  /// Send one complete frame. Fails with IoError or NotConnected.
  virtual Error send(const Frame& frame) = 0;

  /// Receive one frame of expected_len bytes. Fails with Timeout, IoError
  /// or NotConnected.
  virtual Error receive(Frame& frame, size_t expected_len,
                        std::chrono::milliseconds timeout) = 0;

  /// Release the handle. Safe to call more than once.
  virtual void close() = 0;

  virtual bool is_open() const = 0;
};

// ============================================================================
// 5) Byte helpers
// ============================================================================

namespace bytes {
  // write a big-endian integer of `width` bytes at `offset`
  inline void put_be(Frame& f, size_t offset, size_t width, uint32_t value) {
    for (size_t i = 0; i < width; ++i) {
      f[offset + i] = static_cast<uint8_t>(value >> (8 * (width - 1 - i)));
    }
  }
  inline uint32_t get_be(const Frame& f, size_t offset, size_t width) {
    uint32_t v = 0;
    for (size_t i = 0; i < width; ++i) v = (v << 8) | f[offset + i];
    return v;
  }
}

} // namespace qoob

#endif // QOOB_HPP
