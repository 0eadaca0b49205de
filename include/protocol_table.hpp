#ifndef QOOB_PROTOCOL_TABLE_HPP
#define QOOB_PROTOCOL_TABLE_HPP

/*
  Protocol compatibility table

  Opcode values, operand layouts, checksum function and flash geometry are
  facts about a particular bootloader revision. They live here as data so a
  new hardware revision is supported by supplying a new table, not by adding
  branches to the codec.

  qoob_pro_v1() reproduces the traffic of the vendor flasher:

    opcode  value  operands (offsets within the 65-byte report)
    Reset     1    -
    Erase     2    [2] sector, [3..4] zero
    Write     3    [2..4] address (BE24), [5..6] length (BE16), data reports follow
    Read      4    [2..4] address (BE24), [5..6] length (BE16), data reports follow
    Status    5    -           response: [2] erase busy, [4] bus state
    Bus       8    [3] 1 = acquire, 0 = release
*/

#include "qoob.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace qoob {

// ================================================================
// Logical operations
// ================================================================
enum class Opcode : uint8_t {
  Reset = 0,
  Erase,
  Write,
  Read,
  Status,
  Bus,
  Identify
};

constexpr size_t kOpcodeCount = 7;

// ================================================================
// Checksum functions
// ================================================================
enum class ChecksumKind : uint8_t {
  None,   ///< No checksum byte (qoob_pro_v1)
  Sum8,   ///< Sum of covered bytes modulo 256
  Xor8    ///< XOR of covered bytes
};

/// C(bytes): checksum of [begin, end) under the given function
uint8_t compute_checksum(ChecksumKind kind, const uint8_t* begin, const uint8_t* end);

// ================================================================
// Layout descriptions
// ================================================================

/// What an operand field carries
enum class FieldKind : uint8_t {
  Address,   ///< Command address
  Length,    ///< Byte count (payload size for writes)
  Sector,    ///< Sector index
  Argument,  ///< Opcode-specific argument (bus acquire/release)
  Zero       ///< Reserved, always zero
};

struct FieldSpec {
  FieldKind kind{FieldKind::Zero};
  uint8_t offset{0};
  uint8_t width{1};   ///< Bytes, big-endian
};

/// What the device sends back after a command
enum class ResponseKind : uint8_t {
  None,     ///< Nothing; completion is observed by polling status
  Report,   ///< One raw report (status / identify)
  Ack,      ///< One frame whose status byte must equal status_ok
  Data      ///< ceil(length / data_unit) data frames
};

struct CommandLayout {
  bool supported{false};
  uint8_t opcode{0};
  std::vector<FieldSpec> fields;
  ResponseKind response{ResponseKind::None};
};

struct ResponseLayout {
  uint8_t data_offset{2};               ///< Start of data in Data frames
  std::optional<uint8_t> status_offset; ///< Status byte in Ack/Data frames
  uint8_t status_ok{0x00};
};

/// Bytes of the status report polled for erase completion and bus state
struct StatusLayout {
  uint8_t erase_busy_offset{2};  ///< 0 = idle
  uint8_t bus_offset{4};
  uint8_t bus_granted{0};        ///< Host owns the bus
  uint8_t bus_released{1};       ///< Console owns the bus
  uint8_t bus_busy_mask{0x02};   ///< Bus held elsewhere, acquisition refused
};

/// Fields of an Identify response (big-endian)
struct IdentifyLayout {
  uint8_t version_offset{2};      ///< 2 bytes
  uint8_t total_size_offset{4};   ///< 4 bytes
  uint8_t sector_size_offset{8};  ///< 4 bytes
  uint8_t page_size_offset{12};   ///< 4 bytes
  uint8_t erase_value_offset{16}; ///< 1 byte
};

/// A device revision known to work with this table
struct KnownDevice {
  uint16_t vendor_id{0};
  uint16_t product_id{0};
  std::string manufacturer;   ///< Empty = not checked
  std::string product;        ///< Empty = not checked
  uint16_t min_version{0x0000};
  uint16_t max_version{0xFFFF};
  Geometry geometry;
};

// ================================================================
// Protocol table
// ================================================================
struct ProtocolTable {
  std::string name;
  uint16_t revision{1};

  // Frame layout
  size_t frame_size{65};
  std::optional<uint8_t> report_id{0};  ///< Fixed first byte, if any
  uint8_t opcode_offset{1};
  uint8_t payload_offset{2};            ///< Data start in host->device data frames
  uint8_t data_unit{63};                ///< Data bytes per data frame
  ChecksumKind checksum{ChecksumKind::None};
  uint32_t max_transfer{0x8000};        ///< Largest read/write per command

  std::array<CommandLayout, kOpcodeCount> commands{};
  ResponseLayout response;
  StatusLayout status;
  IdentifyLayout identify;

  std::vector<KnownDevice> known_devices;

  const CommandLayout& command(Opcode op) const {
    return commands[static_cast<size_t>(op)];
  }
  bool supports(Opcode op) const { return command(op).supported; }

  bool has_checksum() const { return checksum != ChecksumKind::None; }

  /// Index of the trailing checksum byte
  size_t checksum_offset() const { return frame_size - 1; }

  /// Bytes covered by the checksum start here (report id excluded)
  size_t checksum_start() const { return report_id ? 1 : 0; }

  /// Structural sanity check: fields inside the frame, data units fit,
  /// known geometries consistent. Returns ProtocolMismatch on failure.
  Error validate() const;
};

/// Table for the Qoob Pro as driven by the vendor flasher
const ProtocolTable& qoob_pro_v1();

/// Human-readable opcode name
const char* opcode_name(Opcode op);

} // namespace qoob

#endif // QOOB_PROTOCOL_TABLE_HPP
