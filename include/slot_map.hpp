#ifndef QOOB_SLOT_MAP_HPP
#define QOOB_SLOT_MAP_HPP

/*
  Slot map

  The Qoob BIOS stores files at sector boundaries. Each file starts with a
  256-byte header:

    0x00..0x03  magic ("(C) ", "QPIC", "QCFG", "QCHT", "QCHE",
                       "BIN\0", "DOL\0", "ELF\0", "SWIS")
    0x04..0xF7  NUL-terminated description
    0xFC..0xFF  file size, big-endian, header included

  A file occupies ceil(size / sector_size) consecutive sectors. A sector whose
  header reads as all erase value is free.
*/

#include "qoob.hpp"
#include "flash_programmer.hpp"
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace qoob {
namespace slots {

constexpr uint32_t kHeaderSize = 256;

enum class FileType : uint8_t {
  Bios,
  Background,
  Config,
  CheatDb,
  CheatEngine,
  Bin,
  Dol,
  Elf,
  Swiss,
  Unknown
};

const char* file_type_name(FileType type);

class Header {
public:
  /// nullopt if fewer than kHeaderSize bytes are given
  static std::optional<Header> parse(const std::vector<uint8_t>& bytes);

  FileType type() const;
  std::array<uint8_t, 4> magic() const;

  /// Description up to the first NUL, non-printable bytes escaped as \xNN
  std::string description() const;

  uint32_t size() const;

  /// True if every byte equals the erase value
  bool is_blank(uint8_t erase_value) const;

private:
  std::array<uint8_t, kHeaderSize> raw_{};
};

enum class Occupancy : uint8_t {
  Empty,
  Unknown,
  Slot      ///< Part of the file whose header is at SectorState::slot
};

struct SectorState {
  Occupancy occupancy{Occupancy::Unknown};
  uint32_t slot{0};
};

/// Sectors a file of `size` bytes occupies; at least one
uint32_t size_to_sectors(uint32_t size, uint32_t sector_size);

class SlotMap {
public:
  SlotMap() = default;
  explicit SlotMap(const Geometry& geometry);

  /// Classify `sector` from the bytes at its start.
  /// Returns the number of sectors covered (the caller skips them).
  uint32_t inspect(uint32_t sector, const std::vector<uint8_t>& header_bytes);

  const std::vector<SectorState>& sectors() const { return sectors_; }
  const Geometry& geometry() const { return geometry_; }

  /// Header of the file starting at `slot`, or nullptr
  const Header* slot_info(uint32_t slot) const;

  /// First sectors of every recognised file, ascending
  std::vector<uint32_t> slots() const;

  /// Check that `image` is a recognised file that fits at `first_sector`
  /// and that every sector it needs is free
  Error check_destination(uint32_t first_sector, const std::vector<uint8_t>& image) const;

  /// Lowest sector starting `count` consecutive free sectors
  std::optional<uint32_t> find_free(uint32_t count) const;

private:
  Geometry geometry_;
  std::vector<SectorState> sectors_;
  std::map<uint32_t, Header> toc_;
};

struct ScanResult {
  bool ok{false};
  Error error;
  SlotMap map;
  std::vector<std::string> log_messages;
};

/// Read every sector header through the programmer and build the map
ScanResult scan(FlashProgrammer& programmer);

} // namespace slots
} // namespace qoob

#endif // QOOB_SLOT_MAP_HPP
