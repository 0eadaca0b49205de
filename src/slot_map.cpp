#include "slot_map.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace qoob {
namespace slots {

namespace {

struct MagicEntry {
  char magic[4];
  FileType type;
};

const MagicEntry kMagics[] = {
  {{'(', 'C', ')', ' '}, FileType::Bios},
  {{'Q', 'P', 'I', 'C'}, FileType::Background},
  {{'Q', 'C', 'F', 'G'}, FileType::Config},
  {{'Q', 'C', 'H', 'T'}, FileType::CheatDb},
  {{'Q', 'C', 'H', 'E'}, FileType::CheatEngine},
  {{'B', 'I', 'N', '\0'}, FileType::Bin},
  {{'D', 'O', 'L', '\0'}, FileType::Dol},
  {{'E', 'L', 'F', '\0'}, FileType::Elf},
  {{'S', 'W', 'I', 'S'}, FileType::Swiss},
};

constexpr size_t kDescriptionBegin = 0x04;
constexpr size_t kDescriptionEnd = 0xF8;
constexpr size_t kSizeOffset = 0xFC;

} // namespace

const char* file_type_name(FileType type) {
  switch (type) {
    case FileType::Bios: return "BIOS";
    case FileType::Background: return "Background";
    case FileType::Config: return "Config";
    case FileType::CheatDb: return "Cheat database";
    case FileType::CheatEngine: return "Cheat engine";
    case FileType::Bin: return "BIN";
    case FileType::Dol: return "DOL";
    case FileType::Elf: return "ELF";
    case FileType::Swiss: return "Swiss";
    default: return "Unknown";
  }
}

// ================================================================
// Header
// ================================================================

std::optional<Header> Header::parse(const std::vector<uint8_t>& bytes) {
  if (bytes.size() < kHeaderSize) {
    return std::nullopt;
  }
  Header h;
  std::copy(bytes.begin(), bytes.begin() + kHeaderSize, h.raw_.begin());
  return h;
}

std::array<uint8_t, 4> Header::magic() const {
  return {raw_[0], raw_[1], raw_[2], raw_[3]};
}

FileType Header::type() const {
  for (const auto& entry : kMagics) {
    if (std::memcmp(entry.magic, raw_.data(), 4) == 0) {
      return entry.type;
    }
  }
  return FileType::Unknown;
}

std::string Header::description() const {
  std::ostringstream oss;
  for (size_t i = kDescriptionBegin; i < kDescriptionEnd && raw_[i] != 0; ++i) {
    const uint8_t c = raw_[i];
    if (c >= 0x20 && c < 0x7F) {
      oss << static_cast<char>(c);
    } else {
      oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
          << std::dec;
    }
  }
  return oss.str();
}

uint32_t Header::size() const {
  return (static_cast<uint32_t>(raw_[kSizeOffset]) << 24) |
         (static_cast<uint32_t>(raw_[kSizeOffset + 1]) << 16) |
         (static_cast<uint32_t>(raw_[kSizeOffset + 2]) << 8) |
         static_cast<uint32_t>(raw_[kSizeOffset + 3]);
}

bool Header::is_blank(uint8_t erase_value) const {
  return std::all_of(raw_.begin(), raw_.end(), [&](uint8_t b) { return b == erase_value; });
}

uint32_t size_to_sectors(uint32_t size, uint32_t sector_size) {
  if (sector_size == 0) {
    return 0;
  }
  const uint32_t count = size / sector_size + (size % sector_size ? 1 : 0);
  return std::max<uint32_t>(1, count);
}

// ================================================================
// SlotMap
// ================================================================

SlotMap::SlotMap(const Geometry& geometry)
  : geometry_(geometry),
    sectors_(geometry.sector_count()) {}

uint32_t SlotMap::inspect(uint32_t sector, const std::vector<uint8_t>& header_bytes) {
  if (sector >= sectors_.size()) {
    return 1;
  }
  toc_.erase(sector);

  auto header = Header::parse(header_bytes);
  if (!header) {
    sectors_[sector] = SectorState{Occupancy::Unknown, 0};
    return 1;
  }
  if (header->is_blank(geometry_.erase_value)) {
    sectors_[sector] = SectorState{Occupancy::Empty, 0};
    return 1;
  }

  const uint32_t span = size_to_sectors(header->size(), geometry_.sector_size);
  const uint32_t remaining = static_cast<uint32_t>(sectors_.size()) - sector;
  if (header->type() == FileType::Unknown || span > remaining) {
    sectors_[sector] = SectorState{Occupancy::Unknown, 0};
    return 1;
  }

  for (uint32_t i = sector; i < sector + span; ++i) {
    sectors_[i] = SectorState{Occupancy::Slot, sector};
  }
  toc_.emplace(sector, *header);
  return span;
}

const Header* SlotMap::slot_info(uint32_t slot) const {
  auto it = toc_.find(slot);
  return it == toc_.end() ? nullptr : &it->second;
}

std::vector<uint32_t> SlotMap::slots() const {
  std::vector<uint32_t> out;
  for (const auto& entry : toc_) {
    out.push_back(entry.first);
  }
  return out;
}

Error SlotMap::check_destination(uint32_t first_sector, const std::vector<uint8_t>& image) const {
  auto header = Header::parse(image);
  if (!header || header->type() == FileType::Unknown) {
    return make_error(ErrorCode::InvalidHeader, Stage::Write, "image has no recognised file header");
  }

  const uint32_t count = static_cast<uint32_t>(sectors_.size());
  if (first_sector >= count) {
    Error err = make_error(ErrorCode::OutOfRange, Stage::Write,
                           "no sector " + std::to_string(first_sector));
    err.sector = first_sector;
    return err;
  }

  const uint32_t needed = size_to_sectors(static_cast<uint32_t>(image.size()), geometry_.sector_size);
  if (image.size() > geometry_.total_size || needed > count - first_sector) {
    Error err = make_error(ErrorCode::TooBig, Stage::Write,
                           std::to_string(needed) + " sectors needed, " +
                           std::to_string(count - first_sector) + " available");
    err.sector = first_sector;
    err.address = first_sector * geometry_.sector_size;
    return err;
  }

  for (uint32_t i = first_sector; i < first_sector + needed; ++i) {
    if (sectors_[i].occupancy != Occupancy::Empty) {
      Error err = make_error(ErrorCode::RangeOccupied, Stage::Write,
                             "sector " + std::to_string(i) + " is in use");
      err.sector = i;
      err.address = i * geometry_.sector_size;
      return err;
    }
  }
  return Error{};
}

std::optional<uint32_t> SlotMap::find_free(uint32_t count) const {
  if (count == 0) {
    return std::nullopt;
  }
  uint32_t run = 0;
  for (uint32_t i = 0; i < sectors_.size(); ++i) {
    run = (sectors_[i].occupancy == Occupancy::Empty) ? run + 1 : 0;
    if (run == count) {
      return i + 1 - count;
    }
  }
  return std::nullopt;
}

// ================================================================
// Scan
// ================================================================

ScanResult scan(FlashProgrammer& programmer) {
  ScanResult result;

  Error err = programmer.identify();
  if (err) {
    result.error = err;
    return result;
  }

  const Geometry geometry = programmer.session().info().geometry;
  result.map = SlotMap(geometry);

  uint32_t cursor = 0;
  while (cursor < geometry.sector_count()) {
    OperationResult header = programmer.read(cursor * geometry.sector_size, kHeaderSize);
    if (!header.success) {
      result.error = header.error;
      result.error.sector = cursor;
      result.log_messages.push_back("Scan stopped at sector " + std::to_string(cursor) + ": " +
                                    ErrorInterpreter::format(header.error));
      return result;
    }
    cursor += result.map.inspect(cursor, header.data);
  }

  result.log_messages.push_back("Scanned " + std::to_string(geometry.sector_count()) +
                                " sectors, " + std::to_string(result.map.slots().size()) +
                                " files");
  result.ok = true;
  return result;
}

} // namespace slots
} // namespace qoob
