#include "protocol_table.hpp"
#include <sstream>

namespace qoob {

uint8_t compute_checksum(ChecksumKind kind, const uint8_t* begin, const uint8_t* end) {
  uint8_t c = 0;
  switch (kind) {
    case ChecksumKind::Sum8:
      for (const uint8_t* p = begin; p != end; ++p) c = static_cast<uint8_t>(c + *p);
      break;
    case ChecksumKind::Xor8:
      for (const uint8_t* p = begin; p != end; ++p) c ^= *p;
      break;
    case ChecksumKind::None:
    default:
      break;
  }
  return c;
}

const char* opcode_name(Opcode op) {
  switch (op) {
    case Opcode::Reset: return "Reset";
    case Opcode::Erase: return "Erase";
    case Opcode::Write: return "Write";
    case Opcode::Read: return "Read";
    case Opcode::Status: return "Status";
    case Opcode::Bus: return "Bus";
    case Opcode::Identify: return "Identify";
    default: return "Unknown";
  }
}

Error ProtocolTable::validate() const {
  auto fail = [](const std::string& why) {
    return make_error(ErrorCode::ProtocolMismatch, Stage::None, why);
  };

  const size_t body_end = has_checksum() ? checksum_offset() : frame_size;

  if (frame_size < 2 || opcode_offset >= body_end) {
    return fail("frame too small for opcode");
  }
  if (payload_offset + static_cast<size_t>(data_unit) > body_end || data_unit == 0) {
    return fail("data unit does not fit in a frame");
  }
  if (response.data_offset + static_cast<size_t>(data_unit) > body_end) {
    return fail("response data does not fit in a frame");
  }
  if (response.status_offset && *response.status_offset >= body_end) {
    return fail("response status byte outside frame");
  }

  for (size_t i = 0; i < kOpcodeCount; ++i) {
    const CommandLayout& c = commands[i];
    if (!c.supported) continue;
    for (const FieldSpec& f : c.fields) {
      if (f.width == 0 || f.width > 4 || f.offset + static_cast<size_t>(f.width) > body_end) {
        std::ostringstream oss;
        oss << opcode_name(static_cast<Opcode>(i)) << " field at offset "
            << static_cast<int>(f.offset) << " outside frame";
        return fail(oss.str());
      }
    }
  }

  if (!supports(Opcode::Read)) {
    return fail("table has no read command");
  }

  for (const KnownDevice& d : known_devices) {
    const Geometry& g = d.geometry;
    if (g.page_size == 0 || g.sector_size == 0 || g.total_size == 0 ||
        g.sector_size % g.page_size != 0 || g.total_size % g.sector_size != 0 ||
        g.page_size > max_transfer) {
      return fail("inconsistent geometry for " + d.product);
    }
  }
  return Error{};
}

// ================================================================
// Qoob Pro, vendor flasher traffic
// ================================================================

namespace {

ProtocolTable build_qoob_pro_v1() {
  ProtocolTable t;
  t.name = "qoob-pro-hid";
  t.revision = 1;
  t.frame_size = 65;
  t.report_id = 0;
  t.opcode_offset = 1;
  t.payload_offset = 2;
  t.data_unit = 63;
  t.checksum = ChecksumKind::None;
  t.max_transfer = 0x8000;

  auto set = [&t](Opcode op, uint8_t value, std::vector<FieldSpec> fields, ResponseKind rsp) {
    CommandLayout& c = t.commands[static_cast<size_t>(op)];
    c.supported = true;
    c.opcode = value;
    c.fields = std::move(fields);
    c.response = rsp;
  };

  set(Opcode::Reset, 1, {}, ResponseKind::None);
  // The vendor tool writes [3] as a 16-bit value; the sector index is the
  // only part that varies.
  set(Opcode::Erase, 2, {{FieldKind::Sector, 2, 1}, {FieldKind::Zero, 3, 2}}, ResponseKind::None);
  set(Opcode::Write, 3, {{FieldKind::Address, 2, 3}, {FieldKind::Length, 5, 2}}, ResponseKind::None);
  set(Opcode::Read, 4, {{FieldKind::Address, 2, 3}, {FieldKind::Length, 5, 2}}, ResponseKind::Data);
  set(Opcode::Status, 5, {}, ResponseKind::Report);
  set(Opcode::Bus, 8, {{FieldKind::Argument, 3, 1}}, ResponseKind::None);
  // No identify command: the handshake is a status query.

  t.response.data_offset = 2;
  t.response.status_offset.reset();

  t.status.erase_busy_offset = 2;
  t.status.bus_offset = 4;
  t.status.bus_granted = 0;
  t.status.bus_released = 1;
  t.status.bus_busy_mask = 0x02;

  KnownDevice pro;
  pro.vendor_id = kQoobVendorId;
  pro.product_id = kQoobProductId;
  pro.manufacturer = "QooB Team";
  pro.product = "QOOB Chip Pro";
  pro.geometry.total_size = 32 * 64 * 1024;
  pro.geometry.sector_size = 64 * 1024;
  pro.geometry.page_size = 0x8000;
  pro.geometry.erase_value = 0xFF;
  t.known_devices.push_back(pro);

  return t;
}

} // namespace

const ProtocolTable& qoob_pro_v1() {
  static const ProtocolTable table = build_qoob_pro_v1();
  return table;
}

} // namespace qoob
