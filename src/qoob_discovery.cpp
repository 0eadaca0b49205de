#include "qoob_discovery.hpp"
#include <sstream>
#include <iomanip>

namespace qoob {
namespace discovery {

std::vector<DeviceCandidate> filter(const std::vector<DeviceCandidate>& all,
                                    const ProtocolTable& table) {
  std::vector<DeviceCandidate> out;
  for (const DeviceCandidate& c : all) {
    if (!c.usb) {
      continue;
    }
    for (const KnownDevice& k : table.known_devices) {
      // The id pair is a generic Atmel one; the strings tell the chip apart
      if (c.vendor_id == k.vendor_id && c.product_id == k.product_id &&
          (k.manufacturer.empty() || c.manufacturer == k.manufacturer) &&
          (k.product.empty() || c.product == k.product)) {
        out.push_back(c);
        break;
      }
    }
  }
  return out;
}

Selection select(const std::vector<DeviceCandidate>& candidates) {
  Selection s;
  if (candidates.empty()) {
    s.error = make_error(ErrorCode::DeviceNotFound, Stage::Discovery);
    return s;
  }
  if (candidates.size() > 1) {
    std::ostringstream oss;
    oss << candidates.size() << " devices, pass a device path:";
    for (const auto& c : candidates) {
      oss << " " << c.path;
    }
    s.error = make_error(ErrorCode::MultipleDevices, Stage::Discovery, oss.str());
    return s;
  }
  s.ok = true;
  s.candidate = candidates.front();
  return s;
}

const KnownDevice* match_known(const ProtocolTable& table, const DeviceCandidate& candidate) {
  for (const KnownDevice& k : table.known_devices) {
    if (k.vendor_id != candidate.vendor_id || k.product_id != candidate.product_id) {
      continue;
    }
    if (!k.manufacturer.empty() && !candidate.manufacturer.empty() &&
        k.manufacturer != candidate.manufacturer) {
      continue;
    }
    if (!k.product.empty() && !candidate.product.empty() && k.product != candidate.product) {
      continue;
    }
    return &k;
  }
  return nullptr;
}

namespace {

std::string version_string(uint16_t v) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(4) << std::setfill('0') << v;
  return oss.str();
}

IdentifyResult unsupported(const std::string& why) {
  IdentifyResult r;
  r.error = make_error(ErrorCode::UnsupportedDevice, Stage::Identify, why);
  return r;
}

// Identify-phase errors: a malformed reply means we are not talking to the
// protocol we expect.
IdentifyResult from_exchange_error(Error e) {
  IdentifyResult r;
  if (e.code == ErrorCode::ChecksumInvalid) {
    e.detail = "identify response checksum invalid";
    e.code = ErrorCode::ProtocolMismatch;
  } else if (e.code == ErrorCode::IoError && e.transferred) {
    e.detail = "identify response length invalid (" + e.detail + ")";
    e.code = ErrorCode::ProtocolMismatch;
  }
  e.stage = Stage::Identify;
  r.error = std::move(e);
  return r;
}

} // namespace

IdentifyResult identify(Transport& transport, const Codec& codec,
                        const DeviceCandidate& candidate,
                        std::chrono::milliseconds timeout) {
  const ProtocolTable& table = codec.table();

  const KnownDevice* known = match_known(table, candidate);
  if (!known) {
    return unsupported("no known-good entry for " + candidate.manufacturer + " " +
                       candidate.product);
  }

  IdentifyResult result;
  DeviceInfo& info = result.info;
  info.vendor_id = candidate.vendor_id;
  info.product_id = candidate.product_id;
  info.manufacturer = candidate.manufacturer;
  info.product = candidate.product;
  info.serial = candidate.serial;
  info.path = candidate.path;

  Exchange exchange(transport, codec);

  if (table.supports(Opcode::Identify)) {
    Response rsp = exchange.run(Command::identify(), timeout);
    if (!rsp.ok) {
      return from_exchange_error(std::move(rsp.error));
    }
    const Frame& f = rsp.payload;
    const IdentifyLayout& l = table.identify;
    info.protocol_version = static_cast<uint16_t>(bytes::get_be(f, l.version_offset, 2));
    info.geometry.total_size = bytes::get_be(f, l.total_size_offset, 4);
    info.geometry.sector_size = bytes::get_be(f, l.sector_size_offset, 4);
    info.geometry.page_size = bytes::get_be(f, l.page_size_offset, 4);
    info.geometry.erase_value = f[l.erase_value_offset];

    if (info.geometry != known->geometry) {
      std::ostringstream oss;
      oss << "reported geometry " << info.geometry.total_size << "/"
          << info.geometry.sector_size << "/" << info.geometry.page_size
          << " not in known-good set";
      return unsupported(oss.str());
    }
  } else {
    if (!table.supports(Opcode::Status)) {
      return unsupported("table has neither identify nor status command");
    }
    Response rsp = exchange.run(Command::status(), timeout);
    if (!rsp.ok) {
      return from_exchange_error(std::move(rsp.error));
    }
    info.protocol_version = candidate.release;
    info.geometry = known->geometry;
  }

  if (info.protocol_version < known->min_version || info.protocol_version > known->max_version) {
    return unsupported("protocol version " + version_string(info.protocol_version) +
                       " outside " + version_string(known->min_version) + ".." +
                       version_string(known->max_version));
  }

  result.ok = true;
  return result;
}

} // namespace discovery
} // namespace qoob
