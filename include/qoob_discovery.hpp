#pragma once
/**
 * @file qoob_discovery.hpp
 * @brief Device discovery and the identification handshake
 *
 * Enumeration itself is host-specific (see hid_transport.hpp); the functions
 * here work on the resulting candidate list and on an already-open transport,
 * so they can be exercised without hardware.
 */

#include "qoob.hpp"
#include "qoob_codec.hpp"
#include "protocol_table.hpp"
#include <vector>

namespace qoob {
namespace discovery {

/// Keep only USB candidates whose ids and manufacturer/product strings
/// match a known device exactly. Pure; never touches a device.
std::vector<DeviceCandidate> filter(const std::vector<DeviceCandidate>& all,
                                    const ProtocolTable& table);

struct Selection {
  bool ok{false};
  Error error;
  DeviceCandidate candidate;
};

/// The single candidate, or DeviceNotFound / MultipleDevices
Selection select(const std::vector<DeviceCandidate>& candidates);

/// Known-good entry for a candidate: ids must match, strings must match when
/// both sides have them. nullptr if none.
const KnownDevice* match_known(const ProtocolTable& table, const DeviceCandidate& candidate);

struct IdentifyResult {
  bool ok{false};
  Error error;
  DeviceInfo info;
};

/**
 * @brief Identification handshake
 *
 * Tables with an Identify command query version and geometry from the device
 * and check them against the known-good set. Tables without one (the Qoob
 * Pro) use a status query as the handshake and take geometry from the known
 * device entry; the version is the USB release number.
 *
 * Fails with UnsupportedDevice for unknown version/geometry and with
 * ProtocolMismatch for bad response length or checksum.
 */
IdentifyResult identify(Transport& transport, const Codec& codec,
                        const DeviceCandidate& candidate,
                        std::chrono::milliseconds timeout);

} // namespace discovery
} // namespace qoob
