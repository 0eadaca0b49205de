#ifndef QOOB_SESSION_HPP
#define QOOB_SESSION_HPP

/*
  Device session

  Owns the one open transport to a device for its whole lifetime and is the
  mutual-exclusion boundary around it: callers take lock() for the duration
  of a multi-step operation, so commands from different threads never
  interleave on the wire. Device Info is obtained once through the
  identification handshake and cached read-only.

  BusGuard holds the device-side bus lock. While the host holds the bus the
  GameCube cannot access the flash, and the flash is not reachable from USB
  without it. The guard releases the bus on every exit path.
*/

#include "qoob.hpp"
#include "qoob_codec.hpp"
#include "protocol_table.hpp"
#include <memory>
#include <mutex>

namespace qoob {

class DeviceSession {
public:
  /// A null transport gives a closed session: every call fails NotConnected
  DeviceSession(std::unique_ptr<Transport> transport, const ProtocolTable& table,
                DeviceCandidate candidate = {}, Timings timings = {});
  ~DeviceSession();

  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;

  /// Serialize logical callers around the handle
  std::unique_lock<std::mutex> lock() { return std::unique_lock<std::mutex>(mutex_); }

  /// Run the identification handshake if it has not succeeded yet.
  /// Caller must hold lock().
  Error ensure_identified();

  bool identified() const { return identified_; }
  const DeviceInfo& info() const { return info_; }

  /// One command/response round trip, no retries. Caller must hold lock().
  Response execute(const Command& cmd, std::chrono::milliseconds timeout);

  /// State the last exchange ended in
  ExchangeState last_state() const { return exchange_.state(); }

  /// Total exchanges attempted on this session
  uint64_t exchange_count() const { return exchange_count_; }

  const Codec& codec() const { return codec_; }
  const ProtocolTable& table() const { return codec_.table(); }
  const DeviceCandidate& candidate() const { return candidate_; }

  const Timings& timings() const { return timings_; }
  void set_timings(const Timings& t) { timings_ = t; }

  bool is_open() const { return transport_ && transport_->is_open(); }

  /// Release the device handle. Idempotent.
  void close();

private:
  std::unique_ptr<Transport> transport_;
  Codec codec_;
  Exchange exchange_;
  DeviceCandidate candidate_;
  Timings timings_;
  DeviceInfo info_;
  bool identified_{false};
  uint64_t exchange_count_{0};
  std::mutex mutex_;
};

class BusGuard {
public:
  /// Acquire the bus: send Bus(1), then poll status until granted.
  /// Caller must hold the session lock for the guard's lifetime.
  explicit BusGuard(DeviceSession& session);
  ~BusGuard();

  BusGuard(const BusGuard&) = delete;
  BusGuard& operator=(const BusGuard&) = delete;

  /// Busy, Timeout or a transport error if acquisition failed
  const Error& error() const { return error_; }
  bool held() const { return held_; }

  /// Release now and report the outcome; the destructor releases otherwise
  Error release();

private:
  Error acquire();
  Error poll_bus(uint8_t wanted, Stage stage, bool fail_on_busy);

  DeviceSession& session_;
  Error error_;
  bool held_{false};
};

} // namespace qoob

#endif // QOOB_SESSION_HPP
