#include "qoob_session.hpp"
#include "qoob_discovery.hpp"
#include <thread>

namespace qoob {

namespace {

// Stands in for a missing transport so the session reports NotConnected
class DetachedTransport : public Transport {
public:
  Error send(const Frame&) override { return make_error(ErrorCode::NotConnected); }
  Error receive(Frame&, size_t, std::chrono::milliseconds) override {
    return make_error(ErrorCode::NotConnected);
  }
  void close() override {}
  bool is_open() const override { return false; }
};

std::unique_ptr<Transport> or_detached(std::unique_ptr<Transport> transport) {
  if (!transport) {
    transport = std::make_unique<DetachedTransport>();
  }
  return transport;
}

} // namespace

// ================================================================
// DeviceSession
// ================================================================

DeviceSession::DeviceSession(std::unique_ptr<Transport> transport, const ProtocolTable& table,
                             DeviceCandidate candidate, Timings timings)
  : transport_(or_detached(std::move(transport))),
    codec_(table),
    exchange_(*transport_, codec_),
    candidate_(std::move(candidate)),
    timings_(timings) {}

DeviceSession::~DeviceSession() {
  close();
}

void DeviceSession::close() {
  if (transport_) {
    transport_->close();
  }
}

Error DeviceSession::ensure_identified() {
  if (identified_) {
    return Error{};
  }
  if (!is_open()) {
    return make_error(ErrorCode::NotConnected, Stage::Identify);
  }

  ++exchange_count_;
  auto id = discovery::identify(*transport_, codec_, candidate_, timings_.response);
  if (!id.ok) {
    return id.error;
  }
  info_ = id.info;
  identified_ = true;
  return Error{};
}

Response DeviceSession::execute(const Command& cmd, std::chrono::milliseconds timeout) {
  ++exchange_count_;
  return exchange_.run(cmd, timeout);
}

// ================================================================
// BusGuard
// ================================================================

BusGuard::BusGuard(DeviceSession& session)
  : session_(session) {
  error_ = acquire();
  held_ = error_.ok();
}

BusGuard::~BusGuard() {
  if (held_) {
    // Best effort; an explicit release() reports failures
    Error ignored = release();
    (void)ignored;
  }
}

Error BusGuard::poll_bus(uint8_t wanted, Stage stage, bool fail_on_busy) {
  const ProtocolTable& table = session_.table();
  const Timings& timings = session_.timings();
  const auto deadline = std::chrono::steady_clock::now() + timings.bus;

  while (true) {
    Response st = session_.execute(Command::status(), timings.response);
    if (!st.ok) {
      st.error.stage = stage;
      return st.error;
    }
    if (st.payload.size() <= table.status.bus_offset) {
      return make_error(ErrorCode::ProtocolMismatch, stage, "short status report");
    }
    const uint8_t bus = st.payload[table.status.bus_offset];
    if (bus == wanted) {
      return Error{};
    }
    if (fail_on_busy && (bus & table.status.bus_busy_mask)) {
      return make_error(ErrorCode::Busy, stage, "console holds the flash bus");
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return make_error(ErrorCode::Timeout, stage, "bus state did not change");
    }
    if (timings.poll_interval.count() > 0) {
      std::this_thread::sleep_for(timings.poll_interval);
    }
  }
}

Error BusGuard::acquire() {
  const ProtocolTable& table = session_.table();
  if (!table.supports(Opcode::Bus)) {
    return Error{};
  }

  Response rsp = session_.execute(Command::bus(true), session_.timings().response);
  if (!rsp.ok) {
    rsp.error.stage = Stage::BusAcquire;
    return rsp.error;
  }
  return poll_bus(table.status.bus_granted, Stage::BusAcquire, true);
}

Error BusGuard::release() {
  if (!held_) {
    return Error{};
  }
  held_ = false;

  const ProtocolTable& table = session_.table();
  if (!table.supports(Opcode::Bus)) {
    return Error{};
  }

  Response rsp = session_.execute(Command::bus(false), session_.timings().response);
  if (!rsp.ok) {
    rsp.error.stage = Stage::BusRelease;
    return rsp.error;
  }
  return poll_bus(table.status.bus_released, Stage::BusRelease, false);
}

} // namespace qoob
