/**
 * @file session_test.cpp
 * @brief Tests for the device session and the bus lock guard
 */

#include <gtest/gtest.h>
#include "qoob_session.hpp"
#include "fake_qoob.hpp"
#include <atomic>
#include <thread>

using namespace qoob;

namespace {

// Transport that only records whether it was closed
class CloseProbe : public Transport {
public:
  explicit CloseProbe(int& closes) : closes_(closes) {}
  Error send(const Frame&) override { return Error{}; }
  Error receive(Frame&, size_t, std::chrono::milliseconds) override {
    return make_error(ErrorCode::Timeout);
  }
  void close() override {
    if (open_) ++closes_;
    open_ = false;
  }
  bool is_open() const override { return open_; }

private:
  int& closes_;
  bool open_ = true;
};

Timings fast_timings() {
  Timings t;
  t.response = std::chrono::milliseconds(10);
  t.bus = std::chrono::milliseconds(30);
  t.erase = std::chrono::milliseconds(30);
  return t;
}

} // namespace

class SessionTest : public ::testing::Test {
protected:
  void SetUp() override {
    table_ = sim::test_table();
    auto device = std::make_unique<sim::FakeQoob>(table_);
    device_ = device.get();
    session_ = std::make_unique<DeviceSession>(std::move(device), table_,
                                               sim::qoob_candidate(), fast_timings());
  }

  ProtocolTable table_;
  sim::FakeQoob* device_ = nullptr;
  std::unique_ptr<DeviceSession> session_;
};

// ============================================================================
// Handle ownership
// ============================================================================

TEST(SessionLifetimeTest, DestructorClosesHandleOnce) {
  int closes = 0;
  {
    DeviceSession session(std::make_unique<CloseProbe>(closes), sim::test_table());
    EXPECT_TRUE(session.is_open());
    session.close();
    session.close();
  }
  EXPECT_EQ(closes, 1);
}

TEST(SessionLifetimeTest, DestructorClosesOnEarlyExit) {
  int closes = 0;
  {
    DeviceSession session(std::make_unique<CloseProbe>(closes), sim::test_table(),
                          sim::qoob_candidate(), fast_timings());
    auto lock = session.lock();
    EXPECT_FALSE(session.ensure_identified().ok());
  }
  EXPECT_EQ(closes, 1);
}

TEST_F(SessionTest, ClosedSessionRefusesCommands) {
  session_->close();
  auto lock = session_->lock();
  EXPECT_EQ(session_->ensure_identified().code, ErrorCode::NotConnected);
  EXPECT_EQ(session_->execute(Command::status(), std::chrono::milliseconds(10)).error.code,
            ErrorCode::NotConnected);
}

TEST(SessionLifetimeTest, NullTransportIsNotConnected) {
  DeviceSession session(nullptr, sim::test_table(), sim::qoob_candidate(), fast_timings());
  EXPECT_FALSE(session.is_open());

  auto lock = session.lock();
  EXPECT_EQ(session.ensure_identified().code, ErrorCode::NotConnected);
  EXPECT_EQ(session.execute(Command::status(), std::chrono::milliseconds(10)).error.code,
            ErrorCode::NotConnected);
  session.close();
}

// ============================================================================
// Device info cache
// ============================================================================

TEST_F(SessionTest, IdentifiesOnceAndCaches) {
  auto lock = session_->lock();
  EXPECT_FALSE(session_->identified());
  ASSERT_TRUE(session_->ensure_identified().ok());
  ASSERT_TRUE(session_->ensure_identified().ok());
  EXPECT_TRUE(session_->identified());
  EXPECT_EQ(device_->count(Opcode::Status), 1u);
  EXPECT_EQ(session_->info().geometry.page_size, 256u);
}

TEST_F(SessionTest, ExecuteCountsExchanges) {
  auto lock = session_->lock();
  session_->execute(Command::status(), std::chrono::milliseconds(10));
  session_->execute(Command::bus(false), std::chrono::milliseconds(10));
  EXPECT_EQ(session_->exchange_count(), 2u);
  EXPECT_EQ(session_->last_state(), ExchangeState::Decoded);
}

TEST_F(SessionTest, LockSerializesCallers) {
  std::atomic<bool> entered{false};
  std::thread other;
  {
    auto lock = session_->lock();
    other = std::thread([&] {
      auto inner = session_->lock();
      entered = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(entered.load());
  }
  other.join();
  EXPECT_TRUE(entered.load());
}

// ============================================================================
// Bus lock
// ============================================================================

TEST_F(SessionTest, BusAcquiredAndReleased) {
  auto lock = session_->lock();
  {
    BusGuard bus(*session_);
    ASSERT_TRUE(bus.held()) << ErrorInterpreter::format(bus.error());
    EXPECT_EQ(device_->bus_state(), table_.status.bus_granted);
    EXPECT_TRUE(bus.release().ok());
    EXPECT_FALSE(bus.held());
  }
  EXPECT_EQ(device_->bus_state(), table_.status.bus_released);
  EXPECT_EQ(device_->releases(), 1u);
}

TEST_F(SessionTest, GuardReleasesOnScopeExit) {
  auto lock = session_->lock();
  {
    BusGuard bus(*session_);
    ASSERT_TRUE(bus.held());
  }
  EXPECT_EQ(device_->acquires(), 1u);
  EXPECT_EQ(device_->releases(), 1u);
  EXPECT_EQ(device_->bus_state(), table_.status.bus_released);
}

TEST_F(SessionTest, BusyBusIsReported) {
  device_->set_bus_busy(true);
  auto lock = session_->lock();
  BusGuard bus(*session_);
  EXPECT_FALSE(bus.held());
  EXPECT_EQ(bus.error().code, ErrorCode::Busy);
  EXPECT_EQ(bus.error().stage, Stage::BusAcquire);
}

TEST_F(SessionTest, UngrantedBusTimesOut) {
  device_->refuse_grant(true);
  auto lock = session_->lock();
  BusGuard bus(*session_);
  EXPECT_FALSE(bus.held());
  EXPECT_EQ(bus.error().code, ErrorCode::Timeout);
}

TEST_F(SessionTest, ReleaseIsIdempotent) {
  auto lock = session_->lock();
  BusGuard bus(*session_);
  ASSERT_TRUE(bus.held());
  EXPECT_TRUE(bus.release().ok());
  EXPECT_TRUE(bus.release().ok());
  EXPECT_EQ(device_->releases(), 1u);
}

TEST(SessionBusTest, TableWithoutBusCommandNeedsNoLock) {
  ProtocolTable table = sim::test_table();
  table.commands[static_cast<size_t>(Opcode::Bus)].supported = false;
  auto device = std::make_unique<sim::FakeQoob>(table);
  sim::FakeQoob* raw = device.get();
  DeviceSession session(std::move(device), table, sim::qoob_candidate(), fast_timings());

  auto lock = session.lock();
  BusGuard bus(session);
  EXPECT_TRUE(bus.held());
  EXPECT_TRUE(raw->sent().empty());
}
