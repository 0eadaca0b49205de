/**
 * @file codec_test.cpp
 * @brief Tests for the protocol table, frame codec and exchange state machine
 */

#include <gtest/gtest.h>
#include "qoob_codec.hpp"
#include "fake_qoob.hpp"
#include <queue>

using namespace qoob;

// Mock Transport for Testing
class MockTransport : public Transport {
public:
  Error send(const Frame& frame) override {
    sent_.push_back(frame);
    if (fail_send_) { fail_send_ = false; return make_error(ErrorCode::IoError); }
    return Error{};
  }

  Error receive(Frame& frame, size_t, std::chrono::milliseconds) override {
    if (responses_.empty()) return make_error(ErrorCode::Timeout);
    frame = responses_.front();
    responses_.pop();
    return Error{};
  }

  void close() override { open_ = false; }
  bool is_open() const override { return open_; }

  void queue_response(const Frame& f) { responses_.push(f); }
  void set_fail_send(bool f) { fail_send_ = f; }
  const std::vector<Frame>& sent() const { return sent_; }

private:
  std::queue<Frame> responses_;
  std::vector<Frame> sent_;
  bool fail_send_ = false;
  bool open_ = true;
};

namespace {

Frame v1_frame() { return Frame(65, 0x00); }

// A correctly sealed test-table frame with status byte ok
Frame test_frame(const Codec& codec) {
  Frame f(65, 0x00);
  codec.seal(f);
  return f;
}

} // namespace

// ============================================================================
// Checksum functions
// ============================================================================

TEST(ChecksumTest, Sum8WrapsModulo256) {
  const uint8_t data[] = {0xF0, 0x20, 0x01};
  EXPECT_EQ(compute_checksum(ChecksumKind::Sum8, data, data + 3), 0x11);
}

TEST(ChecksumTest, Xor8) {
  const uint8_t data[] = {0xF0, 0x0F, 0x01};
  EXPECT_EQ(compute_checksum(ChecksumKind::Xor8, data, data + 3), 0xFE);
}

TEST(ChecksumTest, NoneIsZero) {
  const uint8_t data[] = {0x12, 0x34};
  EXPECT_EQ(compute_checksum(ChecksumKind::None, data, data + 2), 0x00);
}

// ============================================================================
// Protocol tables
// ============================================================================

TEST(ProtocolTableTest, ShippedTableIsConsistent) {
  const ProtocolTable& t = qoob_pro_v1();
  EXPECT_TRUE(t.validate().ok());
  EXPECT_EQ(t.frame_size, 65u);
  EXPECT_FALSE(t.has_checksum());
  EXPECT_FALSE(t.supports(Opcode::Identify));
  ASSERT_EQ(t.known_devices.size(), 1u);
  EXPECT_EQ(t.known_devices[0].vendor_id, 0x03eb);
  EXPECT_EQ(t.known_devices[0].product_id, 0x0001);
  EXPECT_EQ(t.known_devices[0].geometry.sector_count(), 32u);
  EXPECT_EQ(t.known_devices[0].geometry.page_size, 0x8000u);
}

TEST(ProtocolTableTest, TestTableIsConsistent) {
  EXPECT_TRUE(sim::test_table().validate().ok());
  EXPECT_TRUE(sim::test_table(true).validate().ok());
}

TEST(ProtocolTableTest, FieldOutsideFrameRejected) {
  ProtocolTable t = sim::test_table();
  t.commands[static_cast<size_t>(Opcode::Read)].fields.push_back({FieldKind::Zero, 64, 1});
  Error e = t.validate();
  EXPECT_EQ(e.code, ErrorCode::ProtocolMismatch);
}

TEST(ProtocolTableTest, PageLargerThanTransferRejected) {
  ProtocolTable t = sim::test_table();
  t.max_transfer = 128;
  EXPECT_FALSE(t.validate().ok());
}

// ============================================================================
// Encoding (byte-exact against captured vendor traffic)
// ============================================================================

TEST(CodecEncodeTest, ReadHeader) {
  Codec codec(qoob_pro_v1());
  auto frames = codec.encode(Command::read(0x123456, 0x8000));
  ASSERT_EQ(frames.size(), 1u);

  Frame expected = v1_frame();
  expected[1] = 0x04;
  expected[2] = 0x12; expected[3] = 0x34; expected[4] = 0x56;
  expected[5] = 0x80; expected[6] = 0x00;
  EXPECT_EQ(frames[0], expected);
}

TEST(CodecEncodeTest, EraseHeader) {
  Codec codec(qoob_pro_v1());
  auto frames = codec.encode(Command::erase(5, 5 * 0x10000));
  ASSERT_EQ(frames.size(), 1u);

  Frame expected = v1_frame();
  expected[1] = 0x02;
  expected[2] = 0x05;
  EXPECT_EQ(frames[0], expected);
}

TEST(CodecEncodeTest, BusAcquireAndRelease) {
  Codec codec(qoob_pro_v1());
  auto acquire = codec.encode(Command::bus(true));
  auto release = codec.encode(Command::bus(false));
  ASSERT_EQ(acquire.size(), 1u);
  ASSERT_EQ(release.size(), 1u);
  EXPECT_EQ(acquire[0][1], 0x08);
  EXPECT_EQ(acquire[0][3], 0x01);
  EXPECT_EQ(release[0][1], 0x08);
  EXPECT_EQ(release[0][3], 0x00);
}

TEST(CodecEncodeTest, StatusAndReset) {
  Codec codec(qoob_pro_v1());
  Frame status = v1_frame();
  status[1] = 0x05;
  Frame reset = v1_frame();
  reset[1] = 0x01;
  EXPECT_EQ(codec.encode(Command::status()).at(0), status);
  EXPECT_EQ(codec.encode(Command::reset()).at(0), reset);
}

TEST(CodecEncodeTest, WriteSplitsPayloadIntoDataUnits) {
  Codec codec(qoob_pro_v1());
  std::vector<uint8_t> data(100);
  for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>(i + 1);

  auto frames = codec.encode(Command::write(0x8000, data));
  ASSERT_EQ(frames.size(), 3u);

  EXPECT_EQ(frames[0][1], 0x03);
  EXPECT_EQ(frames[0][2], 0x00);
  EXPECT_EQ(frames[0][3], 0x80);
  EXPECT_EQ(frames[0][4], 0x00);
  EXPECT_EQ(frames[0][5], 0x00);
  EXPECT_EQ(frames[0][6], 100);

  // 63 bytes at [2..64], then the remaining 37
  EXPECT_EQ(frames[1][0], 0x00);
  EXPECT_EQ(frames[1][2], 1);
  EXPECT_EQ(frames[1][64], 63);
  EXPECT_EQ(frames[2][2], 64);
  EXPECT_EQ(frames[2][38], 100);
  EXPECT_EQ(frames[2][39], 0x00);
}

TEST(CodecEncodeTest, ChecksumSealsEveryFrame) {
  Codec codec(sim::test_table());
  std::vector<uint8_t> data(70, 0x5A);
  auto frames = codec.encode(Command::write(0x100, data));
  ASSERT_EQ(frames.size(), 3u);
  for (const Frame& f : frames) {
    EXPECT_EQ(f[64], compute_checksum(ChecksumKind::Sum8, f.data() + 1, f.data() + 64));
  }
}

TEST(CodecEncodeTest, RejectsWhatTheTableCannotExpress) {
  Codec codec(qoob_pro_v1());
  EXPECT_TRUE(codec.encode(Command::read(0, 0)).empty());
  EXPECT_TRUE(codec.encode(Command::read(0, 0x8001)).empty());
  EXPECT_TRUE(codec.encode(Command::read(0x1000000, 16)).empty());  // 25-bit address
  EXPECT_TRUE(codec.encode(Command::erase(256, 0)).empty());        // 1-byte sector field
  EXPECT_TRUE(codec.encode(Command::identify()).empty());           // not in v1
}

TEST(CodecEncodeTest, ResponseFrameCounts) {
  Codec codec(qoob_pro_v1());
  EXPECT_EQ(codec.response_frames(Command::read(0, 0x8000)), 521u);
  EXPECT_EQ(codec.response_frames(Command::read(0, 63)), 1u);
  EXPECT_EQ(codec.response_frames(Command::read(0, 64)), 2u);
  EXPECT_EQ(codec.response_frames(Command::status()), 1u);
  EXPECT_EQ(codec.response_frames(Command::write(0, {1, 2})), 0u);
  EXPECT_EQ(codec.response_frames(Command::bus(true)), 0u);
}

// ============================================================================
// Decoding
// ============================================================================

TEST(CodecDecodeTest, DataFramePayload) {
  Codec codec(qoob_pro_v1());
  Frame f = v1_frame();
  f[2] = 0xAA;
  f[64] = 0xBB;
  Response r = codec.decode(f, ResponseKind::Data);
  ASSERT_TRUE(r.ok);
  ASSERT_EQ(r.payload.size(), 63u);
  EXPECT_EQ(r.payload.front(), 0xAA);
  EXPECT_EQ(r.payload.back(), 0xBB);
}

TEST(CodecDecodeTest, ReportIsWholeFrame) {
  Codec codec(qoob_pro_v1());
  Frame f = v1_frame();
  f[4] = 0x01;
  Response r = codec.decode(f, ResponseKind::Report);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.payload, f);
}

TEST(CodecDecodeTest, WrongLengthIsProtocolMismatch) {
  Codec codec(qoob_pro_v1());
  Response r = codec.decode(Frame(64, 0x00), ResponseKind::Report);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::ProtocolMismatch);
}

TEST(CodecDecodeTest, WrongReportIdIsProtocolMismatch) {
  Codec codec(qoob_pro_v1());
  Frame f = v1_frame();
  f[0] = 0x01;
  EXPECT_EQ(codec.decode(f, ResponseKind::Report).error.code, ErrorCode::ProtocolMismatch);
}

TEST(CodecDecodeTest, BadChecksumIsChecksumInvalidNotProtocolMismatch) {
  Codec codec(sim::test_table());
  Frame f = test_frame(codec);
  f[10] = 0x33;  // payload changed after sealing

  Response r = codec.decode(f, ResponseKind::Data);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::ChecksumInvalid);
  ASSERT_TRUE(r.error.expected.has_value());
  ASSERT_TRUE(r.error.actual.has_value());
  EXPECT_EQ(*r.error.expected, 0x33);
  EXPECT_EQ(*r.error.actual, 0x00);
}

TEST(CodecDecodeTest, EverySingleByteCorruptionIsDetected) {
  Codec codec(sim::test_table());
  Frame good = test_frame(codec);
  good[2] = 0x10;
  codec.seal(good);
  ASSERT_TRUE(codec.decode(good, ResponseKind::Data).ok);

  for (size_t i = 1; i < good.size(); ++i) {
    Frame bad = good;
    bad[i] ^= 0x01;
    EXPECT_EQ(codec.decode(bad, ResponseKind::Data).error.code, ErrorCode::ChecksumInvalid)
        << "byte " << i;
  }
}

TEST(CodecDecodeTest, StatusByteYieldsDeviceError) {
  Codec codec(sim::test_table());
  Frame f = test_frame(codec);
  f[1] = 0x42;
  codec.seal(f);

  Response r = codec.decode(f, ResponseKind::Ack);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::DeviceError);
  ASSERT_TRUE(r.error.device_status.has_value());
  EXPECT_EQ(*r.error.device_status, 0x42);
}

TEST(CodecDecodeTest, StatusByteIgnoredForRawReports) {
  Codec codec(sim::test_table());
  Frame f = test_frame(codec);
  f[1] = 0x42;
  codec.seal(f);
  EXPECT_TRUE(codec.decode(f, ResponseKind::Report).ok);
}

// ============================================================================
// Exchange state machine
// ============================================================================

class ExchangeTest : public ::testing::Test {
protected:
  MockTransport transport_;
};

TEST_F(ExchangeTest, StatusRoundTrip) {
  Codec codec(qoob_pro_v1());
  Exchange ex(transport_, codec);
  transport_.queue_response(v1_frame());

  Response r = ex.run(Command::status(), std::chrono::milliseconds(100));
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(ex.state(), ExchangeState::Decoded);
  std::vector<ExchangeState> expected = {ExchangeState::Idle, ExchangeState::Sent,
                                         ExchangeState::AwaitingResponse, ExchangeState::Decoded};
  EXPECT_EQ(ex.trace(), expected);
}

TEST_F(ExchangeTest, UnacknowledgedCommandSkipsAwaiting) {
  Codec codec(qoob_pro_v1());
  Exchange ex(transport_, codec);

  Response r = ex.run(Command::bus(true), std::chrono::milliseconds(100));
  EXPECT_TRUE(r.ok);
  std::vector<ExchangeState> expected = {ExchangeState::Idle, ExchangeState::Sent,
                                         ExchangeState::Decoded};
  EXPECT_EQ(ex.trace(), expected);
  EXPECT_EQ(transport_.sent().size(), 1u);
}

TEST_F(ExchangeTest, NoResponseTimesOut) {
  Codec codec(qoob_pro_v1());
  Exchange ex(transport_, codec);

  Response r = ex.run(Command::status(), std::chrono::milliseconds(10));
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error.code, ErrorCode::Timeout);
  EXPECT_EQ(ex.state(), ExchangeState::TimedOut);
}

TEST_F(ExchangeTest, CorruptResponseEndsInChecksumInvalid) {
  Codec codec(sim::test_table());
  Exchange ex(transport_, codec);
  Frame f = test_frame(codec);
  f[64] ^= 0xFF;
  transport_.queue_response(f);

  Response r = ex.run(Command::status(), std::chrono::milliseconds(10));
  EXPECT_EQ(r.error.code, ErrorCode::ChecksumInvalid);
  EXPECT_EQ(ex.state(), ExchangeState::ChecksumInvalid);
}

TEST_F(ExchangeTest, SendFailureFails) {
  Codec codec(qoob_pro_v1());
  Exchange ex(transport_, codec);
  transport_.set_fail_send(true);

  Response r = ex.run(Command::status(), std::chrono::milliseconds(10));
  EXPECT_EQ(r.error.code, ErrorCode::IoError);
  EXPECT_EQ(ex.state(), ExchangeState::Failed);
}

TEST_F(ExchangeTest, ClosedTransportIsNotConnected) {
  Codec codec(qoob_pro_v1());
  Exchange ex(transport_, codec);
  transport_.close();

  Response r = ex.run(Command::status(), std::chrono::milliseconds(10));
  EXPECT_EQ(r.error.code, ErrorCode::NotConnected);
  EXPECT_TRUE(transport_.sent().empty());
}

TEST_F(ExchangeTest, UnencodableCommandNeverReachesTheWire) {
  Codec codec(qoob_pro_v1());
  Exchange ex(transport_, codec);

  Response r = ex.run(Command::read(0, 0), std::chrono::milliseconds(10));
  EXPECT_EQ(r.error.code, ErrorCode::ProtocolMismatch);
  EXPECT_TRUE(transport_.sent().empty());
}

TEST_F(ExchangeTest, ReadReassemblesAndTruncates) {
  Codec codec(qoob_pro_v1());
  Exchange ex(transport_, codec);
  Frame a = v1_frame();
  Frame b = v1_frame();
  std::fill(a.begin() + 2, a.end(), 0x11);
  std::fill(b.begin() + 2, b.end(), 0x22);
  transport_.queue_response(a);
  transport_.queue_response(b);

  Response r = ex.run(Command::read(0, 70), std::chrono::milliseconds(10));
  ASSERT_TRUE(r.ok);
  ASSERT_EQ(r.payload.size(), 70u);
  EXPECT_EQ(r.payload[62], 0x11);
  EXPECT_EQ(r.payload[63], 0x22);
  EXPECT_EQ(r.payload[69], 0x22);
}

TEST_F(ExchangeTest, CodecNeverRetries) {
  Codec codec(sim::test_table());
  Exchange ex(transport_, codec);

  Response r = ex.run(Command::status(), std::chrono::milliseconds(10));
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(transport_.sent().size(), 1u);
}
