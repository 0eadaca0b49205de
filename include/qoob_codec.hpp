#ifndef QOOB_CODEC_HPP
#define QOOB_CODEC_HPP

/**
 * @file qoob_codec.hpp
 * @brief Command encoding, response decoding and the per-exchange state machine
 *
 * The codec is pure: it turns a typed Command into frames and a frame into a
 * Response using only the protocol table. The Exchange drives one
 * command/response round trip over a Transport:
 *
 *   Idle -> Sent -> AwaitingResponse -> Decoded
 *                                    -> TimedOut
 *                                    -> ChecksumInvalid
 *                                    -> Failed
 *
 * Neither retries. Retry policy belongs to the flash programmer.
 */

#include "qoob.hpp"
#include "protocol_table.hpp"
#include <optional>
#include <vector>

namespace qoob {

// ------------------------- Command
struct Command {
  Opcode op{Opcode::Status};
  uint32_t address{0};
  uint32_t length{0};          ///< Read length; writes use payload.size()
  uint32_t sector{0};
  uint8_t argument{0};
  std::vector<uint8_t> payload;

  static Command status() { return Command{}; }
  static Command identify() { Command c; c.op = Opcode::Identify; return c; }
  static Command reset() { Command c; c.op = Opcode::Reset; return c; }
  static Command bus(bool acquire) {
    Command c; c.op = Opcode::Bus; c.argument = acquire ? 1 : 0; return c;
  }
  static Command erase(uint32_t sector, uint32_t address) {
    Command c; c.op = Opcode::Erase; c.sector = sector; c.address = address; return c;
  }
  static Command read(uint32_t address, uint32_t length) {
    Command c; c.op = Opcode::Read; c.address = address; c.length = length; return c;
  }
  static Command write(uint32_t address, std::vector<uint8_t> data) {
    Command c; c.op = Opcode::Write; c.address = address;
    c.length = static_cast<uint32_t>(data.size()); c.payload = std::move(data); return c;
  }
};

// ------------------------- Response
struct Response {
  bool ok{false};
  Error error;                          ///< valid if ok==false
  std::vector<uint8_t> payload;         ///< data bytes (Data) or whole report (Report)
  std::optional<uint8_t> status;        ///< status byte of Ack/Data frames
};

// ------------------------- Codec
class Codec {
public:
  explicit Codec(const ProtocolTable& table) : table_(table) {}

  /// Encode a command as its header frame followed by any data frames.
  /// Returns an empty vector if the table cannot express the command.
  std::vector<Frame> encode(const Command& cmd) const;

  /// Number of frames the device answers with for this command
  size_t response_frames(const Command& cmd) const;

  /// Validate one received frame (length, report id, checksum, status) and
  /// extract its payload
  Response decode(const Frame& frame, ResponseKind kind) const;

  /// Seal a frame: set the trailing checksum byte if the table has one
  void seal(Frame& frame) const;

  const ProtocolTable& table() const { return table_; }

private:
  Frame blank_frame() const;

  ProtocolTable table_;
};

// ------------------------- Exchange state machine
enum class ExchangeState : uint8_t {
  Idle,
  Sent,
  AwaitingResponse,
  Decoded,
  TimedOut,
  ChecksumInvalid,
  Failed
};

class Exchange {
public:
  Exchange(Transport& transport, const Codec& codec)
    : transport_(transport), codec_(codec) {}

  /// Perform one round trip. Data responses are truncated to cmd.length.
  Response run(const Command& cmd, std::chrono::milliseconds timeout);

  ExchangeState state() const { return state_; }

  /// Every state the last run() passed through, starting with Idle
  const std::vector<ExchangeState>& trace() const { return trace_; }

  static const char* state_name(ExchangeState state);

private:
  void transition(ExchangeState next);
  Response fail(ExchangeState terminal, Error error);

  Transport& transport_;
  const Codec& codec_;
  ExchangeState state_{ExchangeState::Idle};
  std::vector<ExchangeState> trace_;
};

} // namespace qoob

#endif // QOOB_CODEC_HPP
