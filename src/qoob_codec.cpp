#include "qoob_codec.hpp"
#include <algorithm>
#include <sstream>

namespace qoob {

// ================================================================
// Codec
// ================================================================

Frame Codec::blank_frame() const {
  Frame f(table_.frame_size, 0x00);
  if (table_.report_id) {
    f[0] = *table_.report_id;
  }
  return f;
}

void Codec::seal(Frame& frame) const {
  if (!table_.has_checksum() || frame.size() != table_.frame_size) {
    return;
  }
  const size_t cs = table_.checksum_offset();
  frame[cs] = compute_checksum(table_.checksum,
                               frame.data() + table_.checksum_start(),
                               frame.data() + cs);
}

std::vector<Frame> Codec::encode(const Command& cmd) const {
  std::vector<Frame> frames;
  const CommandLayout& layout = table_.command(cmd.op);
  if (!layout.supported) {
    return frames;
  }

  const uint32_t length = (cmd.op == Opcode::Write)
      ? static_cast<uint32_t>(cmd.payload.size())
      : cmd.length;

  if (cmd.op == Opcode::Read || cmd.op == Opcode::Write) {
    if (length == 0 || length > table_.max_transfer) {
      return frames;
    }
  }

  Frame header = blank_frame();
  header[table_.opcode_offset] = layout.opcode;

  for (const FieldSpec& field : layout.fields) {
    uint32_t value = 0;
    switch (field.kind) {
      case FieldKind::Address:  value = cmd.address; break;
      case FieldKind::Length:   value = length; break;
      case FieldKind::Sector:   value = cmd.sector; break;
      case FieldKind::Argument: value = cmd.argument; break;
      case FieldKind::Zero:     value = 0; break;
    }
    // Reject values the field cannot hold rather than truncating them
    if (field.width < 4 && (value >> (8 * field.width)) != 0) {
      return {};
    }
    bytes::put_be(header, field.offset, field.width, value);
  }
  seal(header);
  frames.push_back(std::move(header));

  if (cmd.op == Opcode::Write) {
    const size_t unit = table_.data_unit;
    for (size_t pos = 0; pos < cmd.payload.size(); pos += unit) {
      const size_t n = std::min(unit, cmd.payload.size() - pos);
      Frame f = blank_frame();
      std::copy(cmd.payload.begin() + pos, cmd.payload.begin() + pos + n,
                f.begin() + table_.payload_offset);
      seal(f);
      frames.push_back(std::move(f));
    }
  }

  return frames;
}

size_t Codec::response_frames(const Command& cmd) const {
  const CommandLayout& layout = table_.command(cmd.op);
  switch (layout.response) {
    case ResponseKind::Report:
    case ResponseKind::Ack:
      return 1;
    case ResponseKind::Data:
      return (cmd.length + table_.data_unit - 1) / table_.data_unit;
    case ResponseKind::None:
    default:
      return 0;
  }
}

Response Codec::decode(const Frame& frame, ResponseKind kind) const {
  Response r;

  if (frame.size() != table_.frame_size) {
    std::ostringstream oss;
    oss << "expected " << table_.frame_size << " bytes, got " << frame.size();
    r.error = make_error(ErrorCode::ProtocolMismatch, Stage::None, oss.str());
    return r;
  }

  if (table_.report_id && frame[0] != *table_.report_id) {
    r.error = make_error(ErrorCode::ProtocolMismatch, Stage::None, "unexpected report id");
    return r;
  }

  if (table_.has_checksum()) {
    const size_t cs = table_.checksum_offset();
    const uint8_t expected = compute_checksum(table_.checksum,
                                              frame.data() + table_.checksum_start(),
                                              frame.data() + cs);
    if (frame[cs] != expected) {
      r.error = make_error(ErrorCode::ChecksumInvalid);
      r.error.expected = expected;
      r.error.actual = frame[cs];
      return r;
    }
  }

  if ((kind == ResponseKind::Ack || kind == ResponseKind::Data) &&
      table_.response.status_offset) {
    const uint8_t status = frame[*table_.response.status_offset];
    r.status = status;
    if (status != table_.response.status_ok) {
      r.error = make_error(ErrorCode::DeviceError);
      r.error.device_status = status;
      return r;
    }
  }

  switch (kind) {
    case ResponseKind::Report:
      r.payload = frame;
      break;
    case ResponseKind::Data:
      r.payload.assign(frame.begin() + table_.response.data_offset,
                       frame.begin() + table_.response.data_offset + table_.data_unit);
      break;
    default:
      break;
  }

  r.ok = true;
  return r;
}

// ================================================================
// Exchange
// ================================================================

const char* Exchange::state_name(ExchangeState state) {
  switch (state) {
    case ExchangeState::Idle: return "Idle";
    case ExchangeState::Sent: return "Sent";
    case ExchangeState::AwaitingResponse: return "AwaitingResponse";
    case ExchangeState::Decoded: return "Decoded";
    case ExchangeState::TimedOut: return "TimedOut";
    case ExchangeState::ChecksumInvalid: return "ChecksumInvalid";
    case ExchangeState::Failed: return "Failed";
    default: return "Unknown";
  }
}

void Exchange::transition(ExchangeState next) {
  state_ = next;
  trace_.push_back(next);
}

Response Exchange::fail(ExchangeState terminal, Error error) {
  transition(terminal);
  Response r;
  r.error = std::move(error);
  return r;
}

Response Exchange::run(const Command& cmd, std::chrono::milliseconds timeout) {
  trace_.clear();
  state_ = ExchangeState::Idle;
  trace_.push_back(state_);

  if (!transport_.is_open()) {
    return fail(ExchangeState::Failed, make_error(ErrorCode::NotConnected));
  }

  const std::vector<Frame> frames = codec_.encode(cmd);
  if (frames.empty()) {
    return fail(ExchangeState::Failed,
                make_error(ErrorCode::ProtocolMismatch, Stage::None,
                           std::string(opcode_name(cmd.op)) + " cannot be encoded"));
  }

  for (const Frame& f : frames) {
    Error e = transport_.send(f);
    if (e) {
      return fail(ExchangeState::Failed, std::move(e));
    }
  }
  transition(ExchangeState::Sent);

  const ResponseKind kind = codec_.table().command(cmd.op).response;
  const size_t expected = codec_.response_frames(cmd);

  Response out;
  out.ok = true;
  if (expected == 0) {
    transition(ExchangeState::Decoded);
    return out;
  }

  transition(ExchangeState::AwaitingResponse);
  const size_t frame_size = codec_.table().frame_size;

  for (size_t i = 0; i < expected; ++i) {
    Frame rx;
    Error e = transport_.receive(rx, frame_size, timeout);
    if (e) {
      const ExchangeState terminal = (e.code == ErrorCode::Timeout)
          ? ExchangeState::TimedOut : ExchangeState::Failed;
      return fail(terminal, std::move(e));
    }

    Response part = codec_.decode(rx, kind);
    if (!part.ok) {
      const ExchangeState terminal = (part.error.code == ErrorCode::ChecksumInvalid)
          ? ExchangeState::ChecksumInvalid : ExchangeState::Failed;
      return fail(terminal, std::move(part.error));
    }
    out.status = part.status;
    out.payload.insert(out.payload.end(), part.payload.begin(), part.payload.end());
  }

  if (kind == ResponseKind::Data && out.payload.size() > cmd.length) {
    out.payload.resize(cmd.length);
  }

  transition(ExchangeState::Decoded);
  return out;
}

} // namespace qoob
