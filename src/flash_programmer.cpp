#include "flash_programmer.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <thread>

namespace qoob {

namespace {

std::string hex_address(uint32_t address) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase << std::setw(6) << std::setfill('0') << address;
  return oss.str();
}

} // namespace

// ================================================================
// FlashProgrammer Implementation
// ================================================================

FlashProgrammer::FlashProgrammer(DeviceSession& session, ProgrammerConfig config)
  : session_(session), config_(config) {}

uint32_t FlashProgrammer::page_count(uint32_t length, uint32_t page_size) {
  if (page_size == 0) {
    return 0;
  }
  return length / page_size + (length % page_size ? 1 : 0);
}

void FlashProgrammer::log(OperationResult& result, const std::string& message) {
  result.log_messages.push_back(message);
}

void FlashProgrammer::report_stage(Stage stage, uint32_t total) {
  if (config_.progress) {
    config_.progress->on_stage(stage, total);
  }
}

void FlashProgrammer::report_progress(Stage stage, uint32_t done, uint32_t total) {
  if (config_.progress) {
    config_.progress->on_progress(stage, done, total);
  }
}

void FlashProgrammer::fail(OperationResult& result, Error error) {
  result.success = false;
  result.error = std::move(error);
  log(result, "Failed: " + ErrorInterpreter::format(result.error));
}

OperationResult& FlashProgrammer::finish(OperationResult& result) {
  result.elapsed_time = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started_);

  if (result.error.ok()) {
    result.success = true;
    std::ostringstream oss;
    oss << operation_name(result.operation) << " completed: " << result.bytes_done
        << " bytes in " << result.elapsed_time.count() << " ms";
    if (result.retry_count > 0) {
      oss << " (" << result.retry_count << " retries)";
    }
    log(result, oss.str());
  }

  if (config_.progress) {
    config_.progress->on_finished(result);
  }
  return result;
}

bool FlashProgrammer::begin(OperationResult& result, OperationKind kind, uint32_t address) {
  result = OperationResult{};
  result.operation = kind;
  result.start_address = address;
  result.resume_address = address;
  started_ = std::chrono::steady_clock::now();

  log(result, std::string("Starting ") + operation_name(kind));

  const bool first_contact = !session_.identified();
  Error err = session_.ensure_identified();
  if (err) {
    fail(result, err);
    return false;
  }

  if (first_contact) {
    const DeviceInfo& info = session_.info();
    std::ostringstream oss;
    oss << "Identified " << info.product << " (protocol " << info.protocol_version
        << "): " << info.geometry.total_size << " bytes, sector "
        << info.geometry.sector_size << ", page " << info.geometry.page_size;
    log(result, oss.str());
  }
  return true;
}

bool FlashProgrammer::cancelled(OperationResult& result, Stage stage, uint32_t address) {
  if (!abort_requested_.exchange(false)) {
    return false;
  }
  Error err = make_error(ErrorCode::Cancelled, stage, "abort requested");
  err.address = address;
  fail(result, err);
  return true;
}

template <typename Body>
void FlashProgrammer::with_bus(OperationResult& result, Body body) {
  BusGuard bus(session_);
  if (!bus.held()) {
    fail(result, bus.error());
    return;
  }
  log(result, "Bus acquired");

  body();

  Error released = bus.release();
  if (released) {
    log(result, "Warning: Failed to release bus: " + ErrorInterpreter::format(released));
  } else {
    log(result, "Bus released");
  }
}

// ================================================================
// Command retry
// ================================================================

Response FlashProgrammer::command_with_retry(const Command& cmd, Stage stage, uint32_t address,
                                             OperationResult& result) {
  const uint8_t budget = std::max<uint8_t>(1, config_.retry_budget);
  Error last;

  for (uint8_t attempt = 1; attempt <= budget; ++attempt) {
    ++result.commands_sent;
    Response rsp = session_.execute(cmd, config_.timings.response);
    if (rsp.ok) {
      return rsp;
    }

    rsp.error.stage = stage;
    rsp.error.address = address;
    if (!ErrorInterpreter::is_transient(rsp.error.code)) {
      return rsp;
    }

    last = rsp.error;
    log(result, std::string(opcode_name(cmd.op)) + " at " + hex_address(address) +
                " attempt " + std::to_string(attempt) + "/" + std::to_string(budget) +
                ": " + ErrorInterpreter::name(rsp.error.code));
    if (attempt < budget) {
      ++result.retry_count;
    }
  }

  Response exhausted;
  exhausted.error = make_error(ErrorCode::RetryBudgetExceeded, stage,
                               std::string(opcode_name(cmd.op)) + " failed " +
                               std::to_string(budget) + " times, last error " +
                               ErrorInterpreter::name(last.code));
  exhausted.error.address = address;
  exhausted.error.device_status = last.device_status;
  return exhausted;
}

// ================================================================
// Paged read
// ================================================================

Error FlashProgrammer::read_pages(uint32_t address, uint32_t length, Stage stage,
                                  std::vector<uint8_t>& out, OperationResult& result,
                                  bool top_level) {
  const Geometry& geo = session_.info().geometry;
  const uint32_t chunk_limit = std::min<uint32_t>(geo.page_size, session_.table().max_transfer);
  out.clear();
  out.reserve(length);

  uint32_t offset = 0;
  while (offset < length) {
    const uint32_t current = address + offset;
    if (top_level && cancelled(result, stage, current)) {
      return result.error;
    }

    // Never cross a page boundary in one command
    const uint32_t to_boundary = chunk_limit - (current % chunk_limit);
    const uint32_t chunk = std::min(length - offset, to_boundary);

    Response rsp = command_with_retry(Command::read(current, chunk), stage, current, result);
    if (!rsp.ok) {
      return rsp.error;
    }
    if (rsp.payload.size() != chunk) {
      Error err = make_error(ErrorCode::ProtocolMismatch, stage,
                             "read returned " + std::to_string(rsp.payload.size()) +
                             " of " + std::to_string(chunk) + " bytes");
      err.address = current;
      return err;
    }
    out.insert(out.end(), rsp.payload.begin(), rsp.payload.end());
    offset += chunk;

    if (top_level) {
      result.bytes_done = offset;
      result.last_good_address = current;
      result.resume_address = address + offset;
      report_progress(stage, offset, length);
    }
  }
  return Error{};
}

// ================================================================
// Erase
// ================================================================

Error FlashProgrammer::wait_erase_complete(uint32_t address, OperationResult& result) {
  const ProtocolTable& table = session_.table();
  const auto deadline = std::chrono::steady_clock::now() + config_.timings.erase;

  while (true) {
    Response st = command_with_retry(Command::status(), Stage::Erase, address, result);
    if (!st.ok) {
      return st.error;
    }
    if (st.payload.size() <= table.status.erase_busy_offset) {
      Error err = make_error(ErrorCode::ProtocolMismatch, Stage::Erase, "short status report");
      err.address = address;
      return err;
    }
    if (st.payload[table.status.erase_busy_offset] == 0) {
      return Error{};
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      Error err = make_error(ErrorCode::Timeout, Stage::Erase, "erase did not complete");
      err.address = address;
      return err;
    }
    if (config_.timings.poll_interval.count() > 0) {
      std::this_thread::sleep_for(config_.timings.poll_interval);
    }
  }
}

void FlashProgrammer::do_erase(OperationResult& result, uint32_t first_sector, uint32_t count) {
  const Geometry& geo = session_.info().geometry;
  const uint8_t budget = std::max<uint8_t>(1, config_.retry_budget);
  result.total_bytes = count * geo.sector_size;
  report_stage(Stage::Erase, result.total_bytes);

  for (uint32_t i = 0; i < count; ++i) {
    const uint32_t sector = first_sector + i;
    const uint32_t address = sector * geo.sector_size;
    if (cancelled(result, Stage::Erase, address)) {
      return;
    }

    Error blank_error;
    bool blank = false;
    for (uint8_t attempt = 1; attempt <= budget && !blank; ++attempt) {
      Response rsp = command_with_retry(Command::erase(sector, address), Stage::Erase,
                                        address, result);
      if (!rsp.ok) {
        rsp.error.sector = sector;
        fail(result, rsp.error);
        return;
      }

      Error err = wait_erase_complete(address, result);
      if (err) {
        err.sector = sector;
        fail(result, err);
        return;
      }

      std::vector<uint8_t> contents;
      err = read_pages(address, geo.sector_size, Stage::BlankCheck, contents, result, false);
      if (err) {
        err.sector = sector;
        fail(result, err);
        return;
      }

      auto dirty = std::find_if(contents.begin(), contents.end(),
                                [&](uint8_t b) { return b != geo.erase_value; });
      if (dirty == contents.end()) {
        blank = true;
        break;
      }

      blank_error = make_error(ErrorCode::BlankCheckFailed, Stage::BlankCheck,
                               "sector not blank after " + std::to_string(attempt) + " erase(s)");
      blank_error.sector = sector;
      blank_error.address = address + static_cast<uint32_t>(dirty - contents.begin());
      blank_error.expected = geo.erase_value;
      blank_error.actual = *dirty;
      log(result, "Blank-check failed for sector " + std::to_string(sector) + " at " +
                  hex_address(blank_error.address) + ", attempt " + std::to_string(attempt));
      if (attempt < budget) {
        ++result.retry_count;
      }
    }

    if (!blank) {
      fail(result, blank_error);
      return;
    }

    result.last_good_address = address;
    result.resume_address = address + geo.sector_size;
    result.bytes_done += geo.sector_size;
    log(result, "Sector " + std::to_string(sector) + " erased");
    report_progress(Stage::Erase, result.bytes_done, result.total_bytes);
  }
}

void FlashProgrammer::erase_sectors(OperationResult& result, uint32_t first_sector,
                                    uint32_t count) {
  const Geometry& geo = session_.info().geometry;
  result.start_address = first_sector * geo.sector_size;
  result.resume_address = result.start_address;

  if (count == 0 || first_sector >= geo.sector_count() ||
      count > geo.sector_count() - first_sector) {
    Error err = make_error(ErrorCode::OutOfRange, Stage::Erase,
                           "sectors " + std::to_string(first_sector) + "+" +
                           std::to_string(count) + " of " + std::to_string(geo.sector_count()));
    err.address = result.start_address;
    fail(result, err);
    return;
  }

  log(result, "Erasing sectors " + std::to_string(first_sector) + ".." +
              std::to_string(first_sector + count - 1));
  with_bus(result, [&] { do_erase(result, first_sector, count); });
}

OperationResult FlashProgrammer::erase(uint32_t first_sector, uint32_t count) {
  auto lock = session_.lock();
  session_.set_timings(config_.timings);

  OperationResult result;
  if (begin(result, OperationKind::Erase, 0)) {
    erase_sectors(result, first_sector, count);
  }
  return finish(result);
}

OperationResult FlashProgrammer::erase_range(uint32_t address, uint32_t length) {
  auto lock = session_.lock();
  session_.set_timings(config_.timings);

  OperationResult result;
  if (!begin(result, OperationKind::Erase, address)) {
    return finish(result);
  }

  const uint32_t sector_size = session_.info().geometry.sector_size;
  if (address % sector_size != 0) {
    Error err = make_error(ErrorCode::Misaligned, Stage::Erase,
                           "erase offset must be a multiple of the sector size");
    err.address = address;
    fail(result, err);
    return finish(result);
  }

  erase_sectors(result, address / sector_size, page_count(length, sector_size));
  return finish(result);
}

// ================================================================
// Write
// ================================================================

void FlashProgrammer::do_write(OperationResult& result, uint32_t address,
                               const std::vector<uint8_t>& image) {
  const Geometry& geo = session_.info().geometry;
  const uint32_t page_size = geo.page_size;
  const uint32_t pages = page_count(static_cast<uint32_t>(image.size()), page_size);
  const uint8_t budget = std::max<uint8_t>(1, config_.retry_budget);

  result.total_bytes = pages * page_size;
  report_stage(Stage::Write, result.total_bytes);

  for (uint32_t page = 0; page < pages; ++page) {
    const uint32_t offset = page * page_size;
    const uint32_t page_address = address + offset;
    if (cancelled(result, Stage::Write, page_address)) {
      return;
    }

    // Final page is zero padded to a full page
    std::vector<uint8_t> data(page_size, 0x00);
    const size_t available = std::min<size_t>(page_size, image.size() - offset);
    std::copy(image.begin() + offset, image.begin() + offset + available, data.begin());

    Error mismatch;
    bool confirmed = false;
    for (uint8_t attempt = 1; attempt <= budget && !confirmed; ++attempt) {
      Response rsp = command_with_retry(Command::write(page_address, data), Stage::Write,
                                        page_address, result);
      if (!rsp.ok) {
        fail(result, rsp.error);
        return;
      }

      std::vector<uint8_t> readback;
      Error err = read_pages(page_address, page_size, Stage::ReadBack, readback, result, false);
      if (err) {
        fail(result, err);
        return;
      }

      auto diff = std::mismatch(data.begin(), data.end(), readback.begin());
      if (diff.first == data.end()) {
        confirmed = true;
        break;
      }

      const uint32_t bad = page_address + static_cast<uint32_t>(diff.first - data.begin());
      mismatch = make_error(ErrorCode::VerifyMismatch, Stage::ReadBack,
                            "page " + std::to_string(page) + " read back differs after " +
                            std::to_string(attempt) + " write(s)");
      mismatch.address = bad;
      mismatch.expected = *diff.first;
      mismatch.actual = *diff.second;
      log(result, "Read-back mismatch at " + hex_address(bad) + ", attempt " +
                  std::to_string(attempt));
      if (attempt < budget) {
        ++result.retry_count;
      }
    }

    if (!confirmed) {
      fail(result, mismatch);
      return;
    }

    result.last_good_address = page_address;
    result.resume_address = page_address + page_size;
    result.bytes_done = offset + page_size;
    report_progress(Stage::Write, result.bytes_done, result.total_bytes);

    if (config_.inter_page_delay_ms > 0 && page + 1 < pages) {
      std::this_thread::sleep_for(std::chrono::milliseconds(config_.inter_page_delay_ms));
    }
  }
}

OperationResult FlashProgrammer::write(uint32_t address, const std::vector<uint8_t>& image) {
  auto lock = session_.lock();
  session_.set_timings(config_.timings);

  OperationResult result;
  if (!begin(result, OperationKind::Write, address)) {
    return finish(result);
  }

  const Geometry& geo = session_.info().geometry;
  if (image.empty()) {
    log(result, "Nothing to write");
    return finish(result);
  }
  if (address % geo.page_size != 0) {
    Error err = make_error(ErrorCode::Misaligned, Stage::Write,
                           "write offset must be a multiple of the page size");
    err.address = address;
    fail(result, err);
    return finish(result);
  }

  const uint64_t padded =
      static_cast<uint64_t>(page_count(static_cast<uint32_t>(image.size()), geo.page_size)) *
      geo.page_size;
  if (image.size() > geo.total_size || padded > geo.total_size ||
      !geo.contains(address, static_cast<uint32_t>(padded))) {
    Error err = make_error(ErrorCode::OutOfRange, Stage::Write,
                           std::to_string(image.size()) + " bytes do not fit at " +
                           hex_address(address));
    err.address = address;
    fail(result, err);
    return finish(result);
  }

  log(result, "Writing " + std::to_string(image.size()) + " bytes in " +
              std::to_string(page_count(static_cast<uint32_t>(image.size()), geo.page_size)) +
              " pages");
  with_bus(result, [&] { do_write(result, address, image); });
  return finish(result);
}

// ================================================================
// Read / Verify
// ================================================================

OperationResult FlashProgrammer::read(uint32_t address, uint32_t length) {
  auto lock = session_.lock();
  session_.set_timings(config_.timings);

  OperationResult result;
  if (!begin(result, OperationKind::Read, address)) {
    return finish(result);
  }

  const Geometry& geo = session_.info().geometry;
  if (length == 0 || !geo.contains(address, length)) {
    Error err = make_error(ErrorCode::OutOfRange, Stage::Read,
                           std::to_string(length) + " bytes at " + hex_address(address));
    err.address = address;
    fail(result, err);
    return finish(result);
  }

  with_bus(result, [&] {
    result.total_bytes = length;
    report_stage(Stage::Read, length);
    Error err = read_pages(address, length, Stage::Read, result.data, result, true);
    if (err && result.error.ok()) {
      fail(result, err);
    }
  });
  return finish(result);
}

void FlashProgrammer::do_verify(OperationResult& result, uint32_t address,
                                const std::vector<uint8_t>& image) {
  const Geometry& geo = session_.info().geometry;
  const uint32_t length = static_cast<uint32_t>(image.size());
  result.total_bytes = length;
  report_stage(Stage::Verify, length);

  uint32_t offset = 0;
  while (offset < length) {
    const uint32_t current = address + offset;
    if (cancelled(result, Stage::Verify, current)) {
      return;
    }

    const uint32_t to_boundary = geo.page_size - (current % geo.page_size);
    const uint32_t chunk = std::min(length - offset, to_boundary);

    std::vector<uint8_t> flash;
    Error err = read_pages(current, chunk, Stage::Verify, flash, result, false);
    if (err) {
      fail(result, err);
      return;
    }

    auto expected_begin = image.begin() + offset;
    auto diff = std::mismatch(flash.begin(), flash.end(), expected_begin);
    if (diff.first != flash.end()) {
      Error mismatch = make_error(ErrorCode::VerifyMismatch, Stage::Verify);
      mismatch.address = current + static_cast<uint32_t>(diff.first - flash.begin());
      mismatch.expected = *diff.second;
      mismatch.actual = *diff.first;
      fail(result, mismatch);
      return;
    }

    offset += chunk;
    result.last_good_address = current;
    result.resume_address = address + offset;
    result.bytes_done = offset;
    report_progress(Stage::Verify, offset, length);
  }
}

OperationResult FlashProgrammer::verify(uint32_t address, const std::vector<uint8_t>& image) {
  auto lock = session_.lock();
  session_.set_timings(config_.timings);

  OperationResult result;
  if (!begin(result, OperationKind::Verify, address)) {
    return finish(result);
  }

  const Geometry& geo = session_.info().geometry;
  if (image.empty() || image.size() > geo.total_size ||
      !geo.contains(address, static_cast<uint32_t>(image.size()))) {
    Error err = make_error(ErrorCode::OutOfRange, Stage::Verify,
                           std::to_string(image.size()) + " bytes at " + hex_address(address));
    err.address = address;
    fail(result, err);
    return finish(result);
  }

  with_bus(result, [&] { do_verify(result, address, image); });
  return finish(result);
}

// ================================================================
// Reset / Identify
// ================================================================

OperationResult FlashProgrammer::reset() {
  auto lock = session_.lock();
  session_.set_timings(config_.timings);

  OperationResult result;
  result.operation = OperationKind::Reset;
  started_ = std::chrono::steady_clock::now();
  log(result, "Sending reset");

  ++result.commands_sent;
  Response rsp = session_.execute(Command::reset(), config_.timings.response);
  if (!rsp.ok) {
    rsp.error.stage = Stage::Reset;
    if (rsp.error.code == ErrorCode::Timeout) {
      // The device drops off the bus while rebooting
      log(result, "Warning: no answer to reset (device may have reset anyway)");
    } else {
      fail(result, rsp.error);
    }
  }
  return finish(result);
}

Error FlashProgrammer::identify() {
  auto lock = session_.lock();
  session_.set_timings(config_.timings);
  return session_.ensure_identified();
}

} // namespace qoob
