#ifndef QOOB_FLASH_PROGRAMMER_HPP
#define QOOB_FLASH_PROGRAMMER_HPP

/*
  Flash programmer

  Sequences multi-step flash operations over a DeviceSession:

  erase(first, count)
    for each sector, ascending:
      Erase -> poll status until idle -> blank-check read of the sector
      blank-check failure: erase the same sector again, up to the retry budget

  write(address, image)
    for each page (final page zero padded):
      Write -> Read the page back -> compare
      mismatch: rewrite the same page, up to the retry budget
      a page is never skipped

  read(address, length)    one Read per page, no verification
  verify(address, image)   read and compare only

  Failure policy:
  - Transient errors (timeout, checksum, I/O, device status) retry the
    single command, up to the retry budget, then RetryBudgetExceeded
  - Data-integrity errors (blank-check, verify mismatch) retry the
    page/sector, then surface with the exact address
  - Cancellation (abort()) is honoured only between pages/sectors. A
    request stays pending until an operation stops on it, so one arriving
    after the last boundary of an operation cancels the next one

  Every operation holds the session lock and the device bus for its whole
  duration and reports the last confirmed-good page/sector and the address to
  resume from.
*/

#include "qoob_session.hpp"
#include "qoob_progress.hpp"
#include <atomic>
#include <vector>

namespace qoob {

// ================================================================
// Programmer Configuration
// ================================================================
struct ProgrammerConfig {
  // Attempts per command and per page/sector (first try included)
  uint8_t retry_budget{3};

  Timings timings;
  uint32_t inter_page_delay_ms{0};

  // Optional; not owned
  ProgressSink* progress{nullptr};
};

// ================================================================
// Flash Programmer
// ================================================================
class FlashProgrammer {
public:
  explicit FlashProgrammer(DeviceSession& session, ProgrammerConfig config = {});

  /// Erase `count` sectors starting at `first_sector`
  OperationResult erase(uint32_t first_sector, uint32_t count);

  /// Erase the sectors of a sector-aligned byte range
  OperationResult erase_range(uint32_t address, uint32_t length);

  /// Program a page-aligned image with per-page read-back
  OperationResult write(uint32_t address, const std::vector<uint8_t>& image);

  /// Read any byte range
  OperationResult read(uint32_t address, uint32_t length);

  /// Compare flash against an image without writing
  OperationResult verify(uint32_t address, const std::vector<uint8_t>& image);

  /// Send the reset command. Best effort, as the vendor tool does.
  OperationResult reset();

  /// Identify the device (cached after the first success)
  Error identify();

  /// Request cancellation at the next page/sector boundary. Thread-safe.
  void abort() { abort_requested_ = true; }
  bool abort_requested() const { return abort_requested_; }

  /// Drop a pending abort request that no operation has consumed
  void clear_abort() { abort_requested_ = false; }

  const ProgrammerConfig& config() const { return config_; }
  void set_config(const ProgrammerConfig& config) { config_ = config; }

  DeviceSession& session() { return session_; }

  /// ceil(length / page_size)
  static uint32_t page_count(uint32_t length, uint32_t page_size);

private:
  // Setup shared by all flash operations; false if result already failed
  bool begin(OperationResult& result, OperationKind kind, uint32_t address);

  // Range check, then erase under the bus lock
  void erase_sectors(OperationResult& result, uint32_t first_sector, uint32_t count);

  // Bodies, run with the session locked and the bus held
  void do_erase(OperationResult& result, uint32_t first_sector, uint32_t count);
  void do_write(OperationResult& result, uint32_t address, const std::vector<uint8_t>& image);
  void do_verify(OperationResult& result, uint32_t address, const std::vector<uint8_t>& image);

  // Acquire the bus, run body if granted, release
  template <typename Body>
  void with_bus(OperationResult& result, Body body);

  OperationResult& finish(OperationResult& result);
  void fail(OperationResult& result, Error error);

  /// One command with transient-error retries
  Response command_with_retry(const Command& cmd, Stage stage, uint32_t address,
                              OperationResult& result);

  /// Poll status until the erase busy flag clears
  Error wait_erase_complete(uint32_t address, OperationResult& result);

  /// Read a range page by page into `out`. A top-level read reports
  /// progress and honours abort() between pages.
  Error read_pages(uint32_t address, uint32_t length, Stage stage,
                   std::vector<uint8_t>& out, OperationResult& result,
                   bool top_level);

  /// True (and result failed with Cancelled) if abort() was requested.
  /// Consumes the request.
  bool cancelled(OperationResult& result, Stage stage, uint32_t address);

  void log(OperationResult& result, const std::string& message);
  void report_stage(Stage stage, uint32_t total);
  void report_progress(Stage stage, uint32_t done, uint32_t total);

  DeviceSession& session_;
  ProgrammerConfig config_;
  std::atomic<bool> abort_requested_{false};
  std::chrono::steady_clock::time_point started_;
};

} // namespace qoob

#endif // QOOB_FLASH_PROGRAMMER_HPP
