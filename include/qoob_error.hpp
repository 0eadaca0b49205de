#pragma once
/**
 * @file qoob_error.hpp
 * @brief Error taxonomy for the Qoob Pro flashing protocol
 *
 * Errors are carried as values inside result structures. The interpreter
 * classifies each code so the programmer can decide what to retry:
 *
 *   Transient (retry the single command):
 *     Timeout, IoError, ChecksumInvalid, DeviceError
 *
 *   Data integrity (retry the page/sector, then always surface with location):
 *     BlankCheckFailed, VerifyMismatch
 *
 *   Fatal (abort immediately):
 *     everything else
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace qoob {

// ============================================================================
// Error codes
// ============================================================================

enum class ErrorCode : uint8_t {
    None = 0,

    // === Transport / discovery ===
    DeviceNotFound,        ///< No matching device on the bus
    MultipleDevices,       ///< More than one device, cannot choose
    PermissionDenied,      ///< Host denied access to the device node
    Busy,                  ///< Device node or flash bus held by someone else
    NotConnected,          ///< Operation on a closed handle
    Timeout,               ///< No response within the deadline
    IoError,               ///< Short or failed transfer

    // === Codec ===
    ChecksumInvalid,       ///< Trailing checksum does not match C(bytes)
    ProtocolMismatch,      ///< Wrong response length or layout
    UnsupportedDevice,     ///< Identify reported unknown version/geometry
    DeviceError,           ///< Device answered with an error status byte

    // === Programmer ===
    BlankCheckFailed,      ///< Sector not blank after erase retries
    VerifyMismatch,        ///< Read-back differs from expected data
    RetryBudgetExceeded,   ///< Command failed on every attempt
    OutOfRange,            ///< Address range exceeds the flash
    Misaligned,            ///< Write/erase offset not page/sector aligned
    Cancelled,             ///< abort() observed at a page/sector boundary

    // === Slot map ===
    InvalidHeader,         ///< File header magic not recognised
    TooBig,                ///< File does not fit in the destination
    RangeOccupied          ///< Destination sectors are not blank
};

/// Which step of an operation was running when an error was raised
enum class Stage : uint8_t {
    None = 0,
    Discovery,
    Identify,
    BusAcquire,
    BusRelease,
    Erase,
    BlankCheck,
    Write,
    ReadBack,
    Read,
    Verify,
    Reset
};

/// Category used for retry decisions
enum class ErrorCategory : uint8_t {
    Success,
    Transient,
    DataIntegrity,
    Connection,
    Protocol,
    Usage,
    Cancelled
};

/**
 * @brief A structured failure
 *
 * Only the fields relevant to @ref code are meaningful. Address and
 * expected/actual bytes are set for VerifyMismatch and BlankCheckFailed,
 * sector for BlankCheckFailed, device_status for DeviceError, transferred
 * for an IoError caused by a short transfer.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    Stage stage{Stage::None};
    uint32_t address{0};
    std::optional<uint32_t> sector;
    std::optional<uint8_t> expected;
    std::optional<uint8_t> actual;
    std::optional<uint8_t> device_status;
    std::optional<uint32_t> transferred;    ///< Bytes moved by a short transfer
    std::string detail;

    bool ok() const { return code == ErrorCode::None; }
    explicit operator bool() const { return code != ErrorCode::None; }
};

/// Shorthand for building an error without location data
inline Error make_error(ErrorCode code, Stage stage = Stage::None, std::string detail = {}) {
    Error e;
    e.code = code;
    e.stage = stage;
    e.detail = std::move(detail);
    return e;
}

/// IoError for a transfer that moved fewer bytes than requested
inline Error short_transfer(size_t done, size_t wanted) {
    Error e = make_error(ErrorCode::IoError, Stage::None,
                         "transferred " + std::to_string(done) + " of " + std::to_string(wanted));
    e.transferred = static_cast<uint32_t>(done);
    return e;
}

// ============================================================================
// Error interpreter
// ============================================================================

class ErrorInterpreter {
public:
    /// Short name, e.g. "VerifyMismatch"
    static const char* name(ErrorCode code);

    /// Stage name, e.g. "write"
    static const char* stage_name(Stage stage);

    /// Human-readable description of the code
    static std::string get_description(ErrorCode code);

    static ErrorCategory get_category(ErrorCode code);

    /// True when a single-command retry may succeed
    static bool is_transient(ErrorCode code);

    /// True for errors that must always reach the caller with a location
    static bool is_data_integrity(ErrorCode code);

    /// Process exit code for the command-line front end
    static int exit_code(ErrorCode code);

    /// One-line rendering with stage, address and data, for logs
    static std::string format(const Error& error);
};

} // namespace qoob
