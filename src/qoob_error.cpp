#include "qoob_error.hpp"
#include <sstream>
#include <iomanip>

namespace qoob {

// ============================================================================
// Names
// ============================================================================

const char* ErrorInterpreter::name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::DeviceNotFound: return "DeviceNotFound";
        case ErrorCode::MultipleDevices: return "MultipleDevices";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::Busy: return "Busy";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ChecksumInvalid: return "ChecksumInvalid";
        case ErrorCode::ProtocolMismatch: return "ProtocolMismatch";
        case ErrorCode::UnsupportedDevice: return "UnsupportedDevice";
        case ErrorCode::DeviceError: return "DeviceError";
        case ErrorCode::BlankCheckFailed: return "BlankCheckFailed";
        case ErrorCode::VerifyMismatch: return "VerifyMismatch";
        case ErrorCode::RetryBudgetExceeded: return "RetryBudgetExceeded";
        case ErrorCode::OutOfRange: return "OutOfRange";
        case ErrorCode::Misaligned: return "Misaligned";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InvalidHeader: return "InvalidHeader";
        case ErrorCode::TooBig: return "TooBig";
        case ErrorCode::RangeOccupied: return "RangeOccupied";
        default: return "Unknown";
    }
}

const char* ErrorInterpreter::stage_name(Stage stage) {
    switch (stage) {
        case Stage::None: return "none";
        case Stage::Discovery: return "discovery";
        case Stage::Identify: return "identify";
        case Stage::BusAcquire: return "bus-acquire";
        case Stage::BusRelease: return "bus-release";
        case Stage::Erase: return "erase";
        case Stage::BlankCheck: return "blank-check";
        case Stage::Write: return "write";
        case Stage::ReadBack: return "read-back";
        case Stage::Read: return "read";
        case Stage::Verify: return "verify";
        case Stage::Reset: return "reset";
        default: return "unknown";
    }
}

// ============================================================================
// Descriptions
// ============================================================================

std::string ErrorInterpreter::get_description(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "Success";
        case ErrorCode::DeviceNotFound:
            return "Device not found";
        case ErrorCode::MultipleDevices:
            return "Multiple devices are connected, can't choose one";
        case ErrorCode::PermissionDenied:
            return "Permission denied opening the device (check udev rules)";
        case ErrorCode::Busy:
            return "Bus busy, try again later";
        case ErrorCode::NotConnected:
            return "Device handle is not open";
        case ErrorCode::Timeout:
            return "Timed out waiting for the device";
        case ErrorCode::IoError:
            return "USB transfer failed";
        case ErrorCode::ChecksumInvalid:
            return "Response checksum mismatch";
        case ErrorCode::ProtocolMismatch:
            return "Unexpected response layout";
        case ErrorCode::UnsupportedDevice:
            return "Device version or flash geometry not supported";
        case ErrorCode::DeviceError:
            return "Device reported an error status";
        case ErrorCode::BlankCheckFailed:
            return "Sector is not blank after erase";
        case ErrorCode::VerifyMismatch:
            return "Data verification failed";
        case ErrorCode::RetryBudgetExceeded:
            return "Command failed on every retry";
        case ErrorCode::OutOfRange:
            return "Address range outside of flash";
        case ErrorCode::Misaligned:
            return "Offset is not aligned to the page/sector size";
        case ErrorCode::Cancelled:
            return "Operation cancelled";
        case ErrorCode::InvalidHeader:
            return "The file header is invalid";
        case ErrorCode::TooBig:
            return "The file is too big for the destination slot";
        case ErrorCode::RangeOccupied:
            return "The destination range is not blank";
        default:
            return "Unknown error";
    }
}

// ============================================================================
// Classification
// ============================================================================

ErrorCategory ErrorInterpreter::get_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return ErrorCategory::Success;

        case ErrorCode::Timeout:
        case ErrorCode::IoError:
        case ErrorCode::ChecksumInvalid:
        case ErrorCode::DeviceError:
            return ErrorCategory::Transient;

        case ErrorCode::BlankCheckFailed:
        case ErrorCode::VerifyMismatch:
            return ErrorCategory::DataIntegrity;

        case ErrorCode::DeviceNotFound:
        case ErrorCode::MultipleDevices:
        case ErrorCode::PermissionDenied:
        case ErrorCode::Busy:
        case ErrorCode::NotConnected:
            return ErrorCategory::Connection;

        case ErrorCode::ProtocolMismatch:
        case ErrorCode::UnsupportedDevice:
        case ErrorCode::RetryBudgetExceeded:
            return ErrorCategory::Protocol;

        case ErrorCode::Cancelled:
            return ErrorCategory::Cancelled;

        default:
            return ErrorCategory::Usage;
    }
}

bool ErrorInterpreter::is_transient(ErrorCode code) {
    return get_category(code) == ErrorCategory::Transient;
}

bool ErrorInterpreter::is_data_integrity(ErrorCode code) {
    return get_category(code) == ErrorCategory::DataIntegrity;
}

int ErrorInterpreter::exit_code(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return 0;
        case ErrorCode::DeviceNotFound:
        case ErrorCode::MultipleDevices:
        case ErrorCode::NotConnected:
            return 3;
        case ErrorCode::PermissionDenied:
        case ErrorCode::Busy:
            return 4;
        case ErrorCode::BlankCheckFailed:
        case ErrorCode::VerifyMismatch:
            return 6;
        case ErrorCode::Cancelled:
            return 7;
        case ErrorCode::OutOfRange:
        case ErrorCode::Misaligned:
        case ErrorCode::InvalidHeader:
        case ErrorCode::TooBig:
        case ErrorCode::RangeOccupied:
            return 8;
        default:
            return 5;
    }
}

std::string ErrorInterpreter::format(const Error& error) {
    std::ostringstream oss;
    oss << name(error.code);
    if (error.code == ErrorCode::None) {
        return oss.str();
    }
    if (error.stage != Stage::None) {
        oss << " during " << stage_name(error.stage);
    }
    oss << std::hex << std::uppercase << std::setfill('0');
    if (error.sector) {
        oss << " sector " << std::dec << *error.sector << std::hex;
    }
    if (error.stage != Stage::None && error.stage != Stage::Discovery) {
        oss << " at 0x" << std::setw(6) << error.address;
    }
    if (error.expected && error.actual) {
        oss << " (expected 0x" << std::setw(2) << static_cast<int>(*error.expected)
            << ", got 0x" << std::setw(2) << static_cast<int>(*error.actual) << ")";
    }
    if (error.device_status) {
        oss << " status 0x" << std::setw(2) << static_cast<int>(*error.device_status);
    }
    oss << ": " << get_description(error.code);
    if (!error.detail.empty()) {
        oss << " (" << error.detail << ")";
    }
    return oss.str();
}

} // namespace qoob
