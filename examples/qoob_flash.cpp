/*
  qoob_flash: command-line front end for the Qoob Pro flasher

  Usage: qoob_flash [options] <command> [args]

    identify                          show device info
    list                              show the files stored on the chip
    erase <sector> [count]            erase sectors
    write <file> [--address A | --slot N] [--erase]
    read <file> <address> <length>
    verify <file> [--address A]
    reset                             reboot the chip

  Options: --path P  --retries N  --timeout-ms N  --verbose

  Ctrl-C stops an operation at the next page/sector boundary.
*/

#include "qoob.hpp"
#include "protocol_table.hpp"
#include "qoob_session.hpp"
#include "flash_programmer.hpp"
#include "slot_map.hpp"
#include "hid_transport.hpp"
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using namespace qoob;

namespace {

constexpr int kExitUsage = 2;
constexpr int kExitFile = 8;

qoob::FlashProgrammer* g_programmer = nullptr;

void on_interrupt(int) {
    if (g_programmer) {
        g_programmer->abort();
    }
}

struct Options {
    std::string path;
    uint8_t retries{3};
    uint32_t timeout_ms{1000};
    bool verbose{false};
    bool erase_first{false};
    bool has_address{false};
    uint32_t address{0};
    bool has_slot{false};
    uint32_t slot{0};
    std::vector<std::string> args;
};

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options] <command> [args]\n"
              << "Commands:\n"
              << "  identify\n"
              << "  list\n"
              << "  erase <sector> [count]\n"
              << "  write <file> [--address A | --slot N] [--erase]\n"
              << "  read <file> <address> <length>\n"
              << "  verify <file> [--address A]\n"
              << "  reset\n"
              << "Options:\n"
              << "  --path P        device path (default: the only Qoob attached)\n"
              << "  --retries N     attempts per command, page and sector (default 3)\n"
              << "  --timeout-ms N  response timeout (default 1000)\n"
              << "  --verbose       print the operation log\n";
}

bool parse_number(const std::string& text, uint32_t& value) {
    try {
        size_t used = 0;
        unsigned long v = std::stoul(text, &used, 0);
        if (used != text.size() || v > 0xFFFFFFFFul) {
            return false;
        }
        value = static_cast<uint32_t>(v);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parse_options(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](uint32_t& out) {
            return i + 1 < argc && parse_number(argv[++i], out);
        };

        if (arg == "--path") {
            if (i + 1 >= argc) return false;
            opts.path = argv[++i];
        } else if (arg == "--retries") {
            uint32_t n = 0;
            if (!next(n) || n == 0 || n > 255) return false;
            opts.retries = static_cast<uint8_t>(n);
        } else if (arg == "--timeout-ms") {
            if (!next(opts.timeout_ms) || opts.timeout_ms == 0) return false;
        } else if (arg == "--address") {
            if (!next(opts.address)) return false;
            opts.has_address = true;
        } else if (arg == "--slot") {
            if (!next(opts.slot)) return false;
            opts.has_slot = true;
        } else if (arg == "--erase") {
            opts.erase_first = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            opts.args.push_back(arg);
        }
    }
    return !opts.args.empty() && !(opts.has_address && opts.has_slot);
}

bool load_file(const std::string& filename, std::vector<uint8_t>& data) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        return false;
    }
    data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

bool save_file(const std::string& filename, const std::vector<uint8_t>& data) {
    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(file);
}

int report(const OperationResult& result, bool verbose) {
    if (verbose) {
        for (const auto& line : result.log_messages) {
            std::cerr << "  " << line << "\n";
        }
    }
    if (result.success) {
        return 0;
    }
    std::cerr << "Error: " << ErrorInterpreter::format(result.error) << "\n";
    if (result.last_good_address) {
        std::cerr << "Last good address: 0x" << std::hex << *result.last_good_address
                  << ", resume at 0x" << result.resume_address << std::dec << "\n";
    }
    return ErrorInterpreter::exit_code(result.error.code);
}

int report_error(const Error& error) {
    std::cerr << "Error: " << ErrorInterpreter::format(error) << "\n";
    return ErrorInterpreter::exit_code(error.code);
}

// ----------------------------------------------------------------------------
// Commands
// ----------------------------------------------------------------------------

int cmd_identify(FlashProgrammer& programmer) {
    Error err = programmer.identify();
    if (err) {
        return report_error(err);
    }
    const DeviceInfo& info = programmer.session().info();
    std::cout << "Device:       " << info.manufacturer << " " << info.product << "\n"
              << "USB id:       " << std::hex << std::setfill('0')
              << std::setw(4) << info.vendor_id << ":" << std::setw(4) << info.product_id
              << std::dec << std::setfill(' ') << "\n"
              << "Path:         " << info.path << "\n"
              << "Protocol:     " << info.protocol_version << "\n"
              << "Flash:        " << info.geometry.total_size << " bytes, "
              << info.geometry.sector_count() << " sectors of " << info.geometry.sector_size
              << ", page " << info.geometry.page_size << "\n";
    return 0;
}

int cmd_list(FlashProgrammer& programmer, bool verbose) {
    auto scanned = slots::scan(programmer);
    if (verbose) {
        for (const auto& line : scanned.log_messages) {
            std::cerr << "  " << line << "\n";
        }
    }
    if (!scanned.ok) {
        return report_error(scanned.error);
    }

    const auto& sectors = scanned.map.sectors();
    for (uint32_t i = 0; i < sectors.size(); ++i) {
        std::cout << std::setw(2) << i << "  ";
        switch (sectors[i].occupancy) {
            case slots::Occupancy::Empty:
                std::cout << "empty\n";
                break;
            case slots::Occupancy::Unknown:
                std::cout << "unknown\n";
                break;
            case slots::Occupancy::Slot: {
                if (sectors[i].slot != i) {
                    std::cout << "  (part of " << sectors[i].slot << ")\n";
                    break;
                }
                const slots::Header* header = scanned.map.slot_info(i);
                std::cout << slots::file_type_name(header->type()) << "  "
                          << header->size() << " bytes  \"" << header->description() << "\"\n";
                break;
            }
        }
    }
    return 0;
}

int cmd_erase(FlashProgrammer& programmer, const Options& opts) {
    uint32_t first = 0;
    uint32_t count = 1;
    if (opts.args.size() < 2 || !parse_number(opts.args[1], first) ||
        (opts.args.size() > 2 && !parse_number(opts.args[2], count))) {
        return kExitUsage;
    }
    return report(programmer.erase(first, count), opts.verbose);
}

int cmd_write(FlashProgrammer& programmer, const Options& opts) {
    if (opts.args.size() != 2) {
        return kExitUsage;
    }
    std::vector<uint8_t> image;
    if (!load_file(opts.args[1], image) || image.empty()) {
        std::cerr << "Cannot read " << opts.args[1] << "\n";
        return kExitFile;
    }

    uint32_t address = opts.address;
    if (opts.has_slot) {
        // Header reads are not worth a progress line each
        ProgrammerConfig saved = programmer.config();
        ProgrammerConfig quiet = saved;
        quiet.progress = nullptr;
        programmer.set_config(quiet);
        auto scanned = slots::scan(programmer);
        programmer.set_config(saved);
        if (!scanned.ok) {
            return report_error(scanned.error);
        }
        Error err = scanned.map.check_destination(opts.slot, image);
        // --erase overwrites whatever is there
        if (err && !(opts.erase_first && err.code == ErrorCode::RangeOccupied)) {
            return report_error(err);
        }
        address = opts.slot * scanned.map.geometry().sector_size;
    }

    if (opts.erase_first) {
        int rc = report(programmer.erase_range(address, static_cast<uint32_t>(image.size())),
                        opts.verbose);
        if (rc != 0) {
            return rc;
        }
        // Ctrl-C after the last sector was erased
        if (programmer.abort_requested()) {
            Error cancelled = make_error(ErrorCode::Cancelled, Stage::Write, "abort requested");
            cancelled.address = address;
            return report_error(cancelled);
        }
    }
    return report(programmer.write(address, image), opts.verbose);
}

int cmd_read(FlashProgrammer& programmer, const Options& opts) {
    uint32_t address = 0;
    uint32_t length = 0;
    if (opts.args.size() != 4 || !parse_number(opts.args[2], address) ||
        !parse_number(opts.args[3], length)) {
        return kExitUsage;
    }
    OperationResult result = programmer.read(address, length);
    int rc = report(result, opts.verbose);
    if (rc != 0) {
        return rc;
    }
    if (!save_file(opts.args[1], result.data)) {
        std::cerr << "Cannot write " << opts.args[1] << "\n";
        return kExitFile;
    }
    return 0;
}

int cmd_verify(FlashProgrammer& programmer, const Options& opts) {
    if (opts.args.size() != 2) {
        return kExitUsage;
    }
    std::vector<uint8_t> image;
    if (!load_file(opts.args[1], image) || image.empty()) {
        std::cerr << "Cannot read " << opts.args[1] << "\n";
        return kExitFile;
    }
    return report(programmer.verify(opts.address, image), opts.verbose);
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts)) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    const std::string& command = opts.args[0];
    static const char* const kCommands[] = {
        "identify", "list", "erase", "write", "read", "verify", "reset"};
    bool known = false;
    for (const char* c : kCommands) {
        known = known || command == c;
    }
    if (!known) {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return kExitUsage;
    }

    hid::Library hidapi;
    if (hidapi.error()) {
        return report_error(hidapi.error());
    }

    const ProtocolTable& table = qoob_pro_v1();
    hid::Connection conn = hid::connect(table, opts.path);
    if (!conn.transport) {
        return report_error(conn.error);
    }

    ProgrammerConfig config;
    config.retry_budget = opts.retries;
    config.timings.response = std::chrono::milliseconds(opts.timeout_ms);

    DeviceSession session(std::move(conn.transport), table, conn.candidate, config.timings);

    // Progress lines go through a queue so a slow terminal never holds up USB
    CallbackProgressSink printer;
    printer.stage_callback = [](Stage stage, uint32_t total) {
        std::cerr << ErrorInterpreter::stage_name(stage) << ": " << total << " bytes\n";
    };
    printer.progress_callback = [](Stage stage, uint32_t done, uint32_t total) {
        std::cerr << "\r" << ErrorInterpreter::stage_name(stage) << " " << done << "/" << total
                  << (done == total ? "\n" : "") << std::flush;
    };
    QueuedProgressSink queued(printer);

    FlashProgrammer programmer(session, config);
    g_programmer = &programmer;
    std::signal(SIGINT, on_interrupt);

    int rc = 0;
    if (command == "identify") {
        rc = cmd_identify(programmer);
    } else if (command == "list") {
        rc = cmd_list(programmer, opts.verbose);
    } else if (command == "reset") {
        rc = report(programmer.reset(), opts.verbose);
    } else {
        config.progress = &queued;
        programmer.set_config(config);

        if (command == "erase") {
            rc = cmd_erase(programmer, opts);
        } else if (command == "write") {
            rc = cmd_write(programmer, opts);
        } else if (command == "read") {
            rc = cmd_read(programmer, opts);
        } else {
            rc = cmd_verify(programmer, opts);
        }
        queued.flush();
    }

    std::signal(SIGINT, SIG_DFL);
    g_programmer = nullptr;

    if (rc == kExitUsage) {
        print_usage(argv[0]);
    }
    return rc;
}
