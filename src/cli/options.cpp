#include "cli/options.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace {

const std::vector<std::string> MODES = {"share", "download", "list", "tracker", "interactive"};

uint64_t parse_number(const std::string& option, const std::string& value, uint64_t max) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), ::isdigit)) {
        throw UsageError(option + " expects a non-negative integer, got '" + value + "'");
    }
    uint64_t n = 0;
    try {
        n = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw UsageError(option + " value out of range: " + value);
    }
    if (n > max) {
        throw UsageError(option + " value out of range: " + value);
    }
    return n;
}

} // namespace

CommandLine parse_command_line(int argc, const char* const argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        throw UsageError("missing mode");
    }

    CommandLine cmd;
    cmd.mode = args[0];
    if (std::find(MODES.begin(), MODES.end(), cmd.mode) == MODES.end()) {
        throw UsageError("unknown mode: " + cmd.mode);
    }

    // --config first so that the remaining options override it
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) throw UsageError("--config requires a value");
            cmd.config = Config::from_file(args[i + 1]);
        }
    }

    Config& c = cmd.config;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg.rfind("--", 0) != 0) {
            cmd.positional.push_back(arg);
            continue;
        }
        if (arg == "--verbose") { c.verbose = true; continue; }
        if (arg == "--stay") { cmd.stay = true; continue; }

        if (i + 1 >= args.size()) {
            throw UsageError(arg + " requires a value");
        }
        const std::string& value = args[++i];

        if (arg == "--config") {
            // applied above
        } else if (arg == "--tracker") {
            c.tracker_url = value;
        } else if (arg == "--port") {
            c.port = static_cast<uint16_t>(parse_number(arg, value, std::numeric_limits<uint16_t>::max()));
            c.tracker_port = c.port;
            cmd.port_given = true;
        } else if (arg == "--chunk-size") {
            c.chunk_size = static_cast<uint32_t>(parse_number(arg, value, std::numeric_limits<uint32_t>::max()));
        } else if (arg == "--workers") {
            c.workers = static_cast<size_t>(parse_number(arg, value, 1024));
        } else if (arg == "--timeout-ms") {
            c.request_timeout = std::chrono::milliseconds(parse_number(arg, value, 3600 * 1000));
        } else if (arg == "--store") {
            c.store_dir = value;
        } else if (arg == "--data") {
            c.data_dir = value;
        } else if (arg == "--ip") {
            c.advertise_ip = value;
        } else if (arg == "--log") {
            c.log_file = value;
        } else {
            throw UsageError("unknown option: " + arg);
        }
    }

    if ((cmd.mode == "share" || cmd.mode == "download") && cmd.positional.size() != 1) {
        throw UsageError(cmd.mode + " takes exactly one argument");
    }
    if ((cmd.mode == "list" || cmd.mode == "tracker" || cmd.mode == "interactive") && !cmd.positional.empty()) {
        throw UsageError(cmd.mode + " takes no arguments");
    }

    c.validate();
    return cmd;
}

int exit_status_for(ErrorCode code) {
    return is_unavailable(code) ? EXIT_STATUS_UNAVAILABLE : EXIT_STATUS_FAILURE;
}

std::string usage_text() {
    std::ostringstream out;
    out << "Usage: chunkshare <mode> [args] [options]\n"
        << "Modes:\n"
        << "  share <file>            - Share a file and serve it until interrupted\n"
        << "  download <file_name>    - Download a file into the store\n"
        << "  list                    - List files known to the tracker\n"
        << "  tracker                 - Run the tracker (default port " << Config::DEFAULT_TRACKER_PORT << ")\n"
        << "  interactive             - Run a peer with an interactive shell\n"
        << "Options:\n"
        << "  --config <file.json>    --tracker <url>        --port <n>\n"
        << "  --chunk-size <n>        --workers <n>          --timeout-ms <n>\n"
        << "  --store <dir>           --data <dir>           --ip <addr>\n"
        << "  --log <file>            --verbose              --stay (download: keep serving)\n"
        << "Exit status: 0 success, 1 usage error, 2 failure, 3 file not available\n";
    return out.str();
}
