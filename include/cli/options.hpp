#ifndef CHUNKSHARE_OPTIONS_HPP
#define CHUNKSHARE_OPTIONS_HPP

#include <string>
#include <vector>
#include <stdexcept>

#include "../common/config.hpp"
#include "../common/error.hpp"

// Bad command line; main() prints usage and exits with status 1.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct CommandLine {
    std::string mode;                    // share | download | list | tracker | interactive
    std::vector<std::string> positional; // file path or file name
    Config config;
    bool port_given = false;
    bool stay = false;
};

/**
 * @brief Parses "<mode> [args] [options]".
 *
 * A --config file is applied first, every other option overrides it.
 * Throws UsageError for unknown modes and options or missing values, and
 * ChunkShareError(InvalidArgument) for values Config rejects.
 */
CommandLine parse_command_line(int argc, const char* const argv[]);

// Process exit statuses.
constexpr int EXIT_STATUS_OK = 0;
constexpr int EXIT_STATUS_USAGE = 1;
constexpr int EXIT_STATUS_FAILURE = 2;
constexpr int EXIT_STATUS_UNAVAILABLE = 3; // NotFound, NoSources

int exit_status_for(ErrorCode code);

std::string usage_text();

#endif // CHUNKSHARE_OPTIONS_HPP
