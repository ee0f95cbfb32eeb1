#ifndef CHUNKSHARE_ERROR_HPP
#define CHUNKSHARE_ERROR_HPP

#include <stdexcept>
#include <string>

enum class ErrorCode {
    InvalidArgument,
    RegistryUnreachable,
    RegistryRejected,
    NotFound,
    NoSources,
    ChunkFetchFailed,
    NoAvailablePeers,
    HashMismatch,
    StorageError
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:     return "InvalidArgument";
        case ErrorCode::RegistryUnreachable: return "RegistryUnreachable";
        case ErrorCode::RegistryRejected:    return "RegistryRejected";
        case ErrorCode::NotFound:            return "NotFound";
        case ErrorCode::NoSources:           return "NoSources";
        case ErrorCode::ChunkFetchFailed:    return "ChunkFetchFailed";
        case ErrorCode::NoAvailablePeers:    return "NoAvailablePeers";
        case ErrorCode::HashMismatch:        return "HashMismatch";
        case ErrorCode::StorageError:        return "StorageError";
    }
    return "Unknown";
}

// Nothing to download right now: no registry record, or a record with no peers.
// Reported to the user as a result, not as a failure.
inline bool is_unavailable(ErrorCode code) {
    return code == ErrorCode::NotFound || code == ErrorCode::NoSources;
}

/**
 * @brief The single exception type thrown across module boundaries.
 *
 * The code tells a caller whether retrying the whole operation makes sense
 * (HashMismatch, RegistryUnreachable) or not (InvalidArgument).
 */
class ChunkShareError : public std::runtime_error {
public:
    ChunkShareError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

#endif // CHUNKSHARE_ERROR_HPP
