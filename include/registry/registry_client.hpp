#ifndef CHUNKSHARE_REGISTRY_CLIENT_HPP
#define CHUNKSHARE_REGISTRY_CLIENT_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

#include "../files/manifest.hpp"
#include "../network/protocol.hpp"

// One peer's advertisement for one file.
struct PeerRecord {
    std::string ip;
    uint16_t port = 0;
    std::vector<uint32_t> chunks;

    PeerAddress address() const { return PeerAddress{ip, port}; }
};

struct LookupResult {
    content_id_t content_id;
    std::string file_name;
    uint64_t file_size = 0;
    std::vector<PeerRecord> peers; // registration order
};

struct FileListing {
    content_id_t content_id;
    std::string file_name;
    uint64_t file_size = 0;
    size_t peer_count = 0;
};

struct PublishRequest {
    content_id_t content_id;
    std::string file_name;
    uint64_t file_size = 0;
    std::vector<uint32_t> chunks;
    std::string ip;
    uint16_t port = 0;
};

struct PublishResult {
    std::string message;
    content_id_t content_id;
    size_t peers_count = 0;
};

/**
 * @brief What a peer needs from the discovery service.
 *
 * Errors: RegistryUnreachable when the registry cannot be reached or answers
 * nonsense, RegistryRejected when it refuses a well-formed call. "Not found"
 * is not an error: lookup() returns nullopt.
 */
class RegistryClient {
public:
    virtual ~RegistryClient() = default;

    // Republishing the same ip:port for a content id updates its chunk list.
    virtual PublishResult publish(const PublishRequest& request) = 0;

    virtual std::optional<LookupResult> lookup(const std::string& file_name) = 0;

    virtual std::vector<FileListing> list_files() = 0;
};

#endif // CHUNKSHARE_REGISTRY_CLIENT_HPP
