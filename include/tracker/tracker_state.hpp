#ifndef CHUNKSHARE_TRACKER_STATE_HPP
#define CHUNKSHARE_TRACKER_STATE_HPP

#include <mutex>
#include <unordered_map>
#include <vector>
#include <string>

#include "../registry/registry_client.hpp"

/**
 * @brief The tracker's in-memory directory: content id -> file info + peers.
 *
 * Also usable in-process as a RegistryClient. All methods are thread-safe.
 * Entries are never expired; stale peers are the downloader's problem.
 */
class TrackerState : public RegistryClient {
public:
    PublishResult publish(const PublishRequest& request) override;
    std::optional<LookupResult> lookup(const std::string& file_name) override;
    std::vector<FileListing> list_files() override;

    std::optional<LookupResult> lookup_by_content_id(const content_id_t& content_id) const;
    size_t file_count() const;

private:
    struct Entry {
        std::string file_name;
        uint64_t file_size = 0;
        std::vector<PeerRecord> peers;
    };

    LookupResult to_lookup_result(const content_id_t& content_id, const Entry& entry) const;

    mutable std::mutex mutex_;
    std::unordered_map<content_id_t, Entry> files_;
    std::vector<content_id_t> order_; // first registration order
};

#endif // CHUNKSHARE_TRACKER_STATE_HPP
