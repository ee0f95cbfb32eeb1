#ifndef CHUNKSHARE_DOWNLOAD_MANAGER_HPP
#define CHUNKSHARE_DOWNLOAD_MANAGER_HPP

#include "manifest.hpp"
#include "download_session.hpp"
#include "../registry/registry_client.hpp"
#include "../network/chunk_client.hpp"
#include "../storage/storage_manager.hpp"
#include "../common/config.hpp"
#include <filesystem>
#include <functional>
#include <string>

namespace fs = std::filesystem;

struct DownloadResult {
    content_id_t content_id;
    std::string file_name;
    uint64_t file_size = 0;
    fs::path path;           // <store_dir>/<content_id>
    bool from_store = false; // already present and verified, nothing fetched
};

/**
 * @brief Turns a file name into a verified file in the local store.
 *
 * lookup -> DownloadSession -> <content_id>.part -> verify -> rename.
 * A file that fails verification is deleted and reported as HashMismatch;
 * it is never retried here.
 */
class DownloadManager {
public:
    DownloadManager(RegistryClient& registry, StorageManager& storage, ChunkFetcher& fetcher,
                    const Config& config);

    /**
     * @throws ChunkShareError with code NotFound, NoSources (registry lists no
     *         peers), NoAvailablePeers (every holder of a chunk failed), HashMismatch,
     *         StorageError, RegistryUnreachable or RegistryRejected.
     */
    DownloadResult download(const std::string& file_name);

    // Invoked from scheduler threads as chunks complete.
    void set_progress_callback(DownloadSession::ProgressCallback callback) {
        progress_callback_ = std::move(callback);
    }

private:
    fs::path store_verified(const content_id_t& content_id, const std::vector<uint8_t>& data);

    RegistryClient& registry_;
    StorageManager& storage_;
    ChunkFetcher& fetcher_;
    const Config& config_;
    DownloadSession::ProgressCallback progress_callback_;
};

#endif // CHUNKSHARE_DOWNLOAD_MANAGER_HPP
