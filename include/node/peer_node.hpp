#ifndef CHUNKSHARE_PEER_NODE_HPP
#define CHUNKSHARE_PEER_NODE_HPP

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

#include "../common/config.hpp"
#include "../files/file_sharer.hpp"
#include "../files/download_manager.hpp"
#include "../storage/storage_manager.hpp"
#include "../network/chunk_server.hpp"
#include "../network/chunk_client.hpp"
#include "../registry/registry_client.hpp"

namespace fs = std::filesystem;

/**
 * @brief One peer: serves what it shares and downloads what it asks for.
 *
 * Owns the catalog, the shared-file table and the chunk server. Files recorded
 * in the catalog are served again on construction if they still exist; call
 * republish_all() to announce them to the tracker.
 */
class PeerNode {
public:
    // A null fetcher means a TcpChunkFetcher with the configured request timeout.
    // Throws ChunkShareError(StorageError) if the catalog cannot be opened and
    // asio::system_error if the port cannot be bound.
    PeerNode(const Config& config, RegistryClient& registry, std::unique_ptr<ChunkFetcher> fetcher = nullptr);
    ~PeerNode();

    PeerNode(const PeerNode&) = delete;
    PeerNode& operator=(const PeerNode&) = delete;

    void start();
    void stop();

    /**
     * @brief Identifies a local file, serves it and publishes all of its chunks.
     * @throws ChunkShareError: InvalidArgument for a missing file, StorageError,
     *         RegistryUnreachable or RegistryRejected.
     */
    ShareRecord share(const fs::path& path);

    // Publishes every file currently served. Returns how many were announced.
    size_t republish_all();

    // Downloads into the store and, with reshare_downloads, serves the result.
    DownloadResult download(const std::string& file_name);

    void set_progress_callback(DownloadSession::ProgressCallback callback) {
        progress_callback_ = std::move(callback);
    }

    std::vector<ShareRecord> shared_files();
    std::vector<FileListing> list_registry_files();

    uint16_t port() const { return server_.port(); }
    const std::string& advertise_ip() const { return advertise_ip_; }
    PeerAddress address() const { return PeerAddress{advertise_ip_, port()}; }
    const FileSharer& sharer() const { return sharer_; }

    // Local address of a UDP socket aimed at a public address, else 127.0.0.1.
    static std::string detect_local_ip();

private:
    void restore_catalog();
    void publish(const Manifest& manifest);
    void serve(const Manifest& manifest, const fs::path& path);

    Config config_;
    RegistryClient& registry_;
    std::unique_ptr<ChunkFetcher> fetcher_;
    StorageManager storage_;
    FileSharer sharer_;
    ChunkServer server_;
    std::string advertise_ip_;
    DownloadSession::ProgressCallback progress_callback_;
};

#endif // CHUNKSHARE_PEER_NODE_HPP
