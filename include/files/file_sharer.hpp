#ifndef CHUNKSHARE_FILE_SHARER_HPP
#define CHUNKSHARE_FILE_SHARER_HPP

#include "manifest.hpp"
#include <unordered_map>
#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <filesystem>

/**
 * @brief The set of files this peer can serve, keyed by ContentId.
 *
 * Shared by the chunk server's handler threads; every method is thread-safe.
 * Chunks are read from disk on demand, nothing is cached.
 */
class FileSharer {
public:
    FileSharer() = default;
    FileSharer(const FileSharer&) = delete;
    FileSharer& operator=(const FileSharer&) = delete;

    // Add or replace a shared file.
    void add_share(const Manifest& manifest, const std::filesystem::path& file_path);
    bool remove_share(const content_id_t& content_id);

    std::optional<Manifest> get_manifest(const content_id_t& content_id) const;
    std::vector<Manifest> get_all_manifests() const;
    size_t size() const;

    /**
     * @brief Reads one chunk of a shared file.
     * @return nullopt if the file is unknown, the index is out of range, or the
     *         file on disk can no longer supply the full chunk.
     */
    std::optional<std::vector<uint8_t>> get_chunk(const content_id_t& content_id, uint32_t chunk_index) const;

private:
    struct Entry {
        Manifest manifest;
        std::filesystem::path file_path;
    };

    mutable std::mutex mutex_;
    std::unordered_map<content_id_t, Entry> shares_;
};

#endif // CHUNKSHARE_FILE_SHARER_HPP
