#ifndef CHUNKSHARE_STORAGE_MANAGER_HPP
#define CHUNKSHARE_STORAGE_MANAGER_HPP

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>

#include "../files/manifest.hpp"

// Forward declarations for SQLite types
struct sqlite3;
struct sqlite3_stmt;

struct ShareRecord {
    Manifest manifest;
    std::string file_path;
};

/**
 * @brief Durable state of a peer.
 *
 * Two parts: a SQLite catalog of the files this peer shares (so they can be
 * served again after a restart), and the content-addressed store directory
 * where verified downloads live as <store_dir>/<content_id>.
 */
class StorageManager {
public:
    // Opens the catalog and creates the store directory.
    // Throws ChunkShareError(StorageError) if either fails.
    StorageManager(const std::string& db_path, const std::string& store_dir);
    ~StorageManager();

    StorageManager(const StorageManager&) = delete;
    StorageManager& operator=(const StorageManager&) = delete;

    bool open();
    void close();
    bool create_tables();

    // Share catalog
    bool save_share(const Manifest& manifest, const std::string& file_path);
    std::optional<ShareRecord> get_share(const content_id_t& content_id);
    std::vector<ShareRecord> get_all_shares();
    bool delete_share(const content_id_t& content_id);

    // Content-addressed store
    const std::filesystem::path& store_dir() const { return store_dir_; }
    std::filesystem::path stored_path(const content_id_t& content_id) const;
    std::filesystem::path staging_path(const content_id_t& content_id) const;
    bool has_stored(const content_id_t& content_id) const;

    // Writes bytes to the staging file. Throws ChunkShareError(StorageError).
    std::filesystem::path write_staged(const content_id_t& content_id, const std::vector<uint8_t>& data);
    // Renames the staging file to the final path. Throws ChunkShareError(StorageError).
    std::filesystem::path commit_staged(const content_id_t& content_id);
    // Removes the staging file if present; false only if removal failed.
    bool discard_staged(const content_id_t& content_id);

private:
    std::string db_path_;
    std::filesystem::path store_dir_;
    sqlite3* db_;

    bool execute_sql(const std::string& sql);
    static void check_content_id(const content_id_t& content_id);
};

#endif // CHUNKSHARE_STORAGE_MANAGER_HPP
