#include "storage/storage_manager.hpp"
#include "crypto/hasher.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <sqlite3.h>
#include <fstream>
#include <ctime>

namespace fs = std::filesystem;

namespace {

ShareRecord read_share_row(sqlite3_stmt* stmt) {
    ShareRecord record;
    record.manifest.content_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    record.manifest.file_name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
    record.manifest.file_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    record.manifest.chunk_size = static_cast<uint32_t>(sqlite3_column_int(stmt, 3));
    record.file_path = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 4));
    return record;
}

} // namespace

StorageManager::StorageManager(const std::string& db_path, const std::string& store_dir)
    : db_path_(db_path), store_dir_(store_dir), db_(nullptr) {
    std::error_code ec;
    fs::path db_parent = fs::path(db_path_).parent_path();
    if (!db_parent.empty()) {
        fs::create_directories(db_parent, ec);
    }
    if (!open()) {
        throw ChunkShareError(ErrorCode::StorageError, "Failed to open database: " + db_path_);
    }
    if (!create_tables()) {
        close();
        throw ChunkShareError(ErrorCode::StorageError, "Failed to create tables in database: " + db_path_);
    }
    fs::create_directories(store_dir_, ec);
    if (ec) {
        close();
        throw ChunkShareError(ErrorCode::StorageError,
                              "Failed to create store directory " + store_dir_.string() + ": " + ec.message());
    }
}

StorageManager::~StorageManager() {
    close();
}

bool StorageManager::open() {
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERR("Can't open database: ", sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    LOG_DEBUG("Opened database successfully: ", db_path_);
    return true;
}

void StorageManager::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_DEBUG("Closed database ", db_path_);
    }
}

bool StorageManager::execute_sql(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERR("SQL error: ", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool StorageManager::create_tables() {
    std::string create_shares_sql = R"(
        CREATE TABLE IF NOT EXISTS shares (
            content_id TEXT PRIMARY KEY NOT NULL,
            file_name TEXT NOT NULL,
            file_size INTEGER NOT NULL,
            chunk_size INTEGER NOT NULL,
            file_path TEXT NOT NULL,
            added_at INTEGER
        );
    )";
    return execute_sql(create_shares_sql);
}

bool StorageManager::save_share(const Manifest& manifest, const std::string& file_path) {
    std::string sql = "INSERT OR REPLACE INTO shares (content_id, file_name, file_size, chunk_size, file_path, added_at) "
                      "VALUES (?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, manifest.content_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, manifest.file_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(manifest.file_size));
    sqlite3_bind_int(stmt, 4, static_cast<int>(manifest.chunk_size));
    sqlite3_bind_text(stmt, 5, file_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 6, std::time(nullptr));

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to execute statement: ", sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

std::optional<ShareRecord> StorageManager::get_share(const content_id_t& content_id) {
    std::string sql = "SELECT content_id, file_name, file_size, chunk_size, file_path FROM shares WHERE content_id = ?;";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, content_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<ShareRecord> result;
    if ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        result = read_share_row(stmt);
    } else if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to execute statement: ", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<ShareRecord> StorageManager::get_all_shares() {
    std::vector<ShareRecord> shares;
    std::string sql = "SELECT content_id, file_name, file_size, chunk_size, file_path FROM shares ORDER BY added_at, content_id;";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return shares;
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        shares.push_back(read_share_row(stmt));
    }

    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to execute statement: ", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return shares;
}

bool StorageManager::delete_share(const content_id_t& content_id) {
    std::string sql = "DELETE FROM shares WHERE content_id = ?;";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, content_id.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to execute statement: ", sqlite3_errmsg(db_));
        sqlite3_finalize(stmt);
        return false;
    }
    sqlite3_finalize(stmt);
    return true;
}

void StorageManager::check_content_id(const content_id_t& content_id) {
    // Content ids become file names; anything but a hex digest could escape the store
    if (!Hasher::is_hex_digest(content_id)) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "Malformed content id: " + content_id);
    }
}

fs::path StorageManager::stored_path(const content_id_t& content_id) const {
    check_content_id(content_id);
    return store_dir_ / content_id;
}

fs::path StorageManager::staging_path(const content_id_t& content_id) const {
    check_content_id(content_id);
    return store_dir_ / (content_id + ".part");
}

bool StorageManager::has_stored(const content_id_t& content_id) const {
    std::error_code ec;
    return fs::is_regular_file(stored_path(content_id), ec);
}

fs::path StorageManager::write_staged(const content_id_t& content_id, const std::vector<uint8_t>& data) {
    fs::path path = staging_path(content_id);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw ChunkShareError(ErrorCode::StorageError, "Cannot open staging file " + path.string());
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        discard_staged(content_id);
        throw ChunkShareError(ErrorCode::StorageError, "Failed writing staging file " + path.string());
    }
    return path;
}

fs::path StorageManager::commit_staged(const content_id_t& content_id) {
    fs::path from = staging_path(content_id);
    fs::path to = stored_path(content_id);

    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        LOG_WARN("Failed to rename file: ", ec.message(), ". Attempting copy and delete.");
        try {
            fs::copy(from, to, fs::copy_options::overwrite_existing);
            fs::remove(from);
        } catch (const fs::filesystem_error& e) {
            throw ChunkShareError(ErrorCode::StorageError,
                                  "Cannot move " + from.string() + " into the store: " + e.what());
        }
    }
    return to;
}

bool StorageManager::discard_staged(const content_id_t& content_id) {
    std::error_code ec;
    fs::remove(staging_path(content_id), ec);
    if (ec) {
        LOG_ERR("Failed to remove staging file for ", content_id, ": ", ec.message());
        return false;
    }
    return true;
}
