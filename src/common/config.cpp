#include "common/config.hpp"
#include "common/error.hpp"
#include "nlohmann/json.hpp"
#include <fstream>
#include <filesystem>
#include <limits>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template<typename T>
void read_if_present(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(out);
    }
}

// Integral fields go through int64_t so out-of-range values are caught, not truncated.
template<typename T>
void read_number_if_present(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_number_integer()) {
        throw ChunkShareError(ErrorCode::InvalidArgument, std::string(key) + " must be an integer");
    }
    int64_t value = it->get<int64_t>();
    if (value < 0 || static_cast<uint64_t>(value) > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw ChunkShareError(ErrorCode::InvalidArgument,
                              std::string(key) + " out of range: " + std::to_string(value));
    }
    out = static_cast<T>(value);
}

void read_millis_if_present(const json& j, const char* key, std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        if (!it->is_number_integer()) {
            throw ChunkShareError(ErrorCode::InvalidArgument, std::string(key) + " must be an integer");
        }
        out = std::chrono::milliseconds(it->get<int64_t>());
    }
}

} // namespace

Config Config::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "Cannot open config file: " + path);
    }

    Config cfg;
    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            throw ChunkShareError(ErrorCode::InvalidArgument, "Config file must contain a JSON object: " + path);
        }
        read_number_if_present(j, "chunk_size", cfg.chunk_size);
        read_number_if_present(j, "workers", cfg.workers);
        read_millis_if_present(j, "request_timeout_ms", cfg.request_timeout);
        read_millis_if_present(j, "registry_timeout_ms", cfg.registry_timeout);
        read_if_present(j, "tracker_url", cfg.tracker_url);
        read_number_if_present(j, "port", cfg.port);
        read_number_if_present(j, "tracker_port", cfg.tracker_port);
        read_if_present(j, "advertise_ip", cfg.advertise_ip);
        read_number_if_present(j, "server_threads", cfg.server_threads);
        read_if_present(j, "store_dir", cfg.store_dir);
        read_if_present(j, "data_dir", cfg.data_dir);
        read_if_present(j, "reshare_downloads", cfg.reshare_downloads);
        read_if_present(j, "log_file", cfg.log_file);
        read_if_present(j, "verbose", cfg.verbose);
    } catch (const json::exception& e) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "Invalid config file " + path + ": " + e.what());
    }

    cfg.validate();
    return cfg;
}

void Config::validate() const {
    if (chunk_size == 0) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "chunk_size must be positive");
    }
    if (workers == 0) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "workers must be positive");
    }
    if (request_timeout.count() <= 0 || registry_timeout.count() <= 0) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "timeouts must be positive");
    }
    if (tracker_url.empty()) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "tracker_url must not be empty");
    }
    if (store_dir.empty() || data_dir.empty()) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "store_dir and data_dir must not be empty");
    }
}

std::string Config::catalog_path() const {
    return (fs::path(data_dir) / "chunkshare.db").string();
}
