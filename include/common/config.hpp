#ifndef CHUNKSHARE_CONFIG_HPP
#define CHUNKSHARE_CONFIG_HPP

#include <string>
#include <cstdint>
#include <chrono>

struct Config {
    static constexpr uint32_t DEFAULT_CHUNK_SIZE = 1024;
    static constexpr size_t DEFAULT_WORKERS = 10;
    static constexpr uint16_t DEFAULT_PORT = 6000;
    static constexpr uint16_t DEFAULT_TRACKER_PORT = 5000;

    uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
    size_t workers = DEFAULT_WORKERS;
    std::chrono::milliseconds request_timeout{5000};
    std::chrono::milliseconds registry_timeout{5000};

    std::string tracker_url = "http://127.0.0.1:5000";
    uint16_t port = DEFAULT_PORT;
    uint16_t tracker_port = DEFAULT_TRACKER_PORT;
    std::string advertise_ip; // empty: detect
    size_t server_threads = 0; // 0: hardware concurrency

    std::string store_dir = "downloads/p2p_share";
    std::string data_dir = ".chunkshare";
    bool reshare_downloads = true;

    std::string log_file = "chunkshare.log";
    bool verbose = false;

    /**
     * @brief Reads a JSON object of overrides on top of the defaults.
     * @throws ChunkShareError(InvalidArgument) on unreadable files, bad JSON,
     *         wrongly typed or out-of-range values.
     */
    static Config from_file(const std::string& path);

    // Throws ChunkShareError(InvalidArgument) if a value is unusable.
    void validate() const;

    std::string catalog_path() const;
};

#endif // CHUNKSHARE_CONFIG_HPP
