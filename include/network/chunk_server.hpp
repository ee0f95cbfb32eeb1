#ifndef CHUNKSHARE_CHUNK_SERVER_HPP
#define CHUNKSHARE_CHUNK_SERVER_HPP

#include <asio.hpp>
#include <memory>
#include <vector>
#include <thread>
#include <optional>
#include <chrono>

#include "chunk_session.hpp"
#include "../files/file_sharer.hpp"

/**
 * @brief TCP listener answering GET_CHUNK requests for files in a FileSharer.
 *
 * Every accepted connection gets its own ChunkSession; the io_context runs on
 * several threads so a slow disk read or client never holds up the others.
 */
class ChunkServer {
public:
    static constexpr std::chrono::milliseconds DEFAULT_SESSION_DEADLINE{10000};

    // Binds immediately; port 0 picks an ephemeral port. Throws asio::system_error
    // if the port cannot be bound.
    ChunkServer(uint16_t port, const FileSharer& sharer, size_t threads = 0,
                std::chrono::milliseconds session_deadline = DEFAULT_SESSION_DEADLINE);
    ~ChunkServer();

    ChunkServer(const ChunkServer&) = delete;
    ChunkServer& operator=(const ChunkServer&) = delete;

    void start();
    // Stops accepting, waits for in-flight sessions, joins the threads.
    void stop();

    bool running() const { return !threads_.empty(); }
    uint16_t port() const { return port_; }
    const ChunkServerStats& stats() const { return stats_; }

private:
    void start_accept();

    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    const FileSharer& sharer_;
    size_t thread_count_;
    std::chrono::milliseconds session_deadline_;
    uint16_t port_;
    std::vector<std::thread> threads_;
    ChunkServerStats stats_;
};

#endif // CHUNKSHARE_CHUNK_SERVER_HPP
