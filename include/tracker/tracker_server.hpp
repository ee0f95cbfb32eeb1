#ifndef CHUNKSHARE_TRACKER_SERVER_HPP
#define CHUNKSHARE_TRACKER_SERVER_HPP

#include "httplib.h"
#include <atomic>
#include <thread>
#include <chrono>
#include <string>

#include "tracker_state.hpp"

/**
 * @brief HTTP front end of the tracker.
 *
 * Routes:
 *   POST /register              body: {file_name, file_hash, file_size, chunks, ip, port}
 *   GET  /lookup?file_name=<n>  first file registered under that name
 *   GET  /get_file/<n>          same answer, name in the path
 *   GET  /files                 {"files": [...]}
 *
 * One request per connection, answered with "Connection: close". Every reply
 * body is JSON; errors are {"error": "..."}.
 */
class TrackerServer {
public:
    static constexpr std::chrono::milliseconds DEFAULT_READ_TIMEOUT{10000};
    static constexpr size_t MAX_BODY_SIZE = 1024 * 1024;

    // Binds immediately; port 0 picks an ephemeral port. Throws
    // std::runtime_error if the port cannot be bound.
    TrackerServer(uint16_t port, TrackerState& state, size_t threads = 0,
                  std::chrono::milliseconds read_timeout = DEFAULT_READ_TIMEOUT);
    ~TrackerServer();

    TrackerServer(const TrackerServer&) = delete;
    TrackerServer& operator=(const TrackerServer&) = delete;

    void start();
    // Stops accepting, lets in-flight requests finish, joins the listener.
    void stop();

    bool running() const { return listener_.joinable(); }
    uint16_t port() const { return port_; }

private:
    void install_routes();
    void handle_register(const httplib::Request& request, httplib::Response& response);
    void handle_lookup(const std::string& file_name, httplib::Response& response);
    void handle_files(httplib::Response& response);

    httplib::Server server_;
    TrackerState& state_;
    size_t thread_count_;
    uint16_t port_;
    std::thread listener_;
    std::atomic<bool> listen_returned_{false};
    bool stopped_ = false;
};

#endif // CHUNKSHARE_TRACKER_SERVER_HPP
