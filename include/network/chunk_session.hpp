#ifndef CHUNKSHARE_CHUNK_SESSION_HPP
#define CHUNKSHARE_CHUNK_SESSION_HPP

#include <asio.hpp>
#include <memory>
#include <string>
#include <istream>
#include <chrono>
#include <atomic>

#include "protocol.hpp"
#include "../files/file_sharer.hpp"
#include "../common/logger.hpp"

// Counters shared by all sessions of one server.
struct ChunkServerStats {
    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> served{0};
    std::atomic<uint64_t> rejected{0};
};

/**
 * @brief Handles one accepted connection: one request line in, one encoded
 * chunk out, then close.
 *
 * Keeps itself alive through shared_from_this() while an operation is pending.
 * A deadline timer bounds the whole exchange so an idle client cannot pin a
 * session forever. Socket and timer share a strand, so the deadline handler
 * never races a read or write completion on a multi-threaded io_context.
 */
class ChunkSession : public std::enable_shared_from_this<ChunkSession> {
public:
    ChunkSession(asio::io_context& io_context, const FileSharer& sharer,
                 ChunkServerStats& stats, std::chrono::milliseconds deadline)
        : socket_(asio::make_strand(io_context)), deadline_timer_(socket_.get_executor()), sharer_(sharer),
          stats_(stats), deadline_(deadline), request_buffer_(MAX_REQUEST_LINE + 2) {}

    asio::ip::tcp::socket& socket() {
        return socket_;
    }

    void start() {
        deadline_timer_.expires_after(deadline_);
        deadline_timer_.async_wait([self = shared_from_this()](const asio::error_code& error) {
            if (!error) {
                LOG_DEBUG("Chunk session deadline expired, closing");
                self->close();
            }
        });
        read_request();
    }

private:
    void read_request() {
        asio::async_read_until(socket_, request_buffer_, '\n',
            [self = shared_from_this()](const asio::error_code& error, size_t bytes_transferred) {
                // A client may send the line without '\n' and half-close
                if (error && !(error == asio::error::eof && self->request_buffer_.size() > 0)) {
                    LOG_DEBUG("Error reading chunk request: ", error.message());
                    self->reject();
                    return;
                }
                std::istream is(&self->request_buffer_);
                std::string line;
                std::getline(is, line);
                self->handle_request(line);
            });
    }

    void handle_request(const std::string& line) {
        auto request = Protocol::parse_request(line);
        if (!request) {
            LOG_WARN("Invalid request from ", peer_name(), ": ", line.substr(0, 80));
            reject();
            return;
        }

        auto chunk = sharer_.get_chunk(request->content_id, request->chunk_index);
        if (!chunk) {
            LOG_WARN("Cannot serve chunk ", request->chunk_index, " of ", request->content_id, " to ", peer_name());
            reject();
            return;
        }

        response_ = Protocol::encode_chunk_response(*chunk);
        size_t raw_size = chunk->size();
        uint32_t chunk_index = request->chunk_index;
        asio::async_write(socket_, asio::buffer(response_),
            [self = shared_from_this(), raw_size, chunk_index](const asio::error_code& error, size_t) {
                if (!error) {
                    self->stats_.served++;
                    LOG_DEBUG("Sent chunk ", chunk_index, " (", raw_size, " bytes) to ", self->peer_name());
                } else {
                    LOG_WARN("Error writing chunk ", chunk_index, ": ", error.message());
                }
                self->close();
            });
    }

    void reject() {
        stats_.rejected++;
        close();
    }

    void close() {
        asio::error_code ignored;
        deadline_timer_.cancel();
        if (socket_.is_open()) {
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
            socket_.close(ignored);
        }
    }

    std::string peer_name() const {
        asio::error_code ec;
        auto ep = socket_.remote_endpoint(ec);
        if (ec) return "<disconnected>";
        return ep.address().to_string() + ":" + std::to_string(ep.port());
    }

    asio::ip::tcp::socket socket_;
    asio::steady_timer deadline_timer_;
    const FileSharer& sharer_;
    ChunkServerStats& stats_;
    std::chrono::milliseconds deadline_;
    asio::streambuf request_buffer_;
    std::string response_;
};

#endif // CHUNKSHARE_CHUNK_SESSION_HPP
