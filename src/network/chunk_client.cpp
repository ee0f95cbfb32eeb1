#include "network/chunk_client.hpp"
#include "common/logger.hpp"
#include <asio.hpp>
#include <string>

namespace {

// Decrements the in-flight counter on every exit path of fetch().
struct InFlightGuard {
    std::atomic<size_t>& counter;
    explicit InFlightGuard(std::atomic<size_t>& c, std::atomic<size_t>& peak) : counter(c) {
        size_t now = ++counter;
        size_t prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
    }
    ~InFlightGuard() { --counter; }
};

} // namespace

std::optional<std::vector<uint8_t>> TcpChunkFetcher::fetch(const PeerAddress& peer,
                                                           const ChunkRequest& request,
                                                           uint32_t expected_length) {
    InFlightGuard guard(in_flight_, peak_in_flight_);

    asio::io_context io_context;
    asio::ip::tcp::resolver resolver(io_context);
    asio::ip::tcp::socket socket(io_context);

    const std::string request_line = Protocol::format_request(request);
    // Base64 of the expected chunk, plus room for a trailing newline
    const size_t max_response = 4 * ((static_cast<size_t>(expected_length) + 2) / 3) + 2;
    std::string response;

    bool finished = false;
    asio::error_code failure;

    auto fail = [&](const asio::error_code& ec) {
        failure = ec;
        finished = true;
    };

    resolver.async_resolve(peer.ip, std::to_string(peer.port),
        [&](const asio::error_code& ec, asio::ip::tcp::resolver::results_type endpoints) {
            if (ec) { fail(ec); return; }
            asio::async_connect(socket, endpoints,
                [&](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                    if (ec) { fail(ec); return; }
                    asio::async_write(socket, asio::buffer(request_line),
                        [&](const asio::error_code& ec, size_t) {
                            if (ec) { fail(ec); return; }
                            asio::async_read(socket, asio::dynamic_buffer(response, max_response),
                                [&](const asio::error_code& ec, size_t) {
                                    // Server closes after the payload, so eof is success
                                    if (ec && ec != asio::error::eof) { fail(ec); return; }
                                    finished = true;
                                });
                        });
                });
        });

    io_context.run_for(timeout_);

    if (!finished) {
        asio::error_code ignored;
        resolver.cancel();
        socket.close(ignored);
        io_context.run(); // drain aborted handlers before locals go away
        LOG_WARN("ChunkFetchFailed: chunk ", request.chunk_index, " from ", peer.to_string(),
                 ": timed out after ", timeout_.count(), " ms");
        return std::nullopt;
    }

    if (failure) {
        LOG_WARN("ChunkFetchFailed: chunk ", request.chunk_index, " from ", peer.to_string(),
                 ": ", failure.message());
        return std::nullopt;
    }

    auto chunk = Protocol::decode_chunk_response(response);
    if (!chunk) {
        LOG_WARN("ChunkFetchFailed: chunk ", request.chunk_index, " from ", peer.to_string(),
                 ": connection closed without a valid payload");
        return std::nullopt;
    }
    if (chunk->size() != expected_length) {
        LOG_WARN("ChunkFetchFailed: chunk ", request.chunk_index, " from ", peer.to_string(),
                 ": expected ", expected_length, " bytes, got ", chunk->size());
        return std::nullopt;
    }
    return chunk;
}
