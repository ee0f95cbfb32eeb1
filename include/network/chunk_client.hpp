#ifndef CHUNKSHARE_CHUNK_CLIENT_HPP
#define CHUNKSHARE_CHUNK_CLIENT_HPP

#include <vector>
#include <optional>
#include <atomic>
#include <chrono>
#include <cstdint>

#include "protocol.hpp"

/**
 * @brief One read_chunk call against one peer.
 *
 * Implementations must be callable from several threads at once. A failed
 * attempt (timeout, refused connection, empty or short payload) is reported as
 * nullopt, never by throwing.
 */
class ChunkFetcher {
public:
    virtual ~ChunkFetcher() = default;

    virtual std::optional<std::vector<uint8_t>> fetch(const PeerAddress& peer,
                                                      const ChunkRequest& request,
                                                      uint32_t expected_length) = 0;
};

/**
 * @brief ChunkFetcher over a fresh TCP connection per request.
 *
 * Each call runs a private io_context for at most the configured timeout; on
 * expiry the socket is closed and the connection abandoned.
 */
class TcpChunkFetcher : public ChunkFetcher {
public:
    explicit TcpChunkFetcher(std::chrono::milliseconds timeout) : timeout_(timeout) {}

    std::optional<std::vector<uint8_t>> fetch(const PeerAddress& peer,
                                              const ChunkRequest& request,
                                              uint32_t expected_length) override;

    std::chrono::milliseconds timeout() const { return timeout_; }
    size_t in_flight() const { return in_flight_.load(); }
    size_t peak_in_flight() const { return peak_in_flight_.load(); }

private:
    std::chrono::milliseconds timeout_;
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_in_flight_{0};
};

#endif // CHUNKSHARE_CHUNK_CLIENT_HPP
