#ifndef CHUNKSHARE_DOWNLOAD_SESSION_HPP
#define CHUNKSHARE_DOWNLOAD_SESSION_HPP

#include <vector>
#include <deque>
#include <set>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <optional>
#include <cstdint>

#include "manifest.hpp"
#include "../network/chunk_client.hpp"
#include "../registry/registry_client.hpp"

enum class ChunkState {
    Pending,
    InFlight,
    Done,
    Failed
};

struct SessionProgress {
    uint32_t done = 0;
    uint32_t total = 0;
};

/**
 * @brief Fetches every chunk of one file exactly once, using a fixed pool of
 * worker threads over a shared queue of pending chunk indices.
 *
 * Each chunk is tried against the peers advertising it, round-robin from an
 * offset derived from the chunk index. A peer that fails a chunk is never asked
 * for that chunk again; when no eligible peer is left the whole session fails
 * with NoAvailablePeers.
 */
class DownloadSession {
public:
    using ProgressCallback = std::function<void(const SessionProgress&)>;

    /**
     * @param peers Peer records as returned by the registry. Duplicate ip:port
     *              records are merged; indices past the last chunk are ignored.
     * @throws ChunkShareError(InvalidArgument) for a bad size, chunk size or a
     *         worker count of zero.
     */
    DownloadSession(const content_id_t& content_id, uint64_t file_size, uint32_t chunk_size,
                    const std::vector<PeerRecord>& peers, ChunkFetcher& fetcher, size_t workers);

    DownloadSession(const DownloadSession&) = delete;
    DownloadSession& operator=(const DownloadSession&) = delete;

    /**
     * @brief Starts the workers and blocks until the session finishes.
     *
     * Returns the assembled file. Throws ChunkShareError(NoAvailablePeers) once
     * a chunk has run out of peers; all workers are joined before it returns or
     * throws. May be called once.
     */
    std::vector<uint8_t> run();

    // Called from worker threads after each completed chunk.
    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    SessionProgress progress() const;
    ChunkState chunk_state(uint32_t chunk_index) const;

    // Distinct peers advertising this chunk, registration order.
    const std::vector<PeerAddress>& holders(uint32_t chunk_index) const;

    uint32_t chunk_count() const { return static_cast<uint32_t>(tasks_.size()); }
    size_t worker_count() const { return worker_count_; }

private:
    struct ChunkTask {
        ChunkSpec spec;
        ChunkState state = ChunkState::Pending;
        std::vector<PeerAddress> holders;
        std::set<PeerAddress> attempted; // peers that failed this chunk
    };

    void worker_loop();
    // Next peer to ask for this chunk, or nullopt when none is eligible. Requires mutex_.
    std::optional<PeerAddress> select_peer(const ChunkTask& task) const;
    void fail_session(ChunkTask& task);

    content_id_t content_id_;
    uint64_t file_size_;
    ChunkFetcher& fetcher_;
    size_t worker_count_;

    std::vector<ChunkTask> tasks_;
    std::vector<uint8_t> buffer_; // workers write disjoint ranges without the lock

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<uint32_t> queue_;
    uint32_t done_count_ = 0;
    bool aborted_ = false;
    std::optional<uint32_t> failed_chunk_;
    bool started_ = false;

    std::atomic<uint32_t> progress_done_{0};
    ProgressCallback progress_callback_;
};

#endif // CHUNKSHARE_DOWNLOAD_SESSION_HPP
