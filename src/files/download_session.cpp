#include "files/download_session.hpp"
#include "files/chunker.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cstring>
#include <map>
#include <thread>
#include <stdexcept>

DownloadSession::DownloadSession(const content_id_t& content_id, uint64_t file_size, uint32_t chunk_size,
                                 const std::vector<PeerRecord>& peers, ChunkFetcher& fetcher, size_t workers)
    : content_id_(content_id), file_size_(file_size), fetcher_(fetcher), worker_count_(workers) {

    if (workers == 0) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "worker count must be positive");
    }

    for (auto& spec : Chunker::partition(static_cast<int64_t>(file_size), chunk_size, content_id)) {
        ChunkTask task;
        task.spec = std::move(spec);
        tasks_.push_back(std::move(task));
    }
    const uint32_t count = chunk_count();

    // Merge duplicate ip:port records, keeping first-seen order.
    std::vector<PeerAddress> peer_order;
    std::map<PeerAddress, std::set<uint32_t>> advertised;
    for (const auto& record : peers) {
        PeerAddress address = record.address();
        auto it = advertised.find(address);
        if (it == advertised.end()) {
            peer_order.push_back(address);
            it = advertised.emplace(address, std::set<uint32_t>{}).first;
        }
        for (uint32_t index : record.chunks) {
            if (index < count) {
                it->second.insert(index);
            } else {
                LOG_DEBUG("Ignoring chunk ", index, " advertised by ", address.to_string(),
                          " (file has ", count, " chunks)");
            }
        }
    }

    for (const auto& address : peer_order) {
        for (uint32_t index : advertised[address]) {
            tasks_[index].holders.push_back(address);
        }
    }

    buffer_.resize(file_size_);
}

std::vector<uint8_t> DownloadSession::run() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            throw std::logic_error("DownloadSession::run() called twice");
        }
        started_ = true;
    }

    const uint32_t count = chunk_count();
    if (count == 0) {
        return {};
    }

    for (uint32_t i = 0; i < count; ++i) {
        if (tasks_[i].holders.empty()) {
            tasks_[i].state = ChunkState::Failed;
            failed_chunk_ = i;
            LOG_ERR("No peer advertises chunk ", i, " of ", content_id_);
            throw ChunkShareError(ErrorCode::NoAvailablePeers,
                                  "No peer advertises chunk " + std::to_string(i) + " of " + content_id_);
        }
        queue_.push_back(i);
    }

    LOG_INFO("Downloading ", content_id_, ": ", count, " chunks with ", worker_count_, " workers");

    std::vector<std::thread> workers;
    workers.reserve(worker_count_);
    for (size_t i = 0; i < worker_count_; ++i) {
        workers.emplace_back(&DownloadSession::worker_loop, this);
    }
    for (auto& t : workers) {
        t.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (aborted_) {
        uint32_t index = failed_chunk_.value_or(0);
        throw ChunkShareError(ErrorCode::NoAvailablePeers,
                              "All peers failed chunk " + std::to_string(index) + " of " + content_id_);
    }
    LOG_INFO("All ", count, " chunks of ", content_id_, " received");
    return std::move(buffer_);
}

void DownloadSession::worker_loop() {
    const uint32_t total = chunk_count();

    while (true) {
        uint32_t index = 0;
        PeerAddress peer;
        ChunkSpec spec;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&]() { return aborted_ || done_count_ == total || !queue_.empty(); });
            if (aborted_ || done_count_ == total) {
                return;
            }

            index = queue_.front();
            queue_.pop_front();
            ChunkTask& task = tasks_[index];

            auto selected = select_peer(task);
            if (!selected) {
                fail_session(task);
                return;
            }
            peer = *selected;
            task.state = ChunkState::InFlight;
            spec = task.spec;
        }

        std::optional<std::vector<uint8_t>> data;
        try {
            data = fetcher_.fetch(peer, ChunkRequest{content_id_, index}, spec.length);
        } catch (const std::exception& e) {
            LOG_WARN("Chunk fetcher threw for chunk ", index, " from ", peer.to_string(), ": ", e.what());
        }

        bool ok = data && data->size() == spec.length;
        if (ok) {
            std::memcpy(buffer_.data() + spec.offset, data->data(), spec.length);
        }

        SessionProgress snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ChunkTask& task = tasks_[index];
            if (ok) {
                task.state = ChunkState::Done;
                done_count_++;
                progress_done_.store(done_count_);
                snapshot = SessionProgress{done_count_, total};
                if (done_count_ == total) {
                    cv_.notify_all();
                }
            } else {
                task.attempted.insert(peer);
                task.state = ChunkState::Pending;
                LOG_WARN("ChunkFetchFailed: chunk ", index, " of ", content_id_, " from ", peer.to_string(),
                         data ? " (wrong length " + std::to_string(data->size()) + ")" : std::string());
                if (!aborted_) {
                    queue_.push_back(index);
                    cv_.notify_one();
                }
            }
        }

        if (ok && progress_callback_) {
            progress_callback_(snapshot);
        }
    }
}

std::optional<PeerAddress> DownloadSession::select_peer(const ChunkTask& task) const {
    const auto& holders = task.holders;
    if (holders.empty()) return std::nullopt;

    size_t start = task.spec.chunk_index % holders.size();
    for (size_t i = 0; i < holders.size(); ++i) {
        const PeerAddress& candidate = holders[(start + i) % holders.size()];
        if (task.attempted.count(candidate) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

void DownloadSession::fail_session(ChunkTask& task) {
    task.state = ChunkState::Failed;
    aborted_ = true;
    failed_chunk_ = task.spec.chunk_index;
    LOG_ERR("NoAvailablePeers: every holder of chunk ", task.spec.chunk_index, " of ", content_id_,
            " failed (", task.attempted.size(), " tried)");
    cv_.notify_all();
}

SessionProgress DownloadSession::progress() const {
    return SessionProgress{progress_done_.load(), chunk_count()};
}

ChunkState DownloadSession::chunk_state(uint32_t chunk_index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.at(chunk_index).state;
}

const std::vector<PeerAddress>& DownloadSession::holders(uint32_t chunk_index) const {
    return tasks_.at(chunk_index).holders;
}
