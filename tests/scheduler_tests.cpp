#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "files/download_session.hpp"
#include "files/download_manager.hpp"
#include "files/chunker.hpp"
#include "tracker/tracker_state.hpp"
#include "storage/storage_manager.hpp"
#include "common/error.hpp"
#include "test_helpers.hpp"

#include <map>
#include <mutex>
#include <numeric>
#include <thread>
#include <chrono>
#include <limits>

using ::testing::_;
using ::testing::Field;
using ::testing::Return;

namespace {

enum class PeerBehavior {
    Serve,
    Refuse,      // connection refused / timed out
    WrongLength, // payload one byte short
    Corrupt      // right length, one byte flipped
};

// In-memory stand-in for a set of peers that all hold the same file.
class FakeSwarm : public ChunkFetcher {
public:
    FakeSwarm(std::vector<uint8_t> file, uint32_t chunk_size) : file_(std::move(file)), chunk_size_(chunk_size) {}

    void set_behavior(const PeerAddress& peer, PeerBehavior behavior) { behavior_[peer] = behavior; }
    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    std::optional<std::vector<uint8_t>> fetch(const PeerAddress& peer, const ChunkRequest& request,
                                              uint32_t expected_length) override {
        size_t now = ++in_flight_;
        size_t prev = peak_.load();
        while (now > prev && !peak_.compare_exchange_weak(prev, now)) {}

        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_[{peer, request.chunk_index}]++;
            total_calls_++;
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }

        std::optional<std::vector<uint8_t>> result;
        PeerBehavior behavior = PeerBehavior::Serve;
        auto it = behavior_.find(peer);
        if (it != behavior_.end()) behavior = it->second;

        if (behavior != PeerBehavior::Refuse) {
            ChunkSpec spec = Chunker::chunk_spec(static_cast<int64_t>(file_.size()), chunk_size_,
                                                 request.chunk_index);
            std::vector<uint8_t> chunk(file_.begin() + spec.offset, file_.begin() + spec.offset + spec.length);
            EXPECT_EQ(expected_length, spec.length);
            if (behavior == PeerBehavior::WrongLength) chunk.pop_back();
            if (behavior == PeerBehavior::Corrupt) chunk[0] ^= 0xFF;
            result = chunk;
        }

        --in_flight_;
        return result;
    }

    size_t calls(const PeerAddress& peer, uint32_t index) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find({peer, index});
        return it == calls_.end() ? 0 : it->second;
    }
    size_t total_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_calls_;
    }
    size_t peak_in_flight() const { return peak_.load(); }

private:
    std::vector<uint8_t> file_;
    uint32_t chunk_size_;
    std::map<PeerAddress, PeerBehavior> behavior_;
    std::chrono::milliseconds delay_{0};

    std::mutex mutex_;
    std::map<std::pair<PeerAddress, uint32_t>, size_t> calls_;
    size_t total_calls_ = 0;
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_{0};
};

class MockChunkFetcher : public ChunkFetcher {
public:
    MOCK_METHOD((std::optional<std::vector<uint8_t>>), fetch,
                (const PeerAddress& peer, const ChunkRequest& request, uint32_t expected_length), (override));
};

class MockRegistryClient : public RegistryClient {
public:
    MOCK_METHOD(PublishResult, publish, (const PublishRequest& request), (override));
    MOCK_METHOD(std::optional<LookupResult>, lookup, (const std::string& file_name), (override));
    MOCK_METHOD(std::vector<FileListing>, list_files, (), (override));
};

const PeerAddress PEER_A{"127.0.0.1", 7001};
const PeerAddress PEER_B{"127.0.0.1", 7002};
const PeerAddress PEER_C{"127.0.0.1", 7003};

PeerRecord holder(const PeerAddress& address, std::vector<uint32_t> chunks) {
    PeerRecord p;
    p.ip = address.ip;
    p.port = address.port;
    p.chunks = std::move(chunks);
    return p;
}

std::vector<uint32_t> range(uint32_t from, uint32_t to) {
    std::vector<uint32_t> v(to - from);
    std::iota(v.begin(), v.end(), from);
    return v;
}

} // namespace

class DownloadSessionTest : public ::testing::Test {
protected:
    static constexpr uint32_t CHUNK = 1024;
    std::vector<uint8_t> file_ = make_bytes(10 * CHUNK + 300);
    content_id_t id_ = Chunker::identify(file_);
    uint32_t count_ = Chunker::chunk_count(static_cast<int64_t>(file_.size()), CHUNK);
    FakeSwarm swarm_{file_, CHUNK};
};

TEST_F(DownloadSessionTest, SingleSourceAssemblesFile) {
    DownloadSession session(id_, file_.size(), CHUNK, {holder(PEER_A, range(0, count_))}, swarm_, 10);
    auto data = session.run();

    ASSERT_EQ(data, file_);
    ASSERT_EQ(session.progress().done, count_);
    ASSERT_EQ(session.progress().total, count_);
    for (uint32_t i = 0; i < count_; ++i) {
        ASSERT_EQ(session.chunk_state(i), ChunkState::Done);
        ASSERT_EQ(swarm_.calls(PEER_A, i), 1u);
    }
}

TEST_F(DownloadSessionTest, DisjointHalvesFromTwoPeers) {
    uint32_t half = count_ / 2;
    DownloadSession session(id_, file_.size(), CHUNK,
                            {holder(PEER_A, range(0, half)), holder(PEER_B, range(half, count_))}, swarm_, 4);
    ASSERT_EQ(session.run(), file_);

    for (uint32_t i = 0; i < count_; ++i) {
        ASSERT_EQ(swarm_.calls(PEER_A, i), i < half ? 1u : 0u);
        ASSERT_EQ(swarm_.calls(PEER_B, i), i < half ? 0u : 1u);
    }
}

TEST_F(DownloadSessionTest, FailsOverAndNeverRetriesAFailedPeer) {
    swarm_.set_behavior(PEER_A, PeerBehavior::Refuse);
    DownloadSession session(id_, file_.size(), CHUNK,
                            {holder(PEER_A, range(0, count_)), holder(PEER_B, range(0, count_))}, swarm_, 3);
    ASSERT_EQ(session.run(), file_);

    for (uint32_t i = 0; i < count_; ++i) {
        ASSERT_LE(swarm_.calls(PEER_A, i), 1u) << "chunk " << i;
        ASSERT_EQ(swarm_.calls(PEER_B, i), 1u) << "chunk " << i;
    }
}

TEST_F(DownloadSessionTest, WrongLengthReplyCountsAsFailure) {
    swarm_.set_behavior(PEER_A, PeerBehavior::WrongLength);
    DownloadSession session(id_, file_.size(), CHUNK,
                            {holder(PEER_A, range(0, count_)), holder(PEER_B, range(0, count_))}, swarm_, 2);
    ASSERT_EQ(session.run(), file_);
}

TEST_F(DownloadSessionTest, ExhaustedPeersRaiseNoAvailablePeers) {
    swarm_.set_behavior(PEER_A, PeerBehavior::Refuse);
    swarm_.set_behavior(PEER_B, PeerBehavior::Refuse);
    DownloadSession session(id_, file_.size(), CHUNK,
                            {holder(PEER_A, range(0, count_)), holder(PEER_B, range(0, count_))}, swarm_, 4);
    try {
        session.run();
        FAIL() << "expected NoAvailablePeers";
    } catch (const ChunkShareError& e) {
        ASSERT_EQ(e.code(), ErrorCode::NoAvailablePeers);
    }

    bool some_chunk_failed = false;
    for (uint32_t i = 0; i < count_; ++i) {
        ASSERT_LE(swarm_.calls(PEER_A, i), 1u);
        ASSERT_LE(swarm_.calls(PEER_B, i), 1u);
        some_chunk_failed |= session.chunk_state(i) == ChunkState::Failed;
    }
    ASSERT_TRUE(some_chunk_failed);
}

TEST_F(DownloadSessionTest, ChunkWithoutHoldersFailsBeforeAnyRequest) {
    DownloadSession session(id_, file_.size(), CHUNK, {holder(PEER_A, range(1, count_))}, swarm_, 4);
    try {
        session.run();
        FAIL() << "expected NoAvailablePeers";
    } catch (const ChunkShareError& e) {
        ASSERT_EQ(e.code(), ErrorCode::NoAvailablePeers);
    }
    ASSERT_EQ(swarm_.total_calls(), 0u);
    ASSERT_EQ(session.chunk_state(0), ChunkState::Failed);
}

TEST_F(DownloadSessionTest, ConcurrencyNeverExceedsWorkerCount) {
    swarm_.set_delay(std::chrono::milliseconds(20));
    const size_t workers = 3;
    DownloadSession session(id_, file_.size(), CHUNK,
                            {holder(PEER_A, range(0, count_)), holder(PEER_B, range(0, count_)),
                             holder(PEER_C, range(0, count_))}, swarm_, workers);
    ASSERT_EQ(session.worker_count(), workers);
    ASSERT_EQ(session.run(), file_);

    ASSERT_LE(swarm_.peak_in_flight(), workers);
    ASSERT_GE(swarm_.peak_in_flight(), 2u);
    ASSERT_EQ(swarm_.total_calls(), count_);
}

TEST_F(DownloadSessionTest, IgnoresOutOfRangeIndicesAndMergesDuplicatePeers) {
    DownloadSession session(id_, file_.size(), CHUNK,
                            {holder(PEER_A, {0, 1, count_, count_ + 100}),
                             holder(PEER_B, range(2, count_)),
                             holder(PEER_A, range(2, 4))}, swarm_, 4);

    ASSERT_EQ(session.holders(0), std::vector<PeerAddress>{PEER_A});
    ASSERT_EQ(session.holders(2), (std::vector<PeerAddress>{PEER_A, PEER_B}));
    ASSERT_EQ(session.holders(5), std::vector<PeerAddress>{PEER_B});
    ASSERT_EQ(session.run(), file_);
}

TEST_F(DownloadSessionTest, RoundRobinStartsAtChunkDependentOffset) {
    DownloadSession session(id_, file_.size(), CHUNK,
                            {holder(PEER_A, range(0, count_)), holder(PEER_B, range(0, count_))}, swarm_, 1);
    ASSERT_EQ(session.run(), file_);
    // Load is spread: even chunks go to the first holder, odd ones to the second
    for (uint32_t i = 0; i < count_; ++i) {
        ASSERT_EQ(swarm_.calls(i % 2 == 0 ? PEER_A : PEER_B, i), 1u);
    }
}

TEST_F(DownloadSessionTest, ProgressCallbackSeesEveryChunk) {
    std::mutex mutex;
    std::vector<uint32_t> seen;
    DownloadSession session(id_, file_.size(), CHUNK, {holder(PEER_A, range(0, count_))}, swarm_, 4);
    session.set_progress_callback([&](const SessionProgress& p) {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(p.total, count_);
        seen.push_back(p.done);
    });
    session.run();

    std::sort(seen.begin(), seen.end());
    ASSERT_EQ(seen, range(1, count_ + 1));
}

TEST_F(DownloadSessionTest, EmptyFileNeedsNoPeers) {
    DownloadSession session(Chunker::identify({}), 0, CHUNK, {}, swarm_, 4);
    ASSERT_TRUE(session.run().empty());
    ASSERT_EQ(swarm_.total_calls(), 0u);
}

TEST_F(DownloadSessionTest, RejectsZeroWorkersAndSecondRun) {
    ASSERT_THROW(DownloadSession(id_, file_.size(), CHUNK, {}, swarm_, 0), ChunkShareError);

    DownloadSession session(id_, file_.size(), CHUNK, {holder(PEER_A, range(0, count_))}, swarm_, 2);
    session.run();
    ASSERT_THROW(session.run(), std::logic_error);
}

TEST(DownloadSessionMockTest, SecondHolderServesAfterFirstFails) {
    std::vector<uint8_t> chunk = make_bytes(600);
    content_id_t id = Chunker::identify(chunk);
    MockChunkFetcher fetcher;

    {
        ::testing::InSequence seq;
        EXPECT_CALL(fetcher, fetch(PEER_A, Field(&ChunkRequest::chunk_index, 0u), 600u))
            .WillOnce(Return(std::nullopt));
        EXPECT_CALL(fetcher, fetch(PEER_B, Field(&ChunkRequest::chunk_index, 0u), 600u))
            .WillOnce(Return(chunk));
    }

    DownloadSession session(id, chunk.size(), 1024, {holder(PEER_A, {0}), holder(PEER_B, {0})}, fetcher, 10);
    ASSERT_EQ(session.run(), chunk);
}

TEST(DownloadSessionMockTest, FetcherExceptionIsTreatedAsFailure) {
    std::vector<uint8_t> chunk = make_bytes(100);
    MockChunkFetcher fetcher;
    EXPECT_CALL(fetcher, fetch(PEER_A, _, _)).WillOnce(::testing::Throw(std::runtime_error("boom")));
    EXPECT_CALL(fetcher, fetch(PEER_B, _, _)).WillOnce(Return(chunk));

    DownloadSession session(Chunker::identify(chunk), chunk.size(), 1024,
                            {holder(PEER_A, {0}), holder(PEER_B, {0})}, fetcher, 2);
    ASSERT_EQ(session.run(), chunk);
}

// --- Download manager: lookup, session, staging, verification ---

class DownloadManagerTest : public ::testing::Test {
protected:
    TempDir dir_;
    Config config_;
    TrackerState tracker_;
    std::unique_ptr<StorageManager> storage_;
    std::vector<uint8_t> file_ = make_bytes(5000);
    content_id_t id_ = Chunker::identify(file_);
    FakeSwarm swarm_{file_, Config::DEFAULT_CHUNK_SIZE};

    void SetUp() override {
        config_.store_dir = (dir_ / "store").string();
        config_.data_dir = (dir_ / "data").string();
        config_.workers = 4;
        storage_ = std::make_unique<StorageManager>(config_.catalog_path(), config_.store_dir);
    }

    void publish(const PeerAddress& peer, const content_id_t& id, uint64_t size, std::vector<uint32_t> chunks) {
        PublishRequest r;
        r.content_id = id;
        r.file_name = "data.bin";
        r.file_size = size;
        r.chunks = std::move(chunks);
        r.ip = peer.ip;
        r.port = peer.port;
        tracker_.publish(r);
    }
};

TEST_F(DownloadManagerTest, DownloadsIntoStore) {
    publish(PEER_A, id_, file_.size(), range(0, 5));
    DownloadManager manager(tracker_, *storage_, swarm_, config_);

    DownloadResult result = manager.download("data.bin");
    ASSERT_EQ(result.content_id, id_);
    ASSERT_EQ(result.file_size, file_.size());
    ASSERT_FALSE(result.from_store);
    ASSERT_EQ(result.path, storage_->stored_path(id_));
    ASSERT_EQ(read_file(result.path), file_);
    ASSERT_FALSE(fs::exists(storage_->staging_path(id_)));
}

TEST_F(DownloadManagerTest, VerifiedStoredCopyIsReused) {
    publish(PEER_A, id_, file_.size(), range(0, 5));
    DownloadManager manager(tracker_, *storage_, swarm_, config_);
    manager.download("data.bin");
    size_t calls = swarm_.total_calls();

    DownloadResult again = manager.download("data.bin");
    ASSERT_TRUE(again.from_store);
    ASSERT_EQ(swarm_.total_calls(), calls);
}

TEST_F(DownloadManagerTest, CorruptDataIsRejectedAndStagedFileRemoved) {
    swarm_.set_behavior(PEER_A, PeerBehavior::Corrupt);
    publish(PEER_A, id_, file_.size(), range(0, 5));
    DownloadManager manager(tracker_, *storage_, swarm_, config_);

    try {
        manager.download("data.bin");
        FAIL() << "expected HashMismatch";
    } catch (const ChunkShareError& e) {
        ASSERT_EQ(e.code(), ErrorCode::HashMismatch);
    }
    ASSERT_FALSE(fs::exists(storage_->staging_path(id_)));
    ASSERT_FALSE(storage_->has_stored(id_));
}

TEST_F(DownloadManagerTest, UnknownFileIsNotFound) {
    DownloadManager manager(tracker_, *storage_, swarm_, config_);
    try {
        manager.download("missing.bin");
        FAIL() << "expected NotFound";
    } catch (const ChunkShareError& e) {
        ASSERT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(DownloadManagerTest, NoPeersIsNoAvailablePeers) {
    // Advertising only out-of-range chunks leaves every real chunk without a holder
    publish(PEER_A, id_, file_.size(), {99});
    DownloadManager manager(tracker_, *storage_, swarm_, config_);
    try {
        manager.download("data.bin");
        FAIL() << "expected NoAvailablePeers";
    } catch (const ChunkShareError& e) {
        ASSERT_EQ(e.code(), ErrorCode::NoAvailablePeers);
    }
    ASSERT_EQ(swarm_.total_calls(), 0u);
}

TEST_F(DownloadManagerTest, EmptyPeerListIsNoSources) {
    MockRegistryClient registry;
    LookupResult listing;
    listing.content_id = id_;
    listing.file_name = "data.bin";
    listing.file_size = file_.size();
    EXPECT_CALL(registry, lookup("data.bin")).WillOnce(Return(std::optional<LookupResult>(listing)));

    DownloadManager manager(registry, *storage_, swarm_, config_);
    try {
        manager.download("data.bin");
        FAIL() << "expected NoSources";
    } catch (const ChunkShareError& e) {
        ASSERT_EQ(e.code(), ErrorCode::NoSources);
        ASSERT_TRUE(is_unavailable(e.code()));
    }
    ASSERT_EQ(swarm_.total_calls(), 0u);
}

TEST_F(DownloadManagerTest, ImpossibleAdvertisedSizeIsRejected) {
    publish(PEER_A, id_, static_cast<uint64_t>(std::numeric_limits<int64_t>::max()), {0});
    DownloadManager manager(tracker_, *storage_, swarm_, config_);
    try {
        manager.download("data.bin");
        FAIL() << "expected InvalidArgument";
    } catch (const ChunkShareError& e) {
        ASSERT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
    ASSERT_EQ(swarm_.total_calls(), 0u);
    ASSERT_FALSE(fs::exists(storage_->staging_path(id_)));
}

TEST_F(DownloadManagerTest, EmptyFileSucceedsWithoutPeers) {
    content_id_t empty_id = Chunker::identify({});
    publish(PEER_A, empty_id, 0, {});
    DownloadManager manager(tracker_, *storage_, swarm_, config_);

    DownloadResult result = manager.download("data.bin");
    ASSERT_EQ(result.file_size, 0u);
    ASSERT_TRUE(fs::exists(result.path));
    ASSERT_EQ(fs::file_size(result.path), 0u);
    ASSERT_EQ(swarm_.total_calls(), 0u);
}
