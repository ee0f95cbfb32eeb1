#include "gtest/gtest.h"
#include "network/chunk_server.hpp"
#include "network/chunk_client.hpp"
#include "files/file_sharer.hpp"
#include "files/chunker.hpp"
#include "files/download_session.hpp"
#include "files/integrity_verifier.hpp"
#include "registry/http_registry_client.hpp"
#include "tracker/tracker_server.hpp"
#include "node/peer_node.hpp"
#include "cli/cli.hpp"
#include "common/error.hpp"
#include "test_helpers.hpp"

#include <sstream>
#include <chrono>
#include <thread>
#include <atomic>

namespace {

const std::chrono::milliseconds FETCH_TIMEOUT{2000};

PeerRecord local_holder(uint16_t port, std::vector<uint32_t> chunks) {
    PeerRecord p;
    p.ip = "127.0.0.1";
    p.port = port;
    p.chunks = std::move(chunks);
    return p;
}

std::string tracker_url(uint16_t port) {
    return "http://127.0.0.1:" + std::to_string(port);
}

} // namespace

// --- Chunk server over real TCP ---

class ChunkServerTest : public ::testing::Test {
protected:
    TempDir dir_;
    std::vector<uint8_t> data_ = make_bytes(2500);
    Manifest manifest_;
    FileSharer sharer_;
    std::unique_ptr<ChunkServer> server_;

    void SetUp() override {
        write_file(dir_ / "shared.bin", data_);
        manifest_ = Chunker::create_manifest_from_file(dir_ / "shared.bin", 1024);
        sharer_.add_share(manifest_, dir_ / "shared.bin");
        server_ = std::make_unique<ChunkServer>(0, sharer_, 2);
        server_->start();
    }

    void TearDown() override {
        server_->stop();
    }

    std::string request(const std::string& line) {
        return raw_exchange(server_->port(), line);
    }
};

TEST_F(ChunkServerTest, ServesBase64EncodedChunk) {
    std::string reply = request("GET_CHUNK " + manifest_.content_id + " 2\n");
    auto decoded = Protocol::decode_chunk_response(reply);
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(*decoded, std::vector<uint8_t>(data_.begin() + 2048, data_.end()));
    ASSERT_GE(server_->stats().served.load(), 1u);
}

TEST_F(ChunkServerTest, AcceptsRequestWithoutNewlineBeforeHalfClose) {
    asio::io_context io_context;
    asio::ip::tcp::socket socket(io_context);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->port()));
    asio::write(socket, asio::buffer("GET_CHUNK " + manifest_.content_id + " 0"));
    socket.shutdown(asio::ip::tcp::socket::shutdown_send);

    std::string reply;
    asio::error_code ec;
    asio::read(socket, asio::dynamic_buffer(reply), ec);
    ASSERT_EQ(Protocol::decode_chunk_response(reply),
              std::vector<uint8_t>(data_.begin(), data_.begin() + 1024));
}

TEST_F(ChunkServerTest, FailuresCloseWithZeroBytes) {
    std::string unknown = Chunker::identify(make_bytes(10, 7));
    ASSERT_EQ(request("GET_CHUNK " + unknown + " 0\n"), "");
    ASSERT_EQ(request("GET_CHUNK " + manifest_.content_id + " 3\n"), "");
    ASSERT_EQ(request("GET_CHUNK " + manifest_.content_id + "\n"), "");
    ASSERT_EQ(request("HELLO\n"), "");
    ASSERT_EQ(request(std::string(600, 'A') + "\n"), "");
    ASSERT_GE(server_->stats().rejected.load(), 5u);
}

TEST_F(ChunkServerTest, ServesManyClientsConcurrently) {
    std::vector<std::thread> clients;
    std::atomic<int> good{0};
    for (int i = 0; i < 16; ++i) {
        clients.emplace_back([&, i]() {
            uint32_t index = static_cast<uint32_t>(i % 3);
            auto reply = Protocol::decode_chunk_response(
                request("GET_CHUNK " + manifest_.content_id + " " + std::to_string(index) + "\n"));
            ChunkSpec spec = Chunker::chunk_spec(2500, 1024, index);
            if (reply && *reply == std::vector<uint8_t>(data_.begin() + spec.offset,
                                                        data_.begin() + spec.offset + spec.length)) {
                good++;
            }
        });
    }
    for (auto& t : clients) t.join();
    ASSERT_EQ(good.load(), 16);
}

TEST_F(ChunkServerTest, TcpFetcherRoundTrip) {
    TcpChunkFetcher fetcher(FETCH_TIMEOUT);
    PeerAddress peer{"127.0.0.1", server_->port()};

    auto chunk = fetcher.fetch(peer, ChunkRequest{manifest_.content_id, 1}, 1024);
    ASSERT_TRUE(chunk.has_value());
    ASSERT_EQ(*chunk, std::vector<uint8_t>(data_.begin() + 1024, data_.begin() + 2048));

    // Expected length disagrees with what the server holds
    ASSERT_FALSE(fetcher.fetch(peer, ChunkRequest{manifest_.content_id, 2}, 1024).has_value());
    ASSERT_FALSE(fetcher.fetch(peer, ChunkRequest{manifest_.content_id, 9}, 1024).has_value());
    ASSERT_EQ(fetcher.in_flight(), 0u);
}

TEST_F(ChunkServerTest, SessionDownloadsWholeFileAndVerifies) {
    TcpChunkFetcher fetcher(FETCH_TIMEOUT);
    DownloadSession session(manifest_.content_id, manifest_.file_size, 1024,
                            {local_holder(server_->port(), {0, 1, 2})}, fetcher, 10);
    auto assembled = session.run();
    ASSERT_EQ(assembled, data_);
    ASSERT_EQ(IntegrityVerifier::verify(assembled, manifest_.content_id), Verdict::Accepted);
    ASSERT_LE(fetcher.peak_in_flight(), 10u);
}

TEST(ChunkServerLifecycleTest, StopClosesTheListener) {
    FileSharer sharer;
    ChunkServer server(0, sharer, 2);
    server.start();
    uint16_t port = server.port();
    ASSERT_NE(port, 0);
    ASSERT_TRUE(server.running());
    server.stop();
    ASSERT_FALSE(server.running());

    TcpChunkFetcher fetcher(FETCH_TIMEOUT);
    ASSERT_FALSE(fetcher.fetch(PeerAddress{"127.0.0.1", port},
                               ChunkRequest{Chunker::identify({}), 0}, 10).has_value());
}

// --- Chunk client failure modes ---

TEST(TcpChunkFetcherTest, RefusedConnectionIsAFailedAttempt) {
    TcpChunkFetcher fetcher(FETCH_TIMEOUT);
    auto result = fetcher.fetch(PeerAddress{"127.0.0.1", closed_port()},
                                ChunkRequest{Chunker::identify({}), 0}, 10);
    ASSERT_FALSE(result.has_value());
}

TEST(TcpChunkFetcherTest, SilentPeerTimesOut) {
    // Accepts connections (kernel backlog) but never answers
    asio::io_context io_context;
    asio::ip::tcp::acceptor silent(io_context, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    uint16_t port = silent.local_endpoint().port();

    TcpChunkFetcher fetcher(std::chrono::milliseconds(300));
    auto start = std::chrono::steady_clock::now();
    auto result = fetcher.fetch(PeerAddress{"127.0.0.1", port}, ChunkRequest{Chunker::identify({}), 0}, 10);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    ASSERT_GE(elapsed, std::chrono::milliseconds(250));
    ASSERT_LT(elapsed, std::chrono::milliseconds(3000));
}

// --- Multi-peer transfers over TCP ---

class SwarmTest : public ::testing::Test {
protected:
    TempDir dir_;
    std::vector<uint8_t> data_ = make_bytes(20 * 1024 + 99);
    Manifest manifest_;
    FileSharer sharer_a_;
    FileSharer sharer_b_;
    std::unique_ptr<ChunkServer> server_a_;
    std::unique_ptr<ChunkServer> server_b_;

    void SetUp() override {
        write_file(dir_ / "big.bin", data_);
        manifest_ = Chunker::create_manifest_from_file(dir_ / "big.bin", 1024);
        sharer_a_.add_share(manifest_, dir_ / "big.bin");
        sharer_b_.add_share(manifest_, dir_ / "big.bin");
        server_a_ = std::make_unique<ChunkServer>(0, sharer_a_, 2);
        server_b_ = std::make_unique<ChunkServer>(0, sharer_b_, 2);
        server_a_->start();
        server_b_->start();
    }

    std::vector<uint32_t> chunks(uint32_t from, uint32_t to) {
        std::vector<uint32_t> v;
        for (uint32_t i = from; i < to; ++i) v.push_back(i);
        return v;
    }
};

TEST_F(SwarmTest, DisjointHalvesFromTwoServers) {
    uint32_t n = manifest_.chunk_count();
    TcpChunkFetcher fetcher(FETCH_TIMEOUT);
    DownloadSession session(manifest_.content_id, manifest_.file_size, 1024,
                            {local_holder(server_a_->port(), chunks(0, n / 2)),
                             local_holder(server_b_->port(), chunks(n / 2, n))}, fetcher, 4);
    ASSERT_EQ(session.run(), data_);
    ASSERT_GT(server_a_->stats().served.load(), 0u);
    ASSERT_GT(server_b_->stats().served.load(), 0u);
}

TEST_F(SwarmTest, FailsOverFromDeadPeer) {
    uint32_t n = manifest_.chunk_count();
    TcpChunkFetcher fetcher(FETCH_TIMEOUT);
    DownloadSession session(manifest_.content_id, manifest_.file_size, 1024,
                            {local_holder(closed_port(), chunks(0, n)),
                             local_holder(server_b_->port(), chunks(0, n))}, fetcher, 4);
    ASSERT_EQ(session.run(), data_);
    ASSERT_EQ(server_b_->stats().served.load(), n);
}

TEST_F(SwarmTest, AllPeersDeadIsNoAvailablePeers) {
    uint32_t n = manifest_.chunk_count();
    TcpChunkFetcher fetcher(FETCH_TIMEOUT);
    DownloadSession session(manifest_.content_id, manifest_.file_size, 1024,
                            {local_holder(closed_port(), chunks(0, n))}, fetcher, 4);
    try {
        session.run();
        FAIL() << "expected NoAvailablePeers";
    } catch (const ChunkShareError& e) {
        ASSERT_EQ(e.code(), ErrorCode::NoAvailablePeers);
    }
}

// --- Tracker over HTTP ---

class TrackerHttpTest : public ::testing::Test {
protected:
    TrackerState state_;
    std::unique_ptr<TrackerServer> server_;
    std::unique_ptr<HttpRegistryClient> client_;

    void SetUp() override {
        server_ = std::make_unique<TrackerServer>(0, state_, 2);
        server_->start();
        client_ = std::make_unique<HttpRegistryClient>(tracker_url(server_->port()), std::chrono::milliseconds(3000));
    }

    void TearDown() override {
        server_->stop();
    }

    PublishRequest request(uint16_t port, std::vector<uint32_t> chunks) {
        PublishRequest r;
        r.content_id = "a9993e364706816aba3e25717850c26c9cd0d89d";
        r.file_name = "notes file.txt";
        r.file_size = 2500;
        r.chunks = std::move(chunks);
        r.ip = "10.1.2.3";
        r.port = port;
        return r;
    }
};

TEST_F(TrackerHttpTest, PublishIsIdempotent) {
    PublishResult first = client_->publish(request(6000, {0, 1}));
    ASSERT_EQ(first.message, "Peer registered successfully");
    ASSERT_EQ(first.peers_count, 1u);
    ASSERT_EQ(first.content_id, "a9993e364706816aba3e25717850c26c9cd0d89d");

    PublishResult second = client_->publish(request(6000, {0, 1, 2}));
    ASSERT_EQ(second.message, "Peer updated successfully");
    ASSERT_EQ(second.peers_count, 1u);

    auto lookup = client_->lookup("notes file.txt");
    ASSERT_TRUE(lookup.has_value());
    ASSERT_EQ(lookup->file_size, 2500u);
    ASSERT_EQ(lookup->peers.size(), 1u);
    ASSERT_EQ(lookup->peers[0].ip, "10.1.2.3");
    ASSERT_EQ(lookup->peers[0].port, 6000);
    ASSERT_EQ(lookup->peers[0].chunks, (std::vector<uint32_t>{0, 1, 2}));
}

TEST_F(TrackerHttpTest, LookupOfUnknownFileIsNotAnError) {
    ASSERT_FALSE(client_->lookup("nothing.txt").has_value());
}

TEST_F(TrackerHttpTest, ListFiles) {
    ASSERT_TRUE(client_->list_files().empty());
    client_->publish(request(6000, {0}));
    client_->publish(request(6001, {1}));

    auto files = client_->list_files();
    ASSERT_EQ(files.size(), 1u);
    ASSERT_EQ(files[0].file_name, "notes file.txt");
    ASSERT_EQ(files[0].peer_count, 2u);
}

TEST_F(TrackerHttpTest, MissingFieldIsRejectedOverTheWire) {
    std::string body = R"({"file_name": "x", "file_hash": "abc", "file_size": 1, "chunks": [0], "ip": "1.2.3.4"})";
    std::string reply = raw_exchange(server_->port(),
                                     "POST /register HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n"
                                     "Content-Type: application/json\r\n"
                                     "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
    ASSERT_EQ(reply.rfind("HTTP/1.1 400", 0), 0u) << reply;
    ASSERT_NE(reply.find("Missing field: port"), std::string::npos);
    ASSERT_NE(reply.find("Connection: close"), std::string::npos);
}

TEST_F(TrackerHttpTest, OversizedBodyIsRejected) {
    std::string body(TrackerServer::MAX_BODY_SIZE + 1, 'x');
    std::string head = "POST /register HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n"
                       "Content-Type: application/json\r\n"
                       "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";

    asio::io_context io_context;
    asio::ip::tcp::socket socket(io_context);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->port()));
    asio::error_code ec;
    // The server may answer and close before the whole body is written
    asio::write(socket, std::vector<asio::const_buffer>{asio::buffer(head), asio::buffer(body)}, ec);
    std::string reply;
    asio::read(socket, asio::dynamic_buffer(reply), ec);

    if (!reply.empty()) {
        ASSERT_EQ(reply.rfind("HTTP/1.1 413", 0), 0u) << reply.substr(0, 200);
    }
    ASSERT_TRUE(state_.list_files().empty());
    ASSERT_TRUE(client_->list_files().empty());
}

TEST_F(TrackerHttpTest, PortOutOfRangeIsRejected) {
    PublishRequest valid = request(6000, {0});
    std::string body = R"({"file_name": "x", "file_hash": "abc", "file_size": 1, "chunks": [0],
                           "ip": "1.2.3.4", "port": 70000})";
    std::string reply = raw_exchange(server_->port(),
                                     "POST /register HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n"
                                     "Content-Type: application/json\r\n"
                                     "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
    ASSERT_EQ(reply.rfind("HTTP/1.1 400", 0), 0u) << reply;
    ASSERT_FALSE(client_->lookup("x").has_value());

    // A well-formed registration still goes through
    ASSERT_EQ(client_->publish(valid).peers_count, 1u);
}

TEST(HttpRegistryClientTest, ClosedPortIsRegistryUnreachable) {
    HttpRegistryClient client(tracker_url(closed_port()), std::chrono::milliseconds(1000));
    try {
        client.lookup("anything");
        FAIL() << "expected RegistryUnreachable";
    } catch (const ChunkShareError& e) {
        ASSERT_EQ(e.code(), ErrorCode::RegistryUnreachable);
    }
    ASSERT_THROW(client.list_files(), ChunkShareError);
}

// --- Peer nodes end to end ---

class PeerNodeTest : public ::testing::Test {
protected:
    TempDir dir_;
    TrackerState state_;
    std::unique_ptr<TrackerServer> tracker_;

    void SetUp() override {
        tracker_ = std::make_unique<TrackerServer>(0, state_, 2);
        tracker_->start();
    }

    void TearDown() override {
        tracker_->stop();
    }

    Config peer_config(const std::string& name) {
        Config c;
        c.port = 0;
        c.advertise_ip = "127.0.0.1";
        c.server_threads = 2;
        c.workers = 4;
        c.request_timeout = FETCH_TIMEOUT;
        c.tracker_url = tracker_url(tracker_->port());
        c.store_dir = (dir_ / name / "store").string();
        c.data_dir = (dir_ / name / "data").string();
        return c;
    }
};

TEST_F(PeerNodeTest, ShareThenDownloadThroughTracker) {
    auto data = make_bytes(7777);
    write_file(dir_ / "holiday.jpg", data);

    HttpRegistryClient registry_a(tracker_url(tracker_->port()), std::chrono::milliseconds(3000));
    HttpRegistryClient registry_b(tracker_url(tracker_->port()), std::chrono::milliseconds(3000));
    PeerNode seeder(peer_config("a"), registry_a);
    PeerNode leecher(peer_config("b"), registry_b);
    seeder.start();
    leecher.start();

    ShareRecord shared = seeder.share(dir_ / "holiday.jpg");
    ASSERT_EQ(shared.manifest.content_id, Chunker::identify(data));
    ASSERT_EQ(shared.manifest.chunk_count(), 8u);

    DownloadResult result = leecher.download("holiday.jpg");
    ASSERT_EQ(result.content_id, shared.manifest.content_id);
    ASSERT_EQ(read_file(result.path), data);

    // The downloader now serves the file too
    auto lookup = state_.lookup("holiday.jpg");
    ASSERT_TRUE(lookup.has_value());
    ASSERT_EQ(lookup->peers.size(), 2u);
    ASSERT_EQ(lookup->peers[1].port, leecher.port());
    ASSERT_EQ(lookup->peers[1].chunks.size(), 8u);
    ASSERT_TRUE(leecher.sharer().get_chunk(result.content_id, 7).has_value());

    leecher.stop();
    seeder.stop();
}

TEST_F(PeerNodeTest, DownloadOfUnknownNameIsNotFound) {
    HttpRegistryClient registry(tracker_url(tracker_->port()), std::chrono::milliseconds(3000));
    PeerNode node(peer_config("a"), registry);
    try {
        node.download("ghost.txt");
        FAIL() << "expected NotFound";
    } catch (const ChunkShareError& e) {
        ASSERT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(PeerNodeTest, SharingMissingFileIsInvalidArgument) {
    PeerNode node(peer_config("a"), state_);
    try {
        node.share(dir_ / "nope.txt");
        FAIL() << "expected InvalidArgument";
    } catch (const ChunkShareError& e) {
        ASSERT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
}

TEST_F(PeerNodeTest, CatalogIsRestoredAndRepublished) {
    auto data = make_bytes(3000);
    write_file(dir_ / "doc.txt", data);
    content_id_t id;
    {
        PeerNode node(peer_config("a"), state_);
        id = node.share(dir_ / "doc.txt").manifest.content_id;
    }

    TrackerState fresh_tracker;
    PeerNode restarted(peer_config("a"), fresh_tracker);
    ASSERT_TRUE(restarted.sharer().get_manifest(id).has_value());
    ASSERT_EQ(restarted.shared_files().size(), 1u);

    ASSERT_EQ(restarted.republish_all(), 1u);
    auto lookup = fresh_tracker.lookup("doc.txt");
    ASSERT_TRUE(lookup.has_value());
    ASSERT_EQ(lookup->content_id, id);
}

TEST_F(PeerNodeTest, PublishFailureIsSurfaced) {
    write_file(dir_ / "doc.txt", make_bytes(100));
    HttpRegistryClient dead(tracker_url(closed_port()), std::chrono::milliseconds(1000));
    PeerNode node(peer_config("a"), dead);
    try {
        node.share(dir_ / "doc.txt");
        FAIL() << "expected RegistryUnreachable";
    } catch (const ChunkShareError& e) {
        ASSERT_EQ(e.code(), ErrorCode::RegistryUnreachable);
    }
}

TEST_F(PeerNodeTest, InteractiveShellCommands) {
    write_file(dir_ / "song.mp3", make_bytes(1500));
    PeerNode node(peer_config("a"), state_);
    node.start();

    std::istringstream in("help\nshare " + (dir_ / "song.mp3").string() + "\nfiles\nstatus\n"
                          "download ghost.txt\nbogus\nquit\nshare never-reached\n");
    std::ostringstream out;
    CLI cli(node, in, out);
    cli.run();
    node.stop();

    std::string text = out.str();
    ASSERT_NE(text.find("File shared successfully!"), std::string::npos) << text;
    ASSERT_NE(text.find("Files on tracker: 1"), std::string::npos) << text;
    ASSERT_NE(text.find("Shared Files: 1"), std::string::npos) << text;
    ASSERT_NE(text.find("Not available [NotFound]"), std::string::npos) << text;
    ASSERT_EQ(text.find("Download failed"), std::string::npos) << text;
    ASSERT_NE(text.find("Unknown command: bogus"), std::string::npos) << text;
    ASSERT_EQ(text.find("never-reached"), std::string::npos) << text;
}
