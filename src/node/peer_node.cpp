#include "node/peer_node.hpp"
#include "files/chunker.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <asio.hpp>
#include <numeric>

PeerNode::PeerNode(const Config& config, RegistryClient& registry, std::unique_ptr<ChunkFetcher> fetcher)
    : config_(config),
      registry_(registry),
      fetcher_(fetcher ? std::move(fetcher) : std::make_unique<TcpChunkFetcher>(config.request_timeout)),
      storage_(config.catalog_path(), config.store_dir),
      sharer_(),
      server_(config.port, sharer_, config.server_threads),
      advertise_ip_(config.advertise_ip.empty() ? detect_local_ip() : config.advertise_ip) {

    restore_catalog();
    LOG_INFO("Peer node ready at ", advertise_ip_, ":", server_.port(), ", serving ", sharer_.size(), " files");
}

PeerNode::~PeerNode() {
    stop();
}

void PeerNode::start() {
    server_.start();
}

void PeerNode::stop() {
    server_.stop();
}

void PeerNode::restore_catalog() {
    for (const auto& record : storage_.get_all_shares()) {
        std::error_code ec;
        if (!fs::is_regular_file(record.file_path, ec)) {
            LOG_WARN("Shared file no longer exists, not serving it: ", record.file_path);
            continue;
        }
        sharer_.add_share(record.manifest, record.file_path);
    }
}

void PeerNode::serve(const Manifest& manifest, const fs::path& path) {
    if (!storage_.save_share(manifest, path.string())) {
        throw ChunkShareError(ErrorCode::StorageError, "Failed to record share of " + path.string());
    }
    sharer_.add_share(manifest, path);
}

void PeerNode::publish(const Manifest& manifest) {
    PublishRequest request;
    request.content_id = manifest.content_id;
    request.file_name = manifest.file_name;
    request.file_size = manifest.file_size;
    request.chunks.resize(manifest.chunk_count());
    std::iota(request.chunks.begin(), request.chunks.end(), 0u);
    request.ip = advertise_ip_;
    request.port = server_.port();

    PublishResult result = registry_.publish(request);
    LOG_INFO("Published ", manifest.file_name, " (", manifest.content_id, "): ", result.message,
             ", ", result.peers_count, " peers");
}

ShareRecord PeerNode::share(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "File not found: " + path.string());
    }

    fs::path absolute = fs::absolute(path, ec);
    if (ec) absolute = path;

    Manifest manifest = Chunker::create_manifest_from_file(absolute, config_.chunk_size);
    serve(manifest, absolute);
    publish(manifest);

    LOG_INFO("Sharing ", manifest.file_name, " (", manifest.file_size, " bytes, ",
             manifest.chunk_count(), " chunks) as ", manifest.content_id);
    return ShareRecord{manifest, absolute.string()};
}

size_t PeerNode::republish_all() {
    size_t count = 0;
    for (const auto& manifest : sharer_.get_all_manifests()) {
        publish(manifest);
        count++;
    }
    return count;
}

DownloadResult PeerNode::download(const std::string& file_name) {
    DownloadManager manager(registry_, storage_, *fetcher_, config_);
    if (progress_callback_) {
        manager.set_progress_callback(progress_callback_);
    }
    DownloadResult result = manager.download(file_name);

    if (config_.reshare_downloads) {
        Manifest manifest;
        manifest.content_id = result.content_id;
        manifest.file_name = result.file_name;
        manifest.file_size = result.file_size;
        manifest.chunk_size = config_.chunk_size;

        serve(manifest, result.path);
        try {
            publish(manifest);
        } catch (const ChunkShareError& e) {
            // The file is on disk and verified; only the announcement is missing.
            LOG_WARN("Downloaded ", file_name, " but could not announce it: ", e.what());
        }
    }
    return result;
}

std::vector<ShareRecord> PeerNode::shared_files() {
    return storage_.get_all_shares();
}

std::vector<FileListing> PeerNode::list_registry_files() {
    return registry_.list_files();
}

std::string PeerNode::detect_local_ip() {
    try {
        asio::io_context io_context;
        asio::ip::udp::socket socket(io_context);
        socket.connect(asio::ip::udp::endpoint(asio::ip::make_address("8.8.8.8"), 80));
        std::string ip = socket.local_endpoint().address().to_string();
        if (!ip.empty() && ip != "0.0.0.0") {
            return ip;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Local IP detection failed: ", e.what());
    }
    return "127.0.0.1";
}
