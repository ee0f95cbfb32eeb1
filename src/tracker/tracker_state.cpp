#include "tracker/tracker_state.hpp"
#include "common/logger.hpp"
#include <algorithm>

PublishResult TrackerState::publish(const PublishRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = files_.find(request.content_id);
    if (it == files_.end()) {
        Entry entry;
        entry.file_name = request.file_name;
        entry.file_size = request.file_size;
        it = files_.emplace(request.content_id, std::move(entry)).first;
        order_.push_back(request.content_id);
    }

    Entry& entry = it->second;
    PublishResult result;
    result.content_id = request.content_id;

    auto existing = std::find_if(entry.peers.begin(), entry.peers.end(), [&](const PeerRecord& p) {
        return p.ip == request.ip && p.port == request.port;
    });
    if (existing != entry.peers.end()) {
        existing->chunks = request.chunks;
        result.message = "Peer updated successfully";
    } else {
        PeerRecord peer;
        peer.ip = request.ip;
        peer.port = request.port;
        peer.chunks = request.chunks;
        entry.peers.push_back(std::move(peer));
        result.message = "Peer registered successfully";
    }
    result.peers_count = entry.peers.size();

    LOG_INFO(result.message, ": ", request.ip, ":", request.port, " for ", entry.file_name,
             " (", request.content_id, "), ", request.chunks.size(), " chunks");
    return result;
}

LookupResult TrackerState::to_lookup_result(const content_id_t& content_id, const Entry& entry) const {
    LookupResult result;
    result.content_id = content_id;
    result.file_name = entry.file_name;
    result.file_size = entry.file_size;
    result.peers = entry.peers;
    return result;
}

std::optional<LookupResult> TrackerState::lookup(const std::string& file_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& content_id : order_) {
        const Entry& entry = files_.at(content_id);
        if (entry.file_name == file_name) {
            return to_lookup_result(content_id, entry);
        }
    }
    return std::nullopt;
}

std::optional<LookupResult> TrackerState::lookup_by_content_id(const content_id_t& content_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(content_id);
    if (it == files_.end()) return std::nullopt;
    return to_lookup_result(content_id, it->second);
}

std::vector<FileListing> TrackerState::list_files() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FileListing> listing;
    listing.reserve(order_.size());
    for (const auto& content_id : order_) {
        const Entry& entry = files_.at(content_id);
        FileListing f;
        f.content_id = content_id;
        f.file_name = entry.file_name;
        f.file_size = entry.file_size;
        f.peer_count = entry.peers.size();
        listing.push_back(std::move(f));
    }
    return listing;
}

size_t TrackerState::file_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}
