#include "registry/registry_json.hpp"
#include "common/error.hpp"
#include <limits>

using json = nlohmann::json;

namespace {

// Integers are read wide and range-checked; get_to() would narrow silently.
uint64_t read_unsigned(const json& value, const std::string& name, uint64_t max) {
    if (!value.is_number_integer()) {
        throw ChunkShareError(ErrorCode::InvalidArgument, name + " must be an integer");
    }
    if (value.is_number_unsigned()) {
        uint64_t n = value.get<uint64_t>();
        if (n <= max) return n;
    } else {
        int64_t n = value.get<int64_t>();
        if (n >= 0 && static_cast<uint64_t>(n) <= max) return static_cast<uint64_t>(n);
    }
    throw ChunkShareError(ErrorCode::InvalidArgument, name + " out of range: " + value.dump());
}

uint16_t read_port(const json& j) {
    auto port = read_unsigned(j.at("port"), "port", std::numeric_limits<uint16_t>::max());
    if (port == 0) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "port out of range: 0");
    }
    return static_cast<uint16_t>(port);
}

uint64_t read_file_size(const json& j) {
    return read_unsigned(j.at("file_size"), "file_size",
                         static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
}

std::vector<uint32_t> read_chunks(const json& j) {
    const json& chunks = j.at("chunks");
    if (!chunks.is_array()) {
        throw ChunkShareError(ErrorCode::InvalidArgument, "chunks must be an array");
    }
    std::vector<uint32_t> indices;
    indices.reserve(chunks.size());
    for (const auto& index : chunks) {
        indices.push_back(static_cast<uint32_t>(
            read_unsigned(index, "chunk index", std::numeric_limits<uint32_t>::max())));
    }
    return indices;
}

} // namespace

void to_json(json& j, const PeerRecord& p) {
    j = json{
        {"ip", p.ip},
        {"port", p.port},
        {"chunks", p.chunks}
    };
}

void from_json(const json& j, PeerRecord& p) {
    j.at("ip").get_to(p.ip);
    p.port = read_port(j);
    p.chunks = read_chunks(j);
}

void to_json(json& j, const LookupResult& r) {
    j = json{
        {"file_hash", r.content_id},
        {"file_name", r.file_name},
        {"file_size", r.file_size},
        {"peers", r.peers}
    };
}

void from_json(const json& j, LookupResult& r) {
    j.at("file_hash").get_to(r.content_id);
    j.at("file_name").get_to(r.file_name);
    r.file_size = read_file_size(j);
    r.peers.clear();
    for (const auto& peer : j.at("peers")) {
        r.peers.push_back(peer.get<PeerRecord>());
    }
}

void to_json(json& j, const FileListing& f) {
    j = json{
        {"file_hash", f.content_id},
        {"file_name", f.file_name},
        {"file_size", f.file_size},
        {"peers_count", f.peer_count}
    };
}

void from_json(const json& j, FileListing& f) {
    j.at("file_hash").get_to(f.content_id);
    j.at("file_name").get_to(f.file_name);
    f.file_size = read_file_size(j);
    j.at("peers_count").get_to(f.peer_count);
}

void to_json(json& j, const PublishRequest& r) {
    j = json{
        {"file_name", r.file_name},
        {"file_hash", r.content_id},
        {"file_size", r.file_size},
        {"chunks", r.chunks},
        {"ip", r.ip},
        {"port", r.port}
    };
}

void from_json(const json& j, PublishRequest& r) {
    j.at("file_name").get_to(r.file_name);
    j.at("file_hash").get_to(r.content_id);
    r.file_size = read_file_size(j);
    r.chunks = read_chunks(j);
    j.at("ip").get_to(r.ip);
    r.port = read_port(j);
}

void to_json(json& j, const PublishResult& r) {
    j = json{
        {"message", r.message},
        {"file_hash", r.content_id},
        {"peers_count", r.peers_count}
    };
}

void from_json(const json& j, PublishResult& r) {
    j.at("message").get_to(r.message);
    j.at("file_hash").get_to(r.content_id);
    j.at("peers_count").get_to(r.peers_count);
}
