#ifndef CHUNKSHARE_PROTOCOL_HPP
#define CHUNKSHARE_PROTOCOL_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <optional>
#include "files/manifest.hpp"

// Chunk protocol, one request per TCP connection:
//   client -> server: "GET_CHUNK <content_id> <chunk_index>\n"
//   server -> client: base64(chunk bytes), then close
// Any failure on the server side is signalled by closing with no bytes.
constexpr const char* GET_CHUNK_COMMAND = "GET_CHUNK";
constexpr size_t MAX_REQUEST_LINE = 512;

struct PeerAddress {
    std::string ip;
    uint16_t port = 0;

    std::string to_string() const { return ip + ":" + std::to_string(port); }

    bool operator==(const PeerAddress& other) const { return ip == other.ip && port == other.port; }
    bool operator<(const PeerAddress& other) const {
        return ip < other.ip || (ip == other.ip && port < other.port);
    }
};

struct ChunkRequest {
    content_id_t content_id;
    uint32_t chunk_index = 0;
};

namespace Protocol {

std::string format_request(const ChunkRequest& request);

// Accepts the line with or without its trailing CR/LF. The content id is
// returned lowercased.
std::optional<ChunkRequest> parse_request(const std::string& line);

std::string encode_chunk_response(const std::vector<uint8_t>& chunk);

// nullopt for an empty or undecodable body.
std::optional<std::vector<uint8_t>> decode_chunk_response(const std::string& body);

} // namespace Protocol

#endif // CHUNKSHARE_PROTOCOL_HPP
