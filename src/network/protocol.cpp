#include "network/protocol.hpp"
#include "crypto/base64.hpp"
#include "crypto/hasher.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <limits>

namespace Protocol {

std::string format_request(const ChunkRequest& request) {
    std::ostringstream ss;
    ss << GET_CHUNK_COMMAND << ' ' << request.content_id << ' ' << request.chunk_index << '\n';
    return ss.str();
}

std::optional<ChunkRequest> parse_request(const std::string& line) {
    if (line.size() > MAX_REQUEST_LINE) return std::nullopt;

    std::istringstream iss(line);
    std::string command, content_id, index_str, extra;
    if (!(iss >> command >> content_id >> index_str) || (iss >> extra)) {
        return std::nullopt;
    }
    if (command != GET_CHUNK_COMMAND || !Hasher::is_hex_digest(content_id)) {
        return std::nullopt;
    }
    if (index_str.empty() || index_str.size() > 10 ||
        !std::all_of(index_str.begin(), index_str.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    uint64_t index = std::stoull(index_str);
    if (index > std::numeric_limits<uint32_t>::max()) {
        return std::nullopt;
    }

    std::transform(content_id.begin(), content_id.end(), content_id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    ChunkRequest request;
    request.content_id = content_id;
    request.chunk_index = static_cast<uint32_t>(index);
    return request;
}

std::string encode_chunk_response(const std::vector<uint8_t>& chunk) {
    return Base64::encode(chunk);
}

std::optional<std::vector<uint8_t>> decode_chunk_response(const std::string& body) {
    auto decoded = Base64::decode(body);
    if (!decoded || decoded->empty()) {
        return std::nullopt;
    }
    return decoded;
}

} // namespace Protocol
