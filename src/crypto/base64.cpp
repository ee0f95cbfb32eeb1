#include "crypto/base64.hpp"
#include <openssl/evp.h>
#include <limits>

namespace Base64 {

std::string encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    // 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock writes
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::optional<std::vector<uint8_t>> decode(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::vector<uint8_t>{};
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(begin, end - begin + 1);

    if (trimmed.size() % 4 != 0 || trimmed.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }

    size_t padding = 0;
    if (trimmed.back() == '=') padding++;
    if (trimmed.size() >= 2 && trimmed[trimmed.size() - 2] == '=') padding++;

    if (trimmed.find('=') < trimmed.size() - padding) {
        return std::nullopt;
    }

    std::vector<uint8_t> out(trimmed.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(trimmed.data()),
                                  static_cast<int>(trimmed.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return std::nullopt;
    }
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

} // namespace Base64
