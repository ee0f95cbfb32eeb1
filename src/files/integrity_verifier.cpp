#include "files/integrity_verifier.hpp"
#include "crypto/hasher.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace IntegrityVerifier {

bool same_content_id(const content_id_t& a, const content_id_t& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

Verdict verify(const std::vector<uint8_t>& assembled, const content_id_t& expected) {
    std::string actual = Hasher::to_hex(Hasher::sha1(assembled));
    if (same_content_id(actual, expected)) {
        return Verdict::Accepted;
    }
    LOG_WARN("Hash mismatch! Expected ", expected, ", got ", actual);
    return Verdict::Rejected;
}

Verdict verify_file(const std::filesystem::path& path, const content_id_t& expected) {
    std::string actual;
    try {
        actual = Hasher::to_hex(Hasher::sha1_file(path));
    } catch (const std::runtime_error& e) {
        LOG_ERR("Cannot verify ", path.string(), ": ", e.what());
        return Verdict::Rejected;
    }
    if (same_content_id(actual, expected)) {
        return Verdict::Accepted;
    }
    LOG_WARN("Hash mismatch for ", path.string(), "! Expected ", expected, ", got ", actual);
    return Verdict::Rejected;
}

} // namespace IntegrityVerifier
