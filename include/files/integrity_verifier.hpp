#ifndef CHUNKSHARE_INTEGRITY_VERIFIER_HPP
#define CHUNKSHARE_INTEGRITY_VERIFIER_HPP

#include "manifest.hpp"
#include <vector>
#include <cstdint>
#include <filesystem>

enum class Verdict {
    Accepted,
    Rejected
};

namespace IntegrityVerifier {

// Recomputes the ContentId of the assembled bytes; hex comparison ignores case.
Verdict verify(const std::vector<uint8_t>& assembled, const content_id_t& expected);

// Same check streamed from a file; an unreadable file is Rejected.
Verdict verify_file(const std::filesystem::path& path, const content_id_t& expected);

bool same_content_id(const content_id_t& a, const content_id_t& b);

} // namespace IntegrityVerifier

#endif // CHUNKSHARE_INTEGRITY_VERIFIER_HPP
