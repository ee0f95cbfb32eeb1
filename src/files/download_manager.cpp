#include "files/download_manager.hpp"
#include "files/integrity_verifier.hpp"
#include "crypto/hasher.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>

DownloadManager::DownloadManager(RegistryClient& registry, StorageManager& storage, ChunkFetcher& fetcher,
                                 const Config& config)
    : registry_(registry), storage_(storage), fetcher_(fetcher), config_(config) {}

DownloadResult DownloadManager::download(const std::string& file_name) {
    LOG_INFO("Looking up ", file_name, " on the tracker");
    auto lookup = registry_.lookup(file_name);
    if (!lookup) {
        throw ChunkShareError(ErrorCode::NotFound, "File not found on tracker: " + file_name);
    }

    content_id_t content_id = lookup->content_id;
    std::transform(content_id.begin(), content_id.end(), content_id.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (!Hasher::is_hex_digest(content_id)) {
        throw ChunkShareError(ErrorCode::RegistryUnreachable,
                              "Tracker returned an invalid content id for " + file_name + ": " + lookup->content_id);
    }

    DownloadResult result;
    result.content_id = content_id;
    result.file_name = lookup->file_name;
    result.file_size = lookup->file_size;

    if (storage_.has_stored(content_id)) {
        fs::path existing = storage_.stored_path(content_id);
        if (IntegrityVerifier::verify_file(existing, content_id) == Verdict::Accepted) {
            LOG_INFO(file_name, " already in the store at ", existing.string());
            result.path = existing;
            result.from_store = true;
            return result;
        }
        LOG_WARN("Stored copy of ", content_id, " does not verify, downloading again");
    }

    if (lookup->peers.empty() && lookup->file_size > 0) {
        throw ChunkShareError(ErrorCode::NoSources, "No sources currently available for " + file_name);
    }

    LOG_INFO("Found ", file_name, " (", lookup->file_size, " bytes, ", lookup->peers.size(), " peers)");

    DownloadSession session(content_id, lookup->file_size, config_.chunk_size, lookup->peers,
                            fetcher_, config_.workers);
    if (progress_callback_) {
        session.set_progress_callback(progress_callback_);
    }
    std::vector<uint8_t> data = session.run();

    result.path = store_verified(content_id, data);
    LOG_INFO("Downloaded ", file_name, " to ", result.path.string());
    return result;
}

fs::path DownloadManager::store_verified(const content_id_t& content_id, const std::vector<uint8_t>& data) {
    fs::path staged = storage_.write_staged(content_id, data);

    if (IntegrityVerifier::verify_file(staged, content_id) != Verdict::Accepted) {
        if (!storage_.discard_staged(content_id)) {
            LOG_ERR("Could not remove rejected download ", staged.string());
        }
        throw ChunkShareError(ErrorCode::HashMismatch,
                              "Downloaded data does not match content id " + content_id);
    }
    return storage_.commit_staged(content_id);
}
