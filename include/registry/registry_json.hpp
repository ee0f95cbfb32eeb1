#ifndef CHUNKSHARE_REGISTRY_JSON_HPP
#define CHUNKSHARE_REGISTRY_JSON_HPP

#include "nlohmann/json.hpp"
#include "registry_client.hpp"

// JSON shapes of the tracker's HTTP API. The content id travels as "file_hash".
// from_json throws nlohmann::json::exception on missing or mistyped fields and
// ChunkShareError(InvalidArgument) for a port, size or chunk index out of range.

void to_json(nlohmann::json& j, const PeerRecord& p);
void from_json(const nlohmann::json& j, PeerRecord& p);

void to_json(nlohmann::json& j, const LookupResult& r);
void from_json(const nlohmann::json& j, LookupResult& r);

void to_json(nlohmann::json& j, const FileListing& f);
void from_json(const nlohmann::json& j, FileListing& f);

void to_json(nlohmann::json& j, const PublishRequest& r);
void from_json(const nlohmann::json& j, PublishRequest& r);

void to_json(nlohmann::json& j, const PublishResult& r);
void from_json(const nlohmann::json& j, PublishResult& r);

#endif // CHUNKSHARE_REGISTRY_JSON_HPP
