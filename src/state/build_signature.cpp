// build_signature.cpp - Signature capture and JSON persistence
// Part of jarcache - Server Artifact Cache

#include "state/build_signature.hpp"

#include <fstream>
#include <sstream>

namespace jarcache {

namespace {

// Field names are part of the on-disk format
constexpr const char* KEY_ARTIFACT_HASH = "artifact_hash";
constexpr const char* KEY_SOURCE_REVISION = "source_revision";
constexpr const char* KEY_CHANGED_SOURCES = "changed_sources";

[[noreturn]] void corrupt(const std::string& reason) {
    throw CacheError(ErrorKind::CORRUPT_SIGNATURE, "Corrupt build signature: " + reason);
}

} // namespace

// =============================================================================
// Serialization
// =============================================================================

nlohmann::json BuildSignature::to_json() const {
    nlohmann::json sources = nlohmann::json::array();
    for (const auto& [path, hash] : changed_sources) {
        sources.push_back(nlohmann::json::array({path, hash}));
    }
    return {
        {KEY_ARTIFACT_HASH, artifact_hash},
        {KEY_SOURCE_REVISION, source_revision},
        {KEY_CHANGED_SOURCES, std::move(sources)}
    };
}

BuildSignature BuildSignature::from_json(const nlohmann::json& data) {
    if (!data.is_object()) {
        corrupt("expected an object");
    }

    BuildSignature signature;

    auto hash_it = data.find(KEY_ARTIFACT_HASH);
    if (hash_it == data.end() || !hash_it->is_string()) {
        corrupt(std::string("missing string field '") + KEY_ARTIFACT_HASH + "'");
    }
    signature.artifact_hash = hash_it->get<std::string>();

    auto revision_it = data.find(KEY_SOURCE_REVISION);
    if (revision_it == data.end() || !revision_it->is_string()) {
        corrupt(std::string("missing string field '") + KEY_SOURCE_REVISION + "'");
    }
    signature.source_revision = revision_it->get<std::string>();

    auto sources_it = data.find(KEY_CHANGED_SOURCES);
    if (sources_it == data.end() || !sources_it->is_array()) {
        corrupt(std::string("missing array field '") + KEY_CHANGED_SOURCES + "'");
    }
    for (const auto& entry : *sources_it) {
        if (!entry.is_array() || entry.size() != 2
            || !entry[0].is_string() || !entry[1].is_string()) {
            corrupt("changed source entries must be [path, hash] pairs");
        }
        std::string path = entry[0].get<std::string>();
        if (!signature.changed_sources.emplace(path, entry[1].get<std::string>()).second) {
            corrupt("duplicate changed source '" + path + "'");
        }
    }

    return signature;
}

// =============================================================================
// Capture
// =============================================================================

std::string directory_marker_hash() {
    static const std::string marker = ContentHasher::hash_bytes("<directory>");
    return marker;
}

std::string deleted_marker_hash() {
    static const std::string marker = ContentHasher::hash_bytes("<deleted>");
    return marker;
}

BuildSignature capture_signature(const ContentHasher& hasher,
                                 const VcsInspector& inspector,
                                 const fs::path& artifact_path,
                                 const std::string& source_revision,
                                 const fs::path& repo_root,
                                 const ChangeSet& changes) {
    BuildSignature signature;
    signature.artifact_hash = hasher.hash(artifact_path, HashMode::PLAIN_FILE);
    signature.source_revision = source_revision;

    for (const auto& relative : changes) {
        fs::path target = repo_root / relative;
        std::error_code ec;
        auto status = fs::status(target, ec);

        std::string digest;
        if (!fs::exists(status)) {
            digest = deleted_marker_hash();
        } else if (fs::is_directory(status)) {
            digest = inspector.is_repository(target)
                ? hasher.hash(target, HashMode::REPOSITORY)
                : directory_marker_hash();
        } else {
            digest = hasher.hash(target, HashMode::PLAIN_FILE);
        }
        signature.changed_sources[relative] = std::move(digest);
    }

    return signature;
}

// =============================================================================
// Persistence
// =============================================================================

bool save_signature(const BuildSignature& signature, const fs::path& path) {
    fs::path parent = path.parent_path();
    if (!parent.empty() && !fs::exists(parent)) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return false;
    }

    file << signature.to_json().dump(2) << "\n";
    return file.good();
}

BuildSignature load_signature(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        corrupt("unable to open " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        corrupt(std::string("invalid JSON in ") + path.string() + " (" + e.what() + ")");
    }
    return BuildSignature::from_json(data);
}

// =============================================================================
// SignatureStore
// =============================================================================

SignatureStore::SignatureStore(fs::path path)
    : path_(std::move(path)) {
}

bool SignatureStore::exists() const {
    std::error_code ec;
    return fs::is_regular_file(path_, ec);
}

const BuildSignature& SignatureStore::load() {
    if (!cached_) {
        if (!exists()) {
            throw CacheInvalidationError(
                ErrorKind::SIGNATURE_MISSING,
                "Missing development build signature: " + path_.filename().string());
        }
        cached_ = load_signature(path_);
    }
    return *cached_;
}

bool SignatureStore::save(const BuildSignature& signature) {
    if (!save_signature(signature, path_)) {
        return false;
    }
    cached_ = signature;
    return true;
}

} // namespace jarcache
