// build_catalog.cpp - Build descriptor parsing and memoized catalog queries
// Part of jarcache - Server Artifact Cache

#include "catalog/build_catalog.hpp"
#include "core/version.hpp"

#include <algorithm>
#include <cctype>

namespace jarcache {

namespace {

[[noreturn]] void malformed(const std::string& reason) {
    throw CacheError(ErrorKind::CATALOG_ERROR, "Malformed build descriptor: " + reason);
}

const nlohmann::json& require(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        malformed(std::string("missing field '") + key + "'");
    }
    return *it;
}

std::string require_string(const nlohmann::json& object, const char* key) {
    const auto& value = require(object, key);
    if (!value.is_string()) {
        malformed(std::string("field '") + key + "' is not a string");
    }
    return value.get<std::string>();
}

} // namespace

// =============================================================================
// BuildDescriptor
// =============================================================================

BuildDescriptor BuildDescriptor::from_json(const nlohmann::json& data) {
    if (!data.is_object()) {
        malformed("expected an object");
    }

    BuildDescriptor descriptor;
    descriptor.project_id = require_string(data, "project_id");
    descriptor.project_name = require_string(data, "project_name");
    descriptor.version = require_string(data, "version");
    descriptor.time = require_string(data, "time");

    const auto& build = require(data, "build");
    if (!build.is_number_integer()) {
        malformed("field 'build' is not an integer");
    }
    descriptor.build_number = build.get<int>();

    const auto& changes = require(data, "changes");
    if (!changes.is_array()) {
        malformed("field 'changes' is not an array");
    }
    for (const auto& change : changes) {
        if (!change.is_object()) {
            malformed("change entries must be objects");
        }
        descriptor.changes.push_back(BuildChange{
            require_string(change, "commit"),
            require_string(change, "summary"),
            require_string(change, "message")
        });
    }

    const auto& downloads = require(data, "downloads");
    if (!downloads.is_object()) {
        malformed("field 'downloads' is not an object");
    }
    const auto& application = require(downloads, "application");
    descriptor.download_name = require_string(application, "name");
    descriptor.download_hash = require_string(application, "sha256");
    std::transform(descriptor.download_hash.begin(), descriptor.download_hash.end(),
                   descriptor.download_hash.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return descriptor;
}

// =============================================================================
// CatalogStore
// =============================================================================

const std::set<int>& CatalogStore::builds(const std::string& version) {
    auto it = builds_.find(version);
    if (it == builds_.end()) {
        it = builds_.emplace(version, catalog_.list_builds(version)).first;
    }
    return it->second;
}

const BuildDescriptor& CatalogStore::build_info(const std::string& version, int build) {
    auto key = std::make_pair(version, build);
    auto it = info_.find(key);
    if (it == info_.end()) {
        it = info_.emplace(key, catalog_.fetch_build_info(version, build)).first;
    }
    return it->second;
}

const std::vector<std::string>& CatalogStore::versions() {
    if (!versions_loaded_) {
        std::vector<ProductVersion> parsed;
        for (const auto& name : catalog_.list_versions()) {
            if (ProductVersion::is_valid(name)) {
                parsed.emplace_back(name);
            }
        }
        std::sort(parsed.begin(), parsed.end());

        versions_.clear();
        for (const auto& version : parsed) {
            versions_.push_back(version.name());
        }
        versions_loaded_ = true;
    }
    return versions_;
}

void CatalogStore::clear_builds(const std::string& version) {
    builds_.erase(version);
}

void CatalogStore::clear() {
    builds_.clear();
    info_.clear();
    versions_.clear();
    versions_loaded_ = false;
}

} // namespace jarcache
