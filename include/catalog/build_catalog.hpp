#ifndef JARCACHE_BUILD_CATALOG_HPP
#define JARCACHE_BUILD_CATALOG_HPP

// build_catalog.hpp - Remote catalog of official builds
// Part of jarcache - Server Artifact Cache
//
// The catalog is the source of truth for official artifacts: which builds
// exist for a version and the SHA-256 each download must have. Network
// access lives behind BuildCatalog/ArtifactDownloader so the resolver can
// be driven by in-memory implementations.

#include "state/cache_errors.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace jarcache {

// One upstream commit that went into a build
struct BuildChange {
    std::string revision;
    std::string summary;
    std::string message;
};

struct BuildDescriptor {
    std::string project_id;
    std::string project_name;
    std::string version;
    int build_number = 0;
    std::string time;
    std::vector<BuildChange> changes;
    std::string download_name;
    std::string download_hash;    // Lowercase hex SHA-256

    // "<project name>-<build>", e.g. "Paper-196"
    std::string display_name() const {
        return project_name + "-" + std::to_string(build_number);
    }

    // Parse a build object of the v2 downloads API.
    // Throws CacheError(CATALOG_ERROR) when a required field is missing.
    static BuildDescriptor from_json(const nlohmann::json& data);
};

class BuildCatalog {
public:
    virtual ~BuildCatalog() = default;

    // Every version name the catalog knows about (unfiltered)
    virtual std::vector<std::string> list_versions() = 0;

    virtual std::set<int> list_builds(const std::string& version) = 0;

    virtual BuildDescriptor fetch_build_info(const std::string& version, int build) = 0;
};

// Receives downloaded bytes in arrival order
using ChunkSink = std::function<void(const char* data, size_t length)>;

class ArtifactDownloader {
public:
    virtual ~ArtifactDownloader() = default;

    // Stream the artifact described by `descriptor` into `sink`.
    // Throws CacheError(CATALOG_ERROR) on transport failure.
    virtual void download(const BuildDescriptor& descriptor, const ChunkSink& sink) = 0;
};

// Memoizes catalog answers for the lifetime of a run. force-style refreshes
// go through clear_builds()/clear().
class CatalogStore {
public:
    explicit CatalogStore(BuildCatalog& catalog)
        : catalog_(catalog) {}

    const std::set<int>& builds(const std::string& version);
    const BuildDescriptor& build_info(const std::string& version, int build);

    // Catalog versions that parse as product versions, oldest first
    const std::vector<std::string>& versions();

    void clear_builds(const std::string& version);
    void clear();

    BuildCatalog& catalog() { return catalog_; }

private:
    BuildCatalog& catalog_;
    std::map<std::string, std::set<int>> builds_;
    std::map<std::pair<std::string, int>, BuildDescriptor> info_;
    std::vector<std::string> versions_;
    bool versions_loaded_ = false;
};

} // namespace jarcache

#endif // JARCACHE_BUILD_CATALOG_HPP
