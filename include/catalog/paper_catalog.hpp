#ifndef JARCACHE_PAPER_CATALOG_HPP
#define JARCACHE_PAPER_CATALOG_HPP

// paper_catalog.hpp - PaperMC v2 downloads API client (cpp-httplib)
// Part of jarcache - Server Artifact Cache

#include "catalog/build_catalog.hpp"

#include <string>

namespace jarcache {

struct CatalogConfig {
    std::string base_url = "https://api.papermc.io";
    std::string project = "paper";
    int connect_timeout_sec = 10;
    int read_timeout_sec = 60;
    bool verbose = false;
};

// Catalog and downloader backed by one API host. Every request failure
// (connection, non-200 status, malformed JSON) is a CacheError(CATALOG_ERROR).
class PaperCatalog : public BuildCatalog, public ArtifactDownloader {
public:
    explicit PaperCatalog(CatalogConfig config = {});

    std::vector<std::string> list_versions() override;
    std::set<int> list_builds(const std::string& version) override;
    BuildDescriptor fetch_build_info(const std::string& version, int build) override;

    void download(const BuildDescriptor& descriptor, const ChunkSink& sink) override;

    const CatalogConfig& config() const { return config_; }

private:
    CatalogConfig config_;

    std::string project_path() const;
    nlohmann::json get_json(const std::string& path) const;
};

} // namespace jarcache

#endif // JARCACHE_PAPER_CATALOG_HPP
