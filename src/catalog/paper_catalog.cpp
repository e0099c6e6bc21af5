// paper_catalog.cpp - HTTP access to the PaperMC downloads API
// Part of jarcache - Server Artifact Cache

#include "catalog/paper_catalog.hpp"

#include <httplib.h>

#include <iostream>

namespace jarcache {

using json = nlohmann::json;

namespace {

[[noreturn]] void request_failed(const std::string& path, const std::string& reason) {
    throw CacheError(ErrorKind::CATALOG_ERROR, "Catalog request failed: " + path,
                     {reason});
}

void configure(httplib::Client& client, const CatalogConfig& config) {
    client.set_follow_location(true);
    client.set_connection_timeout(config.connect_timeout_sec, 0);
    client.set_read_timeout(config.read_timeout_sec, 0);
}

} // namespace

PaperCatalog::PaperCatalog(CatalogConfig config)
    : config_(std::move(config)) {
}

std::string PaperCatalog::project_path() const {
    return "/v2/projects/" + config_.project;
}

json PaperCatalog::get_json(const std::string& path) const {
    if (config_.verbose) {
        std::cout << "[HTTP] GET " << config_.base_url << path << "\n";
    }

    httplib::Client client(config_.base_url);
    configure(client, config_);
    auto res = client.Get(path);
    if (!res) {
        request_failed(path, "Connection failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        request_failed(path, "HTTP status " + std::to_string(res->status));
    }

    try {
        return json::parse(res->body);
    } catch (const json::parse_error& e) {
        request_failed(path, std::string("Invalid JSON: ") + e.what());
    }
}

std::vector<std::string> PaperCatalog::list_versions() {
    std::string path = project_path();
    json data = get_json(path);

    auto it = data.find("versions");
    if (it == data.end() || !it->is_array()) {
        request_failed(path, "Response has no 'versions' array");
    }

    std::vector<std::string> versions;
    for (const auto& name : *it) {
        if (name.is_string()) {
            versions.push_back(name.get<std::string>());
        }
    }
    return versions;
}

std::set<int> PaperCatalog::list_builds(const std::string& version) {
    std::string path = project_path() + "/versions/" + version;
    json data = get_json(path);

    auto it = data.find("builds");
    if (it == data.end() || !it->is_array()) {
        request_failed(path, "Response has no 'builds' array");
    }

    std::set<int> builds;
    for (const auto& build : *it) {
        if (build.is_number_integer()) {
            builds.insert(build.get<int>());
        }
    }
    return builds;
}

BuildDescriptor PaperCatalog::fetch_build_info(const std::string& version, int build) {
    std::string path = project_path() + "/versions/" + version + "/builds/" + std::to_string(build);
    BuildDescriptor descriptor = BuildDescriptor::from_json(get_json(path));

    if (descriptor.project_id != config_.project) {
        request_failed(path, "Unexpected project '" + descriptor.project_id + "'");
    }
    return descriptor;
}

void PaperCatalog::download(const BuildDescriptor& descriptor, const ChunkSink& sink) {
    std::string path = "/v2/projects/" + descriptor.project_id
        + "/versions/" + descriptor.version
        + "/builds/" + std::to_string(descriptor.build_number)
        + "/downloads/" + descriptor.download_name;

    if (config_.verbose) {
        std::cout << "[HTTP] GET " << config_.base_url << path << "\n";
    }

    httplib::Client client(config_.base_url);
    configure(client, config_);
    int status = 0;
    auto res = client.Get(
        path,
        [&](const httplib::Response& response) {
            status = response.status;
            return status == 200;
        },
        [&](const char* data, size_t length) {
            sink(data, length);
            return true;
        });

    if (status != 0 && status != 200) {
        request_failed(path, "HTTP status " + std::to_string(status));
    }
    if (!res) {
        request_failed(path, "Download failed: " + httplib::to_string(res.error()));
    }
}

} // namespace jarcache
