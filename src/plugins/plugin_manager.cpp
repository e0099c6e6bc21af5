// plugin_manager.cpp - Bulk download and presence check of server plugins
// Part of jarcache - Server Artifact Cache

#include "plugins/plugin_manager.hpp"

namespace jarcache {

PluginManager::PluginManager(fs::path plugins_dir, UrlFetcher& fetcher)
    : plugins_dir_(std::move(plugins_dir))
    , fetcher_(fetcher) {
}

void PluginManager::report(PluginEvent event, const PluginConfig& config,
                           const std::string& jar) const {
    if (progress_callback_) {
        progress_callback_(PluginProgress{event, config.display_name(), jar});
    }
}

size_t PluginManager::update(const std::vector<PluginConfig>& configs,
                             const std::set<std::string>& ignores,
                             bool force) {
    // Reject typos before anything is downloaded
    std::set<std::string> known;
    for (const auto& config : configs) {
        known.insert(config.name);
    }
    for (const auto& ignore : ignores) {
        if (known.count(ignore) == 0) {
            throw CacheError(ErrorKind::PLUGIN_ERROR, "Unknown plugin name: " + ignore);
        }
    }

    size_t downloaded = 0;
    for (const auto& config : configs) {
        if (ignores.count(config.name) > 0) {
            report(PluginEvent::SKIPPED, config);
            continue;
        }
        if (!config.download_strategy) {
            throw CacheError(ErrorKind::MALFORMED_PLUGIN_CONFIG,
                             "No download strategy for " + config.name);
        }

        report(PluginEvent::DOWNLOADING, config);
        std::vector<PluginJar> jars = config.jars();
        for (const auto& jar : jars) {
            if (jars.size() > 1) {
                report(PluginEvent::DOWNLOADING_JAR, config, jar.file_name());
            }
            if (config.download_strategy->download(jar, plugins_dir_, force, fetcher_)) {
                ++downloaded;
            } else {
                report(PluginEvent::ALREADY_PRESENT, config, jar.file_name());
            }
        }
    }
    return downloaded;
}

void PluginManager::check(const std::vector<PluginConfig>& configs) const {
    for (const auto& config : configs) {
        config.check(plugins_dir_);
        report(PluginEvent::CHECKED, config);
    }
}

} // namespace jarcache
