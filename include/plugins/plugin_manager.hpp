#ifndef JARCACHE_PLUGIN_MANAGER_HPP
#define JARCACHE_PLUGIN_MANAGER_HPP

// plugin_manager.hpp - Bulk download and presence check of server plugins
// Part of jarcache - Server Artifact Cache

#include "plugins/plugin_config.hpp"

#include <functional>
#include <set>
#include <string>
#include <vector>

namespace jarcache {

enum class PluginEvent {
    SKIPPED,          // Plugin listed in the ignore set
    DOWNLOADING,      // Plugin about to be processed
    DOWNLOADING_JAR,  // One jar of a multi-jar plugin
    ALREADY_PRESENT,  // Jar exists and wasn't refreshed
    CHECKED           // Every jar of the plugin is in place
};

inline const char* plugin_event_to_string(PluginEvent event) {
    switch (event) {
        case PluginEvent::SKIPPED:         return "skipped";
        case PluginEvent::DOWNLOADING:     return "downloading";
        case PluginEvent::DOWNLOADING_JAR: return "downloading_jar";
        case PluginEvent::ALREADY_PRESENT: return "already_present";
        case PluginEvent::CHECKED:         return "checked";
        default:                           return "unknown";
    }
}

struct PluginProgress {
    PluginEvent event;
    std::string plugin;   // display_name() of the plugin
    std::string jar;      // File name, empty for plugin-level events
};

using PluginProgressCallback = std::function<void(const PluginProgress&)>;

class PluginManager {
public:
    PluginManager(fs::path plugins_dir, UrlFetcher& fetcher);

    void set_progress_callback(PluginProgressCallback callback) {
        progress_callback_ = std::move(callback);
    }

    /**
     * Download every jar of every plugin not in `ignores`.
     *
     * @param force Redownload jars that already exist
     * @return Number of jars actually downloaded
     * @throws CacheError(PLUGIN_ERROR) for an ignore name that isn't configured
     *         or a failed download; CacheError(MANUAL_PLUGIN_MISSING) for a
     *         manual jar that is absent (or forced)
     */
    size_t update(const std::vector<PluginConfig>& configs,
                  const std::set<std::string>& ignores = {},
                  bool force = false);

    // Every jar of every plugin must exist; throws CacheError(PLUGIN_ERROR)
    void check(const std::vector<PluginConfig>& configs) const;

    const fs::path& plugins_dir() const { return plugins_dir_; }

private:
    fs::path plugins_dir_;
    UrlFetcher& fetcher_;
    PluginProgressCallback progress_callback_;

    void report(PluginEvent event, const PluginConfig& config,
                const std::string& jar = "") const;
};

} // namespace jarcache

#endif // JARCACHE_PLUGIN_MANAGER_HPP
