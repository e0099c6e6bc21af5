#ifndef JARCACHE_PLUGIN_CONFIG_HPP
#define JARCACHE_PLUGIN_CONFIG_HPP

// plugin_config.hpp - Server plugin declarations and download strategies
// Part of jarcache - Server Artifact Cache
//
// Plugins are declared in a TOML file, one table per plugin:
//
//   [WorldEdit]
//   version = "7.2.5"
//   url = "https://example.org/{plugin_name}/{version}/{jar_name}.jar"
//
//   [Essentials]
//   version = "2.18.2"
//   jars = ["EssentialsX", "EssentialsXChat"]
//   manual-download = true
//
// Each plugin resolves to one or more jars stored as
// <plugins_dir>/<jar_name>-v<version>.jar.

#include "state/cache_errors.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jarcache {

namespace fs = std::filesystem;

// =============================================================================
// URL Fetching
// =============================================================================

using FetchSink = std::function<void(const char* data, size_t length)>;

class UrlFetcher {
public:
    virtual ~UrlFetcher() = default;

    // Stream the body of `url` into `sink`.
    // Throws CacheError(DOWNLOAD_FAILED) on transport or HTTP failure.
    virtual void fetch(const std::string& url, const FetchSink& sink) = 0;
};

// =============================================================================
// Plugin Jars
// =============================================================================

using PatternVars = std::map<std::string, std::string>;

struct PluginJar {
    std::string plugin_name;
    std::string version;
    std::string name;

    std::string file_name() const { return name + "-v" + version + ".jar"; }
    fs::path path(const fs::path& plugins_dir) const { return plugins_dir / file_name(); }
    bool exists(const fs::path& plugins_dir) const;

    // Keys available to URL patterns: plugin_name, version, jar_name
    PatternVars vars() const;
};

/**
 * Expand `{key}` placeholders; `{{` and `}}` are literal braces.
 *
 * @throws CacheError(MALFORMED_PLUGIN_CONFIG) for unknown keys, positional
 *         placeholders (`{}`, `{0}`) and unbalanced braces
 */
std::string format_url_pattern(const std::string& pattern, const PatternVars& vars);

// =============================================================================
// Download Strategies
// =============================================================================

class DownloadStrategy {
public:
    virtual ~DownloadStrategy() = default;

    // Fetch `jar` into `plugins_dir`; returns whether it was (re)downloaded
    virtual bool download(const PluginJar& jar, const fs::path& plugins_dir,
                          bool force, UrlFetcher& fetcher) const = 0;

    virtual std::string describe() const = 0;
};

class UrlPatternDownload : public DownloadStrategy {
public:
    explicit UrlPatternDownload(std::string url_pattern)
        : url_pattern_(std::move(url_pattern)) {}

    bool download(const PluginJar& jar, const fs::path& plugins_dir,
                  bool force, UrlFetcher& fetcher) const override;

    std::string describe() const override { return "url " + url_pattern_; }

    const std::string& url_pattern() const { return url_pattern_; }

private:
    std::string url_pattern_;
};

// The jar is placed by hand; it can be checked but never refreshed
class ManualDownload : public DownloadStrategy {
public:
    bool download(const PluginJar& jar, const fs::path& plugins_dir,
                  bool force, UrlFetcher& fetcher) const override;

    std::string describe() const override { return "manual"; }
};

// =============================================================================
// Plugin Configuration
// =============================================================================

struct PluginConfig {
    std::string name;
    std::string version;
    std::shared_ptr<const DownloadStrategy> download_strategy;
    std::optional<std::vector<std::string>> jar_names;   // Defaults to one jar named after the plugin

    std::vector<PluginJar> jars() const;

    // Throws CacheError(PLUGIN_ERROR) naming the first missing jar
    void check(const fs::path& plugins_dir) const;

    std::string display_name() const { return name + " v" + version; }
};

/**
 * Parse a plugin list.
 *
 * @param text   TOML document
 * @param source Name used in error messages (usually the file path)
 * @throws CacheError(MALFORMED_PLUGIN_CONFIG)
 */
std::vector<PluginConfig> parse_plugin_configs(const std::string& text,
                                               const std::string& source = "plugins.toml");

// Read and parse `path`; an unreadable file is MALFORMED_PLUGIN_CONFIG too
std::vector<PluginConfig> load_plugin_configs(const fs::path& path);

} // namespace jarcache

#endif // JARCACHE_PLUGIN_CONFIG_HPP
