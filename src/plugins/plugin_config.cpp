// plugin_config.cpp - plugins.toml parsing and jar downloads
// Part of jarcache - Server Artifact Cache

#include "plugins/plugin_config.hpp"

#include <toml++/toml.hpp>

#include <cctype>
#include <fstream>
#include <sstream>

namespace jarcache {

namespace {

[[noreturn]] void malformed(const std::string& message, std::vector<std::string> details = {}) {
    throw CacheError(ErrorKind::MALFORMED_PLUGIN_CONFIG, message, std::move(details));
}

bool is_positional(const std::string& key) {
    if (key.empty()) return true;
    for (char c : key) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// version may be written as a string or a bare integer
std::optional<std::string> read_version(const toml::table& entry) {
    auto node = entry["version"];
    if (node.is_string()) {
        return node.value<std::string>();
    }
    if (node.is_integer()) {
        return std::to_string(*node.value<int64_t>());
    }
    return std::nullopt;
}

PluginConfig parse_entry(const std::string& name, const toml::table& entry) {
    PluginConfig config;
    config.name = name;

    auto version = read_version(entry);
    if (!version) {
        malformed("Missing required config key in " + name, {"Expected a 'version' string"});
    }
    config.version = *version;

    if (auto jars = entry["jars"]) {
        const toml::array* names = jars.as_array();
        if (!names) {
            malformed("Invalid 'jars' for " + name, {"Expected an array of jar names"});
        }
        std::vector<std::string> jar_names;
        for (const auto& element : *names) {
            auto jar = element.value<std::string>();
            if (!element.is_string() || !jar || jar->empty()) {
                malformed("Invalid 'jars' for " + name, {"Jar names must be non-empty strings"});
            }
            jar_names.push_back(*jar);
        }
        config.jar_names = std::move(jar_names);
    }

    bool manual = false;
    if (auto flag = entry["manual-download"]) {
        if (!flag.is_boolean()) {
            malformed("Invalid 'manual-download' for " + name, {"Expected true or false"});
        }
        manual = *flag.value<bool>();
    }

    if (manual) {
        config.download_strategy = std::make_shared<ManualDownload>();
    } else if (auto url = entry["url"].value<std::string>()) {
        config.download_strategy = std::make_shared<UrlPatternDownload>(*url);
    } else {
        malformed("No download strategy for " + name,
                  {"Set 'url' to a pattern or 'manual-download = true'"});
    }
    return config;
}

} // namespace

// =============================================================================
// Plugin Jars
// =============================================================================

bool PluginJar::exists(const fs::path& plugins_dir) const {
    std::error_code ec;
    return fs::is_regular_file(path(plugins_dir), ec);
}

PatternVars PluginJar::vars() const {
    return {
        {"plugin_name", plugin_name},
        {"version", version},
        {"jar_name", name}
    };
}

std::string format_url_pattern(const std::string& pattern, const PatternVars& vars) {
    std::string out;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '}') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '}') {
                out += '}';
                ++i;
                continue;
            }
            malformed("Unbalanced '}' in URL pattern: " + pattern);
        }
        if (c != '{') {
            out += c;
            continue;
        }
        if (i + 1 < pattern.size() && pattern[i + 1] == '{') {
            out += '{';
            ++i;
            continue;
        }

        size_t close = pattern.find('}', i + 1);
        if (close == std::string::npos) {
            malformed("Unbalanced '{' in URL pattern: " + pattern);
        }
        std::string key = pattern.substr(i + 1, close - i - 1);
        // Conversions and format specs don't apply to plain strings
        key = key.substr(0, key.find_first_of("!:"));
        if (is_positional(key)) {
            malformed("May not use indexes in URL pattern: " + pattern);
        }
        auto it = vars.find(key);
        if (it == vars.end()) {
            malformed("Missing key in URL pattern: " + pattern, {"Unknown key '" + key + "'"});
        }
        out += it->second;
        i = close;
    }
    return out;
}

// =============================================================================
// Download Strategies
// =============================================================================

bool UrlPatternDownload::download(const PluginJar& jar, const fs::path& plugins_dir,
                                  bool force, UrlFetcher& fetcher) const {
    // The pattern is checked even when nothing needs downloading
    std::string url = format_url_pattern(url_pattern_, jar.vars());
    if (!force && jar.exists(plugins_dir)) {
        return false;
    }

    fs::path target = jar.path(plugins_dir);
    fs::path partial = target;
    partial += ".part";

    std::error_code ec;
    fs::create_directories(plugins_dir, ec);

    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw CacheError(ErrorKind::PLUGIN_ERROR,
                             "Unable to write to jar: " + target.string());
        }
        try {
            fetcher.fetch(url, [&out](const char* data, size_t length) {
                out.write(data, static_cast<std::streamsize>(length));
            });
        } catch (const CacheError& e) {
            out.close();
            fs::remove(partial, ec);
            std::vector<std::string> details{e.what()};
            details.insert(details.end(), e.details().begin(), e.details().end());
            throw CacheError(ErrorKind::PLUGIN_ERROR, "Unable to download jar: " + url,
                             std::move(details));
        }
        out.flush();
        if (!out) {
            out.close();
            fs::remove(partial, ec);
            throw CacheError(ErrorKind::PLUGIN_ERROR,
                             "Unable to write to jar: " + target.string());
        }
    }

    fs::rename(partial, target, ec);
    if (ec) {
        fs::remove(partial, ec);
        throw CacheError(ErrorKind::PLUGIN_ERROR,
                         "Unable to write to jar: " + target.string(), {ec.message()});
    }
    return true;
}

bool ManualDownload::download(const PluginJar& jar, const fs::path& plugins_dir,
                              bool force, UrlFetcher& /*fetcher*/) const {
    if (force) {
        throw CacheError(ErrorKind::MANUAL_PLUGIN_MISSING,
                         "Can't refresh (force-download) a manually downloaded plugin: "
                             + jar.file_name());
    }
    if (!jar.exists(plugins_dir)) {
        throw CacheError(ErrorKind::MANUAL_PLUGIN_MISSING,
                         "Jar must be downloaded manually: " + jar.file_name(),
                         {"Expected location: " + jar.path(plugins_dir).string()});
    }
    return false;
}

// =============================================================================
// Plugin Configuration
// =============================================================================

std::vector<PluginJar> PluginConfig::jars() const {
    if (!jar_names) {
        return {PluginJar{name, version, name}};
    }
    std::vector<PluginJar> result;
    result.reserve(jar_names->size());
    for (const auto& jar_name : *jar_names) {
        result.push_back(PluginJar{name, version, jar_name});
    }
    return result;
}

void PluginConfig::check(const fs::path& plugins_dir) const {
    for (const auto& jar : jars()) {
        if (jar.exists(plugins_dir)) {
            continue;
        }
        std::string expected = "Expected location: " + jar.path(plugins_dir).string();
        if (jar_names) {
            throw CacheError(ErrorKind::PLUGIN_ERROR, "Missing jar: " + jar.file_name(), {expected});
        }
        throw CacheError(ErrorKind::PLUGIN_ERROR, "Missing plugin: " + display_name(), {expected});
    }
}

std::vector<PluginConfig> parse_plugin_configs(const std::string& text, const std::string& source) {
    toml::table document;
    try {
        document = toml::parse(text, source);
    } catch (const toml::parse_error& e) {
        const auto& begin = e.source().begin;
        malformed("Unable to parse " + source,
                  {std::string(e.description()),
                   "At line " + std::to_string(begin.line) + ", column " + std::to_string(begin.column)});
    }

    std::vector<PluginConfig> configs;
    for (const auto& [key, node] : document) {
        std::string name(key.str());
        const toml::table* entry = node.as_table();
        if (!entry) {
            malformed("Plugin entry must be a table: " + name);
        }
        configs.push_back(parse_entry(name, *entry));
    }
    return configs;
}

std::vector<PluginConfig> load_plugin_configs(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        malformed("Unable to load " + path.string());
    }
    std::ostringstream text;
    text << in.rdbuf();
    return parse_plugin_configs(text.str(), path.string());
}

} // namespace jarcache
