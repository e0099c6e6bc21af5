// test_plugins.cpp - Tests for plugin configuration, downloads and checks
// Part of jarcache - Server Artifact Cache

#include "plugins/plugin_config.hpp"
#include "plugins/plugin_manager.hpp"

#include "test_support.hpp"

#include <map>
#include <memory>
#include <sstream>

using namespace jarcache;

static std::unique_ptr<TestFixture> fixture;

// Serves fixed bodies by URL; unknown URLs fail like a 404
class FakeFetcher : public UrlFetcher {
public:
    std::map<std::string, std::string> bodies;
    std::vector<std::string> requested;

    void fetch(const std::string& url, const FetchSink& sink) override {
        requested.push_back(url);
        auto it = bodies.find(url);
        if (it == bodies.end()) {
            throw CacheError(ErrorKind::DOWNLOAD_FAILED, "Download failed: " + url,
                             {"HTTP status 404"});
        }
        sink(it->second.data(), it->second.size());
    }
};

static const char* PLUGINS_TOML = R"(
[WorldEdit]
version = "7.2.5"
url = "https://dl.example.org/{plugin_name}/{version}/{jar_name}.jar"

[Essentials]
version = "2.18.2"
jars = ["EssentialsX", "EssentialsXChat"]
url = "https://dl.example.org/ess/{jar_name}-{version}.jar"

[Protocol]
version = 4
manual-download = true
)";

static const PluginConfig& find_config(const std::vector<PluginConfig>& configs,
                                       const std::string& name) {
    for (const auto& config : configs) {
        if (config.name == name) return config;
    }
    throw std::runtime_error("No plugin named " + name);
}

static std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream text;
    text << in.rdbuf();
    return text.str();
}

// =============================================================================
// Configuration Tests
// =============================================================================

void test_parse_plugin_list() {
    auto configs = parse_plugin_configs(PLUGINS_TOML);
    ASSERT_EQ(configs.size(), 3u);

    const PluginConfig& worldedit = find_config(configs, "WorldEdit");
    ASSERT_EQ(worldedit.version, "7.2.5");
    ASSERT(!worldedit.jar_names.has_value());
    ASSERT_EQ(worldedit.jars().size(), 1u);
    ASSERT_EQ(worldedit.jars()[0].file_name(), "WorldEdit-v7.2.5.jar");
    ASSERT_EQ(worldedit.download_strategy->describe(),
              "url https://dl.example.org/{plugin_name}/{version}/{jar_name}.jar");
    ASSERT_EQ(worldedit.display_name(), "WorldEdit v7.2.5");

    const PluginConfig& essentials = find_config(configs, "Essentials");
    auto jars = essentials.jars();
    ASSERT_EQ(jars.size(), 2u);
    ASSERT_EQ(jars[1].file_name(), "EssentialsXChat-v2.18.2.jar");
    ASSERT_EQ(jars[1].plugin_name, "Essentials");

    const PluginConfig& protocol = find_config(configs, "Protocol");
    ASSERT_EQ(protocol.version, "4");
    ASSERT_EQ(protocol.download_strategy->describe(), "manual");
}

void test_missing_version_is_malformed() {
    ASSERT_THROWS_KIND(parse_plugin_configs("[A]\nurl = \"https://x/{version}\"\n"),
                       ErrorKind::MALFORMED_PLUGIN_CONFIG);
}

void test_missing_strategy_is_malformed() {
    ASSERT_THROWS_KIND(parse_plugin_configs("[A]\nversion = \"1\"\n"),
                       ErrorKind::MALFORMED_PLUGIN_CONFIG);
}

void test_invalid_toml_is_malformed() {
    bool located = false;
    try {
        parse_plugin_configs("[A\nversion = 1\n", "broken.toml");
    } catch (const CacheError& e) {
        located = e.kind() == ErrorKind::MALFORMED_PLUGIN_CONFIG
            && std::string(e.what()).find("broken.toml") != std::string::npos
            && e.details().size() == 2;
    }
    ASSERT(located);
}

void test_non_table_entry_is_malformed() {
    ASSERT_THROWS_KIND(parse_plugin_configs("A = 3\n"), ErrorKind::MALFORMED_PLUGIN_CONFIG);
}

void test_load_missing_file() {
    ASSERT_THROWS_KIND(load_plugin_configs(fixture->test_dir / "absent.toml"),
                       ErrorKind::MALFORMED_PLUGIN_CONFIG);
}

void test_load_from_file() {
    fs::path file = fixture->scratch("load") / "plugins.toml";
    write_file(file, PLUGINS_TOML);
    ASSERT_EQ(load_plugin_configs(file).size(), 3u);
}

// =============================================================================
// URL Pattern Tests
// =============================================================================

void test_url_pattern_expansion() {
    PluginJar jar{"Essentials", "2.18.2", "EssentialsXChat"};
    ASSERT_EQ(format_url_pattern("https://h/{plugin_name}/{jar_name}-{version}.jar", jar.vars()),
              "https://h/Essentials/EssentialsXChat-2.18.2.jar");
    ASSERT_EQ(format_url_pattern("https://h/{{literal}}/{version}", jar.vars()),
              "https://h/{literal}/2.18.2");
}

void test_url_pattern_errors() {
    PatternVars vars = PluginJar{"A", "1", "A"}.vars();
    ASSERT_THROWS_KIND(format_url_pattern("https://h/{build}", vars),
                       ErrorKind::MALFORMED_PLUGIN_CONFIG);
    ASSERT_THROWS_KIND(format_url_pattern("https://h/{0}", vars),
                       ErrorKind::MALFORMED_PLUGIN_CONFIG);
    ASSERT_THROWS_KIND(format_url_pattern("https://h/{}", vars),
                       ErrorKind::MALFORMED_PLUGIN_CONFIG);
    ASSERT_THROWS_KIND(format_url_pattern("https://h/{version", vars),
                       ErrorKind::MALFORMED_PLUGIN_CONFIG);
    ASSERT_THROWS_KIND(format_url_pattern("https://h/version}", vars),
                       ErrorKind::MALFORMED_PLUGIN_CONFIG);
}

// =============================================================================
// Download Tests
// =============================================================================

static FakeFetcher serving_all() {
    FakeFetcher fetcher;
    fetcher.bodies["https://dl.example.org/WorldEdit/7.2.5/WorldEdit.jar"] = "worldedit";
    fetcher.bodies["https://dl.example.org/ess/EssentialsX-2.18.2.jar"] = "essx";
    fetcher.bodies["https://dl.example.org/ess/EssentialsXChat-2.18.2.jar"] = "essx-chat";
    return fetcher;
}

void test_update_downloads_missing_jars() {
    fs::path dir = fixture->scratch("update") / "plugins";
    FakeFetcher fetcher = serving_all();
    PluginManager manager(dir, fetcher);
    std::vector<PluginProgress> events;
    manager.set_progress_callback([&events](const PluginProgress& p) { events.push_back(p); });

    auto configs = parse_plugin_configs(PLUGINS_TOML);
    write_file(dir / "Protocol-v4.jar", "placed by hand");

    ASSERT_EQ(manager.update(configs), 3u);
    ASSERT_EQ(read_file(dir / "WorldEdit-v7.2.5.jar"), "worldedit");
    ASSERT_EQ(read_file(dir / "EssentialsXChat-v2.18.2.jar"), "essx-chat");
    ASSERT(!fs::exists(dir / "WorldEdit-v7.2.5.jar.part"));

    size_t per_jar = 0;
    for (const auto& e : events) {
        if (e.event == PluginEvent::DOWNLOADING_JAR) ++per_jar;
    }
    ASSERT_EQ(per_jar, 2u);

    // Second run: everything is present
    fetcher.requested.clear();
    ASSERT_EQ(manager.update(configs), 0u);
    ASSERT(fetcher.requested.empty());

    manager.check(configs);
}

void test_force_redownloads_url_jars() {
    fs::path dir = fixture->scratch("force") / "plugins";
    FakeFetcher fetcher = serving_all();
    PluginManager manager(dir, fetcher);
    auto configs = parse_plugin_configs(PLUGINS_TOML);

    ASSERT_EQ(manager.update(configs, {"Protocol"}), 3u);
    fetcher.bodies["https://dl.example.org/WorldEdit/7.2.5/WorldEdit.jar"] = "worldedit 2";
    ASSERT_EQ(manager.update(configs, {"Protocol"}, true), 3u);
    ASSERT_EQ(read_file(dir / "WorldEdit-v7.2.5.jar"), "worldedit 2");
}

void test_force_on_manual_plugin_fails() {
    fs::path dir = fixture->scratch("force_manual") / "plugins";
    FakeFetcher fetcher = serving_all();
    PluginManager manager(dir, fetcher);
    auto configs = parse_plugin_configs(PLUGINS_TOML);
    write_file(dir / "Protocol-v4.jar", "placed by hand");

    ASSERT_THROWS_KIND(manager.update(configs, {"WorldEdit", "Essentials"}, true),
                       ErrorKind::MANUAL_PLUGIN_MISSING);
}

void test_missing_manual_jar() {
    fs::path dir = fixture->scratch("manual") / "plugins";
    FakeFetcher fetcher = serving_all();
    PluginManager manager(dir, fetcher);
    auto configs = parse_plugin_configs(PLUGINS_TOML);

    ASSERT_THROWS_KIND(manager.update(configs), ErrorKind::MANUAL_PLUGIN_MISSING);
}

void test_unknown_ignore_is_rejected_before_downloading() {
    fs::path dir = fixture->scratch("ignore") / "plugins";
    FakeFetcher fetcher = serving_all();
    PluginManager manager(dir, fetcher);
    auto configs = parse_plugin_configs(PLUGINS_TOML);

    ASSERT_THROWS_KIND(manager.update(configs, {"WorldEdit", "Typo"}), ErrorKind::PLUGIN_ERROR);
    ASSERT(fetcher.requested.empty());
}

void test_failed_download_leaves_nothing_behind() {
    fs::path dir = fixture->scratch("failed") / "plugins";
    FakeFetcher fetcher;
    PluginManager manager(dir, fetcher);
    auto configs = parse_plugin_configs(PLUGINS_TOML);

    bool failed = false;
    try {
        manager.update(configs, {"Essentials", "Protocol"});
    } catch (const CacheError& e) {
        failed = e.kind() == ErrorKind::PLUGIN_ERROR
            && std::string(e.what()).find("WorldEdit.jar") != std::string::npos;
    }
    ASSERT(failed);
    ASSERT(!fs::exists(dir / "WorldEdit-v7.2.5.jar"));
    ASSERT(!fs::exists(dir / "WorldEdit-v7.2.5.jar.part"));
}

void test_bad_pattern_fails_even_when_present() {
    fs::path dir = fixture->scratch("bad_pattern") / "plugins";
    FakeFetcher fetcher;
    PluginManager manager(dir, fetcher);
    auto configs = parse_plugin_configs("[A]\nversion = \"1\"\nurl = \"https://h/{build}\"\n");
    write_file(dir / "A-v1.jar", "present");

    ASSERT_THROWS_KIND(manager.update(configs), ErrorKind::MALFORMED_PLUGIN_CONFIG);
}

// =============================================================================
// Check Tests
// =============================================================================

void test_check_reports_missing_jar() {
    fs::path dir = fixture->scratch("check") / "plugins";
    auto configs = parse_plugin_configs(PLUGINS_TOML);
    write_file(dir / "WorldEdit-v7.2.5.jar", "x");
    write_file(dir / "EssentialsX-v2.18.2.jar", "x");
    write_file(dir / "Protocol-v4.jar", "x");

    bool named = false;
    try {
        find_config(configs, "Essentials").check(dir);
    } catch (const CacheError& e) {
        named = e.kind() == ErrorKind::PLUGIN_ERROR
            && std::string(e.what()) == "Missing jar: EssentialsXChat-v2.18.2.jar";
    }
    ASSERT(named);

    fs::remove(dir / "WorldEdit-v7.2.5.jar");
    named = false;
    try {
        find_config(configs, "WorldEdit").check(dir);
    } catch (const CacheError& e) {
        named = std::string(e.what()) == "Missing plugin: WorldEdit v7.2.5";
    }
    ASSERT(named);
}

int main() {
    std::cout << "=== Plugin Test Suite ===\n\n";

    fixture = std::make_unique<TestFixture>("plugins");

    std::cout << "Configuration Tests:\n";
    TEST(parse_plugin_list);
    TEST(missing_version_is_malformed);
    TEST(missing_strategy_is_malformed);
    TEST(invalid_toml_is_malformed);
    TEST(non_table_entry_is_malformed);
    TEST(load_missing_file);
    TEST(load_from_file);

    std::cout << "\nURL Pattern Tests:\n";
    TEST(url_pattern_expansion);
    TEST(url_pattern_errors);

    std::cout << "\nDownload Tests:\n";
    TEST(update_downloads_missing_jars);
    TEST(force_redownloads_url_jars);
    TEST(force_on_manual_plugin_fails);
    TEST(missing_manual_jar);
    TEST(unknown_ignore_is_rejected_before_downloading);
    TEST(failed_download_leaves_nothing_behind);
    TEST(bad_pattern_fails_even_when_present);

    std::cout << "\nCheck Tests:\n";
    TEST(check_reports_missing_jar);

    fixture.reset();

    return report_results();
}
