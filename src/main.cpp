/**
 * main.cpp
 * jarcache - Server Artifact Cache CLI
 *
 * Usage:
 *   jarcache <command> [options]
 *
 * Commands:
 *   official    Resolve an official build (download when missing or stale)
 *   dev         Resolve a development build (compile when stale)
 *   check       Validate a cached artifact without updating it
 *   builds      List catalog versions and builds
 *   update-plugins  Download the plugins listed in plugins.toml
 *   check-plugins   Verify every listed plugin jar is present
 *
 * Options:
 *   -C <dir>            Change to directory before running
 *   --cache-dir <dir>   Cache directory (default: cache)
 *   --repo <dir>        Development checkout (default: ~/git/Paper)
 *   --build <N>         Official build number (default: latest)
 *   --mc <version>      Product version (default: latest / detected)
 *   --force             Refresh catalog data and redownload
 *   --recompile         Rebuild the development jar even if valid
 *   --ignore-updates    Don't look for newer builds
 *   --plugins-file <f>  Plugin list (default: plugins.toml)
 *   --plugins-dir <dir> Plugin jar directory (default: server/plugins)
 *   --ignore <name>     Skip a plugin (repeatable)
 *   -v                  Verbose output
 *   -q                  Quiet mode
 *   --help              Show this help
 *   --version           Show version
 *
 * Copyright (c) 2025 jarcache contributors
 */

#include "catalog/build_catalog.hpp"
#include "catalog/paper_catalog.hpp"
#include "core/artifact_resolver.hpp"
#include "core/version.hpp"
#include "plugins/http_url_fetcher.hpp"
#include "plugins/plugin_manager.hpp"
#include "vcs/vcs_inspector.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace jarcache;

// -----------------------------------------------------------------------------
// Version and Help
// -----------------------------------------------------------------------------

void print_version() {
    std::cout << "jarcache 0.1.0\n";
    std::cout << "Server Artifact Cache\n";
    std::cout << "Copyright (c) 2025 jarcache contributors\n";
}

void print_help() {
    std::cout << R"(
jarcache - Server Artifact Cache

USAGE:
    jarcache <COMMAND> [OPTIONS]

COMMANDS:
    official    Resolve an official build, downloading it when missing or stale
    dev         Resolve a development build, compiling it when stale
    check       Validate a cached artifact without updating it
    builds      List catalog versions and the builds of one version
    update-plugins
                Download the plugins listed in the plugin file
    check-plugins
                Verify that every listed plugin jar is present

OPTIONS:
    -C <dir>            Change to directory before running
    --cache-dir <dir>   Cache directory (default: cache)
    --repo <dir>        Development checkout (default: ~/git/Paper)
    --build <N>         Official build number (default: latest)
    --mc <version>      Product version (default: latest, or detected from the repo)
    --force             Refresh catalog data and redownload
    --recompile         Rebuild the development jar even if it is valid
    --ignore-updates    Don't look for newer builds
    --plugins-file <f>  Plugin list (default: plugins.toml)
    --plugins-dir <dir> Plugin jar directory (default: server/plugins)
    --ignore <name>     Plugin to skip when updating (repeatable)
    -v, --verbose       Verbose output (show commands and requests)
    -q, --quiet         Quiet mode (only print the resolved path)

    -h, --help          Show this help message
    --version           Show version information

EXAMPLES:
    jarcache official                   Latest build of the latest version
    jarcache official --mc 1.16.5       Latest build of 1.16.5
    jarcache dev --repo ~/git/Paper     Compile the checkout if needed
    jarcache check --repo ~/git/Paper   Explain why a rebuild would happen
    jarcache builds --mc 1.16.5         List known builds
    jarcache update-plugins --force     Redownload every plugin jar

)";
}

// -----------------------------------------------------------------------------
// Progress Reporter
// -----------------------------------------------------------------------------

class ConsoleProgress {
public:
    explicit ConsoleProgress(bool verbose = false, bool quiet = false)
        : verbose_(verbose), quiet_(quiet) {}

    void operator()(const ResolveProgress& progress) {
        if (quiet_) return;

        switch (progress.state) {
            case ResolveState::VALIDATING:
                if (verbose_) {
                    std::cout << "[check] " << progress.artifact << ": " << progress.message << "\n";
                }
                break;

            case ResolveState::VALID:
                std::cout << "[valid] Reusing " << progress.artifact << "\n";
                break;

            case ResolveState::INVALID:
                std::cout << "[invalid] Cached " << progress.artifact
                          << " is invalid: " << progress.message << "\n";
                print_details(progress.details);
                break;

            case ResolveState::UPDATE_AVAILABLE:
                std::cout << "[update] " << progress.artifact << " is available\n";
                break;

            case ResolveState::UPDATING:
                std::cout << "[update] " << progress.message << "\n";
                break;

            case ResolveState::RESOLVED:
                if (verbose_) {
                    std::cout << "[done] " << progress.artifact << ": " << progress.message << "\n";
                }
                break;

            case ResolveState::UNRESOLVED:
                break;
        }
    }

private:
    bool verbose_;
    bool quiet_;

    static void print_details(const std::vector<std::string>& details) {
        for (const auto& line : details) {
            std::cout << "    " << line << "\n";
        }
    }
};

class ConsolePluginProgress {
public:
    explicit ConsolePluginProgress(bool verbose = false, bool quiet = false)
        : verbose_(verbose), quiet_(quiet) {}

    void operator()(const PluginProgress& progress) {
        if (quiet_) return;

        switch (progress.event) {
            case PluginEvent::SKIPPED:
                std::cout << "Skipping " << progress.plugin << "\n";
                break;
            case PluginEvent::DOWNLOADING:
                std::cout << "Downloading " << progress.plugin << "\n";
                break;
            case PluginEvent::DOWNLOADING_JAR:
                std::cout << "  - Downloading " << progress.jar << "\n";
                break;
            case PluginEvent::ALREADY_PRESENT:
                std::cout << "  - Already exists: " << progress.jar << "\n";
                break;
            case PluginEvent::CHECKED:
                if (verbose_) {
                    std::cout << "[ok] " << progress.plugin << "\n";
                }
                break;
        }
    }

private:
    bool verbose_;
    bool quiet_;
};

void print_error(const CacheError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    for (const auto& line : e.details()) {
        std::cerr << "    " << line << "\n";
    }
}

void print_commit(const RevisionInfo& commit) {
    std::cout << "Compiling from commit " << commit.short_id << ":\n";
    std::istringstream lines(commit.full_message);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            std::cout << "\n";
        } else {
            std::cout << "    " << line << "\n";
        }
    }
    std::cout << "\n";
}

// -----------------------------------------------------------------------------
// Argument Parsing
// -----------------------------------------------------------------------------

enum class Command {
    NONE,
    OFFICIAL,
    DEV,
    CHECK,
    BUILDS,
    UPDATE_PLUGINS,
    CHECK_PLUGINS
};

struct Options {
    Command command = Command::NONE;
    ResolverConfig config;
    fs::path repo;
    std::optional<int> build;
    std::string minecraft_version;
    bool force = false;
    bool recompile = false;
    bool ignore_updates = false;
    fs::path plugins_file = "plugins.toml";
    fs::path plugins_dir = fs::path("server") / "plugins";
    std::set<std::string> ignored_plugins;
    bool show_help = false;
    bool show_version = false;
};

fs::path default_repo() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / "git" / "Paper";
    }
    return fs::path("Paper");
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Help and version
        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return true;
        }
        if (arg == "--version") {
            opts.show_version = true;
            return true;
        }

        // Commands
        if (arg == "official") {
            opts.command = Command::OFFICIAL;
            continue;
        }
        if (arg == "dev") {
            opts.command = Command::DEV;
            continue;
        }
        if (arg == "check") {
            opts.command = Command::CHECK;
            continue;
        }
        if (arg == "builds") {
            opts.command = Command::BUILDS;
            continue;
        }
        if (arg == "update-plugins") {
            opts.command = Command::UPDATE_PLUGINS;
            continue;
        }
        if (arg == "check-plugins") {
            opts.command = Command::CHECK_PLUGINS;
            continue;
        }

        // Options with arguments
        if (arg == "-C" && i + 1 < argc) {
            std::error_code ec;
            fs::current_path(argv[++i], ec);
            if (ec) {
                std::cerr << "Cannot change to directory " << argv[i] << ": " << ec.message() << "\n";
                return false;
            }
            continue;
        }
        if (arg == "--cache-dir" && i + 1 < argc) {
            opts.config.cache_dir = argv[++i];
            continue;
        }
        if (arg == "--repo" && i + 1 < argc) {
            opts.repo = argv[++i];
            continue;
        }
        if ((arg == "--build" || arg == "--build-number") && i + 1 < argc) {
            try {
                opts.build = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid build number: " << argv[i] << "\n";
                return false;
            }
            continue;
        }
        if (arg == "--plugins-file" && i + 1 < argc) {
            opts.plugins_file = argv[++i];
            continue;
        }
        if (arg == "--plugins-dir" && i + 1 < argc) {
            opts.plugins_dir = argv[++i];
            continue;
        }
        if (arg == "--ignore" && i + 1 < argc) {
            opts.ignored_plugins.insert(argv[++i]);
            continue;
        }
        if ((arg == "--mc" || arg == "--minecraft-version") && i + 1 < argc) {
            opts.minecraft_version = argv[++i];
            continue;
        }

        // Boolean options
        if (arg == "-v" || arg == "--verbose") {
            opts.config.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            opts.config.quiet = true;
            continue;
        }
        if (arg == "--force") {
            opts.force = true;
            continue;
        }
        if (arg == "--recompile" || arg == "-r") {
            opts.recompile = true;
            continue;
        }
        if (arg == "--ignore-updates") {
            opts.ignore_updates = true;
            continue;
        }

        std::cerr << "Unknown argument: " << arg << "\n";
        std::cerr << "Try 'jarcache --help' for more information.\n";
        return false;
    }

    if (opts.repo.empty()) {
        opts.repo = default_repo();
    }
    return true;
}

// -----------------------------------------------------------------------------
// Commands
// -----------------------------------------------------------------------------

// Requested version, or the newest one the catalog knows
const ProductVersion& select_version(const Options& opts, CatalogStore& catalog,
                                     VersionStore& versions) {
    if (!opts.minecraft_version.empty()) {
        return versions.intern(opts.minecraft_version);
    }
    const auto& known = catalog.versions();
    if (known.empty()) {
        throw CacheError(ErrorKind::CATALOG_ERROR, "Catalog lists no versions");
    }
    return versions.intern(known.back());
}

std::string join_builds(const std::set<int>& builds) {
    std::string joined;
    for (int build : builds) {
        if (!joined.empty()) joined += ", ";
        joined += std::to_string(build);
    }
    return joined;
}

int run_official(const Options& opts, ArtifactResolver& resolver, VersionStore& versions) {
    CatalogStore& catalog = resolver.catalog();
    const ProductVersion& version = select_version(opts, catalog, versions);

    const auto& builds = catalog.builds(version.name());
    if (builds.empty()) {
        throw CacheError(ErrorKind::CATALOG_ERROR,
                         "No known " + resolver.config().project_name + " builds for " + version.name());
    }

    int latest = *builds.rbegin();
    int build = opts.build.value_or(latest);
    if (builds.count(build) == 0) {
        throw CacheError(ErrorKind::CATALOG_ERROR,
                         "Build " + std::to_string(build) + " is not a valid build for " + version.name(),
                         {"Known builds: " + join_builds(builds)});
    }

    // An explicit build is pinned: never replace it with a newer one
    bool ignore_updates = opts.ignore_updates || opts.build.has_value();
    if (build != latest && !opts.config.quiet) {
        std::cout << "The latest build for " << version.name() << " is " << latest
                  << ", using " << build << " instead\n";
    }

    Artifact resolved = resolver.ensure(OfficialArtifact{version, build}, opts.force, ignore_updates);
    std::cout << resolver.resolved_path(resolved).string() << "\n";
    return 0;
}

int run_dev(const Options& opts, ArtifactResolver& resolver) {
    ProductVersion version = resolver.detect_repo_version(opts.repo);
    if (!opts.minecraft_version.empty() && opts.minecraft_version != version.name()) {
        throw CacheError(ErrorKind::INVALID_VERSION,
                         "Detected version " + version.name() + " for " + opts.repo.string()
                             + " (expected " + opts.minecraft_version + ")");
    }

    Artifact artifact = DevelopmentArtifact{version, opts.repo};
    bool rebuild = opts.recompile;
    try {
        resolver.validate_cache(artifact);
        if (opts.recompile && !opts.config.quiet) {
            std::cout << "WARNING: The cached development jar is already up to date.\n";
        }
    } catch (const CacheInvalidationError& e) {
        if (!opts.config.quiet) {
            std::cout << "Cached development jar is invalid: " << e.what() << "\n";
            if (!opts.recompile) {
                for (const auto& line : e.details()) {
                    std::cout << "    " << line << "\n";
                }
            }
        }
        rebuild = true;
    }

    if (rebuild) {
        if (!opts.config.quiet) {
            print_commit(resolver.head_commit(opts.repo));
        }
        resolver.update(artifact, true);
        try {
            resolver.validate_cache(artifact);
        } catch (const CacheInvalidationError& e) {
            throw CacheError(ErrorKind::REVALIDATION_FAILED,
                             "Freshly compiled jar failed validation: " + std::string(e.what()),
                             e.details());
        }
    } else if (!opts.config.quiet) {
        std::cout << "Reusing existing jar\n";
    }

    std::cout << resolver.resolved_path(artifact).string() << "\n";
    return 0;
}

int run_check(const Options& opts, ArtifactResolver& resolver, VersionStore& versions) {
    std::optional<Artifact> artifact;
    if (opts.build) {
        const ProductVersion& version = select_version(opts, resolver.catalog(), versions);
        artifact = OfficialArtifact{version, *opts.build};
    } else {
        artifact = DevelopmentArtifact{resolver.detect_repo_version(opts.repo), opts.repo};
    }

    try {
        auto update = resolver.check_for_updates(*artifact, opts.force, opts.ignore_updates);
        if (update) {
            std::cout << "Update available: " << resolver.describe(*update) << "\n";
            return 2;
        }
    } catch (const CacheInvalidationError& e) {
        std::cout << "Cached " << resolver.describe(*artifact) << " is invalid: " << e.what() << "\n";
        for (const auto& line : e.details()) {
            std::cout << "    " << line << "\n";
        }
        return 1;
    }

    std::cout << resolver.describe(*artifact) << " is valid: "
              << resolver.resolved_path(*artifact).string() << "\n";
    return 0;
}

int run_builds(const Options& opts, CatalogStore& catalog, VersionStore& versions) {
    if (opts.minecraft_version.empty()) {
        std::cout << "Known versions:\n";
        for (const auto& name : catalog.versions()) {
            std::cout << "  " << versions.intern(name).name() << "\n";
        }
    }

    const ProductVersion& version = select_version(opts, catalog, versions);
    if (opts.force) {
        catalog.clear_builds(version.name());
    }
    const auto& builds = catalog.builds(version.name());
    std::cout << "Known builds for " << version.name() << ":\n";
    std::cout << "    " << join_builds(builds) << "\n";
    return 0;
}

int run_update_plugins(const Options& opts) {
    std::vector<PluginConfig> configs = load_plugin_configs(opts.plugins_file);

    HttpUrlFetcher fetcher(opts.config.verbose);
    PluginManager manager(opts.plugins_dir, fetcher);
    manager.set_progress_callback(ConsolePluginProgress(opts.config.verbose, opts.config.quiet));

    size_t downloaded = manager.update(configs, opts.ignored_plugins, opts.force);
    if (!opts.config.quiet) {
        std::cout << "Downloaded " << downloaded << " jar(s) into "
                  << manager.plugins_dir().string() << "\n";
    }
    return 0;
}

int run_check_plugins(const Options& opts) {
    std::vector<PluginConfig> configs = load_plugin_configs(opts.plugins_file);

    HttpUrlFetcher fetcher(opts.config.verbose);
    PluginManager manager(opts.plugins_dir, fetcher);
    manager.set_progress_callback(ConsolePluginProgress(opts.config.verbose, opts.config.quiet));

    if (!opts.config.quiet) {
        std::cout << "Checking plugins...\n";
    }
    manager.check(configs);
    if (!opts.config.quiet) {
        std::cout << configs.size() << " plugin(s) present\n";
    }
    return 0;
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options opts;

    if (!parse_args(argc, argv, opts)) {
        return 1;
    }

    if (opts.show_help) {
        print_help();
        return 0;
    }

    if (opts.show_version) {
        print_version();
        return 0;
    }

    if (opts.command == Command::NONE) {
        std::cerr << "No command specified!\n";
        print_help();
        return 1;
    }

    CatalogConfig catalog_config;
    catalog_config.project = opts.config.project_id;
    catalog_config.verbose = opts.config.verbose;

    PaperCatalog paper(catalog_config);
    CatalogStore catalog(paper);
    VersionStore versions;
    GitInspector git("git", opts.config.verbose);

    ArtifactResolver resolver(opts.config, git, catalog, paper);
    resolver.set_progress_callback(ConsoleProgress(opts.config.verbose, opts.config.quiet));

    try {
        switch (opts.command) {
            case Command::OFFICIAL:
                return run_official(opts, resolver, versions);
            case Command::DEV:
                return run_dev(opts, resolver);
            case Command::CHECK:
                return run_check(opts, resolver, versions);
            case Command::BUILDS:
                return run_builds(opts, catalog, versions);
            case Command::UPDATE_PLUGINS:
                return run_update_plugins(opts);
            case Command::CHECK_PLUGINS:
                return run_check_plugins(opts);
            case Command::NONE:
                break;
        }
    } catch (const CacheError& e) {
        print_error(e);
        if (e.is_fatal()) {
            std::cerr << "(" << error_kind_to_string(e.kind()) << ")\n";
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
