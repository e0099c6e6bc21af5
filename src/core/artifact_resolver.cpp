/**
 * artifact_resolver.cpp
 * Official download / development build resolution
 */

#include "core/artifact_resolver.hpp"

#include <fstream>
#include <stdexcept>

namespace jarcache {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string substitute(std::string pattern, const std::string& key, const std::string& value) {
    size_t pos = 0;
    while ((pos = pattern.find(key, pos)) != std::string::npos) {
        pattern.replace(pos, key.size(), value);
        pos += value.size();
    }
    return pattern;
}

std::vector<std::string> with_summary(const CacheError& e) {
    std::vector<std::string> lines{e.what()};
    for (const auto& line : e.details()) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

// =============================================================================
// Artifacts
// =============================================================================

const ProductVersion& artifact_version(const Artifact& artifact) {
    return std::visit([](const auto& a) -> const ProductVersion& { return a.version; }, artifact);
}

bool is_official(const Artifact& artifact) {
    return std::holds_alternative<OfficialArtifact>(artifact);
}

// =============================================================================
// Construction
// =============================================================================

ArtifactResolver::ArtifactResolver(ResolverConfig config,
                                   const VcsInspector& inspector,
                                   CatalogStore& catalog,
                                   ArtifactDownloader& downloader)
    : config_(std::move(config))
    , inspector_(inspector)
    , catalog_(catalog)
    , downloader_(downloader)
    , hasher_(inspector)
    , scanner_(inspector, config_.nested_repositories)
    , validator_(inspector, hasher_, scanner_)
    , build_tool_(config_.build_command, config_.verbose) {
}

SignatureStore& ArtifactResolver::signature_store(const ProductVersion& version) {
    auto it = signatures_.find(version.name());
    if (it == signatures_.end()) {
        it = signatures_.emplace(
            version.name(),
            std::make_unique<SignatureStore>(signature_path(version))).first;
    }
    return *it->second;
}

void ArtifactResolver::report(ResolveState state, const Artifact& artifact,
                              const std::string& message,
                              std::vector<std::string> details) const {
    if (!progress_callback_) {
        return;
    }
    ResolveProgress progress;
    progress.state = state;
    progress.artifact = progress_label(artifact);
    progress.message = message;
    progress.details = std::move(details);
    progress_callback_(progress);
}

std::string ArtifactResolver::progress_label(const Artifact& artifact) const {
    return std::visit(overloaded{
        [&](const OfficialArtifact& a) {
            return config_.project_name + "-" + std::to_string(a.build_number);
        },
        [&](const DevelopmentArtifact& a) {
            return config_.project_name + " " + a.version.name()
                + " (" + a.repo_dir.string() + ")";
        }
    }, artifact);
}

// =============================================================================
// Update Check / Validation
// =============================================================================

std::optional<Artifact> ArtifactResolver::check_for_updates(const Artifact& artifact,
                                                            bool force,
                                                            bool ignore_updates) {
    return std::visit(overloaded{
        [&](const OfficialArtifact& a) { return check_official(a, force, ignore_updates); },
        [&](const DevelopmentArtifact& a) { return check_development(a, force, ignore_updates); }
    }, artifact);
}

void ArtifactResolver::validate_cache(const Artifact& artifact) {
    auto update = check_for_updates(artifact, false, true);
    if (update) {
        throw std::logic_error("validate_cache: unexpected update for " + describe(artifact));
    }
}

std::optional<Artifact> ArtifactResolver::check_official(const OfficialArtifact& artifact,
                                                         bool force,
                                                         bool ignore_updates) {
    const std::string& version = artifact.version.name();

    if (!ignore_updates) {
        if (force) {
            catalog_.clear_builds(version);
        }
        const auto& builds = catalog_.builds(version);
        if (builds.empty()) {
            throw CacheError(ErrorKind::CATALOG_ERROR,
                             "No known " + config_.project_name + " builds for " + version);
        }

        int maximum = *builds.rbegin();
        if (maximum > artifact.build_number) {
            return Artifact{OfficialArtifact{artifact.version, maximum}};
        }
        if (maximum < artifact.build_number) {
            throw CacheError(
                ErrorKind::CATALOG_INCONSISTENCY,
                "Current build number " + std::to_string(artifact.build_number)
                    + " greater than maximum build",
                {"According to the catalog, the maximum build for " + version
                    + " is " + std::to_string(maximum)});
        }
    }

    fs::path path = resolved_path(artifact);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw CacheInvalidationError(
            ErrorKind::ARTIFACT_MISSING,
            "Missing download for " + describe(artifact),
            {"Expected location: " + path.string()});
    }

    std::string actual = hasher_.hash(path);
    const std::string& expected = catalog_.build_info(version, artifact.build_number).download_hash;
    if (actual != expected) {
        throw CacheInvalidationError(
            ErrorKind::ARTIFACT_HASH_MISMATCH,
            "Mismatched hash for " + describe(artifact),
            {"Expected " + expected, "Actually " + actual});
    }
    return std::nullopt;
}

std::optional<Artifact> ArtifactResolver::check_development(const DevelopmentArtifact& artifact,
                                                            bool force,
                                                            bool ignore_updates) {
    // The checkout always describes the wanted build, so the only "update"
    // is an explicit request to rebuild it
    if (force && !ignore_updates) {
        return Artifact{artifact};
    }
    validator_.validate(resolved_path(artifact),
                        signature_store(artifact.version),
                        artifact.repo_dir);
    return std::nullopt;
}

// =============================================================================
// Update
// =============================================================================

void ArtifactResolver::update(const Artifact& artifact, bool force) {
    std::visit(overloaded{
        [&](const OfficialArtifact& a) { update_official(a, force); },
        [&](const DevelopmentArtifact& a) { update_development(a, force); }
    }, artifact);
}

void ArtifactResolver::update_official(const OfficialArtifact& artifact, bool force) {
    fs::path path = resolved_path(artifact);
    std::error_code ec;
    if (!force && fs::exists(path, ec)) {
        return;
    }

    const BuildDescriptor& info = catalog_.build_info(artifact.version.name(), artifact.build_number);
    report(ResolveState::UPDATING, artifact, "Downloading " + info.download_name);

    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to open for writing: " + path.string());
        }
        downloader_.download(info, [&out](const char* data, size_t length) {
            out.write(data, static_cast<std::streamsize>(length));
        });
        out.close();
        if (!out) {
            throw std::runtime_error("Failed to write: " + path.string());
        }
    }

    std::string actual = hasher_.hash(path);
    if (actual != info.download_hash) {
        fs::remove(path, ec);
        throw CacheError(
            ErrorKind::DOWNLOAD_CORRUPT,
            "Downloaded " + describe(artifact) + " does not match the catalog hash",
            {"Expected " + info.download_hash, "Actually " + actual});
    }
}

void ArtifactResolver::update_development(const DevelopmentArtifact& artifact, bool force) {
    if (!force) {
        try {
            validator_.validate(resolved_path(artifact),
                                signature_store(artifact.version),
                                artifact.repo_dir);
            return;
        } catch (const CacheInvalidationError&) {
            // Stale: rebuild below
        }
    }

    report(ResolveState::UPDATING, artifact, "Running " + build_tool_.describe());
    auto result = build_tool_.run(artifact.repo_dir);
    if (!result.success()) {
        throw CacheError(
            ErrorKind::BUILD_FAILED,
            "Unable to compile " + config_.project_name + " (exit code "
                + std::to_string(result.exit_code) + ")",
            {"Command: " + build_tool_.describe(),
             "Directory: " + artifact.repo_dir.string()});
    }

    fs::path output = resolved_path(artifact);
    std::error_code ec;
    if (!fs::exists(output, ec)) {
        throw CacheError(ErrorKind::ARTIFACT_NOT_PRODUCED,
                         "Unable to find compiled artifact: " + output.string());
    }

    SignatureStore& store = signature_store(artifact.version);
    BuildSignature signature = validator_.current_signature(output, artifact.repo_dir);
    if (!store.save(signature)) {
        throw std::runtime_error("Failed to save build signature: " + store.path().string());
    }
}

// =============================================================================
// Ensure
// =============================================================================

Artifact ArtifactResolver::ensure(const Artifact& artifact, bool force, bool ignore_updates) {
    report(ResolveState::VALIDATING, artifact, "Checking cache");

    std::optional<Artifact> next;
    try {
        next = check_for_updates(artifact, force, ignore_updates);
    } catch (const CacheInvalidationError& e) {
        report(ResolveState::INVALID, artifact, e.what(), e.details());
        update(artifact, true);
        try {
            validate_cache(artifact);
        } catch (const CacheInvalidationError& again) {
            throw CacheError(ErrorKind::REVALIDATION_FAILED,
                             describe(artifact) + " is still invalid after updating",
                             with_summary(again));
        }
        report(ResolveState::RESOLVED, artifact, "Updated");
        return artifact;
    }

    if (!next) {
        report(ResolveState::VALID, artifact, "Reusing cached artifact");
        report(ResolveState::RESOLVED, artifact, resolved_path(artifact).string());
        return artifact;
    }

    report(ResolveState::UPDATE_AVAILABLE, *next, "Update available");
    update(*next, false);
    try {
        validate_cache(*next);
    } catch (const CacheInvalidationError& e) {
        report(ResolveState::INVALID, *next, e.what(), e.details());
        update(*next, true);
        try {
            validate_cache(*next);
        } catch (const CacheInvalidationError& again) {
            throw CacheError(ErrorKind::REVALIDATION_FAILED,
                             describe(*next) + " is still invalid after updating",
                             with_summary(again));
        }
    }
    report(ResolveState::RESOLVED, *next, resolved_path(*next).string());
    return *next;
}

// =============================================================================
// Queries
// =============================================================================

std::string ArtifactResolver::describe(const Artifact& artifact) const {
    return std::visit(overloaded{
        [&](const OfficialArtifact& a) {
            return config_.project_name + "-" + std::to_string(a.build_number);
        },
        [&](const DevelopmentArtifact& a) {
            std::string descriptor = config_.project_name + "-"
                + inspector_.head_revision(a.repo_dir).value_or("unborn");
            if (!detect_changes(a.repo_dir).empty()) {
                descriptor += "-dirty";
            }
            return descriptor;
        }
    }, artifact);
}

fs::path ArtifactResolver::resolved_path(const Artifact& artifact) const {
    return std::visit(overloaded{
        [&](const OfficialArtifact& a) {
            return config_.cache_dir / "official-builds"
                / (config_.project_id + "-" + std::to_string(a.build_number) + ".jar");
        },
        [&](const DevelopmentArtifact& a) {
            return a.repo_dir / substitute(config_.dev_output_pattern, "{version}", a.version.name());
        }
    }, artifact);
}

fs::path ArtifactResolver::signature_path(const ProductVersion& version) const {
    return config_.cache_dir / ("dev-signature-" + version.name() + ".json");
}

ProductVersion ArtifactResolver::detect_repo_version(const fs::path& repo_dir) const {
    fs::path version_file = repo_dir / config_.version_file;
    std::ifstream file(version_file);
    if (!file) {
        throw CacheError(ErrorKind::INVALID_VERSION,
                         "Repository is missing its version file: " + version_file.string());
    }

    const std::string open_tag = "<" + config_.version_tag + ">";
    const std::string close_tag = "</" + config_.version_tag + ">";

    std::string line;
    while (std::getline(file, line)) {
        size_t start = line.find(open_tag);
        if (start == std::string::npos) {
            continue;
        }
        start += open_tag.size();
        size_t end = line.find(close_tag, start);
        if (end == std::string::npos) {
            throw CacheError(ErrorKind::INVALID_VERSION,
                             "Invalid version line in " + version_file.string(),
                             {"Missing closing tag " + close_tag});
        }

        std::string name = line.substr(start, end - start);
        if (!ProductVersion::is_valid(name)) {
            throw CacheError(ErrorKind::INVALID_VERSION,
                             "Invalid version '" + name + "' in " + version_file.string());
        }
        return ProductVersion(name);
    }

    throw CacheError(ErrorKind::INVALID_VERSION,
                     "Could not find " + open_tag + " in " + version_file.string());
}

RevisionInfo ArtifactResolver::head_commit(const fs::path& repo_dir) const {
    return inspector_.resolve_revision(repo_dir, "HEAD");
}

ChangeSet ArtifactResolver::detect_changes(const fs::path& repo_dir) const {
    return scanner_.detect_changes(repo_dir);
}

} // namespace jarcache
