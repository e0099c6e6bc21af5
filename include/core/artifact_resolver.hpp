/**
 * artifact_resolver.hpp
 * Decides whether a server artifact can be reused, updated or rebuilt
 *
 * Two kinds of artifact:
 * - Official:    a numbered build published by the catalog, downloaded into
 *                the cache and verified against the catalog hash
 * - Development: a jar compiled from a local checkout, verified against the
 *                build signature recorded when it was compiled
 *
 * Resolve Flow (ensure):
 * 1. UNRESOLVED -> VALIDATING: check for updates and validate the cache
 * 2. VALID:            nothing to do
 * 3. UPDATE_AVAILABLE: resolve the newer artifact (non-forced update)
 * 4. INVALID:          forced update, then validate again; a second failure
 *                      is fatal (REVALIDATION_FAILED)
 * 5. RESOLVED:         resolved_path() exists and is trusted
 *
 * Copyright (c) 2025 jarcache contributors
 */

#ifndef JARCACHE_ARTIFACT_RESOLVER_HPP
#define JARCACHE_ARTIFACT_RESOLVER_HPP

#include "catalog/build_catalog.hpp"
#include "core/build_tool.hpp"
#include "core/version.hpp"
#include "state/build_signature.hpp"
#include "state/cache_validator.hpp"
#include "state/change_scanner.hpp"
#include "state/content_hasher.hpp"
#include "vcs/vcs_inspector.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jarcache {

namespace fs = std::filesystem;

// =============================================================================
// Artifacts
// =============================================================================
struct OfficialArtifact {
    ProductVersion version;
    int build_number;
};

struct DevelopmentArtifact {
    ProductVersion version;
    fs::path repo_dir;
};

using Artifact = std::variant<OfficialArtifact, DevelopmentArtifact>;

const ProductVersion& artifact_version(const Artifact& artifact);

bool is_official(const Artifact& artifact);

// =============================================================================
// Resolver Configuration
// =============================================================================
struct ResolverConfig {
    // Cache directory for downloads and signatures
    fs::path cache_dir = "cache";

    // Catalog project id (file names) and display name (descriptors)
    std::string project_id = "paper";
    std::string project_name = "Paper";

    // Development output, relative to the repository ({version} substituted)
    std::string dev_output_pattern = "Paper-Server/target/paper-{version}.jar";

    // Where the repository declares its product version
    std::string version_file = "work/CraftBukkit/pom.xml";
    std::string version_tag = "minecraft.version";

    // Independent checkouts inside the repository that feed the build
    std::vector<std::string> nested_repositories = {"Paper-Server", "Paper-API"};

    // Build command, run in the repository
    std::vector<std::string> build_command = {"mvn", "clean", "package"};

    bool verbose = false;
    bool quiet = false;
};

// =============================================================================
// Progress Callback
// =============================================================================
enum class ResolveState {
    UNRESOLVED,        // Nothing checked yet
    VALIDATING,        // Checking catalog / signature
    VALID,             // Cache can be reused as-is
    INVALID,           // Cache must be rebuilt or redownloaded
    UPDATE_AVAILABLE,  // A newer artifact exists
    UPDATING,          // Downloading or building
    RESOLVED           // Artifact on disk and trusted
};

inline const char* resolve_state_to_string(ResolveState state) {
    switch (state) {
        case ResolveState::UNRESOLVED:       return "unresolved";
        case ResolveState::VALIDATING:       return "validating";
        case ResolveState::VALID:            return "valid";
        case ResolveState::INVALID:          return "invalid";
        case ResolveState::UPDATE_AVAILABLE: return "update";
        case ResolveState::UPDATING:         return "updating";
        case ResolveState::RESOLVED:         return "resolved";
        default:                             return "unknown";
    }
}

struct ResolveProgress {
    ResolveState state = ResolveState::UNRESOLVED;
    std::string artifact;                 // Name of the artifact involved (no repository scan)
    std::string message;
    std::vector<std::string> details;     // Indented diagnostic lines
};

using ProgressCallback = std::function<void(const ResolveProgress&)>;

// =============================================================================
// Artifact Resolver
// =============================================================================
class ArtifactResolver {
public:
    ArtifactResolver(ResolverConfig config,
                     const VcsInspector& inspector,
                     CatalogStore& catalog,
                     ArtifactDownloader& downloader);

    // No copying (stores reference the embedded hasher/scanner)
    ArtifactResolver(const ArtifactResolver&) = delete;
    ArtifactResolver& operator=(const ArtifactResolver&) = delete;

    void set_progress_callback(ProgressCallback callback) {
        progress_callback_ = std::move(callback);
    }

    // =========================================================================
    // Resolve Operations
    // =========================================================================

    /**
     * Check for a newer artifact and verify the cache, in that order.
     *
     * @param force Refresh memoized catalog answers; a development artifact
     *              returns itself as "the update" to request a rebuild
     * @param ignore_updates Skip the update check (validate only)
     * @return The newer artifact, or nullopt if `artifact` is current and valid
     * @throws CacheInvalidationError if the cache is invalid
     * @throws CacheError(CATALOG_ERROR / CATALOG_INCONSISTENCY) on catalog problems
     */
    std::optional<Artifact> check_for_updates(const Artifact& artifact,
                                              bool force = false,
                                              bool ignore_updates = false);

    /**
     * Validate the cache only. Throws CacheInvalidationError when invalid.
     */
    void validate_cache(const Artifact& artifact);

    /**
     * Download or build the artifact. Without `force` this is a no-op for
     * an artifact that is already present (official) or valid (development).
     */
    void update(const Artifact& artifact, bool force = false);

    /**
     * Drive the full state machine and return the artifact that ended up
     * resolved (which may be newer than the one requested).
     */
    Artifact ensure(const Artifact& artifact, bool force = false, bool ignore_updates = false);

    // =========================================================================
    // Queries
    // =========================================================================

    // "Paper-<build>" or "Paper-<revision>[-dirty]"
    std::string describe(const Artifact& artifact) const;

    // Where the artifact lives (may not exist yet)
    fs::path resolved_path(const Artifact& artifact) const;

    // Signature side-car for development builds of `version`
    fs::path signature_path(const ProductVersion& version) const;

    // Read the product version declared by a development checkout.
    // Throws CacheError(INVALID_VERSION) if missing or malformed.
    ProductVersion detect_repo_version(const fs::path& repo_dir) const;

    // The commit a rebuild would compile
    RevisionInfo head_commit(const fs::path& repo_dir) const;

    // Paths differing from a clean checkout of `repo_dir`
    ChangeSet detect_changes(const fs::path& repo_dir) const;

    const ResolverConfig& config() const { return config_; }
    CatalogStore& catalog() { return catalog_; }

private:
    ResolverConfig config_;
    const VcsInspector& inspector_;
    CatalogStore& catalog_;
    ArtifactDownloader& downloader_;

    ContentHasher hasher_;
    RepoChangeScanner scanner_;
    CacheValidator validator_;
    BuildTool build_tool_;

    // One store per product version, created on first use
    std::map<std::string, std::unique_ptr<SignatureStore>> signatures_;

    ProgressCallback progress_callback_;

    SignatureStore& signature_store(const ProductVersion& version);

    std::optional<Artifact> check_official(const OfficialArtifact& artifact,
                                           bool force, bool ignore_updates);
    std::optional<Artifact> check_development(const DevelopmentArtifact& artifact,
                                              bool force, bool ignore_updates);

    void update_official(const OfficialArtifact& artifact, bool force);
    void update_development(const DevelopmentArtifact& artifact, bool force);

    // describe() without touching the repository
    std::string progress_label(const Artifact& artifact) const;

    void report(ResolveState state, const Artifact& artifact,
                const std::string& message,
                std::vector<std::string> details = {}) const;
};

} // namespace jarcache

#endif // JARCACHE_ARTIFACT_RESOLVER_HPP
