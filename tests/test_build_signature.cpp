// test_build_signature.cpp - Tests for BuildSignature capture and persistence
// Part of jarcache - Server Artifact Cache

#include "state/build_signature.hpp"
#include "vcs/vcs_inspector.hpp"

#include "test_support.hpp"

#include <memory>

using namespace jarcache;

static std::unique_ptr<TestFixture> fixture;
static GitInspector inspector;

static BuildSignature sample_signature() {
    BuildSignature sig;
    sig.artifact_hash = ContentHasher::hash_bytes("artifact");
    sig.source_revision = "3f786850e387550fdab836ed7e6dc881de23001b";
    sig.changed_sources["src/Main.java"] = ContentHasher::hash_bytes("main");
    sig.changed_sources["README.md"] = ContentHasher::hash_bytes("readme");
    return sig;
}

// =============================================================================
// Value Tests
// =============================================================================

void test_equality() {
    BuildSignature a = sample_signature();
    BuildSignature b = sample_signature();
    ASSERT(a == b);

    b.changed_sources["README.md"] = ContentHasher::hash_bytes("other");
    ASSERT(a != b);

    b = sample_signature();
    b.source_revision = "";
    ASSERT(a != b);
}

void test_json_layout() {
    nlohmann::json data = sample_signature().to_json();

    ASSERT(data["artifact_hash"].is_string());
    ASSERT_EQ(data["source_revision"].get<std::string>(), "3f786850e387550fdab836ed7e6dc881de23001b");

    const auto& sources = data["changed_sources"];
    ASSERT(sources.is_array());
    ASSERT_EQ(sources.size(), 2u);
    // Sorted by path, each entry a [path, hash] pair
    ASSERT_EQ(sources[0][0].get<std::string>(), "README.md");
    ASSERT_EQ(sources[1][0].get<std::string>(), "src/Main.java");
    ASSERT_EQ(sources[1][1].get<std::string>(), ContentHasher::hash_bytes("main"));
}

void test_from_json_accepts_empty_changes() {
    auto data = nlohmann::json::parse(R"({
        "artifact_hash": "abc",
        "source_revision": "",
        "changed_sources": []
    })");
    BuildSignature sig = BuildSignature::from_json(data);
    ASSERT_EQ(sig.artifact_hash, "abc");
    ASSERT(sig.source_revision.empty());
    ASSERT(sig.changed_sources.empty());
}

void test_from_json_rejects_malformed() {
    ASSERT_THROWS_KIND(BuildSignature::from_json(nlohmann::json::array()),
                       ErrorKind::CORRUPT_SIGNATURE);
    ASSERT_THROWS_KIND(BuildSignature::from_json(nlohmann::json::parse(
                           R"({"source_revision": "", "changed_sources": []})")),
                       ErrorKind::CORRUPT_SIGNATURE);
    ASSERT_THROWS_KIND(BuildSignature::from_json(nlohmann::json::parse(
                           R"({"artifact_hash": 5, "source_revision": "", "changed_sources": []})")),
                       ErrorKind::CORRUPT_SIGNATURE);
    ASSERT_THROWS_KIND(BuildSignature::from_json(nlohmann::json::parse(
                           R"({"artifact_hash": "a", "source_revision": "", "changed_sources": [["only-path"]]})")),
                       ErrorKind::CORRUPT_SIGNATURE);
    ASSERT_THROWS_KIND(BuildSignature::from_json(nlohmann::json::parse(
                           R"({"artifact_hash": "a", "source_revision": "",
                               "changed_sources": [["x", "1"], ["x", "2"]]})")),
                       ErrorKind::CORRUPT_SIGNATURE);
}

// =============================================================================
// Persistence Tests
// =============================================================================

void test_save_creates_parent_directories() {
    fs::path path = fixture->test_dir / "nested" / "cache" / "dev-signature-1.16.5.json";
    ASSERT(save_signature(sample_signature(), path));
    ASSERT(fs::exists(path));
    ASSERT(load_signature(path) == sample_signature());
}

void test_load_rejects_garbage() {
    fs::path path = fixture->test_dir / "garbage.json";
    write_file(path, "{ not json");
    ASSERT_THROWS_KIND(load_signature(path), ErrorKind::CORRUPT_SIGNATURE);

    ASSERT_THROWS_KIND(load_signature(fixture->test_dir / "absent.json"),
                       ErrorKind::CORRUPT_SIGNATURE);
}

void test_store_missing_signature() {
    SignatureStore store(fixture->test_dir / "store-missing.json");
    ASSERT(!store.exists());

    bool thrown = false;
    try {
        store.load();
    } catch (const CacheInvalidationError& e) {
        thrown = true;
        ASSERT(e.kind() == ErrorKind::SIGNATURE_MISSING);
    }
    ASSERT(thrown);
}

void test_store_caches_until_invalidated() {
    fs::path path = fixture->test_dir / "store-cached.json";
    SignatureStore store(path);
    ASSERT(store.save(sample_signature()));
    ASSERT(store.is_loaded());

    // The file changes behind the store's back; the cached value wins
    write_file(path, "{ broken");
    ASSERT(store.load() == sample_signature());

    store.invalidate();
    ASSERT(!store.is_loaded());
    ASSERT_THROWS_KIND(store.load(), ErrorKind::CORRUPT_SIGNATURE);
}

// =============================================================================
// Capture Tests
// =============================================================================

void test_capture_hashes_each_kind_of_change() {
    fs::path repo = fixture->scratch("capture");
    init_repo(repo);
    write_file(repo / "committed.txt", "v1\n");
    commit_all(repo, "Initial");

    fs::path inner = repo / "inner";
    init_repo(inner);
    write_file(inner / "lib.txt", "lib\n");
    commit_all(inner, "Inner");

    write_file(repo / "edited.txt", "edited\n");
    fs::create_directories(repo / "plain_dir");
    fs::path artifact = fixture->test_dir / "capture-artifact.jar";
    write_file(artifact, "jar bytes");

    ChangeSet changes = {"edited.txt", "gone.txt", "inner", "plain_dir"};
    ContentHasher hasher(inspector);
    BuildSignature sig = capture_signature(hasher, inspector, artifact,
                                           head_of(repo), repo, changes);

    ASSERT_EQ(sig.artifact_hash, ContentHasher::hash_bytes("jar bytes"));
    ASSERT_EQ(sig.source_revision, head_of(repo));
    ASSERT_EQ(sig.changed_sources.size(), 4u);
    ASSERT_EQ(sig.changed_sources["edited.txt"], ContentHasher::hash_bytes("edited\n"));
    ASSERT_EQ(sig.changed_sources["gone.txt"], deleted_marker_hash());
    ASSERT_EQ(sig.changed_sources["plain_dir"], directory_marker_hash());
    ASSERT_EQ(sig.changed_sources["inner"],
              ContentHasher::hash_bytes(hex_to_bytes(head_of(inner))));
}

void test_capture_requires_artifact() {
    fs::path repo = fixture->scratch("capture_missing");
    init_repo(repo);

    ContentHasher hasher(inspector);
    ASSERT_THROWS_KIND(capture_signature(hasher, inspector, repo / "no.jar", "", repo, {}),
                       ErrorKind::NOT_HASHABLE);
}

int main() {
    std::cout << "=== BuildSignature Test Suite ===\n\n";

    fixture = std::make_unique<TestFixture>("signature");

    std::cout << "Value Tests:\n";
    TEST(equality);
    TEST(json_layout);
    TEST(from_json_accepts_empty_changes);
    TEST(from_json_rejects_malformed);

    std::cout << "\nPersistence Tests:\n";
    TEST(save_creates_parent_directories);
    TEST(load_rejects_garbage);
    TEST(store_missing_signature);
    TEST(store_caches_until_invalidated);

    std::cout << "\nCapture Tests:\n";
    TEST(capture_hashes_each_kind_of_change);
    TEST(capture_requires_artifact);

    fixture.reset();

    return report_results();
}
