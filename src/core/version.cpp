// version.cpp - Product version parsing and interning
// Part of jarcache - Server Artifact Cache

#include "core/version.hpp"
#include "state/cache_errors.hpp"

#include <regex>
#include <stdexcept>

namespace jarcache {

static const std::regex& version_pattern() {
    static const std::regex pattern(R"((\d+)\.(\d+)(?:\.(\d+))?)");
    return pattern;
}

ProductVersion::ProductVersion(const std::string& name)
    : name_(name) {
    std::smatch match;
    if (!std::regex_match(name, match, version_pattern())) {
        throw CacheError(ErrorKind::INVALID_VERSION,
                         "Invalid version name: '" + name + "'");
    }
    try {
        major_ = std::stoi(match[1].str());
        minor_ = std::stoi(match[2].str());
        patch_ = match[3].matched ? std::stoi(match[3].str()) : 0;
    } catch (const std::out_of_range&) {
        throw CacheError(ErrorKind::INVALID_VERSION,
                         "Version component out of range: '" + name + "'");
    }
}

bool ProductVersion::is_valid(const std::string& name) {
    if (!std::regex_match(name, version_pattern())) {
        return false;
    }
    try {
        ProductVersion version(name);
    } catch (const CacheError&) {
        return false;
    }
    return true;
}

const ProductVersion& VersionStore::intern(const std::string& name) {
    auto it = versions_.find(name);
    if (it != versions_.end()) {
        return it->second;
    }
    // Parse before inserting so a bad name never lands in the store
    ProductVersion version(name);
    return versions_.emplace(name, std::move(version)).first->second;
}

} // namespace jarcache
