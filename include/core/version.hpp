#ifndef JARCACHE_VERSION_HPP
#define JARCACHE_VERSION_HPP

// version.hpp - Product version identifiers and their interning store
// Part of jarcache - Server Artifact Cache

#include <map>
#include <string>
#include <tuple>

namespace jarcache {

// A "<major>.<minor>[.<patch>]" version. The name is kept verbatim as the
// canonical string form; equality is by name, ordering by the numeric triple.
class ProductVersion {
public:
    // Throws CacheError(INVALID_VERSION) if the name doesn't parse
    explicit ProductVersion(const std::string& name);

    static bool is_valid(const std::string& name);

    const std::string& name() const { return name_; }
    int major() const { return major_; }
    int minor() const { return minor_; }
    int patch() const { return patch_; }

    bool operator==(const ProductVersion& other) const { return name_ == other.name_; }
    bool operator!=(const ProductVersion& other) const { return !(*this == other); }
    bool operator<(const ProductVersion& other) const {
        return std::tie(major_, minor_, patch_, name_)
             < std::tie(other.major_, other.minor_, other.patch_, other.name_);
    }
    bool operator>(const ProductVersion& other) const { return other < *this; }
    bool operator<=(const ProductVersion& other) const { return !(other < *this); }
    bool operator>=(const ProductVersion& other) const { return !(*this < other); }

private:
    std::string name_;
    int major_ = 0;
    int minor_ = 0;
    int patch_ = 0;
};

// Process-scoped interning store: equal names resolve to the same instance.
// Owned by whoever drives a run and passed by reference.
class VersionStore {
public:
    const ProductVersion& intern(const std::string& name);

    bool contains(const std::string& name) const {
        return versions_.count(name) > 0;
    }
    size_t size() const { return versions_.size(); }
    void clear() { versions_.clear(); }

private:
    std::map<std::string, ProductVersion> versions_;
};

} // namespace jarcache

#endif // JARCACHE_VERSION_HPP
