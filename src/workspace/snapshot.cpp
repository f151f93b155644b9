#include "workspace/snapshot.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace protoforge::workspace {

namespace {

constexpr std::uint64_t kFnvOffsetBasis = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

void fnv1a_update(std::uint64_t& hash, const char* data, const std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= static_cast<unsigned char>(data[i]);
        hash *= kFnvPrime;
    }
}

void fnv1a_update(std::uint64_t& hash, const std::string& value) {
    const std::string length = std::to_string(value.size());
    fnv1a_update(hash, length.data(), length.size());
    fnv1a_update(hash, ":", 1);
    fnv1a_update(hash, value.data(), value.size());
}

}  // namespace

Snapshot::Snapshot(const std::uint64_t generation, Entries entries)
    : generation_(generation),
      entries_(std::move(entries)),
      digest_(compute_digest(entries_)) {}

bool Snapshot::contains(const std::string& path) const {
    return entries_.find(path) != entries_.end();
}

const std::string* Snapshot::content(const std::string& path) const {
    const auto it = entries_.find(path);
    if (it == entries_.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<std::string> Snapshot::paths() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    return out;
}

std::size_t Snapshot::total_bytes() const {
    std::size_t total = 0;
    for (const auto& entry : entries_) {
        if (entry.second) {
            total += entry.second->size();
        }
    }
    return total;
}

FileTree Snapshot::to_tree() const {
    FileTree tree;
    for (const auto& entry : entries_) {
        tree.emplace(entry.first, entry.second ? *entry.second : std::string());
    }
    return tree;
}

bool Snapshot::verify() const {
    return compute_digest(entries_) == digest_;
}

// Length-prefixed FNV-1a over (path, content) pairs in path order. The map is
// ordered, so equal trees always produce equal digests.
std::string Snapshot::compute_digest(const Entries& entries) {
    std::uint64_t hash = kFnvOffsetBasis;
    for (const auto& entry : entries) {
        fnv1a_update(hash, entry.first);
        fnv1a_update(hash, entry.second ? *entry.second : std::string());
    }

    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << hash;
    return out.str();
}

}  // namespace protoforge::workspace
