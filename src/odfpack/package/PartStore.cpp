#include "odfpack/package/PartStore.hpp"

namespace odfpack {
namespace package {

std::string normalizePartPath(const std::string& path) {
    std::string result;
    result.reserve(path.size());
    
    for (char c : path) {
        if (c == '\\') {
            c = '/';
        }
        if (c == '/' && (result.empty() || result.back() == '/')) {
            continue;
        }
        result.push_back(c);
    }
    
    while (result.size() >= 2 && result[0] == '.' && result[1] == '/') {
        result.erase(0, 2);
    }
    return result;
}

bool isSafePartPath(const std::string& path) {
    const std::string normalized = normalizePartPath(path);
    if (normalized.empty()) {
        return false;
    }
    
    size_t start = 0;
    while (start <= normalized.size()) {
        size_t end = normalized.find('/', start);
        if (end == std::string::npos) {
            end = normalized.size();
        }
        if (normalized.compare(start, end - start, "..") == 0) {
            return false;
        }
        start = end + 1;
    }
    return true;
}

const PartEntry* PartStore::find(const std::string& path) const {
    auto it = entries_.find(normalizePartPath(path));
    return it == entries_.end() ? nullptr : &it->second;
}

bool PartStore::contains(const std::string& path) const {
    return find(path) != nullptr;
}

bool PartStore::isDeleted(const std::string& path) const {
    const PartEntry* entry = find(path);
    return entry && entry->isDeleted();
}

void PartStore::setLoaded(const std::string& path, std::string data, int64_t timestamp) {
    PartEntry& entry = entries_[normalizePartPath(path)];
    entry.state = PartEntry::State::Loaded;
    entry.data = std::move(data);
    entry.timestamp = timestamp;
    entry.pinned = true;
}

void PartStore::setCached(const std::string& path, std::string data, int64_t timestamp) {
    PartEntry& entry = entries_[normalizePartPath(path)];
    entry.state = PartEntry::State::Loaded;
    entry.data = std::move(data);
    entry.timestamp = timestamp;
    entry.pinned = false;
}

void PartStore::markDeleted(const std::string& path) {
    PartEntry& entry = entries_[normalizePartPath(path)];
    entry.state = PartEntry::State::Deleted;
    entry.data.clear();
    entry.timestamp = -1;
    entry.pinned = false;
}

bool PartStore::erase(const std::string& path) {
    return entries_.erase(normalizePartPath(path)) > 0;
}

std::vector<std::string> PartStore::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [path, entry] : entries_) {
        result.push_back(path);
    }
    return result;
}

PartStore PartStore::clone() const {
    PartStore copy;
    for (const auto& [path, entry] : entries_) {
        PartEntry& target = copy.entries_[path];
        target.state = entry.state;
        target.data = entry.data;
        target.timestamp = entry.timestamp;
        target.pinned = entry.pinned;
    }
    return copy;
}

}} // namespace odfpack::package
