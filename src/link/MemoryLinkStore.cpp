#include "link/MemoryLinkStore.hpp"
#include "link/Errors.hpp"

#include <algorithm>
#include <mutex>

using namespace ql::link;
using namespace ql::types;

MemoryLinkStore::Shard& MemoryLinkStore::shardFor(const std::string& shortCode) {
    return shards_[std::hash<std::string>{}(shortCode) % SHARD_COUNT];
}

const MemoryLinkStore::Shard& MemoryLinkStore::shardFor(const std::string& shortCode) const {
    return shards_[std::hash<std::string>{}(shortCode) % SHARD_COUNT];
}

std::shared_ptr<Link> MemoryLinkStore::create(const std::string& shortCode, const std::string& originalUrl) {
    auto& shard = shardFor(shortCode);
    std::unique_lock lock(shard.mtx);

    Link link(shortCode, originalUrl);
    const auto [it, inserted] = shard.links.try_emplace(shortCode, std::move(link));
    if (!inserted) throw LinkError(ErrorCode::Conflict, "Short code already exists: " + shortCode);

    it->second.id = nextId_.fetch_add(1, std::memory_order_relaxed);
    return std::make_shared<Link>(it->second);
}

std::shared_ptr<Link> MemoryLinkStore::findByCode(const std::string& shortCode) {
    const auto& shard = shardFor(shortCode);
    std::shared_lock lock(shard.mtx);
    const auto it = shard.links.find(shortCode);
    if (it == shard.links.end()) return nullptr;
    return std::make_shared<Link>(it->second);
}

bool MemoryLinkStore::exists(const std::string& shortCode) {
    const auto& shard = shardFor(shortCode);
    std::shared_lock lock(shard.mtx);
    return shard.links.contains(shortCode);
}

void MemoryLinkStore::attachQrUrl(const std::string& shortCode, const std::string& qrUrl) {
    auto& shard = shardFor(shortCode);
    std::unique_lock lock(shard.mtx);
    const auto it = shard.links.find(shortCode);
    if (it == shard.links.end()) throw LinkError(ErrorCode::NotFound, "Short code not found: " + shortCode);
    it->second.qr_code_url = qrUrl;
}

std::vector<std::shared_ptr<Link>> MemoryLinkStore::list(const ListQueryParams& params) {
    std::vector<std::shared_ptr<Link>> all;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard.mtx);
        for (const auto& [_, link] : shard.links) all.push_back(std::make_shared<Link>(link));
    }

    std::ranges::sort(all, [](const auto& a, const auto& b) {
        if (a->created_at != b->created_at) return a->created_at > b->created_at;
        return a->id > b->id;
    });

    const auto offset = static_cast<size_t>(params.effectiveOffset());
    const auto limit = static_cast<size_t>(params.effectiveLimit());
    if (offset >= all.size()) return {};

    const auto last = std::min(all.size(), offset + limit);
    return {all.begin() + static_cast<std::ptrdiff_t>(offset), all.begin() + static_cast<std::ptrdiff_t>(last)};
}

size_t MemoryLinkStore::size() const {
    size_t n = 0;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard.mtx);
        n += shard.links.size();
    }
    return n;
}
