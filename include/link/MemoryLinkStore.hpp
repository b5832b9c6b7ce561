#pragma once

#include "link/LinkStore.hpp"

#include <array>
#include <atomic>
#include <shared_mutex>
#include <unordered_map>

namespace ql::link {

class MemoryLinkStore final : public LinkStore {
public:
    static constexpr size_t SHARD_COUNT = 16;

    MemoryLinkStore() = default;

    std::shared_ptr<types::Link> create(const std::string& shortCode, const std::string& originalUrl) override;
    std::shared_ptr<types::Link> findByCode(const std::string& shortCode) override;
    bool exists(const std::string& shortCode) override;
    void attachQrUrl(const std::string& shortCode, const std::string& qrUrl) override;
    std::vector<std::shared_ptr<types::Link>> list(const types::ListQueryParams& params) override;

    [[nodiscard]] size_t size() const;

private:
    struct Shard {
        mutable std::shared_mutex mtx;
        std::unordered_map<std::string, types::Link> links;
    };

    std::array<Shard, SHARD_COUNT> shards_;
    std::atomic<uint64_t> nextId_{1};

    Shard& shardFor(const std::string& shortCode);
    const Shard& shardFor(const std::string& shortCode) const;
};

}
