#pragma once

#include "link/Errors.hpp"
#include "storage/BlobStore.hpp"

#include <atomic>
#include <map>
#include <mutex>

namespace ql::test {

class FakeBlobStore final : public storage::BlobStore {
public:
    std::atomic<bool> failUploads{false};

    std::string upload(const std::string& key, const std::vector<uint8_t>& bytes,
                       const std::string& contentType) override {
        if (failUploads) throw link::LinkError(link::ErrorCode::StorageUploadError, "simulated upload failure");
        std::scoped_lock lock(mtx_);
        objects_[key] = bytes;
        contentTypes_[key] = contentType;
        ++uploads_;
        return publicUrl(key);
    }

    [[nodiscard]] std::string publicUrl(const std::string& key) const override {
        return "https://cdn.test/qr-codes/" + key;
    }

    [[nodiscard]] bool has(const std::string& key) const {
        std::scoped_lock lock(mtx_);
        return objects_.contains(key);
    }

    [[nodiscard]] std::vector<uint8_t> object(const std::string& key) const {
        std::scoped_lock lock(mtx_);
        return objects_.at(key);
    }

    [[nodiscard]] std::string contentType(const std::string& key) const {
        std::scoped_lock lock(mtx_);
        return contentTypes_.at(key);
    }

    [[nodiscard]] size_t uploads() const {
        std::scoped_lock lock(mtx_);
        return uploads_;
    }

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::vector<uint8_t>> objects_;
    std::map<std::string, std::string> contentTypes_;
    size_t uploads_ = 0;
};

}
