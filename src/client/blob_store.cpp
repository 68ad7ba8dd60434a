#include "client/blob_store.hpp"

namespace peerdrop {

void BlobStore::insert(const crypto::BlobHash& hash, std::vector<uint8_t> content) {
    std::lock_guard lock(mutex_);
    if (blobs_.contains(hash)) {
        return;
    }
    total_bytes_ += content.size();
    blobs_.emplace(hash, std::make_shared<const std::vector<uint8_t>>(std::move(content)));
}

BlobData BlobStore::get(const crypto::BlobHash& hash) const {
    std::lock_guard lock(mutex_);
    auto it = blobs_.find(hash);
    return it != blobs_.end() ? it->second : nullptr;
}

bool BlobStore::contains(const crypto::BlobHash& hash) const {
    std::lock_guard lock(mutex_);
    return blobs_.contains(hash);
}

size_t BlobStore::count() const {
    std::lock_guard lock(mutex_);
    return blobs_.size();
}

uint64_t BlobStore::total_bytes() const {
    std::lock_guard lock(mutex_);
    return total_bytes_;
}

} // namespace peerdrop
