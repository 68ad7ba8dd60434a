#pragma once

#include "common/crypto.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace peerdrop {

using BlobData = std::shared_ptr<const std::vector<uint8_t>>;

/**
 * BlobStore - in-memory content-addressed blob storage.
 *
 * Holds the blobs this node publishes, keyed by their BLAKE2b-256 hash and
 * shared read-only with the serving coroutines. Nothing is persisted.
 */
class BlobStore {
public:
    // Store content under a hash the caller computed; a known hash keeps the first copy
    void insert(const crypto::BlobHash& hash, std::vector<uint8_t> content);

    // nullptr when unknown
    BlobData get(const crypto::BlobHash& hash) const;

    bool contains(const crypto::BlobHash& hash) const;
    size_t count() const;
    uint64_t total_bytes() const;

private:
    mutable std::mutex mutex_;
    std::map<crypto::BlobHash, BlobData> blobs_;
    uint64_t total_bytes_ = 0;
};

} // namespace peerdrop
