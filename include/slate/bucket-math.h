#pragma once

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>

namespace slate {

// Size-class ladder of the GPU buffer pool:
// 64, 128, 256, 512, 1024, 2048, 4096, 8192, 16384, 32768, 65536
constexpr uint32_t POOL_BUCKET_COUNT = 11;
constexpr uint32_t POOL_MIN_BUCKET_SHIFT = 6;
constexpr size_t POOL_MIN_BUCKET_SIZE = size_t{1} << POOL_MIN_BUCKET_SHIFT;
constexpr size_t POOL_MAX_BUCKET_SIZE = POOL_MIN_BUCKET_SIZE << (POOL_BUCKET_COUNT - 1);

// Smallest power of two >= n. nextPowerOfTwo(0) == 1.
// Inputs above 2^63 saturate at 2^63.
constexpr uint64_t nextPowerOfTwo(uint64_t n) noexcept {
    constexpr uint64_t top = uint64_t{1} << 63;
    if (n > top) return top;
    return std::bit_ceil(n);
}

// floor(log2(n)); log2Floor(0) == 0.
constexpr uint32_t log2Floor(uint64_t n) noexcept {
    if (n == 0) return 0;
    return static_cast<uint32_t>(std::bit_width(n)) - 1;
}

// Bucket serving a request of `size` bytes. Requests above the top bucket
// map to the top bucket.
constexpr uint32_t bucketIndex(size_t size) noexcept {
    if (size <= POOL_MIN_BUCKET_SIZE) return 0;
    uint32_t index = log2Floor(nextPowerOfTwo(size)) - POOL_MIN_BUCKET_SHIFT;
    return std::min(index, POOL_BUCKET_COUNT - 1);
}

constexpr size_t bucketSize(uint32_t index) noexcept {
    return POOL_MIN_BUCKET_SIZE << index;
}

static_assert(bucketIndex(1) == 0);
static_assert(bucketIndex(64) == 0);
static_assert(bucketIndex(65) == 1);
static_assert(bucketIndex(65536) == POOL_BUCKET_COUNT - 1);
static_assert(bucketSize(POOL_BUCKET_COUNT - 1) == POOL_MAX_BUCKET_SIZE);

} // namespace slate
