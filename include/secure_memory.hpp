#pragma once

#include <cstddef>

#include <sodium.h>

namespace wh {

inline void secureZero(void* ptr, std::size_t numBytes) {
    if (ptr == nullptr || numBytes == 0) {
        return;
    }

    sodium_memzero(ptr, numBytes);
}

inline bool constantTimeEqual(const void* a, const void* b, std::size_t numBytes) {
    return sodium_memcmp(a, b, numBytes) == 0;
}

} // namespace wh
