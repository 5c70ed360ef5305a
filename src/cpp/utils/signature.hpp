#pragma once
// MurmurHash3 (x64, 128-bit variant) -- Pure C++ implementation for
// statement and plan signatures. Only the first 64-bit half is used.
#include <cstdint>
#include <cstring>
#include <cstdio>
#include <string>

namespace harvest {

class Murmur3 {
public:
    struct Hash128 {
        uint64_t h1;
        uint64_t h2;
    };

    static Hash128 hash128(const void* data, size_t len, uint64_t seed = 0) noexcept {
        const auto* bytes = static_cast<const uint8_t*>(data);
        const size_t nblocks = len / 16;

        uint64_t h1 = seed;
        uint64_t h2 = seed;

        for (size_t i = 0; i < nblocks; ++i) {
            uint64_t k1 = load64(bytes + i * 16);
            uint64_t k2 = load64(bytes + i * 16 + 8);

            k1 *= C1; k1 = rotl(k1, 31); k1 *= C2; h1 ^= k1;
            h1 = rotl(h1, 27); h1 += h2; h1 = h1 * 5 + 0x52dce729;

            k2 *= C2; k2 = rotl(k2, 33); k2 *= C1; h2 ^= k2;
            h2 = rotl(h2, 31); h2 += h1; h2 = h2 * 5 + 0x38495ab5;
        }

        // Tail: up to 15 remaining bytes
        const uint8_t* tail = bytes + nblocks * 16;
        const size_t rem = len & 15;
        uint64_t k1 = 0;
        uint64_t k2 = 0;

        for (size_t i = rem; i > 8; --i) {
            k2 ^= static_cast<uint64_t>(tail[i - 1]) << ((i - 9) * 8);
        }
        if (rem > 8) {
            k2 *= C2; k2 = rotl(k2, 33); k2 *= C1; h2 ^= k2;
        }
        for (size_t i = (rem > 8 ? 8 : rem); i > 0; --i) {
            k1 ^= static_cast<uint64_t>(tail[i - 1]) << ((i - 1) * 8);
        }
        if (rem > 0) {
            k1 *= C1; k1 = rotl(k1, 31); k1 *= C2; h1 ^= k1;
        }

        h1 ^= static_cast<uint64_t>(len);
        h2 ^= static_cast<uint64_t>(len);
        h1 += h2;
        h2 += h1;
        h1 = fmix(h1);
        h2 = fmix(h2);
        h1 += h2;
        h2 += h1;
        return {h1, h2};
    }

    static uint64_t hash64(const std::string& s, uint64_t seed = 0) noexcept {
        return hash128(s.data(), s.size(), seed).h1;
    }

    // 16 lowercase hex digits
    static std::string hash64_hex(const std::string& s) {
        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx",
            static_cast<unsigned long long>(hash64(s)));
        return buf;
    }

private:
    static constexpr uint64_t C1 = 0x87c37b91114253d5ULL;
    static constexpr uint64_t C2 = 0x4cf5ad432745937fULL;

    static uint64_t rotl(uint64_t x, int r) noexcept {
        return (x << r) | (x >> (64 - r));
    }

    static uint64_t load64(const uint8_t* p) noexcept {
        uint64_t v;
        std::memcpy(&v, p, sizeof(v));  // little-endian hosts only
        return v;
    }

    static uint64_t fmix(uint64_t k) noexcept {
        k ^= k >> 33;
        k *= 0xff51afd7ed558ccdULL;
        k ^= k >> 33;
        k *= 0xc4ceb9fe1a85ec53ULL;
        k ^= k >> 33;
        return k;
    }
};

} // namespace harvest
