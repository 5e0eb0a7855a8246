#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace duochat::chat {

// Message ids: prefixed ULIDs ("msg-01J..."). Ids sort by creation time and
// stay monotonic for bursts inside one millisecond, so they are predictable
// and must not be used as secrets. Thread-safe.
class IDGenerator {
public:
    IDGenerator()
        : rng_(seed_engine_()) {}

    IDGenerator(const IDGenerator&) = delete;
    IDGenerator& operator=(const IDGenerator&) = delete;

    std::string messageID() { return "msg-" + ulid_string_(); }

private:
    using u128 = unsigned __int128;
    using Bytes = std::array<std::uint8_t, 16>;

    std::string ulid_string_() {
        Bytes bytes{};
        const std::uint64_t ts_ms = now_ms_();

        // 48-bit big-endian timestamp in bytes[0..5]
        for (int i = 0; i < 6; ++i) {
            bytes[static_cast<std::size_t>(i)] =
                static_cast<std::uint8_t>((ts_ms >> (8 * (5 - i))) & 0xFF);
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts_ms != last_ts_ms_) {
                last_rand_ = random_80_();
                last_ts_ms_ = ts_ms;
            } else {
                ++last_rand_;
            }
            write_rand_80_(bytes, last_rand_);
        }

        return crockford_base32_(bytes);
    }

    static std::uint64_t now_ms_() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    // caller holds mu_
    u128 random_80_() {
        const std::uint64_t hi = dist64_(rng_);
        const std::uint64_t lo = dist64_(rng_);
        return (static_cast<u128>(hi) << 16) | (lo >> 48);
    }

    static void write_rand_80_(Bytes& bytes, u128 rand80) {
        for (int i = 15; i >= 6; --i) {
            bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(rand80 & 0xFF);
            rand80 >>= 8;
        }
    }

    // 128 bits -> 26 chars of Crockford base32 (no I, L, O, U).
    static std::string crockford_base32_(const Bytes& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        u128 value = 0;
        for (std::uint8_t b : bytes) value = (value << 8) | b;

        std::string out(26, '0');
        for (int i = 25; i >= 0; --i) {
            out[static_cast<std::size_t>(i)] = alphabet[static_cast<std::size_t>(value & 0x1F)];
            value >>= 5;
        }
        return out;
    }

    static std::mt19937_64 seed_engine_() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count())
        };
        return std::mt19937_64(seq);
    }

private:
    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::uint64_t> dist64_{0, ~std::uint64_t(0)};

    std::mutex mu_;
    std::uint64_t last_ts_ms_ = 0;
    u128 last_rand_ = 0;
};

} // namespace duochat::chat
