#pragma once
/**
 * @file uid_utils.hpp
 * @brief Utilities for generating and validating kanbanhub identifiers.
 *
 * ## Formats
 *
 *   Entity:      {UUIDv4}           e.g. "3f2b1c0e-9a7d-4e51-8c2a-1d4b5e6f7a80"
 *   Transaction: tx-{UUIDv4}        e.g. "tx-3f2b1c0e-9a7d-4e51-8c2a-1d4b5e6f7a80"
 *
 * Entity ids (boards, columns, tasks, tags, notes, dependencies) are plain RFC 4122
 * version-4 UUIDs, matching what the store has always held.
 *
 * Transaction ids carry a "tx-" prefix so they are recognisable in log lines. They are
 * keys into the in-memory transaction registry and must never collide between
 * concurrent transactions; 122 random bits make that negligible.
 *
 * Randomness comes from a per-thread std::mt19937_64 seeded from std::random_device,
 * falling back to a high-res-clock + thread-id mix on platforms where entropy() == 0.
 */

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <random>
#include <string>
#include <string_view>
#include <thread>

namespace kanbanhub::uid
{

namespace detail
{

/// Returns a seed for the per-thread generator.
inline uint64_t make_seed()
{
    std::random_device rd;
    if (rd.entropy() > 0.0)
    {
        return (static_cast<uint64_t>(rd()) << 32U) ^ static_cast<uint64_t>(rd());
    }
    // Fallback: mix high-res timestamp with the thread id.
    const auto ns = static_cast<uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>()(std::this_thread::get_id()));
    // Knuth multiplicative hash step (good avalanche)
    return (ns ^ (ns >> 17U) ^ tid) * 2654435761ULL;
}

/// Returns 64 random bits from the calling thread's generator.
inline uint64_t random_u64()
{
    thread_local std::mt19937_64 engine{make_seed()};
    return engine();
}

} // namespace detail

// ---------------------------------------------------------------------------
// Public generators
// ---------------------------------------------------------------------------

/**
 * @brief Generate an RFC 4122 version-4 UUID string (lowercase hex, 36 chars).
 */
inline std::string generate_uuid()
{
    uint64_t hi = detail::random_u64();
    uint64_t lo = detail::random_u64();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32U), static_cast<unsigned>((hi >> 16U) & 0xFFFFU),
                  static_cast<unsigned>(hi & 0xFFFFU), static_cast<unsigned>(lo >> 48U),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf, 36);
}

/**
 * @brief Generate a transaction id: @c "tx-{UUIDv4}".
 */
inline std::string generate_transaction_id()
{
    return "tx-" + generate_uuid();
}

// ---------------------------------------------------------------------------
// Validators
// ---------------------------------------------------------------------------

/// True if @p id has the 8-4-4-4-12 lowercase-hex UUID shape.
inline bool is_uuid(std::string_view id) noexcept
{
    if (id.size() != 36U)
    {
        return false;
    }
    for (std::size_t i = 0; i < id.size(); ++i)
    {
        const char c = id[i];
        if (i == 8 || i == 13 || i == 18 || i == 23)
        {
            if (c != '-')
            {
                return false;
            }
        }
        else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
        {
            return false;
        }
    }
    return true;
}

/// True if @p id starts with @c "tx-" followed by a UUID.
inline bool has_transaction_prefix(std::string_view id) noexcept
{
    return id.size() == 39U && id.substr(0, 3) == "tx-" && is_uuid(id.substr(3));
}

} // namespace kanbanhub::uid
