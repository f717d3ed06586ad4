#pragma once
/**
 * @file crc32.hpp
 * @brief CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320).
 *
 * Initial value 0xFFFFFFFF, final XOR 0xFFFFFFFF. The empty range yields
 * 0x00000000 and "123456789" yields 0xCBF43926.
 */
#include <cstdint>
#include <span>
#include <vector>

#include "aiomerge_export.h"
#include "engine/merge_types.hpp"

namespace aiomerge::engine
{

inline constexpr uint32_t kCrc32Polynomial = 0xEDB88320u;

/**
 * @class Crc32
 * @brief Incremental CRC-32 accumulator.
 *
 * @code
 *   Crc32 crc;
 *   crc.update(first_chunk);
 *   crc.update(second_chunk);
 *   uint32_t v = crc.value();
 * @endcode
 */
class AIOMERGE_EXPORT Crc32
{
  public:
    void update(std::span<const uint8_t> data) noexcept;
    [[nodiscard]] uint32_t value() const noexcept { return m_state ^ 0xFFFFFFFFu; }
    void reset() noexcept { m_state = 0xFFFFFFFFu; }

  private:
    uint32_t m_state{0xFFFFFFFFu};
};

/** @brief One-shot CRC-32 of a byte range. */
AIOMERGE_EXPORT uint32_t crc32(std::span<const uint8_t> data) noexcept;

/**
 * @brief CRC-32 of every placed entry's own payload, in plan order.
 *
 * With @p parallel set, entries are checksummed concurrently with std::async.
 * Payloads are immutable and disjoint, so no synchronization is needed.
 */
AIOMERGE_EXPORT std::vector<uint32_t> compute_entry_checksums(const LayoutPlan &plan,
                                                              bool parallel = false);

} // namespace aiomerge::engine
