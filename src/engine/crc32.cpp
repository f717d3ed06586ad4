// crc32.cpp
#include "engine/crc32.hpp"
#include "utils/logger.hpp"

#include <array>
#include <future>

namespace aiomerge::engine
{

namespace
{

constexpr std::array<uint32_t, 256> make_crc32_table() noexcept
{
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i)
    {
        uint32_t c = i;
        for (int bit = 0; bit < 8; ++bit)
            c = (c & 1u) ? (kCrc32Polynomial ^ (c >> 1)) : (c >> 1);
        table[i] = c;
    }
    return table;
}

constexpr std::array<uint32_t, 256> kCrc32Table = make_crc32_table();

static_assert(kCrc32Table[1] == 0x77073096u, "CRC-32 table generated with the wrong polynomial");

} // namespace

void Crc32::update(std::span<const uint8_t> data) noexcept
{
    uint32_t c = m_state;
    for (uint8_t b : data)
        c = kCrc32Table[(c ^ b) & 0xFFu] ^ (c >> 8);
    m_state = c;
}

uint32_t crc32(std::span<const uint8_t> data) noexcept
{
    Crc32 crc;
    crc.update(data);
    return crc.value();
}

std::vector<uint32_t> compute_entry_checksums(const LayoutPlan &plan, bool parallel)
{
    std::vector<uint32_t> checksums(plan.entries.size(), 0);

    if (!parallel || plan.entries.size() < 2)
    {
        for (size_t i = 0; i < plan.entries.size(); ++i)
            checksums[i] = crc32(plan.entries[i].image.bytes());
    }
    else
    {
        std::vector<std::future<uint32_t>> pending;
        pending.reserve(plan.entries.size());
        for (const auto &entry : plan.entries)
        {
            pending.push_back(std::async(std::launch::async,
                                         [bytes = entry.image.bytes()]() { return crc32(bytes); }));
        }
        for (size_t i = 0; i < pending.size(); ++i)
            checksums[i] = pending[i].get();
    }

    for (size_t i = 0; i < checksums.size(); ++i)
    {
        LOGGER_TRACE("crc32 entry #{} ({} bytes) = 0x{:08X}", plan.entries[i].input_index,
                     plan.entries[i].size, checksums[i]);
    }
    return checksums;
}

} // namespace aiomerge::engine
