// assembler.cpp
#include "engine/assembler.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace aiomerge::engine
{

std::vector<uint8_t> assemble_image(std::span<const uint8_t> header, const LayoutPlan &plan)
{
    if (header.size() != plan.total_header_size)
    {
        throw std::invalid_argument(fmt::format("assemble_image: header is {} bytes, plan expects {}",
                                                header.size(), plan.total_header_size));
    }

    std::vector<uint8_t> out(plan.total_output_size, 0x00);
    std::copy(header.begin(), header.end(), out.begin());

    uint64_t covered = 0;
    for (const auto &entry : plan.entries)
    {
        if (entry.end() > out.size() || entry.absolute_offset < plan.total_header_size)
        {
            throw std::invalid_argument(
                fmt::format("assemble_image: entry #{} [0x{:X}, 0x{:X}) outside payload region",
                            entry.input_index, entry.absolute_offset, entry.end()));
        }
        const auto payload = entry.image.bytes();
        std::copy(payload.begin(), payload.end(), out.begin() + entry.absolute_offset);
        covered += payload.size();
    }

    LOGGER_DEBUG("assembled 0x{:X} bytes: header 0x{:X}, payload {}, zero fill {}", out.size(),
                 header.size(), covered, out.size() - header.size() - covered);
    return out;
}

} // namespace aiomerge::engine
