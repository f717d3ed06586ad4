// header_detector.cpp
#include "engine/header_detector.hpp"
#include "engine/header_codec.hpp"
#include "utils/byte_order.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace aiomerge::engine
{

MergeResult<RawImage> extract_clean_payload(const RawImage &base)
{
    const auto bytes = base.bytes();
    if (!has_aio_magic(bytes))
    {
        LOGGER_DEBUG("base '{}': no AIO header, using all {} bytes as payload", base.label(),
                     bytes.size());
        return MergeResult<RawImage>::ok(base);
    }

    constexpr size_t kFieldEnd = summary_field::kHeaderSize + 2;
    if (bytes.size() < kFieldEnd)
    {
        return MergeResult<RawImage>::error(MergeFailure{
            MergeError::MalformedHeader,
            fmt::format("base '{}' carries the AIO magic but is only {} bytes long; "
                        "the header size field needs {}",
                        base.label(), bytes.size(), kFieldEnd),
            0, std::nullopt, std::nullopt});
    }

    const uint16_t header_size = utils::load_le_u16(bytes.data(), summary_field::kHeaderSize);
    if (header_size < kAioMagic.size() || header_size > bytes.size())
    {
        return MergeResult<RawImage>::error(MergeFailure{
            MergeError::MalformedHeader,
            fmt::format("base '{}' declares header size 0x{:X} outside [0x4, 0x{:X}]", base.label(),
                        header_size, bytes.size()),
            0, std::nullopt, header_size});
    }

    LOGGER_INFO("base '{}' is already packaged; stripping 0x{:X}-byte header, {} payload bytes remain",
                base.label(), header_size, bytes.size() - header_size);
    return MergeResult<RawImage>::ok(base.tail_from(header_size));
}

} // namespace aiomerge::engine
