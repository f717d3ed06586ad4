// merge_types.cpp
#include "engine/merge_types.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace aiomerge::engine
{

RawImage::RawImage(std::vector<uint8_t> bytes, std::string label)
    : m_storage(std::make_shared<const std::vector<uint8_t>>(std::move(bytes))),
      m_offset(0),
      m_length(m_storage->size()),
      m_label(std::move(label))
{
}

RawImage RawImage::slice(size_t offset, size_t length) const
{
    if (offset > m_length || length > m_length - offset)
    {
        throw std::out_of_range(fmt::format("RawImage::slice [{}, +{}) outside image of {} bytes",
                                            offset, length, m_length));
    }
    RawImage view = *this;
    view.m_offset = m_offset + offset;
    view.m_length = length;
    return view;
}

RawImage RawImage::tail_from(size_t offset) const
{
    if (offset > m_length)
    {
        throw std::out_of_range(
            fmt::format("RawImage::tail_from {} beyond image of {} bytes", offset, m_length));
    }
    return slice(offset, m_length - offset);
}

std::span<const uint8_t> RawImage::bytes() const noexcept
{
    if (!m_storage)
        return {};
    return std::span<const uint8_t>(m_storage->data() + m_offset, m_length);
}

} // namespace aiomerge::engine
