#include <algorithm>
#include <cstring>
#include <utility>

#include "proto/chunker.hpp"
#include "util/log.hpp"

namespace frag
{

std::vector<ChunkSpan> plan_chunks(std::size_t total, std::size_t chunk_size)
{
    std::vector<ChunkSpan> out;
    if (chunk_size == 0)
    {
        LOG_ERROR("plan_chunks: invalid chunk_size (0)");
        return out;
    }
    if (total == 0)
        return out;

    const std::size_t num_chunks = (total + chunk_size - 1) / chunk_size;
    out.reserve(num_chunks);
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        const std::size_t start = i * chunk_size;
        out.push_back({start, std::min(chunk_size, total - start)});
    }
    return out;
}

ChunkCursor::ChunkCursor(const std::uint8_t *data,
                         std::size_t         len,
                         std::size_t         chunk_size,
                         OnChunk             on_chunk)
    : data_(data), len_(len), spans_(plan_chunks(len, chunk_size)), on_chunk_(std::move(on_chunk))
{
}

std::size_t ChunkCursor::read(std::uint8_t *dst, std::size_t cap)
{
    if (done() || cap == 0)
        return 0;

    const ChunkSpan  &span = spans_[next_];
    const std::size_t take = std::min(cap, span.len - in_chunk_);
    std::memcpy(dst, data_ + span.offset + in_chunk_, take);
    in_chunk_ += take;

    if (in_chunk_ == span.len)
    {
        // whole chunk is with the transport now
        handed_ += span.len;
        next_++;
        in_chunk_ = 0;
        // after a rewind, stay quiet until we pass what was already reported
        if (handed_ > reported_)
        {
            reported_ = handed_;
            if (on_chunk_)
                on_chunk_(handed_);
        }
    }
    return take;
}

void ChunkCursor::rewind()
{
    LOG_DEBUG("ChunkCursor::rewind: restarting body at 0 (had %llu bytes out)",
              static_cast<unsigned long long>(handed_));
    next_     = 0;
    in_chunk_ = 0;
    handed_   = 0;
}

}  // namespace frag
