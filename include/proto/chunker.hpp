#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

/*
TX (one attempt):
seal(plaintext) = ciphertext + tag
  -> plan_chunks(ciphertext.size(), chunk_size)
     -> ChunkCursor pulled by the transport (curl read callback, loopback host)
          -> each fully handed-over chunk: on_chunk(cumulative_bytes)
               -> bytes_sent counter -> ProgressMonitor tick
The host sees one continuous body; chunks only bound how much is handed over
per step.
*/

namespace frag
{

struct ChunkSpan
{
    std::size_t offset{0};
    std::size_t len{0};
};

// Sequential spans of chunk_size bytes; only the last one may be shorter.
// Empty when total == 0 or chunk_size == 0.
std::vector<ChunkSpan> plan_chunks(std::size_t total, std::size_t chunk_size);

using OnChunk = std::function<void(std::uint64_t cumulative_bytes)>;

// Pull-based producer over one contiguous buffer. The consumer asks for at most
// `cap` bytes at a time and never gets bytes from two chunks in one read, so
// on_chunk fires exactly once per planned chunk, in order.
class ChunkCursor
{
  public:
    ChunkCursor(const std::uint8_t *data, std::size_t len, std::size_t chunk_size, OnChunk on_chunk);

    std::size_t read(std::uint8_t *dst, std::size_t cap);

    // Return to the start (e.g. libcurl rewinding the body on a redirect).
    // on_chunk never reports a smaller cumulative count than before.
    void rewind();

    bool          done() const { return next_ >= spans_.size(); }
    std::uint64_t handed_over() const { return handed_; }
    std::size_t   total() const { return len_; }
    std::size_t   chunk_count() const { return spans_.size(); }

  private:
    const std::uint8_t    *data_;
    std::size_t            len_;
    std::vector<ChunkSpan> spans_;
    OnChunk                on_chunk_;
    std::size_t            next_{0};    // index of the chunk being handed over
    std::size_t            in_chunk_{0};  // bytes of that chunk already handed over
    std::uint64_t          handed_{0};
    std::uint64_t          reported_{0};  // high-water mark passed to on_chunk
};

}  // namespace frag
