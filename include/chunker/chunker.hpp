#ifndef BV_CHUNKER_HPP
#define BV_CHUNKER_HPP

#include <cstdint>
#include <istream>
#include "common/types.hpp"

namespace bv {
namespace chunker {

// One fixed-size slice of the source image, at offset index * chunk_size
struct Chunk {
  uint64_t index = 0;
  Bytes data;

  std::size_t size() const { return data.size(); }
};

// Splits a sequential byte stream into numbered chunks. The sequence is lazy,
// finite and can only be walked once.
class Chunker {
public:
  // ---- CONSTRUCTOR ----
  // Throws ConfigError if chunk_size is zero
  Chunker(std::istream& source, uint64_t chunk_size);


  // ---- ITERATION ----
  // Fills chunk with the next slice. Returns false once the source is
  // exhausted. Throws IoError if the stream reports a read failure.
  bool next(Chunk& chunk);


  // ---- GETTERS ----
  uint64_t chunk_size() const { return chunk_size_; }
  uint64_t bytes_read() const { return bytes_read_; }
  uint64_t chunks_produced() const { return next_index_; }

private:
  std::istream& source_;
  uint64_t chunk_size_;
  uint64_t next_index_ = 0;
  uint64_t bytes_read_ = 0;
  bool exhausted_ = false;
};

} // namespace chunker
} // namespace bv

#endif // BV_CHUNKER_HPP
