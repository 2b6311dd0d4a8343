#include "chunker/chunker.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>

namespace bv {
namespace chunker {

Chunker::Chunker(std::istream& source, uint64_t chunk_size)
  : source_(source)
  , chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Chunk size must be greater than zero";
    throw ConfigError("Chunker: chunk size must be greater than zero");
  }
  if (source_.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Source stream is unusable";
    throw IoError("Chunker: source stream is unusable");
  }
  BOOST_LOG_TRIVIAL(debug) << "Chunker: Created with chunk size " << chunk_size_;
}

bool Chunker::next(Chunk& chunk) {
  if (exhausted_) {
    return false;
  }

  Bytes buffer(chunk_size_);
  std::size_t filled = 0;

  // A single read may return less than requested on pipes and devices, keep
  // reading until the chunk is full or the stream ends
  while (filled < chunk_size_) {
    source_.read(reinterpret_cast<char*>(buffer.data() + filled),
                 static_cast<std::streamsize>(chunk_size_ - filled));
    auto got = source_.gcount();
    filled += static_cast<std::size_t>(got);

    if (source_.bad()) {
      BOOST_LOG_TRIVIAL(error) << "Chunker: Read failed at offset " << bytes_read_ + filled;
      throw IoError("Chunker: read failed at offset " + std::to_string(bytes_read_ + filled));
    }
    if (source_.eof()) {
      exhausted_ = true;
      break;
    }
    if (got == 0) {
      // failbit without eof means the stream refused to read
      BOOST_LOG_TRIVIAL(error) << "Chunker: Source stopped producing data at offset " << bytes_read_ + filled;
      throw IoError("Chunker: source stopped producing data at offset " +
                    std::to_string(bytes_read_ + filled));
    }
  }

  if (filled == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Chunker: End of source after " << next_index_ << " chunks";
    return false;
  }

  buffer.resize(filled);
  chunk.index = next_index_++;
  chunk.data = std::move(buffer);
  bytes_read_ += filled;

  BOOST_LOG_TRIVIAL(trace) << "Chunker: Produced chunk " << chunk.index << " of " << filled << " bytes";
  return true;
}

} // namespace chunker
} // namespace bv
