#include "pipeline/sink.hpp"
#include <cstring>
#include <filesystem>
#include <system_error>
#include <boost/log/trivial.hpp>
#include "common/error.hpp"

namespace bv {
namespace pipeline {

//==============================================
// MEMORY SINK
//==============================================

void MemorySink::prepare(uint64_t total_size) {
  buffer_.assign(total_size, 0);
  bytes_written_ = 0;
  complete_ = false;
}

void MemorySink::write_at(uint64_t offset, const uint8_t* data, std::size_t size) {
  if (offset > buffer_.size() || size > buffer_.size() - offset) {
    throw IoError("write of " + std::to_string(size) + " bytes at offset " +
                  std::to_string(offset) + " exceeds image length " +
                  std::to_string(buffer_.size()));
  }
  if (size > 0) {
    std::memcpy(buffer_.data() + offset, data, size);
  }
  bytes_written_ += size;
}

void MemorySink::finalize() {
  complete_ = true;
}

void MemorySink::abandon() {
  complete_ = false;
}


//==============================================
// STREAM SINK
//==============================================

StreamSink::StreamSink(std::ostream& out)
  : out_(out) {}

void StreamSink::prepare(uint64_t) {
  bytes_written_ = 0;
  complete_ = false;
}

void StreamSink::write_at(uint64_t offset, const uint8_t* data, std::size_t size) {
  if (offset != bytes_written_) {
    throw IoError("stream sink expected offset " + std::to_string(bytes_written_) +
                  ", got " + std::to_string(offset));
  }
  out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  if (!out_) {
    throw IoError("failed to write " + std::to_string(size) + " bytes to output stream");
  }
  bytes_written_ += size;
}

void StreamSink::finalize() {
  out_.flush();
  if (!out_) {
    throw IoError("failed to flush output stream");
  }
  complete_ = true;
}

void StreamSink::abandon() {
  complete_ = false;
}


//==============================================
// FILE SINK
//==============================================

FileSink::FileSink(const std::string& path)
  : path_(path) {
  std::error_code ec;
  block_device_ = std::filesystem::is_block_file(path_, ec);
}

FileSink::~FileSink() {
  if (file_.is_open()) {
    file_.close();
  }
}

std::string FileSink::working_path() const {
  return block_device_ ? path_ : path_ + INCOMPLETE_SUFFIX;
}

void FileSink::prepare(uint64_t total_size) {
  const std::string target = working_path();
  bytes_written_ = 0;
  complete_ = false;

  if (block_device_) {
    file_.open(target, std::ios::in | std::ios::out | std::ios::binary);
  } else {
    file_.open(target, std::ios::out | std::ios::binary | std::ios::trunc);
  }
  if (!file_.is_open()) {
    throw IoError("failed to open restore destination: " + target);
  }

  if (block_device_) {
    file_.seekp(0, std::ios::end);
    const auto capacity = static_cast<uint64_t>(file_.tellp());
    if (!file_ || capacity < total_size) {
      throw IoError("block device " + target + " is smaller than image of " +
                    std::to_string(total_size) + " bytes");
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "File sink: Writing " << total_size << " bytes to " << target;
}

void FileSink::write_at(uint64_t offset, const uint8_t* data, std::size_t size) {
  if (!file_.is_open()) {
    throw IoError("file sink written before prepare: " + path_);
  }
  file_.seekp(static_cast<std::streamoff>(offset));
  file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  if (!file_) {
    throw IoError("failed to write " + std::to_string(size) + " bytes at offset " +
                  std::to_string(offset) + " of " + working_path());
  }
  bytes_written_ += size;
}

void FileSink::finalize() {
  if (!file_.is_open()) {
    throw IoError("file sink finalized before prepare: " + path_);
  }
  file_.flush();
  if (!file_) {
    throw IoError("failed to flush " + working_path());
  }
  file_.close();

  if (!block_device_) {
    std::error_code ec;
    std::filesystem::rename(working_path(), path_, ec);
    if (ec) {
      throw IoError("failed to rename " + working_path() + " to " + path_ + ": " + ec.message());
    }
  }
  complete_ = true;
  BOOST_LOG_TRIVIAL(info) << "File sink: Restore complete at " << path_;
}

void FileSink::abandon() {
  complete_ = false;
  if (file_.is_open()) {
    file_.close();
  }
  BOOST_LOG_TRIVIAL(warning) << "File sink: Restore abandoned, partial data left at " << working_path();
}

} // namespace pipeline
} // namespace bv
