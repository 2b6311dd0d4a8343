#ifndef BV_PIPELINE_SINK_HPP
#define BV_PIPELINE_SINK_HPP

#include <cstdint>
#include <fstream>
#include <ostream>
#include <string>
#include "common/types.hpp"

namespace bv {
namespace pipeline {

// Destination of a restore. Writes arrive in ascending offset order from a
// single thread. A sink is complete only after finalize() succeeded.
class Sink {
public:
  virtual ~Sink() = default;

  // Called once before the first write with the final image length
  virtual void prepare(uint64_t total_size) = 0;
  // Throws IoError if the bytes cannot be written at offset
  virtual void write_at(uint64_t offset, const uint8_t* data, std::size_t size) = 0;
  virtual void finalize() = 0;
  // Marks the restore as failed, must not throw
  virtual void abandon() = 0;

  virtual bool complete() const = 0;
  virtual uint64_t bytes_written() const = 0;
};


// Restores into a byte buffer
class MemorySink : public Sink {
public:
  void prepare(uint64_t total_size) override;
  void write_at(uint64_t offset, const uint8_t* data, std::size_t size) override;
  void finalize() override;
  void abandon() override;

  bool complete() const override { return complete_; }
  uint64_t bytes_written() const override { return bytes_written_; }
  const Bytes& data() const { return buffer_; }

private:
  Bytes buffer_;
  uint64_t bytes_written_ = 0;
  bool complete_ = false;
};


// Restores into a sequential stream, offsets must follow each other
class StreamSink : public Sink {
public:
  explicit StreamSink(std::ostream& out);

  void prepare(uint64_t total_size) override;
  void write_at(uint64_t offset, const uint8_t* data, std::size_t size) override;
  void finalize() override;
  void abandon() override;

  bool complete() const override { return complete_; }
  uint64_t bytes_written() const override { return bytes_written_; }

private:
  std::ostream& out_;
  uint64_t bytes_written_ = 0;
  bool complete_ = false;
};


// Restores into a file or block device. A regular file is assembled at
// <path>.incomplete and renamed to <path> by finalize(); a failed restore
// leaves only the .incomplete file. Block devices are written in place.
class FileSink : public Sink {
public:
  static constexpr const char* INCOMPLETE_SUFFIX = ".incomplete";

  explicit FileSink(const std::string& path);
  ~FileSink() override;

  void prepare(uint64_t total_size) override;
  void write_at(uint64_t offset, const uint8_t* data, std::size_t size) override;
  void finalize() override;
  void abandon() override;

  bool complete() const override { return complete_; }
  uint64_t bytes_written() const override { return bytes_written_; }

  const std::string& path() const { return path_; }
  // Where bytes go until finalize()
  std::string working_path() const;
  bool is_block_device() const { return block_device_; }

private:
  std::string path_;
  std::fstream file_;
  bool block_device_ = false;
  uint64_t bytes_written_ = 0;
  bool complete_ = false;
};

} // namespace pipeline
} // namespace bv

#endif // BV_PIPELINE_SINK_HPP
