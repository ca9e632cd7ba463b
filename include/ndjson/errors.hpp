#pragma once
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "ndjson/value.hpp"

namespace nj {

// Root of every error raised by the library.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Misconfiguration: bad flags/depth/chunk size, bad path, bad header.
class InvalidArgument : public Error {
public:
  using Error::Error;
};

// Byte-source failure (seek on a pipe, failed write, ...).
class StreamError : public Error {
public:
  using Error::Error;
};

// Failure attributed to a single record: the offending value, its offset
// in the stream and the underlying cause (may be null).
class RecordError : public Error {
public:
  RecordError(const std::string& msg, Value value, std::int64_t offset,
              std::exception_ptr cause = nullptr)
      : Error(msg), value_(std::move(value)), offset_(offset), cause_(std::move(cause)) {}

  const Value& value() const noexcept { return value_; }
  std::int64_t offset() const noexcept { return offset_; }
  std::exception_ptr cause() const noexcept { return cause_; }

  // Rethrow the underlying cause; no-op when there is none.
  void rethrow_cause() const {
    if (cause_) std::rethrow_exception(cause_);
  }

private:
  Value value_;
  std::int64_t offset_;
  std::exception_ptr cause_;
};

class DecodingFailed : public RecordError {
public:
  using RecordError::RecordError;
};

class EncodingFailed : public RecordError {
public:
  using RecordError::RecordError;
};

}
