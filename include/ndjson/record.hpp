#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <vector>

#include "ndjson/value.hpp"

namespace nj {

// One value flowing through the pipeline and its zero-based offset.
struct Record {
  std::int64_t offset = 0;
  Value value;
};

// Lazy, single-pass sequence of records. Each read_next() advances exactly
// one step; errors for a record surface when that record is pulled.
class RecordReader {
public:
  using Callback = std::function<void(const Record&)>;

  virtual ~RecordReader() = default;

  // False once the sequence is exhausted.
  virtual bool read_next(Record& out) = 0;

  void for_each(const Callback& cb);
};

using RecordReaderPtr = std::unique_ptr<RecordReader>;
using RecordFn = std::function<Value(Value, std::int64_t)>;
using RecordPredicate = std::function<bool(const Record&)>;

// Offsets 0..n-1.
RecordReaderPtr from_values(std::vector<Value> values);

// Decorators; each keeps the inner offsets.
RecordReaderPtr map_records(RecordReaderPtr inner, RecordFn fn);
RecordReaderPtr filter_records(RecordReaderPtr inner, RecordPredicate keep);
RecordReaderPtr prepend_record(Record first, RecordReaderPtr inner);

// Lookahead over a reader. Records pulled by peek() are buffered and
// replayed by read_next(), so no record is lost and the source is never
// rewound.
class PeekReader : public RecordReader {
public:
  explicit PeekReader(RecordReaderPtr inner) : inner_(std::move(inner)) {}

  // Record `position` steps ahead of the read cursor; false if the
  // sequence ends before it.
  bool peek(std::size_t position, Record& out);
  bool read_next(Record& out) override;

private:
  RecordReaderPtr inner_;
  std::deque<Record> ahead_;
};

std::vector<Record> collect(RecordReader& reader);
std::vector<Value> collect_values(RecordReader& reader);

}
