#include "ndjson/record.hpp"

#include <utility>

namespace nj {

void RecordReader::for_each(const Callback& cb) {
  Record r;
  while (read_next(r)) cb(r);
}

struct VectorReader : RecordReader {
  std::vector<Value> values;
  std::size_t pos{0};

  explicit VectorReader(std::vector<Value> v) : values(std::move(v)) {}

  bool read_next(Record& out) override {
    if (pos >= values.size()) return false;
    out.offset = static_cast<std::int64_t>(pos);
    out.value = std::move(values[pos]);
    ++pos;
    return true;
  }
};

struct MapReader : RecordReader {
  RecordReaderPtr inner;
  RecordFn fn;

  MapReader(RecordReaderPtr i, RecordFn f) : inner(std::move(i)), fn(std::move(f)) {}

  bool read_next(Record& out) override {
    if (!inner->read_next(out)) return false;
    out.value = fn(std::move(out.value), out.offset);
    return true;
  }
};

struct FilterReader : RecordReader {
  RecordReaderPtr inner;
  RecordPredicate keep;

  FilterReader(RecordReaderPtr i, RecordPredicate k) : inner(std::move(i)), keep(std::move(k)) {}

  bool read_next(Record& out) override {
    while (inner->read_next(out)) {
      if (keep(out)) return true;
    }
    return false;
  }
};

struct PrependReader : RecordReader {
  Record first;
  bool first_sent{false};
  RecordReaderPtr inner;

  PrependReader(Record f, RecordReaderPtr i) : first(std::move(f)), inner(std::move(i)) {}

  bool read_next(Record& out) override {
    if (!first_sent) {
      first_sent = true;
      out = std::move(first);
      return true;
    }
    return inner->read_next(out);
  }
};

RecordReaderPtr from_values(std::vector<Value> values) {
  return std::make_unique<VectorReader>(std::move(values));
}

RecordReaderPtr map_records(RecordReaderPtr inner, RecordFn fn) {
  return std::make_unique<MapReader>(std::move(inner), std::move(fn));
}

RecordReaderPtr filter_records(RecordReaderPtr inner, RecordPredicate keep) {
  return std::make_unique<FilterReader>(std::move(inner), std::move(keep));
}

RecordReaderPtr prepend_record(Record first, RecordReaderPtr inner) {
  return std::make_unique<PrependReader>(std::move(first), std::move(inner));
}

bool PeekReader::peek(std::size_t position, Record& out) {
  while (ahead_.size() <= position) {
    Record r;
    if (!inner_->read_next(r)) return false;
    ahead_.push_back(std::move(r));
  }
  out = ahead_[position];
  return true;
}

bool PeekReader::read_next(Record& out) {
  if (!ahead_.empty()) {
    out = std::move(ahead_.front());
    ahead_.pop_front();
    return true;
  }
  return inner_->read_next(out);
}

std::vector<Record> collect(RecordReader& reader) {
  std::vector<Record> out;
  Record r;
  while (reader.read_next(r)) out.push_back(std::move(r));
  return out;
}

std::vector<Value> collect_values(RecordReader& reader) {
  std::vector<Value> out;
  Record r;
  while (reader.read_next(r)) out.push_back(std::move(r.value));
  return out;
}

}
