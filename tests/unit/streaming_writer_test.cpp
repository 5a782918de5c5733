#include "internal/writer/streaming_writer.hpp"

#include <arrow/filesystem/localfs.h>

#include <cassert>
#include <filesystem>
#include <iterator>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using eventcache::model::EventRow;
using eventcache::model::RawJson;
using eventcache::model::Timestamp;
using eventcache::model::Value;
using eventcache::model::ValueKind;
using eventcache::writer::ColumnSchema;
using eventcache::writer::PartSink;
using eventcache::writer::PartStats;
using eventcache::writer::StreamingWriter;
using eventcache::writer::WriterOptions;

class RecordingSink final : public PartSink {
 public:
  PartStats WritePart(const std::string& segment_dir, uint32_t index, const std::vector<EventRow>& rows,
                      const ColumnSchema&) override {
    parts.push_back(rows);
    indexes.push_back(index);
    return PartStats{index, segment_dir + "/part-" + std::to_string(index), rows.size(), 100 * (static_cast<int64_t>(index) + 1)};
  }

  std::vector<std::vector<EventRow>> parts;
  std::vector<uint32_t>              indexes;
};

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "eventcache_streaming_writer_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

EventRow Row(int64_t ts, EventRow::Columns extra = {}) {
  extra.emplace("timestamp", ts);
  return EventRow(std::move(extra), "timestamp");
}

struct Fixture {
  std::shared_ptr<arrow::fs::FileSystem> fs     = std::make_shared<arrow::fs::LocalFileSystem>();
  std::shared_ptr<RecordingSink>         sink   = std::make_shared<RecordingSink>();
  std::shared_ptr<ColumnSchema>          schema = std::make_shared<ColumnSchema>("timestamp");
};

void TestRowThresholdBoundsTheBuffer() {
  Fixture    f;
  const auto dir = FreshDir("row_threshold") / "from=0" / "to=100";

  StreamingWriter writer(f.fs, dir.string(), WriterOptions{4, 0}, f.sink, f.schema);
  for (int64_t i = 0; i < 25; ++i) {
    writer.Append(Row(i));
    assert(writer.buffered_rows() < 4);
  }
  auto stats = writer.Finalize();

  assert(stats.rows == 25);
  assert(stats.parts == 7);
  assert(stats.peak_buffered_rows == 4);
  assert(f.sink->parts.size() == 7);
  for (size_t i = 0; i < 6; ++i) {
    assert(f.sink->parts[i].size() == 4);
  }
  assert(f.sink->parts[6].size() == 1);
  assert((f.sink->indexes == std::vector<uint32_t>{0, 1, 2, 3, 4, 5, 6}));
  assert(stats.bytes == 100 + 200 + 300 + 400 + 500 + 600 + 700);
  assert(stats.part_bytes_min == 100);
  assert(stats.part_bytes_max == 700);
  assert(stats.part_files.size() == 7);

  assert(std::filesystem::is_directory(dir));
  assert(std::filesystem::is_empty(dir));
  assert(std::distance(std::filesystem::directory_iterator(dir.parent_path()), std::filesystem::directory_iterator()) == 1);
}

void TestSegmentDirectoryAppearsWithFirstPart() {
  Fixture    f;
  const auto dir = FreshDir("lazy_directory") / "from=0" / "to=100";

  StreamingWriter writer(f.fs, dir.string(), WriterOptions{4, 0}, f.sink, f.schema);
  assert(std::filesystem::is_directory(dir.parent_path()));
  assert(std::filesystem::is_empty(dir.parent_path()));
  assert(!std::filesystem::exists(dir));

  for (int64_t i = 0; i < 3; ++i) {
    writer.Append(Row(i));
  }
  assert(!std::filesystem::exists(dir));

  writer.Append(Row(3));
  assert(f.sink->parts.size() == 1);
  assert(std::filesystem::is_directory(dir));
}

void TestAbandonedWriterLeavesNoSegment() {
  Fixture    f;
  const auto dir = FreshDir("abandoned") / "from=0" / "to=100";
  {
    StreamingWriter writer(f.fs, dir.string(), WriterOptions{4, 0}, f.sink, f.schema);
    writer.Append(Row(1));
  }
  assert(!std::filesystem::exists(dir));
  assert(f.sink->parts.empty());
}

void TestByteThreshold() {
  Fixture    f;
  const auto dir = FreshDir("byte_threshold");

  const auto row_bytes = Row(0, {{"message", std::string("payload")}}).EstimatedBytes();

  StreamingWriter writer(f.fs, dir.string(), WriterOptions{1000, 3 * row_bytes}, f.sink, f.schema);
  for (int64_t i = 0; i < 10; ++i) {
    writer.Append(Row(i, {{"message", std::string("payload")}}));
  }
  auto stats = writer.Finalize();

  assert(stats.parts == 4);
  assert(f.sink->parts[0].size() == 3);
  assert(f.sink->parts[3].size() == 1);
}

void TestColumnKindsArePinned() {
  Fixture    f;
  const auto dir = FreshDir("coercion");

  StreamingWriter writer(f.fs, dir.string(), WriterOptions{100, 0}, f.sink, f.schema);
  writer.Append(Row(1, {{"n", int64_t{5}}, {"d", 1.5}, {"s", std::string("text")}, {"b", true}}));
  writer.Append(Row(2, {{"n", 2.5}, {"d", int64_t{2}}, {"s", RawJson{R"({"k":1})"}}, {"b", std::string("x")}}));
  writer.Append(Row(3, {{"n", 7.0}, {"late", Value{}}}));
  writer.Finalize();

  assert(f.sink->parts.size() == 1);
  const auto& rows = f.sink->parts[0];

  assert(std::get<int64_t>(*rows[0].Find("n")) == 5);
  assert(eventcache::model::KindOf(*rows[1].Find("n")) == ValueKind::kNull);
  assert(std::get<int64_t>(*rows[2].Find("n")) == 7);
  assert(std::get<double>(*rows[1].Find("d")) == 2.0);
  assert(std::get<std::string>(*rows[1].Find("s")) == R"({"k":1})");
  assert(eventcache::model::KindOf(*rows[1].Find("b")) == ValueKind::kNull);
  assert(std::get<Timestamp>(*rows[2].Find("timestamp")).millis == 3);

  assert(f.schema->type_conflicts() == 2);
  assert(f.schema->KindOf("n") == ValueKind::kInt64);
  assert(f.schema->KindOf("d") == ValueKind::kDouble);
  assert(f.schema->KindOf("timestamp") == ValueKind::kTimestamp);
  assert(!f.schema->KindOf("late"));
}

void TestPinnedKindsComeBeforeRows() {
  ColumnSchema schema("timestamp");

  assert(schema.Pin("n", ValueKind::kInt64));
  assert(schema.Pin("n", ValueKind::kInt64));
  assert(schema.Pin("w", ValueKind::kInt64));
  assert(schema.Pin("w", ValueKind::kDouble));
  assert(schema.Pin("s", ValueKind::kString));
  assert(schema.Pin("s", ValueKind::kRaw));
  assert(schema.Pin("none", ValueKind::kNull));
  assert(!schema.Pin("n", ValueKind::kString));

  assert(schema.KindOf("n") == ValueKind::kInt64);
  assert(schema.KindOf("w") == ValueKind::kDouble);
  assert(schema.KindOf("s") == ValueKind::kString);
  assert(!schema.KindOf("none"));

  // Rows are coerced to the pins, not the other way round.
  auto row = schema.Admit(Row(1, {{"n", std::string("text")}, {"w", int64_t{3}}}));
  assert(eventcache::model::KindOf(*row.Find("n")) == ValueKind::kNull);
  assert(std::get<double>(*row.Find("w")) == 3.0);
  assert(schema.type_conflicts() == 1);
}

void TestEmptySegmentFinalizes() {
  Fixture    f;
  const auto dir = FreshDir("empty") / "from=0" / "to=1";

  StreamingWriter writer(f.fs, dir.string(), WriterOptions{}, f.sink, f.schema);
  auto            stats = writer.Finalize();

  assert(stats.rows == 0 && stats.parts == 0);
  assert(!stats.part_bytes_min && !stats.part_bytes_max);
  assert(f.sink->parts.empty());
  assert(std::filesystem::is_directory(dir));

  bool threw = false;
  try {
    writer.Finalize();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    writer.Append(Row(1));
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void TestUnwritableDirectory() {
  Fixture    f;
  const auto base = FreshDir("unwritable");
  {
    std::ofstream blocker(base / "blocker");
    blocker << "not a directory";
  }

  bool threw = false;
  try {
    StreamingWriter writer(f.fs, (base / "blocker" / "from=0" / "to=1").string(), WriterOptions{}, f.sink, f.schema);
  } catch (const eventcache::util::WriteError&) {
    threw = true;
  }
  assert(threw);
}

void TestZeroFlushRowsIsRejected() {
  Fixture f;
  bool    threw = false;
  try {
    StreamingWriter writer(f.fs, FreshDir("zero_rows").string(), WriterOptions{0, 0}, f.sink, f.schema);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRowThresholdBoundsTheBuffer();
  TestSegmentDirectoryAppearsWithFirstPart();
  TestAbandonedWriterLeavesNoSegment();
  TestByteThreshold();
  TestColumnKindsArePinned();
  TestPinnedKindsComeBeforeRows();
  TestEmptySegmentFinalizes();
  TestUnwritableDirectory();
  TestZeroFlushRowsIsRejected();

  std::cout << "eventcache_unit_streaming_writer: pass\n";
  return 0;
}
