#include "pltx/core/errors.hpp"
#include "pltx/data/pltx_reader.hpp"
#include "pltx/data/signal_cursor.hpp"
#include "pltx_test_utils.hpp"

#include "gtest/gtest.h"

namespace pltx {

using format::CompressionType;

class PltxReaderTest : public testing::Test {
public:
  /// Voltage: 3 samples in 2 chunks, Current: none, Temp: 250 samples in 5
  static test::PltxFileBuilder standard_file(
      CompressionType compression = CompressionType::NONE) {
    test::PltxFileBuilder b(compression);
    uint32_t voltage = b.add_signal("Voltage", "V", "Bus voltage", "bench");
    b.add_signal("Current", "A");
    uint32_t temp = b.add_signal("Temp", "C");
    b.add_chunk(voltage, {{0.0, 1.0}, {1.0, 2.0}});
    for (int i = 0; i < 5; i++)
      b.add_chunk(temp, test::ramp(50, 100.0 + i * 50, 1.0, i * 50));
    b.add_chunk(voltage, {{2.0, 3.0}});
    return b;
  }

  void expect_open_error(OpenErrorKind kind, const std::string &path,
                         const ReaderOptions &options = ReaderOptions()) {
    try {
      PltxReader::open(path, options);
      FAIL() << "expected OpenError " << to_string(kind);
    } catch (const OpenError &e) {
      EXPECT_EQ(kind, e.kind()) << e.what();
    }
  }

  test::TempDir dir_;
};

TEST_F(PltxReaderTest, ListSignals) {
  auto reader = PltxReader::open(dir_.write("a.pltx", standard_file().build()));
  auto signals = reader->list_signals();
  ASSERT_EQ(reader->header().signal_count, signals.size());
  ASSERT_EQ(3u, signals.size());

  ASSERT_EQ("Voltage", signals[0].name);
  ASSERT_EQ("V", signals[0].unit);
  ASSERT_EQ("Bus voltage", signals[0].description);
  ASSERT_EQ("bench", signals[0].source);
  ASSERT_EQ(3u, signals[0].total_samples);
  ASSERT_EQ(2u, signals[0].chunk_count);
  ASSERT_DOUBLE_EQ(0.0, signals[0].start_time);
  ASSERT_DOUBLE_EQ(2.0, signals[0].end_time);

  ASSERT_EQ("Current", signals[1].name);
  ASSERT_EQ(0u, signals[1].total_samples);
  ASSERT_EQ(0u, signals[1].chunk_count);

  ASSERT_EQ(250u, signals[2].total_samples);
  ASSERT_EQ(5u, signals[2].chunk_count);

  ASSERT_EQ((std::vector<std::string>{"Voltage", "Current", "Temp"}),
            reader->get_signal_names());
  ASSERT_DOUBLE_EQ(1700000000.0, reader->header().created);
  ASSERT_EQ("a.pltx", reader->display_name());
}

TEST_F(PltxReaderTest, ChunkDescriptorsIncreasing) {
  auto reader = PltxReader::open(dir_.write("a.pltx", standard_file().build()));
  for (const auto &entry : reader->index().signals()) {
    uint64_t total = 0;
    for (size_t i = 0; i < entry.chunks.size(); i++) {
      total += entry.chunks[i].sample_count;
      if (i > 0)
        ASSERT_GT(entry.chunks[i].start_time, entry.chunks[i - 1].start_time);
    }
    ASSERT_EQ(entry.metadata.total_samples, total);
  }
}

TEST_F(PltxReaderTest, OpenReadsNoPayload) {
  auto reader = PltxReader::open(dir_.write("a.pltx", standard_file().build()));
  uint64_t after_open = reader->read_count();

  auto cursor = reader->open_cursor("Temp");
  ASSERT_EQ(after_open, reader->read_count());

  Sample s;
  ASSERT_EQ(CursorState::SAMPLE, cursor->next(s));
  ASSERT_EQ(after_open + 1, reader->read_count());
}

TEST_F(PltxReaderTest, ReadSignalAll) {
  for (auto compression : {CompressionType::NONE, CompressionType::ZLIB,
                           CompressionType::ZSTD}) {
    auto reader = PltxReader::open(
        dir_.write("a.pltx", standard_file(compression).build()));
    ASSERT_EQ(compression, reader->header().compression);

    SampleBlock v = reader->read_signal_all("Voltage");
    ASSERT_EQ("Voltage", v.signal_name);
    ASSERT_EQ((std::vector<double>{0.0, 1.0, 2.0}), v.timestamps);
    ASSERT_EQ((std::vector<double>{1.0, 2.0, 3.0}), v.values);

    SampleBlock t = reader->read_signal_all("Temp");
    ASSERT_EQ(250u, t.size());
    for (size_t i = 0; i < t.size(); i++) {
      ASSERT_DOUBLE_EQ(100.0 + i, t.timestamps[i]);
      ASSERT_DOUBLE_EQ(static_cast<double>(i), t.values[i]);
    }

    ASSERT_TRUE(reader->read_signal_all("Current").empty());
  }
}

TEST_F(PltxReaderTest, ReadTimeRangeSkipsChunks) {
  auto reader = PltxReader::open(dir_.write("a.pltx", standard_file().build()));
  uint64_t before = reader->read_count();

  SampleBlock block = reader->read_time_range("Temp", 160.0, 170.0);
  ASSERT_EQ(11u, block.size());
  ASSERT_DOUBLE_EQ(160.0, block.timestamps.front());
  ASSERT_DOUBLE_EQ(170.0, block.timestamps.back());
  // Only the chunk covering [150, 199] is read
  ASSERT_EQ(before + 1, reader->read_count());

  ASSERT_TRUE(reader->read_time_range("Temp", 1000.0, 2000.0).empty());
}

TEST_F(PltxReaderTest, InflatedRecordCountIsDecodeError) {
  test::PltxFileBuilder b;
  uint32_t v = b.add_signal("Voltage");
  b.add_chunk(v, test::ramp(4, 0.0));
  b.add_chunk(v, test::ramp(4, 10.0));
  auto file = b.build();
  // ChunkHeader.record_count follows "CHNK" and signal_id
  file.patch(file.chunk_offsets[0] + 8, uint32_t(0xFFFFFFFF));
  file.patch(file.chunk_offsets[1] + 8, uint32_t(0xFFFFFFFF));
  auto reader = PltxReader::open(dir_.write("a.pltx", file));
  ASSERT_EQ(2ull * 0xFFFFFFFFull,
            reader->signal_metadata("Voltage").total_samples);

  try {
    reader->read_signal_all("Voltage");
    FAIL() << "expected DecodeError";
  } catch (const DecodeError &e) {
    ASSERT_EQ(DecodeErrorKind::SIZE_MISMATCH, e.kind());
  }
  EXPECT_THROW(reader->read_time_range("Voltage", 0.0, 20.0), DecodeError);
}

TEST_F(PltxReaderTest, UnknownSignal) {
  auto reader = PltxReader::open(dir_.write("a.pltx", standard_file().build()));
  EXPECT_FALSE(reader->has_signal("Volt"));
  EXPECT_THROW(reader->open_cursor("Volt"), LookupError);
  EXPECT_THROW(reader->signal_metadata("voltage"), LookupError);
  EXPECT_THROW(reader->open_cursor(uint32_t(42)), LookupError);
}

TEST_F(PltxReaderTest, DuplicateNameFirstMatchWins) {
  test::PltxFileBuilder b;
  uint32_t first = b.add_signal("Temp");
  uint32_t second = b.add_signal("Temp");
  b.add_chunk(first, {{0.0, 1.0}});
  b.add_chunk(second, {{0.0, 2.0}, {1.0, 3.0}});
  auto reader = PltxReader::open(dir_.write("a.pltx", b.build()));

  ASSERT_EQ(2u, reader->list_signals().size());
  ASSERT_EQ(1u, reader->read_signal_all("Temp").size());

  auto cursor = reader->open_cursor(second);
  Sample s;
  ASSERT_EQ(CursorState::SAMPLE, cursor->next(s));
  ASSERT_DOUBLE_EQ(2.0, s.value);
}

TEST_F(PltxReaderTest, Mmap) {
  ReaderOptions options;
  options.use_mmap = true;
  auto reader = PltxReader::open(
      dir_.write("a.pltx", standard_file(CompressionType::ZSTD).build()),
      options);
  ASSERT_EQ(250u, reader->read_signal_all("Temp").size());
}

TEST_F(PltxReaderTest, MissingFile) {
  expect_open_error(OpenErrorKind::NOT_FOUND, dir_.path("missing.pltx"));
}

TEST_F(PltxReaderTest, TooSmall) {
  expect_open_error(OpenErrorKind::BAD_HEADER,
                    dir_.write("tiny.pltx", std::vector<uint8_t>{'P', 'L'}));
}

TEST_F(PltxReaderTest, BadMagic) {
  auto file = standard_file().build();
  file.bytes[0] = 'X';
  expect_open_error(OpenErrorKind::BAD_HEADER, dir_.write("a.pltx", file));
}

TEST_F(PltxReaderTest, UnsupportedVersion) {
  expect_open_error(OpenErrorKind::BAD_HEADER,
                    dir_.write("a.pltx", standard_file().version(3).build()));
  expect_open_error(OpenErrorKind::BAD_HEADER,
                    dir_.write("b.pltx", standard_file().version(1).build()));
}

TEST_F(PltxReaderTest, UnknownCompressionCode) {
  auto file = standard_file().build();
  file.bytes[5] = 9;
  expect_open_error(OpenErrorKind::BAD_HEADER, dir_.write("a.pltx", file));
}

TEST_F(PltxReaderTest, EmptySignalName) {
  test::PltxFileBuilder b;
  b.add_signal("");
  expect_open_error(OpenErrorKind::BAD_HEADER, dir_.write("a.pltx", b.build()));
}

TEST_F(PltxReaderTest, SignalTableRunsIntoFooter) {
  auto file = standard_file().build();
  uint16_t many = 5000;
  file.patch(14, many);
  expect_open_error(OpenErrorKind::BAD_HEADER, dir_.write("a.pltx", file));
}

TEST_F(PltxReaderTest, BadFooter) {
  auto file = standard_file().build();
  file.bytes[file.bytes.size() - 12] = 'X';
  expect_open_error(OpenErrorKind::BAD_INDEX, dir_.write("a.pltx", file));
}

TEST_F(PltxReaderTest, IndexOffsetOutOfBounds) {
  auto file = standard_file().build();
  file.patch(file.bytes.size() - 8, uint64_t(file.bytes.size() + 100));
  expect_open_error(OpenErrorKind::BAD_INDEX, dir_.write("a.pltx", file));
}

TEST_F(PltxReaderTest, IndexCountTooLarge) {
  auto file = standard_file().build();
  file.patch(file.index_offset + 4, uint32_t(1000));
  expect_open_error(OpenErrorKind::BAD_INDEX, dir_.write("a.pltx", file));
}

TEST_F(PltxReaderTest, ChunkOffsetOutsideDataRegion) {
  auto file = standard_file().build();
  // First entry's offset field: after "IDXT", count and signal id
  file.patch(file.index_offset + 12, uint64_t(0));
  expect_open_error(OpenErrorKind::BAD_INDEX, dir_.write("a.pltx", file));
}

TEST_F(PltxReaderTest, ChunkMagicMissing) {
  auto file = standard_file().build();
  file.bytes[file.chunk_offsets[1]] = 'X';
  expect_open_error(OpenErrorKind::BAD_INDEX, dir_.write("a.pltx", file));
}

TEST_F(PltxReaderTest, ChunksOutOfOrder) {
  test::PltxFileBuilder b;
  uint32_t v = b.add_signal("Voltage");
  b.add_chunk(v, test::ramp(2, 10.0));
  b.add_chunk(v, test::ramp(2, 0.0));
  expect_open_error(OpenErrorKind::BAD_INDEX, dir_.write("a.pltx", b.build()));
}

TEST_F(PltxReaderTest, ChunkSizeLimit) {
  ReaderOptions options;
  options.max_chunk_bytes = 32;
  // Temp chunks hold 50 samples (800 bytes)
  expect_open_error(OpenErrorKind::BAD_INDEX,
                    dir_.write("a.pltx", standard_file().build()), options);
}

} // namespace pltx
