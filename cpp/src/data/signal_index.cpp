/**
 * SignalIndex Implementation
 *
 * Open-time parsing: O(signals + chunks) small reads, no payloads.
 */

#include "pltx/data/signal_index.hpp"
#include "pltx/core/errors.hpp"

#include <algorithm>
#include <cstring>

namespace pltx {

using format::ChunkDescriptor;
using format::CompressionType;

namespace {

/// Sequential reader over [0, limit) of a file, buffered in small blocks
class RegionReader {
public:
  RegionReader(const FileHandle &file, uint64_t limit)
      : file_(file), limit_(limit), position_(0), buffer_start_(0) {}

  void read(void *dest, uint64_t length, const char *what) {
    if (position_ > limit_ || length > limit_ - position_) {
      throw OpenError(OpenErrorKind::BAD_HEADER,
                      std::string("Header truncated while reading ") + what);
    }
    uint8_t *out = static_cast<uint8_t *>(dest);
    while (length > 0) {
      if (position_ < buffer_start_ ||
          position_ >= buffer_start_ + buffer_.size()) {
        fill();
      }
      uint64_t in_buffer = buffer_start_ + buffer_.size() - position_;
      uint64_t n = std::min(length, in_buffer);
      std::memcpy(out, buffer_.data() + (position_ - buffer_start_), n);
      out += n;
      position_ += n;
      length -= n;
    }
  }

  std::string read_string(const char *what) {
    uint16_t len = 0;
    read(&len, sizeof(len), what);
    std::string s(len, '\0');
    if (len > 0) {
      read(&s[0], len, what);
    }
    return s;
  }

  uint64_t position() const { return position_; }

private:
  static constexpr uint64_t BLOCK_SIZE = 4096;

  void fill() {
    buffer_start_ = position_;
    uint64_t n = std::min(BLOCK_SIZE, limit_ - position_);
    buffer_ = file_.read_range(buffer_start_, n);
  }

  const FileHandle &file_;
  uint64_t limit_;
  uint64_t position_;
  uint64_t buffer_start_;
  std::vector<uint8_t> buffer_;
};

} // namespace

SignalIndex SignalIndex::build(const FileHandle &file,
                               uint32_t max_chunk_bytes) {
  SignalIndex index;
  try {
    index.read_header(file);
    index.read_index(file, max_chunk_bytes);
  } catch (const IoError &e) {
    throw OpenError(OpenErrorKind::IO_ERROR, e.what());
  }
  index.finalize_signals();
  return index;
}

const SignalEntry *SignalIndex::find(const std::string &name) const {
  auto it = name_map_.find(name);
  if (it == name_map_.end()) {
    return nullptr;
  }
  return &signals_[it->second];
}

const SignalEntry *SignalIndex::find(uint32_t signal_id) const {
  auto it = id_map_.find(signal_id);
  if (it == id_map_.end()) {
    return nullptr;
  }
  return &signals_[it->second];
}

uint64_t SignalIndex::chunk_count() const {
  uint64_t total = 0;
  for (const auto &entry : signals_) {
    total += entry.chunks.size();
  }
  return total;
}

// Private helper methods

void SignalIndex::read_header(const FileHandle &file) {
  header_.file_size = file.size();
  if (header_.file_size < format::HEADER_PREFIX_SIZE + format::FOOTER_SIZE) {
    throw OpenError(OpenErrorKind::BAD_HEADER,
                    "File too small for header: " + file.filename());
  }

  // Header and signal table must end before the footer
  RegionReader region(file, header_.file_size - format::FOOTER_SIZE);

  format::HeaderPrefix prefix;
  region.read(&prefix, sizeof(prefix), "header prefix");

  if (!format::magic_equals(prefix.magic, format::MAGIC)) {
    throw OpenError(OpenErrorKind::BAD_HEADER, "Invalid PLTX file: bad magic");
  }
  if (prefix.version != format::SUPPORTED_VERSION) {
    throw OpenError(OpenErrorKind::BAD_HEADER,
                    "Unsupported PLTX version " +
                        std::to_string(static_cast<int>(prefix.version)));
  }
  if (!format::is_known_compression(prefix.compression)) {
    throw OpenError(OpenErrorKind::BAD_HEADER,
                    "Unknown compression code " +
                        std::to_string(static_cast<int>(prefix.compression)));
  }

  header_.version = prefix.version;
  header_.compression = static_cast<CompressionType>(prefix.compression);
  header_.created = prefix.created;
  header_.signal_count = prefix.signal_count;

  signals_.reserve(prefix.signal_count);
  for (uint16_t i = 0; i < prefix.signal_count; ++i) {
    SignalEntry entry;
    SignalMetadata &meta = entry.metadata;

    region.read(&meta.signal_id, sizeof(meta.signal_id), "signal id");
    meta.name = region.read_string("signal name");
    meta.unit = region.read_string("signal unit");
    meta.description = region.read_string("signal description");
    meta.source = region.read_string("signal source");

    if (meta.name.empty()) {
      throw OpenError(OpenErrorKind::BAD_HEADER,
                      "Signal " + std::to_string(meta.signal_id) +
                          " has an empty name");
    }
    if (id_map_.count(meta.signal_id)) {
      throw OpenError(OpenErrorKind::BAD_HEADER,
                      "Duplicate signal id " + std::to_string(meta.signal_id));
    }

    id_map_[meta.signal_id] = signals_.size();
    name_map_.emplace(meta.name, signals_.size());
    signals_.push_back(std::move(entry));
  }

  header_.header_length = region.position();
}

void SignalIndex::read_index(const FileHandle &file, uint32_t max_chunk_bytes) {
  const uint64_t footer_offset = header_.file_size - format::FOOTER_SIZE;

  format::Footer footer;
  file.read_into(footer_offset, &footer, sizeof(footer));

  if (!format::magic_equals(footer.magic, format::FOOTER_MAGIC)) {
    throw OpenError(OpenErrorKind::BAD_INDEX, "Footer magic missing");
  }

  const uint64_t index_offset = footer.index_offset;
  if (index_offset < header_.header_length ||
      index_offset > footer_offset ||
      footer_offset - index_offset <
          format::MAGIC_SIZE + format::INDEX_COUNT_SIZE) {
    throw OpenError(OpenErrorKind::BAD_INDEX,
                    "Index offset " + std::to_string(index_offset) +
                        " outside file bounds");
  }

  char index_magic[format::MAGIC_SIZE];
  uint32_t entry_count = 0;
  file.read_into(index_offset, index_magic, sizeof(index_magic));
  file.read_into(index_offset + format::MAGIC_SIZE, &entry_count,
                 sizeof(entry_count));

  if (!format::magic_equals(index_magic, format::INDEX_MAGIC)) {
    throw OpenError(OpenErrorKind::BAD_INDEX, "Index magic missing");
  }

  const uint64_t entries_offset =
      index_offset + format::MAGIC_SIZE + format::INDEX_COUNT_SIZE;
  const uint64_t entries_size =
      static_cast<uint64_t>(entry_count) * format::INDEX_ENTRY_SIZE;
  if (entries_size > footer_offset - entries_offset) {
    throw OpenError(OpenErrorKind::BAD_INDEX,
                    "Index declares " + std::to_string(entry_count) +
                        " entries, more than fit before the footer");
  }

  header_.index_offset = index_offset;
  header_.index_length =
      format::MAGIC_SIZE + format::INDEX_COUNT_SIZE + entries_size;

  std::vector<uint8_t> raw_entries = file.read_range(entries_offset, entries_size);

  for (uint32_t i = 0; i < entry_count; ++i) {
    format::IndexEntry entry;
    std::memcpy(&entry,
                raw_entries.data() +
                    static_cast<size_t>(i) * format::INDEX_ENTRY_SIZE,
                sizeof(entry));

    auto it = id_map_.find(entry.signal_id);
    if (it == id_map_.end()) {
      throw OpenError(OpenErrorKind::BAD_INDEX,
                      "Index entry " + std::to_string(i) +
                          " references unknown signal " +
                          std::to_string(entry.signal_id));
    }

    if (entry.offset < header_.header_length ||
        entry.offset > index_offset ||
        index_offset - entry.offset < format::CHUNK_PREAMBLE_SIZE) {
      throw OpenError(OpenErrorKind::BAD_INDEX,
                      "Chunk offset " + std::to_string(entry.offset) +
                          " outside data region");
    }

    // Chunk preamble: magic + header, the payload is left for the cursor
    uint8_t preamble[format::CHUNK_PREAMBLE_SIZE];
    file.read_into(entry.offset, preamble, sizeof(preamble));

    if (!format::magic_equals(reinterpret_cast<const char *>(preamble),
                              format::CHUNK_MAGIC)) {
      throw OpenError(OpenErrorKind::BAD_INDEX,
                      "Invalid chunk magic at offset " +
                          std::to_string(entry.offset));
    }

    format::ChunkHeader chunk_header;
    std::memcpy(&chunk_header, preamble + format::MAGIC_SIZE,
                sizeof(chunk_header));

    if (chunk_header.signal_id != entry.signal_id) {
      throw OpenError(OpenErrorKind::BAD_INDEX,
                      "Index points to wrong signal at offset " +
                          std::to_string(entry.offset));
    }
    if (chunk_header.stored_length > max_chunk_bytes ||
        chunk_header.raw_length > max_chunk_bytes) {
      throw OpenError(OpenErrorKind::BAD_INDEX,
                      "Chunk at offset " + std::to_string(entry.offset) +
                          " exceeds the chunk size limit");
    }

    const uint64_t payload_offset = entry.offset + format::CHUNK_PREAMBLE_SIZE;
    if (chunk_header.stored_length > index_offset - payload_offset) {
      throw OpenError(OpenErrorKind::BAD_INDEX,
                      "Chunk payload at offset " +
                          std::to_string(payload_offset) +
                          " runs past the index");
    }

    ChunkDescriptor desc;
    desc.offset = entry.offset;
    desc.payload_offset = payload_offset;
    desc.stored_length = chunk_header.stored_length;
    desc.raw_length = chunk_header.raw_length;
    desc.sample_count = chunk_header.record_count;
    desc.start_time = entry.min_timestamp;
    desc.end_time = entry.max_timestamp;
    desc.compression = header_.compression;

    SignalEntry &signal = signals_[it->second];
    if (!signal.chunks.empty() &&
        !(desc.start_time > signal.chunks.back().start_time)) {
      throw OpenError(OpenErrorKind::BAD_INDEX,
                      "Chunks of signal '" + signal.metadata.name +
                          "' are not in increasing time order");
    }
    signal.chunks.push_back(desc);
  }
}

void SignalIndex::finalize_signals() {
  for (auto &entry : signals_) {
    SignalMetadata &meta = entry.metadata;
    meta.chunk_count = static_cast<uint32_t>(entry.chunks.size());
    meta.total_samples = 0;
    for (const auto &chunk : entry.chunks) {
      meta.total_samples += chunk.sample_count;
    }
    if (!entry.chunks.empty()) {
      meta.start_time = entry.chunks.front().start_time;
      meta.end_time = entry.chunks.back().end_time;
    }
  }
}

} // namespace pltx
