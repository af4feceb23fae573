/**
 * PLTX Reader Implementation
 */

#include "pltx/data/pltx_reader.hpp"
#include "pltx/core/errors.hpp"
#include "pltx/data/signal_cursor.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace pltx {

std::shared_ptr<PltxReader> PltxReader::open(const std::string &path,
                                             const ReaderOptions &options) {
  std::shared_ptr<PltxReader> reader(new PltxReader(path, options));

  const format::FileHeader &header = reader->header();
  std::cout << "[PLTX] Opened: " << path << " (" << header.signal_count
            << " signals, " << reader->index_.chunk_count() << " chunks, "
            << format::compression_name(header.compression) << ")"
            << std::endl;
  return reader;
}

PltxReader::PltxReader(const std::string &path, const ReaderOptions &options)
    : path_(path), options_(options) {
  file_ = std::make_unique<FileHandle>(path, options.use_mmap);
  index_ = SignalIndex::build(*file_, options.max_chunk_bytes);
}

PltxReader::~PltxReader() = default;

std::vector<SignalMetadata> PltxReader::list_signals() const {
  std::vector<SignalMetadata> result;
  result.reserve(index_.signal_count());
  for (const auto &entry : index_.signals()) {
    result.push_back(entry.metadata);
  }
  return result;
}

std::vector<std::string> PltxReader::get_signal_names() const {
  std::vector<std::string> names;
  names.reserve(index_.signal_count());
  for (const auto &entry : index_.signals()) {
    names.push_back(entry.metadata.name);
  }
  return names;
}

bool PltxReader::has_signal(const std::string &name) const {
  return index_.find(name) != nullptr;
}

const SignalMetadata &
PltxReader::signal_metadata(const std::string &name) const {
  const SignalEntry *entry = index_.find(name);
  if (!entry) {
    throw LookupError(name);
  }
  return entry->metadata;
}

std::unique_ptr<SignalCursor>
PltxReader::open_cursor(const std::string &name) const {
  const SignalEntry *entry = index_.find(name);
  if (!entry) {
    throw LookupError(name);
  }
  return make_cursor(*entry, TimeWindow());
}

std::unique_ptr<SignalCursor> PltxReader::open_cursor(uint32_t signal_id) const {
  const SignalEntry *entry = index_.find(signal_id);
  if (!entry) {
    throw LookupError("Unknown signal id: " + std::to_string(signal_id),
                      std::to_string(signal_id));
  }
  return make_cursor(*entry, TimeWindow());
}

std::unique_ptr<SignalCursor>
PltxReader::open_cursor(const std::string &name, double start_time,
                        double end_time) const {
  const SignalEntry *entry = index_.find(name);
  if (!entry) {
    throw LookupError(name);
  }
  return make_cursor(*entry, TimeWindow(start_time, end_time));
}

SampleBlock PltxReader::read_signal_all(const std::string &name) const {
  auto cursor = open_cursor(name);
  return drain(*cursor, name);
}

SampleBlock PltxReader::read_time_range(const std::string &name,
                                        double start_time,
                                        double end_time) const {
  auto cursor = open_cursor(name, start_time, end_time);
  return drain(*cursor, name);
}

std::vector<uint8_t>
PltxReader::read_chunk(const format::ChunkDescriptor &chunk) const {
  return file_->read_range(chunk.payload_offset, chunk.stored_length);
}

std::string PltxReader::display_name() const {
  size_t pos = path_.find_last_of('/');
  if (pos == std::string::npos) {
    return path_;
  }
  return path_.substr(pos + 1);
}

// Private helper methods

std::unique_ptr<SignalCursor>
PltxReader::make_cursor(const SignalEntry &entry,
                        const TimeWindow &window) const {
  return std::make_unique<SignalCursor>(shared_from_this(), entry, window);
}

SampleBlock PltxReader::drain(SignalCursor &cursor,
                              const std::string &name) const {
  SampleBlock block(name);

  // record_count is only checked at decode time; bound the reservation by
  // what the chunks' raw payloads can actually hold
  const SignalEntry *entry = index_.find(cursor.metadata().signal_id);
  if (entry) {
    uint64_t capacity = 0;
    for (const auto &chunk : entry->chunks) {
      capacity += chunk.raw_length / format::RECORD_SIZE;
    }
    block.reserve(static_cast<size_t>(
        std::min(capacity, cursor.metadata().total_samples)));
  }

  Sample sample;
  CursorState state;
  while ((state = cursor.next(sample)) == CursorState::SAMPLE) {
    block.push_back(sample);
  }

  if (state == CursorState::ERROR) {
    std::cerr << "[PLTX] Read of '" << name << "' failed: "
              << cursor.error_message() << std::endl;
    std::rethrow_exception(cursor.error());
  }
  return block;
}

} // namespace pltx
