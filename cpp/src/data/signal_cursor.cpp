/**
 * SignalCursor Implementation
 */

#include "pltx/data/signal_cursor.hpp"
#include "pltx/core/errors.hpp"
#include "pltx/data/chunk_codec.hpp"

#include <utility>

namespace pltx {

SignalCursor::SignalCursor(std::shared_ptr<const PltxReader> reader,
                           const SignalEntry &entry, const TimeWindow &window)
    : reader_(std::move(reader)), entry_(entry), window_(window),
      chunk_index_(0), offset_(0), seq_(0), state_(CursorState::SAMPLE) {}

CursorState SignalCursor::next(Sample &sample, uint64_t &seq) {
  while (state_ == CursorState::SAMPLE) {
    if (offset_ < buffer_.size()) {
      const Sample &candidate = buffer_[offset_++];
      if (!window_.unbounded() && !window_.contains(candidate.timestamp)) {
        continue;
      }
      sample = candidate;
      seq = seq_++;
      return CursorState::SAMPLE;
    }

    if (!load_next_chunk()) {
      break;
    }
  }
  return state_;
}

CursorState SignalCursor::next(Sample &sample) {
  uint64_t seq = 0;
  return next(sample, seq);
}

bool SignalCursor::load_next_chunk() {
  // Release the previous chunk before reading the next one
  buffer_.clear();
  buffer_.shrink_to_fit();
  offset_ = 0;

  while (chunk_index_ < entry_.chunks.size()) {
    const format::ChunkDescriptor &chunk = entry_.chunks[chunk_index_++];

    if (!window_.unbounded() &&
        !window_.overlaps(chunk.start_time, chunk.end_time)) {
      continue;
    }

    try {
      std::vector<uint8_t> stored = reader_->read_chunk(chunk);
      buffer_ = ChunkCodec::decode(stored, chunk);
    } catch (const DecodeError &e) {
      fail("Chunk " + std::to_string(chunk_index_ - 1) + " of '" +
           entry_.metadata.name + "': " + e.what());
      error_ = std::current_exception();
      return false;
    } catch (const IoError &e) {
      fail("Chunk " + std::to_string(chunk_index_ - 1) + " of '" +
           entry_.metadata.name + "': " + e.what());
      error_ = std::current_exception();
      return false;
    }
    return true;
  }

  state_ = CursorState::END;
  return false;
}

void SignalCursor::fail(const std::string &message) {
  buffer_.clear();
  buffer_.shrink_to_fit();
  offset_ = 0;
  error_message_ = message;
  state_ = CursorState::ERROR;
}

} // namespace pltx
