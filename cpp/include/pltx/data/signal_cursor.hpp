/**
 * SignalCursor - forward-only lazy sample sequence over one signal
 *
 * Owned by a single consumer. Holds at most one decoded chunk; the next
 * chunk is read and decoded when the buffer runs dry. END and ERROR are
 * terminal: once reached, every later next() returns the same state.
 */

#pragma once

#include "pltx/core/types.hpp"
#include "pltx/data/pltx_reader.hpp"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace pltx {

enum class CursorState : uint8_t {
  SAMPLE = 0, // A sample was produced
  END = 1,    // All chunks consumed
  ERROR = 2   // Decode or I/O failure; see error_message()
};

class SignalCursor {
public:
  SignalCursor(std::shared_ptr<const PltxReader> reader,
               const SignalEntry &entry,
               const TimeWindow &window = TimeWindow());

  SignalCursor(const SignalCursor &) = delete;
  SignalCursor &operator=(const SignalCursor &) = delete;

  /**
   * Produce the next sample
   *
   * @param sample Receives the sample when SAMPLE is returned
   * @param seq Receives the sample's sequence number (0, 1, 2, ...)
   * @return SAMPLE, END or ERROR
   */
  CursorState next(Sample &sample, uint64_t &seq);

  /// Convenience overload without the sequence number
  CursorState next(Sample &sample);

  /// Number of samples produced so far (the next sample's seq)
  uint64_t seq() const { return seq_; }

  CursorState state() const { return state_; }
  bool finished() const { return state_ != CursorState::SAMPLE; }

  const std::string &error_message() const { return error_message_; }

  /// The DecodeError or IoError that put the cursor in ERROR state
  std::exception_ptr error() const { return error_; }

  const SignalMetadata &metadata() const { return entry_.metadata; }
  const std::string &signal_name() const { return entry_.metadata.name; }

  /// Index of the chunk currently buffered (or to be loaded next)
  size_t chunk_position() const { return chunk_index_; }

  /// Decoded samples currently held in memory
  size_t buffered_samples() const { return buffer_.size(); }

private:
  bool load_next_chunk();
  void fail(const std::string &message);

  std::shared_ptr<const PltxReader> reader_;
  const SignalEntry &entry_;
  TimeWindow window_;

  size_t chunk_index_;  // Next chunk to load
  size_t offset_;       // Position inside buffer_
  std::vector<Sample> buffer_;

  uint64_t seq_;
  CursorState state_;
  std::string error_message_;
  std::exception_ptr error_;
};

} // namespace pltx
