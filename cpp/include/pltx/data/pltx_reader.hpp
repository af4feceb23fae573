/**
 * PLTX Reader - lazy, shared access to one PLTX file
 *
 * Features:
 * - Header/index parsed once at open, chunk payloads read on demand
 * - One FileHandle shared by any number of cursors
 * - Shared ownership: cursors keep their reader alive
 */

#pragma once

#include "pltx/core/types.hpp"
#include "pltx/data/file_handle.hpp"
#include "pltx/data/pltx_format.hpp"
#include "pltx/data/signal_index.hpp"
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace pltx {

class SignalCursor;

struct ReaderOptions {
  bool use_mmap;            // Serve chunk reads from a read-only mapping
  uint32_t max_chunk_bytes; // Reject chunks larger than this at open

  ReaderOptions()
      : use_mmap(false), max_chunk_bytes(constants::DEFAULT_MAX_CHUNK_BYTES) {}
};

/// Closed time interval used to restrict a cursor
struct TimeWindow {
  double start;
  double end;

  TimeWindow()
      : start(-std::numeric_limits<double>::infinity()),
        end(std::numeric_limits<double>::infinity()) {}
  TimeWindow(double s, double e) : start(s), end(e) {}

  bool contains(double t) const { return t >= start && t <= end; }
  bool overlaps(double lo, double hi) const { return !(hi < start || lo > end); }
  bool unbounded() const {
    return start == -std::numeric_limits<double>::infinity() &&
           end == std::numeric_limits<double>::infinity();
  }
};

class PltxReader : public std::enable_shared_from_this<PltxReader> {
public:
  /**
   * Open PLTX file
   *
   * @param path File path
   * @param options Reader options
   * @return Shared reader
   * @throws OpenError NOT_FOUND, BAD_HEADER, BAD_INDEX or IO_ERROR
   */
  static std::shared_ptr<PltxReader>
  open(const std::string &path, const ReaderOptions &options = ReaderOptions());

  ~PltxReader();

  PltxReader(const PltxReader &) = delete;
  PltxReader &operator=(const PltxReader &) = delete;

  /**
   * Get all signals (index order, stable for the reader's lifetime)
   */
  std::vector<SignalMetadata> list_signals() const;

  /**
   * Get signal names in index order
   */
  std::vector<std::string> get_signal_names() const;

  bool has_signal(const std::string &name) const;

  /**
   * Get metadata by internal name
   * @throws LookupError if the signal does not exist
   */
  const SignalMetadata &signal_metadata(const std::string &name) const;

  /**
   * Open a cursor over a signal
   *
   * Allocates cursor state only; no I/O happens until the first pull.
   *
   * @throws LookupError if the signal does not exist
   */
  std::unique_ptr<SignalCursor> open_cursor(const std::string &name) const;
  std::unique_ptr<SignalCursor> open_cursor(uint32_t signal_id) const;

  /**
   * Open a cursor restricted to [start_time, end_time]
   *
   * Chunks outside the window are skipped without reading them.
   */
  std::unique_ptr<SignalCursor> open_cursor(const std::string &name,
                                            double start_time,
                                            double end_time) const;

  /**
   * Load entire signal (use with caution!)
   *
   * Memory: Entire signal in memory
   * @throws LookupError, DecodeError, IoError
   */
  SampleBlock read_signal_all(const std::string &name) const;

  /**
   * Load samples with start_time <= t <= end_time
   */
  SampleBlock read_time_range(const std::string &name, double start_time,
                              double end_time) const;

  /**
   * Read the stored payload of one chunk
   * @throws IoError
   */
  std::vector<uint8_t> read_chunk(const format::ChunkDescriptor &chunk) const;

  const format::FileHeader &header() const { return index_.header(); }
  const SignalIndex &index() const { return index_; }
  const std::string &path() const { return path_; }

  /// File name without directories
  std::string display_name() const;

  uint64_t get_file_size() const { return file_->size(); }

  /// Physical reads issued so far (open included)
  uint64_t read_count() const { return file_->read_count(); }

private:
  PltxReader(const std::string &path, const ReaderOptions &options);

  std::unique_ptr<SignalCursor> make_cursor(const SignalEntry &entry,
                                            const TimeWindow &window) const;
  SampleBlock drain(SignalCursor &cursor, const std::string &name) const;

  std::string path_;
  ReaderOptions options_;
  std::unique_ptr<FileHandle> file_;
  SignalIndex index_;
};

} // namespace pltx
