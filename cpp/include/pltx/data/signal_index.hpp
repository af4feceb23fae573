/**
 * SignalIndex - header + per-signal chunk table of one PLTX file
 *
 * Built once at open from the header, footer, index and chunk headers
 * (never the chunk payloads). Immutable afterwards, so concurrent readers
 * need no synchronization.
 */

#pragma once

#include "pltx/core/types.hpp"
#include "pltx/data/file_handle.hpp"
#include "pltx/data/pltx_format.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace pltx {

struct SignalEntry {
  SignalMetadata metadata;
  std::vector<format::ChunkDescriptor> chunks; // Strictly increasing start_time
};

class SignalIndex {
public:
  /**
   * Parse and validate header, footer, index and chunk headers
   *
   * @param file Open file
   * @param max_chunk_bytes Largest stored/raw chunk size accepted
   * @throws OpenError BAD_HEADER, BAD_INDEX or IO_ERROR
   */
  static SignalIndex build(const FileHandle &file,
                           uint32_t max_chunk_bytes =
                               constants::DEFAULT_MAX_CHUNK_BYTES);

  SignalIndex() = default;

  const format::FileHeader &header() const { return header_; }

  /// Signals in header order
  const std::vector<SignalEntry> &signals() const { return signals_; }

  /// First signal with this name, or nullptr
  const SignalEntry *find(const std::string &name) const;

  const SignalEntry *find(uint32_t signal_id) const;

  size_t signal_count() const { return signals_.size(); }

  uint64_t chunk_count() const;

private:
  void read_header(const FileHandle &file);
  void read_index(const FileHandle &file, uint32_t max_chunk_bytes);
  void finalize_signals();

  format::FileHeader header_;
  std::vector<SignalEntry> signals_;
  std::unordered_map<std::string, size_t> name_map_;
  std::unordered_map<uint32_t, size_t> id_map_;
};

} // namespace pltx
