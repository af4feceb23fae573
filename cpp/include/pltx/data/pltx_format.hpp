/**
 * PLTX Format - chunked, indexed time-series container (v2)
 *
 * Layout:
 *   [1] Header prefix + signal table
 *   [2] Chunks: "CHNK" + chunk header + payload (one signal per chunk)
 *   [3] Index: "IDXT" + entry count + index entries
 *   [4] Footer: "FTER" + index offset (last 12 bytes)
 *
 * All integers and floats are little-endian. A decoded payload is a packed
 * array of (timestamp f64, value f64) records.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <string>

namespace pltx {
namespace format {

// ==============================================================================
// Constants
// ==============================================================================

constexpr char MAGIC[4] = {'P', 'L', 'T', 'X'};
constexpr char CHUNK_MAGIC[4] = {'C', 'H', 'N', 'K'};
constexpr char INDEX_MAGIC[4] = {'I', 'D', 'X', 'T'};
constexpr char FOOTER_MAGIC[4] = {'F', 'T', 'E', 'R'};

constexpr uint8_t SUPPORTED_VERSION = 2;

constexpr uint32_t RECORD_SIZE = 16;        // timestamp f64 + value f64
constexpr uint32_t MAGIC_SIZE = 4;
constexpr uint32_t SIGNAL_ID_SIZE = 4;
constexpr uint32_t STRING_LENGTH_SIZE = 2;  // u16 prefix
constexpr uint32_t INDEX_COUNT_SIZE = 4;

// ==============================================================================
// Enums
// ==============================================================================

enum class CompressionType : uint8_t { NONE = 0, ZLIB = 1, LZ4 = 2, ZSTD = 3 };

inline bool is_known_compression(uint8_t code) {
  return code <= static_cast<uint8_t>(CompressionType::ZSTD);
}

inline const char *compression_name(CompressionType type) {
  switch (type) {
  case CompressionType::NONE:
    return "none";
  case CompressionType::ZLIB:
    return "zlib";
  case CompressionType::LZ4:
    return "lz4";
  case CompressionType::ZSTD:
    return "zstd";
  }
  return "unknown";
}

// ==============================================================================
// On-disk records
// ==============================================================================

#pragma pack(push, 1)

struct HeaderPrefix {
  char magic[4];        // "PLTX"
  uint8_t version;      // 2
  uint8_t compression;  // CompressionType
  double created;       // Unix timestamp (seconds)
  uint16_t signal_count;
};

struct ChunkHeader {
  uint32_t signal_id;
  uint32_t record_count;
  uint32_t raw_length;    // Decoded payload size
  uint32_t stored_length; // Payload size on disk (after compression)
  double min_timestamp;
  double max_timestamp;
};

struct IndexEntry {
  uint32_t signal_id;
  uint64_t offset; // Offset of the chunk's "CHNK" magic
  double min_timestamp;
  double max_timestamp;
};

struct Footer {
  char magic[4]; // "FTER"
  uint64_t index_offset;
};

#pragma pack(pop)

static_assert(sizeof(HeaderPrefix) == 16, "Header prefix must be 16 bytes");
static_assert(sizeof(ChunkHeader) == 32, "Chunk header must be 32 bytes");
static_assert(sizeof(IndexEntry) == 28, "Index entry must be 28 bytes");
static_assert(sizeof(Footer) == 12, "Footer must be 12 bytes");

constexpr uint32_t HEADER_PREFIX_SIZE = sizeof(HeaderPrefix);
constexpr uint32_t CHUNK_HEADER_SIZE = sizeof(ChunkHeader);
constexpr uint32_t CHUNK_PREAMBLE_SIZE = MAGIC_SIZE + CHUNK_HEADER_SIZE;
constexpr uint32_t INDEX_ENTRY_SIZE = sizeof(IndexEntry);
constexpr uint32_t FOOTER_SIZE = sizeof(Footer);

inline bool magic_equals(const char *bytes, const char (&magic)[4]) {
  return std::memcmp(bytes, magic, MAGIC_SIZE) == 0;
}

// ==============================================================================
// Parsed structures
// ==============================================================================

struct FileHeader {
  uint8_t version;
  CompressionType compression;
  double created;
  uint16_t signal_count;  // Declared in the header prefix
  uint64_t header_length; // Prefix + signal table
  uint64_t index_offset;
  uint64_t index_length;  // Magic + count + entries
  uint64_t file_size;

  FileHeader()
      : version(0), compression(CompressionType::NONE), created(0.0),
        signal_count(0), header_length(0), index_offset(0), index_length(0),
        file_size(0) {}
};

struct ChunkDescriptor {
  uint64_t offset;         // Offset of the "CHNK" magic
  uint64_t payload_offset; // First payload byte
  uint32_t stored_length;
  uint32_t raw_length;
  uint32_t sample_count;
  double start_time;
  double end_time;
  CompressionType compression;

  bool compressed() const { return compression != CompressionType::NONE; }

  ChunkDescriptor()
      : offset(0), payload_offset(0), stored_length(0), raw_length(0),
        sample_count(0), start_time(0.0), end_time(0.0),
        compression(CompressionType::NONE) {}
};

} // namespace format
} // namespace pltx
