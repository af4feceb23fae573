/**
 * ChunkCodec - decode one stored chunk into samples
 *
 * Stateless. Inflates the payload when the chunk is compressed (zlib or
 * zstd), then unpacks (timestamp, value) records.
 */

#pragma once

#include "pltx/core/types.hpp"
#include "pltx/data/pltx_format.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pltx {

class ChunkCodec {
public:
  /**
   * Decode stored chunk bytes
   *
   * @param stored Payload bytes as read from the file
   * @param descriptor Chunk descriptor from the index
   * @return Exactly descriptor.sample_count samples
   * @throws DecodeError on size mismatch, corrupt stream, truncated payload
   *         or unsupported compression
   */
  static std::vector<Sample> decode(const std::vector<uint8_t> &stored,
                                    const format::ChunkDescriptor &descriptor);

  /**
   * Inflate a payload to exactly raw_length bytes
   */
  static std::vector<uint8_t> decompress(const uint8_t *data, size_t size,
                                         format::CompressionType compression,
                                         uint32_t raw_length);

  /**
   * Unpack little-endian (f64, f64) records
   */
  static std::vector<Sample> unpack_records(const uint8_t *data, size_t size,
                                            uint32_t sample_count);

  /// Whether this build can decode the given compression
  static bool supports(format::CompressionType compression);

private:
  static std::vector<uint8_t> inflate_zlib(const uint8_t *data, size_t size,
                                           uint32_t raw_length);
  static std::vector<uint8_t> inflate_zstd(const uint8_t *data, size_t size,
                                           uint32_t raw_length);
#ifdef PLTX_HAVE_LZ4
  static std::vector<uint8_t> inflate_lz4(const uint8_t *data, size_t size,
                                          uint32_t raw_length);
#endif
};

} // namespace pltx
