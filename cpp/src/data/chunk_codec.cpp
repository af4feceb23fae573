/**
 * ChunkCodec Implementation
 */

#include "pltx/data/chunk_codec.hpp"
#include "pltx/core/errors.hpp"

#include <cstring>
#include <memory>
#include <string>

#include <zlib.h>
#include <zstd.h>

#ifdef PLTX_HAVE_LZ4
#include <lz4frame.h>
#else
#pragma message("Warning: LZ4 not available, lz4 chunks cannot be decoded")
#endif

namespace pltx {

using format::ChunkDescriptor;
using format::CompressionType;

std::vector<Sample> ChunkCodec::decode(const std::vector<uint8_t> &stored,
                                       const ChunkDescriptor &descriptor) {
  if (stored.size() < descriptor.stored_length) {
    throw DecodeError(DecodeErrorKind::TRUNCATED,
                      "Payload has " + std::to_string(stored.size()) +
                          " bytes, chunk declares " +
                          std::to_string(descriptor.stored_length));
  }
  if (stored.size() != descriptor.stored_length) {
    throw DecodeError(DecodeErrorKind::SIZE_MISMATCH,
                      "Payload has " + std::to_string(stored.size()) +
                          " bytes, chunk declares " +
                          std::to_string(descriptor.stored_length));
  }

  uint64_t expected_raw =
      static_cast<uint64_t>(descriptor.sample_count) * format::RECORD_SIZE;
  if (descriptor.raw_length != expected_raw) {
    throw DecodeError(DecodeErrorKind::SIZE_MISMATCH,
                      "Raw length " + std::to_string(descriptor.raw_length) +
                          " does not hold " +
                          std::to_string(descriptor.sample_count) + " records");
  }

  if (!descriptor.compressed()) {
    if (stored.size() < descriptor.raw_length) {
      throw DecodeError(DecodeErrorKind::TRUNCATED,
                        "Uncompressed payload shorter than raw length");
    }
    if (stored.size() != descriptor.raw_length) {
      throw DecodeError(DecodeErrorKind::SIZE_MISMATCH,
                        "Uncompressed payload size differs from raw length");
    }
    return unpack_records(stored.data(), stored.size(), descriptor.sample_count);
  }

  std::vector<uint8_t> raw =
      decompress(stored.data(), stored.size(), descriptor.compression,
                 descriptor.raw_length);
  return unpack_records(raw.data(), raw.size(), descriptor.sample_count);
}

std::vector<uint8_t> ChunkCodec::decompress(const uint8_t *data, size_t size,
                                            CompressionType compression,
                                            uint32_t raw_length) {
  switch (compression) {
  case CompressionType::NONE:
    return std::vector<uint8_t>(data, data + size);
  case CompressionType::ZLIB:
    return inflate_zlib(data, size, raw_length);
  case CompressionType::ZSTD:
    return inflate_zstd(data, size, raw_length);
  case CompressionType::LZ4:
#ifdef PLTX_HAVE_LZ4
    return inflate_lz4(data, size, raw_length);
#else
    break;
#endif
  }
  throw DecodeError(DecodeErrorKind::UNSUPPORTED_COMPRESSION,
                    std::string("Compression '") +
                        format::compression_name(compression) +
                        "' is not supported by this reader");
}

std::vector<Sample> ChunkCodec::unpack_records(const uint8_t *data, size_t size,
                                               uint32_t sample_count) {
  uint64_t needed = static_cast<uint64_t>(sample_count) * format::RECORD_SIZE;
  if (size < needed) {
    throw DecodeError(DecodeErrorKind::TRUNCATED,
                      "Payload holds " + std::to_string(size / format::RECORD_SIZE) +
                          " records, expected " + std::to_string(sample_count));
  }
  if (size != needed) {
    throw DecodeError(DecodeErrorKind::SIZE_MISMATCH,
                      "Payload of " + std::to_string(size) + " bytes for " +
                          std::to_string(sample_count) + " records");
  }

  std::vector<Sample> samples(sample_count);
  for (uint32_t i = 0; i < sample_count; ++i) {
    const uint8_t *rec = data + static_cast<size_t>(i) * format::RECORD_SIZE;
    std::memcpy(&samples[i].timestamp, rec, sizeof(double));
    std::memcpy(&samples[i].value, rec + sizeof(double), sizeof(double));
  }
  return samples;
}

bool ChunkCodec::supports(CompressionType compression) {
#ifdef PLTX_HAVE_LZ4
  (void)compression;
  return true;
#else
  return compression != CompressionType::LZ4;
#endif
}

std::vector<uint8_t> ChunkCodec::inflate_zlib(const uint8_t *data, size_t size,
                                              uint32_t raw_length) {
  std::vector<uint8_t> result(raw_length);
  uLongf dest_len = static_cast<uLongf>(raw_length);
  Bytef empty = 0;
  Bytef *dest = result.empty() ? &empty : result.data();

  int ret = uncompress(dest, &dest_len, data, static_cast<uLong>(size));
  // Z_BUF_ERROR: the output buffer filled up before the stream ended
  if (ret == Z_BUF_ERROR) {
    throw DecodeError(DecodeErrorKind::SIZE_MISMATCH,
                      "zlib stream inflates beyond raw length " +
                          std::to_string(raw_length));
  }
  if (ret != Z_OK) {
    throw DecodeError(DecodeErrorKind::CORRUPT_STREAM,
                      std::string("zlib inflate failed: ") + zError(ret));
  }
  if (dest_len != raw_length) {
    throw DecodeError(DecodeErrorKind::SIZE_MISMATCH,
                      "Inflated " + std::to_string(dest_len) +
                          " bytes, expected " + std::to_string(raw_length));
  }
  return result;
}

std::vector<uint8_t> ChunkCodec::inflate_zstd(const uint8_t *data, size_t size,
                                              uint32_t raw_length) {
  unsigned long long frame_size = ZSTD_getFrameContentSize(data, size);
  if (frame_size == ZSTD_CONTENTSIZE_ERROR) {
    throw DecodeError(DecodeErrorKind::CORRUPT_STREAM,
                      "ZSTD frame header is invalid");
  }
  if (frame_size != ZSTD_CONTENTSIZE_UNKNOWN && frame_size != raw_length) {
    throw DecodeError(DecodeErrorKind::SIZE_MISMATCH,
                      "ZSTD frame holds " + std::to_string(frame_size) +
                          " bytes, expected " + std::to_string(raw_length));
  }

  std::vector<uint8_t> result(raw_length);
  size_t decompressed_size =
      ZSTD_decompress(result.data(), result.size(), data, size);

  if (ZSTD_isError(decompressed_size)) {
    throw DecodeError(DecodeErrorKind::CORRUPT_STREAM,
                      "ZSTD decompression failed: " +
                          std::string(ZSTD_getErrorName(decompressed_size)));
  }
  if (decompressed_size != raw_length) {
    throw DecodeError(DecodeErrorKind::SIZE_MISMATCH,
                      "Decompressed " + std::to_string(decompressed_size) +
                          " bytes, expected " + std::to_string(raw_length));
  }
  return result;
}

#ifdef PLTX_HAVE_LZ4
std::vector<uint8_t> ChunkCodec::inflate_lz4(const uint8_t *data, size_t size,
                                             uint32_t raw_length) {
  LZ4F_decompressionContext_t ctx = nullptr;
  LZ4F_errorCode_t err = LZ4F_createDecompressionContext(&ctx, LZ4F_VERSION);
  if (LZ4F_isError(err)) {
    throw DecodeError(DecodeErrorKind::CORRUPT_STREAM,
                      std::string("LZ4 context creation failed: ") +
                          LZ4F_getErrorName(err));
  }
  std::unique_ptr<LZ4F_dctx, decltype(&LZ4F_freeDecompressionContext)> guard(
      ctx, &LZ4F_freeDecompressionContext);

  // One spare byte so a frame longer than raw_length is detected
  std::vector<uint8_t> result(static_cast<size_t>(raw_length) + 1);
  size_t dst_size = result.size();
  size_t src_size = size;
  size_t hint =
      LZ4F_decompress(ctx, result.data(), &dst_size, data, &src_size, nullptr);

  if (LZ4F_isError(hint)) {
    throw DecodeError(DecodeErrorKind::CORRUPT_STREAM,
                      std::string("LZ4 decompression failed: ") +
                          LZ4F_getErrorName(hint));
  }
  if (dst_size > raw_length) {
    throw DecodeError(DecodeErrorKind::SIZE_MISMATCH,
                      "LZ4 frame inflates beyond raw length " +
                          std::to_string(raw_length));
  }
  if (hint != 0) {
    throw DecodeError(DecodeErrorKind::TRUNCATED, "LZ4 frame is incomplete");
  }
  if (src_size != size || dst_size != raw_length) {
    throw DecodeError(DecodeErrorKind::SIZE_MISMATCH,
                      "Decompressed " + std::to_string(dst_size) +
                          " bytes, expected " + std::to_string(raw_length));
  }
  result.resize(raw_length);
  return result;
}
#endif

} // namespace pltx
