/**
 * FileHandle - serialized byte-range reads on one open file
 *
 * One descriptor is shared by every cursor of a reader. Each read_range()
 * holds the handle's mutex for the whole seek + read, so reads issued from
 * different threads never interleave.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace pltx {

class FileHandle {
public:
  /**
   * Open file read-only
   *
   * @param filename File path
   * @param use_mmap Serve reads from a read-only mapping (default: false)
   * @throws OpenError NOT_FOUND if the file does not exist, IO_ERROR otherwise
   */
  explicit FileHandle(const std::string &filename, bool use_mmap = false);

  ~FileHandle();

  FileHandle(const FileHandle &) = delete;
  FileHandle &operator=(const FileHandle &) = delete;

  /**
   * Read exactly `length` bytes at `offset`
   *
   * @throws IoError on short read or range outside the file
   */
  std::vector<uint8_t> read_range(uint64_t offset, uint64_t length) const;

  /**
   * Read exactly `length` bytes at `offset` into `dest`
   */
  void read_into(uint64_t offset, void *dest, uint64_t length) const;

  uint64_t size() const { return file_size_; }
  const std::string &filename() const { return filename_; }
  bool is_mapped() const { return mmap_data_ != nullptr; }

  /// Number of read_range()/read_into() calls served so far
  uint64_t read_count() const;

private:
  void read_locked(uint64_t offset, uint8_t *dest, uint64_t length) const;

  std::string filename_;
  int fd_;
  void *mmap_data_;
  uint64_t file_size_;

  mutable std::mutex mutex_;
  mutable uint64_t read_count_;
};

} // namespace pltx
