/**
 * FileHandle Implementation
 *
 * POSIX descriptor with optional read-only mapping.
 */

#include "pltx/data/file_handle.hpp"
#include "pltx/core/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pltx {

FileHandle::FileHandle(const std::string &filename, bool use_mmap)
    : filename_(filename), fd_(-1), mmap_data_(nullptr), file_size_(0),
      read_count_(0) {
  fd_ = ::open(filename_.c_str(), O_RDONLY);
  if (fd_ == -1) {
    int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
      throw OpenError(OpenErrorKind::NOT_FOUND, "No such file: " + filename_);
    }
    throw OpenError(OpenErrorKind::IO_ERROR,
                    "Failed to open file: " + filename_ + " (" +
                        std::strerror(err) + ")");
  }

  struct stat st;
  if (fstat(fd_, &st) == -1) {
    int err = errno;
    ::close(fd_);
    throw OpenError(OpenErrorKind::IO_ERROR,
                    "Failed to get file size: " + filename_ + " (" +
                        std::strerror(err) + ")");
  }
  if (!S_ISREG(st.st_mode)) {
    ::close(fd_);
    throw OpenError(OpenErrorKind::IO_ERROR, "Not a regular file: " + filename_);
  }

  file_size_ = static_cast<uint64_t>(st.st_size);

  if (use_mmap && file_size_ > 0) {
    mmap_data_ = mmap(nullptr, file_size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (mmap_data_ == MAP_FAILED) {
      mmap_data_ = nullptr;
      ::close(fd_);
      throw OpenError(OpenErrorKind::IO_ERROR, "Failed to mmap file: " + filename_);
    }
  }
}

FileHandle::~FileHandle() {
  if (mmap_data_) {
    munmap(mmap_data_, file_size_);
  }
  if (fd_ != -1) {
    ::close(fd_);
  }
}

std::vector<uint8_t> FileHandle::read_range(uint64_t offset,
                                            uint64_t length) const {
  std::vector<uint8_t> data(length);
  read_into(offset, data.data(), length);
  return data;
}

void FileHandle::read_into(uint64_t offset, void *dest, uint64_t length) const {
  if (offset > file_size_ || length > file_size_ - offset) {
    throw IoError("Range [" + std::to_string(offset) + ", +" +
                  std::to_string(length) + ") outside file of " +
                  std::to_string(file_size_) + " bytes: " + filename_);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ++read_count_;
  if (length == 0) {
    return;
  }
  read_locked(offset, static_cast<uint8_t *>(dest), length);
}

uint64_t FileHandle::read_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return read_count_;
}

void FileHandle::read_locked(uint64_t offset, uint8_t *dest,
                             uint64_t length) const {
  if (mmap_data_) {
    const uint8_t *src = static_cast<const uint8_t *>(mmap_data_) + offset;
    std::memcpy(dest, src, length);
    return;
  }

  // The descriptor's position is shared state: seek + read under the lock
  if (lseek(fd_, static_cast<off_t>(offset), SEEK_SET) == static_cast<off_t>(-1)) {
    throw IoError("Seek failed at offset " + std::to_string(offset) + ": " +
                  std::strerror(errno));
  }

  uint64_t done = 0;
  while (done < length) {
    ssize_t n = ::read(fd_, dest + done, length - done);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw IoError("Read failed at offset " + std::to_string(offset + done) +
                    ": " + std::strerror(errno));
    }
    if (n == 0) {
      throw IoError("Unexpected end of file at offset " +
                    std::to_string(offset + done) + ": " + filename_);
    }
    done += static_cast<uint64_t>(n);
  }
}

} // namespace pltx
