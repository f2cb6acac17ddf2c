/**
 * @file memory_io.cpp
 * @brief mmap-backed reads and rename-backed writes
 */

#include "term_reel/memory_io.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "term_reel/logging.hpp"

namespace term_reel {

// **---- Mapping ----**

MappedFile::~MappedFile() { release(); }

void MappedFile::release() {
  if (data_)
    munmap(data_, size_);
  if (fd_ != -1)
    close(fd_);
  data_ = nullptr;
  size_ = 0;
  fd_ = -1;
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(std::exchange(other.data_, nullptr)),
      size_(std::exchange(other.size_, 0)),
      fd_(std::exchange(other.fd_, -1)) {}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    release();
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

// **---- Reading and Writing ----**

bool MemoryLoader::load_file(const std::string &path, MappedFile &file) {
  TIMER_START(load_file);

  int fd = open(path.c_str(), O_RDONLY);
  if (fd == -1) {
    LOG_ERROR("Cannot open recording {} ({})", path, std::strerror(errno));
    return false;
  }

  struct stat sb;
  if (fstat(fd, &sb) == -1 || sb.st_size <= 0) {
    /// An empty file cannot be mapped and holds no document anyway
    LOG_ERROR("Recording {} is empty or unreadable", path);
    close(fd);
    return false;
  }
  const size_t size = static_cast<size_t>(sb.st_size);

  void *addr = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
  if (addr == MAP_FAILED) {
    LOG_ERROR("Cannot map recording {} ({})", path, std::strerror(errno));
    close(fd);
    return false;
  }
  madvise(addr, size, MADV_SEQUENTIAL);

  file.release();
  file.data_ = static_cast<uint8_t *>(addr);
  file.size_ = size;
  file.fd_ = fd;

  TIMER_END(load_file);
  return true;
}

bool MemoryLoader::write_file(const std::string &path, std::string_view data) {
  TIMER_START(write_file);

  std::string tmp_path = path + ".tmp";
  int fd = open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd == -1) {
    LOG_ERROR("Failed to create file: {} ({})", tmp_path,
              std::strerror(errno));
    return false;
  }

  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = write(fd, data.data() + written, data.size() - written);
    if (n == -1) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("Failed to write file: {} ({})", tmp_path,
                std::strerror(errno));
      close(fd);
      unlink(tmp_path.c_str());
      return false;
    }
    written += static_cast<size_t>(n);
  }

  int sync_rc = fsync(fd);
  int close_rc = close(fd);
  if (sync_rc == -1 || close_rc == -1) {
    LOG_ERROR("Failed to flush file: {}", tmp_path);
    unlink(tmp_path.c_str());
    return false;
  }

  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    LOG_ERROR("Failed to replace {} ({})", path, std::strerror(errno));
    unlink(tmp_path.c_str());
    return false;
  }

  TIMER_END(write_file);
  return true;
}

} // namespace term_reel
