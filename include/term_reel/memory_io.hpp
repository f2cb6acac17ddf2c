/**
 * @file memory_io.hpp
 * @brief Whole-file reads and atomic writes of recording documents
 */

#ifndef TERM_REEL_MEMORY_IO_HPP
#define TERM_REEL_MEMORY_IO_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace term_reel {

/**
 * @class MappedFile
 * @brief A recording document mapped read-only; the parser reads it in place.
 */
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  bool is_valid() const { return data_ != nullptr; }

  std::string_view view() const {
    return std::string_view(reinterpret_cast<const char *>(data_), size_);
  }

private:
  friend class MemoryLoader;
  void release();

  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  int fd_ = -1;
};

/// File access used by session_io and the CLI
class MemoryLoader {
public:
  /**
   * @brief Map path into file, replacing whatever file held before.
   * @return false (and logs why) if path is missing, unreadable or empty
   */
  static bool load_file(const std::string &path, MappedFile &file);

  /**
   * @brief Write data to a sibling path + ".tmp", then rename it over path.
   * @return false on failure; an existing recording at path is left intact
   */
  static bool write_file(const std::string &path, std::string_view data);
};

} // namespace term_reel

#endif // TERM_REEL_MEMORY_IO_HPP
