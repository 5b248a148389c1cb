/** \file   include/util/file.hh
 *  \brief  File utilities
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#ifndef ARX_INCLUDE_UTIL_FILE_HH_INCLUDED
#define ARX_INCLUDE_UTIL_FILE_HH_INCLUDED

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iterator>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace Arx {

/** \section  ReadingWriting Reading and writing files
 * \subsection Concepts Concepts
 *
 * \subsubsection ConceptIFType IFType Concept
 *
 * The IFType Concept provides file reading functions.  Types implementing the concept need to
 * implement the following member functions:
 *
 * // Return the number of bytes in a file.
 * std::size_t size_bytes() const;
 *
 * // Current offset in the file.
 * std::size_t offset_bytes() const;
 *
 * // Set the current offset in the file.  Setting the offset to size_bytes() is allowed.
 * void offset_bytes(std::size_t offset);
 *
 * // Read the next s.size_bytes() starting at offset_bytes() into the given span.  An exception is
 * // to be raised if there are not enough bytes to fill the span.  Updates offset_bytes() by
 * // s.size_bytes() bytes.
 * template<typename T, std::size_t E>
 * void read(std::span<T, E> s);
 *
 * // Read up to s.size_bytes() from offset_bytes() into the given span.  Returns the number of
 * // bytes actually read.  Updates offset_bytes() by the number of bytes read.
 * template<typename T, std::size_t E>
 * std::size_t read_upto(std::span<T, E> s);
 *
 * \subsubsection ConceptOFType OFType Concept
 *
 * // Append the bytes of the span to the file.
 * template<typename T, std::size_t E>
 * void write(std::span<T, E> s);
 *
 * // Number of bytes written so far, which is the offset the next write lands at.
 * std::size_t offset_bytes() const;
 */

/** \brief  Input file based on a file.
 *
 * Implements the IFType concept.
 */
class InputFile
{
public:
  /** \brief      Construct the input file.
   *  \param name Name of the file.
   */
  explicit InputFile(std::string name) : name_(std::move(name)), fd_(::open(name_.c_str(), O_RDONLY))
  {
    if (fd_ == -1) {
      throw std::system_error(errno, std::generic_category(), "Unable to open " + name_);
    }
    if (::fstat(fd_, &stat_) == -1) {
      auto saved_errno = errno;
      ::close(fd_);
      fd_ = -1;
      throw std::system_error(saved_errno, std::generic_category(), "Unable to stat " + name_);
    }
  }

  ~InputFile()
  {
    if (fd_ != -1) {
      ::close(fd_);
    }
  }

  InputFile(InputFile const&) = delete;
  InputFile(InputFile&& rhs) noexcept
      : name_(std::move(rhs.name_)), stat_(rhs.stat_), fd_(rhs.fd_), offset_(rhs.offset_)
  {
    rhs.fd_ = -1;
  }

  auto operator=(InputFile const&) -> InputFile& = delete;
  auto operator=(InputFile&& rhs) noexcept -> InputFile&
  {
    if (&rhs != this) {
      if (fd_ != -1) {
        ::close(fd_);
      }
      name_ = std::move(rhs.name_);
      stat_ = rhs.stat_;
      fd_ = rhs.fd_;
      offset_ = rhs.offset_;
      rhs.fd_ = -1;
    }

    return *this;
  }

  [[nodiscard]] auto size_bytes() const noexcept -> std::size_t
  {
    return static_cast<std::size_t>(stat_.st_size);
  }

  [[nodiscard]] auto offset_bytes() const noexcept -> std::size_t { return offset_; }

  void offset_bytes(std::size_t offset)
  {
    if (::lseek(fd_, static_cast<::off_t>(offset), SEEK_SET) == -1) {
      throw std::system_error(errno, std::generic_category(), "Whilst seeking in " + name_);
    }
    offset_ = offset;
  }

  template<typename T, std::size_t Count>
  void read(std::span<T, Count> dest)
  {
    auto res = read_upto(dest);
    if (res != dest.size_bytes()) {
      throw std::runtime_error("Unable to read enough bytes from " + name_);
    }
  }

  template<typename T, std::size_t Count>
  auto read_upto(std::span<T, Count> dest) -> std::size_t
  {
    auto saved_errno = errno;
    std::byte* data = std::as_writable_bytes(dest).data();
    std::size_t count = dest.size_bytes();
    while (count > 0) {
      errno = 0;
      ::ssize_t res = ::read(fd_, data, count);
      if (res < 0) {
        if (errno != EINTR) {
          throw std::system_error(errno, std::generic_category(), "Whilst reading " + name_);
        }
        continue;
      }
      if (res == 0) {
        break;
      }
      count -= static_cast<std::size_t>(res);
      data += res;  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    };

    errno = saved_errno;
    offset_ += dest.size_bytes() - count;
    return dest.size_bytes() - count;
  }

  [[nodiscard]] auto name() const -> std::string const& { return name_; }

  [[nodiscard]] auto mtime() const -> std::time_t
  {
#ifdef __APPLE__
    return stat_.st_mtimespec.tv_sec;
#else
    return stat_.st_mtim.tv_sec;
#endif  // __APPLE__
  }

  [[nodiscard]] auto uid() const -> uid_t { return stat_.st_uid; }

  [[nodiscard]] auto gid() const -> gid_t { return stat_.st_gid; }

  [[nodiscard]] auto mode() const -> mode_t { return stat_.st_mode; }

private:
  std::string name_;         ///< File name.
  struct stat stat_ = {};    ///< File stats.
  int fd_;                   ///< File descriptor
  std::size_t offset_ = 0;   ///< Current offset.
};

/** \brief  Input file based on a memory span.
 *
 * Implements the IFType concept.
 */
class MemorySpanInputFile
{
public:
  /** \brief     Construct the input file.
   *  \param mem Memory to use as the file data.
   *
   * \a mem must remain valid for the lifetime of this MemorySpanInputFile object.
   */
  template<typename T, std::size_t E>
  explicit MemorySpanInputFile(std::span<T, E> mem) : data_(std::as_bytes(mem)), offset_(0)
  {
  }

  ~MemorySpanInputFile() = default;
  MemorySpanInputFile(MemorySpanInputFile const&) = default;
  MemorySpanInputFile(MemorySpanInputFile&&) = default;
  auto operator=(MemorySpanInputFile const&) -> MemorySpanInputFile& = default;
  auto operator=(MemorySpanInputFile&&) -> MemorySpanInputFile& = default;

  [[nodiscard]] auto size_bytes() const noexcept -> std::size_t { return data_.size_bytes(); }

  [[nodiscard]] auto offset_bytes() const noexcept -> std::size_t { return offset_; }

  void offset_bytes(std::size_t offset)
  {
    if (offset > size_bytes()) {
      throw std::runtime_error("Tried to set offset outside of data.");
    }
    offset_ = offset;
  }

  template<typename T, std::size_t Count>
  void read(std::span<T, Count> dest)
  {
    read_at(dest, offset_);
    offset_ += dest.size_bytes();
  }

  template<typename T, std::size_t Count>
  void read_at(std::span<T, Count> dest, std::size_t offset) const
  {
    if (offset > size_bytes()) {
      throw std::runtime_error("Reading outside of data.");
    }
    if (size_bytes() - offset < dest.size_bytes()) {
      throw std::runtime_error("Trying to read too many bytes");
    }
    std::memcpy(dest.data(), data_.data() + offset, dest.size_bytes());  // NOLINT
  }

  template<typename T, std::size_t Count>
  auto read_upto(std::span<T, Count> dest) -> std::size_t
  {
    std::size_t count = std::min(dest.size_bytes(), size_bytes() - offset_);
    std::memcpy(dest.data(), data_.data() + offset_, count);  // NOLINT
    offset_ += count;
    return count;
  }

private:
  std::span<std::byte const> data_;  ///< Data we're using
  std::size_t offset_;               ///< Current offset into the file.
};

/** \brief  Output file that collects everything written to it in memory.
 *
 * Implements the OFType concept.
 */
class MemoryFileWriter
{
public:
  explicit MemoryFileWriter() = default;
  ~MemoryFileWriter() = default;

  MemoryFileWriter(MemoryFileWriter const&) = delete;
  MemoryFileWriter(MemoryFileWriter&&) = default;
  auto operator=(MemoryFileWriter const&) -> MemoryFileWriter& = delete;
  auto operator=(MemoryFileWriter&&) -> MemoryFileWriter& = default;

  /** \brief Write
   *  \tparam T Type of data in span
   *  \tparam E Extent of span
   *  \param span Span to output.
   */
  template<typename T, std::size_t E>
  void write(std::span<T, E> span)
  {
    auto raw_data = std::as_bytes(span);
    data_.reserve(data_.size() + raw_data.size_bytes());
    std::copy(raw_data.begin(), raw_data.end(), std::back_inserter(data_));
  }

  [[nodiscard]] auto offset_bytes() const noexcept -> std::size_t { return data_.size(); }

  /** \brief  Get the data that has been written to this memory file.  */
  [[nodiscard]] auto data() const noexcept -> std::span<std::byte const>
  {
    return std::span<std::byte const>(data_);
  }

private:
  std::vector<std::byte> data_;
};

/** \brief  Implement a transactional file writer.
 *
 * By "transactional" we mean that the destination file is either completely written with the new
 * data, or the previous file state is left.
 *
 * Example usage:
 *
 * \code {.c++}
 * TxnWriteFile file("file.txt", 0644);
 * file.write(std::span<char const>(text));
 * file.commit(); // Needed to show we've finished writing.
 * \endcode
 *
 * Implements the OFType concept.
 */
class TxnWriteFile
{
public:
  /** \brief  Constructor
   *  \param dest Destination file
   *  \param mode Mode to give destination file.
   */
  TxnWriteFile(fs::path const& dest, mode_t mode) : fd_(-1), dest_(dest), mode_(mode & 07777)
  {
    // Use a temporary file if the destination already exists.
    if (fs::exists(dest_)) {
      temp_ = dest_ + "XXXXXX";
      while (fd_ == -1) {
        fd_ = ::mkstemp(temp_.data());
        if (fd_ == -1 && errno != EINTR) {
          throw std::system_error(errno, std::generic_category(), "Whilst opening temp file.");
        }
      }
      return;
    }

    temp_ = dest_;
    while (fd_ == -1) {
      fd_ = ::open(dest_.c_str(), O_WRONLY | O_CREAT | O_EXCL, S_IWUSR | S_IRUSR);
      if (fd_ == -1 && errno != EINTR) {
        throw std::system_error(errno, std::generic_category(), "Whilst opening " + dest_);
      }
    }
  }

  /** \brief Destructor
   *
   * If TxnWriteFile::commit() has *not* been called this will abort the file write.
   */
  ~TxnWriteFile() { abort(); }

  /** Cannot copy.  */
  TxnWriteFile(TxnWriteFile const&) = delete;
  auto operator=(TxnWriteFile const&) -> TxnWriteFile& = delete;

  /** \brief Move constructor.  */
  TxnWriteFile(TxnWriteFile&& rhs) noexcept
      : fd_(rhs.fd_), dest_(std::move(rhs.dest_)), temp_(std::move(rhs.temp_)), mode_(rhs.mode_),
        offset_(rhs.offset_)
  {
    rhs.has_moved();
  }

  /** \brief Move assignment.  */
  auto operator=(TxnWriteFile&& rhs) noexcept -> TxnWriteFile&
  {
    if (this != &rhs) {
      abort();
      fd_ = rhs.fd_;
      dest_ = std::move(rhs.dest_);
      temp_ = std::move(rhs.temp_);
      mode_ = rhs.mode_;
      offset_ = rhs.offset_;
      rhs.has_moved();
    }
    return *this;
  }

  /** \brief Write
   *  \tparam T Type of data in span
   *  \tparam E Extent of span
   *  \param span Span to output.
   */
  template<typename T, std::size_t E>
  void write(std::span<T, E> span)
  {
    if (fd_ == -1 || temp_.empty()) {
      throw std::runtime_error("Writing after file has been committed.");
    }
    auto const* data = std::as_bytes(span).data();
    auto count = span.size_bytes();
    while (count != 0) {
      auto res = ::write(
        fd_, data, std::min(static_cast<std::size_t>(std::numeric_limits<::ssize_t>::max()), count));
      if (res == -1) {
        if (errno != EINTR) {
          throw std::system_error(errno, std::generic_category(), "Whilst writing " + dest_);
        }
      }
      else {
        data += res;  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        count -= static_cast<std::size_t>(res);
        offset_ += static_cast<std::size_t>(res);
      }
    }
  }

  [[nodiscard]] auto offset_bytes() const noexcept -> std::size_t { return offset_; }

  /** \brief Commit transaction.  */
  void commit()
  {
    if (fd_ == -1 || temp_.empty()) {
      throw std::runtime_error("Committing empty txn.");
    }
    if (::close(fd_) == -1) {
      fd_ = -1;
      throw std::system_error(errno, std::generic_category(), "Whilst closing " + temp_);
    }
    fd_ = -1;
    if (temp_ != dest_) {
      if (::rename(temp_.c_str(), dest_.c_str()) == -1) {
        throw std::system_error(errno, std::generic_category(), "Whilst committing a write.");
      }
    }
    temp_.clear();
    /* And set the mode bits appropriately.  */
    if (::chmod(dest_.c_str(), mode_) == -1) {
      throw std::system_error(errno, std::generic_category(), "Whilst setting mode of " + dest_);
    }
  }

  /** \brief  Abort transaction.  */
  void abort() noexcept
  {
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
    if (!temp_.empty()) {
      // Nothing useful to do if the clean-up fails.
      (void)std::remove(temp_.c_str());
    }
    temp_.clear();
  }

private:
  /** \brief Mark the object as having been moved. */
  void has_moved() noexcept
  {
    fd_ = -1;
    temp_.clear();
  }

  int fd_;                   ///< File descriptor.
  std::string dest_;         ///< Final destination file.
  std::string temp_;         ///< File we actually write to.
  mode_t mode_;              ///< Final mode to give file.
  std::size_t offset_ = 0;   ///< Bytes written so far.
};

}  // namespace Arx

#endif  // ARX_INCLUDE_UTIL_FILE_HH_INCLUDED
