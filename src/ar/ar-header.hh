/** \file   ar-header.hh
 *  \brief  Fixed width archive member header encoding and decoding
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef ARX_AR_HEADER_HH_INCLUDED_
#define ARX_AR_HEADER_HH_INCLUDED_

#include <sys/types.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <ctime>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace Arx::Details {

/** \brief  Magic string at the start of every archive.  */
constexpr std::string_view archive_magic = "!<arch>\n";

/** \brief  Byte inserted after a member whose data ends at an odd offset.  */
constexpr char pad_byte = '\n';

/** \brief        Make a string of raw archive bytes printable for a diagnostic.
 *  \param  bytes Bytes to render.
 *  \return       \a bytes with non-printable characters written as \c \\xNN escapes.
 */
auto printable(std::string_view bytes) -> std::string;

/** \brief        Read a number in the string \a v
 *  \tparam T     Type of number to return
 *  \tparam Base  Base of number to read.
 *  \param  v     String of value to read.
 *  \return       Value read, or std::nullopt if \a v is not a number.
 *
 * Valid numbers start with zero or more space, followed by one or more digits, terminated by zero
 * or more space.
 */
template<typename T, unsigned Base = 10>  // NOLINT
auto to_number(std::string_view v) -> std::optional<T>
{
  static_assert(Base <= 10);  // NOLINT
  static_assert(std::numeric_limits<T>::digits >= 32);

  /* Skip any leading whitespace. */
  auto it = std::find_if_not(v.begin(), v.end(), [](char c) { return c == ' '; });
  if (it == v.end()) {
    return std::nullopt;
  }

  /* Convert to unsigned integer.  */
  T result = 0;
  auto digits_end = std::find_if_not(it, v.end(), [&result](char c) {
    if (c >= '0' && c < static_cast<char>('0' + Base)) {
      result *= Base;
      result += c - '0';
      return true;
    }
    return false;
  });

  if (digits_end == it) {
    return std::nullopt;
  }
  if (std::find_if_not(digits_end, v.end(), [](char c) { return c == ' '; }) != v.end()) {
    return std::nullopt;
  }
  return result;
}

/** \brief  Header of an archive member.
 *
 * On disk a header is exactly header_len bytes of space padded text:
 *
 * | Field      | Width | Encoding       |
 * |------------|-------|----------------|
 * | name       | 16    | text           |
 * | mtime      | 12    | decimal        |
 * | uid        | 6     | decimal        |
 * | gid        | 6     | decimal        |
 * | mode       | 8     | octal          |
 * | size       | 10    | decimal        |
 * | terminator | 2     | <tt>`\\n</tt>  |
 *
 * The name stored here has its padding removed.  How the name maps onto a member's file name is
 * up to the member variant.
 */
class MemberHeader
{
public:
  static constexpr std::size_t name_len = 16;    ///< Length of name field
  static constexpr std::size_t mtime_len = 12;   ///< Length of the mtime field
  static constexpr std::size_t uid_len = 6;      ///< Length of the User-ID field
  static constexpr std::size_t gid_len = 6;      ///< Length of the group-id field
  static constexpr std::size_t mode_len = 8;     ///< Length of the mode field
  static constexpr std::size_t size_len = 10;    ///< Length of the size field.
  static constexpr std::size_t fmag_len = 2;     ///< Length of the header terminator field.
  static constexpr std::size_t header_len = 60;  ///< Length of header in table.

  /** \brief  Raw bytes of a header.  */
  using Raw = std::array<char, header_len>;

  MemberHeader() = default;

  /** \brief        Construct a header ready for encoding.
   *  \param  name  Contents of the name field, at most name_len bytes.
   *  \param  mtime Modification time (seconds since 1 Jan 1970)
   *  \param  uid   User ID
   *  \param  gid   Group ID
   *  \param  mode  File mode
   *  \param  size  Number of bytes following the header.
   */
  MemberHeader(std::string name, std::time_t mtime, uid_t uid, gid_t gid, mode_t mode,
               std::size_t size);

  ~MemberHeader() = default;
  MemberHeader(MemberHeader const&) = default;
  MemberHeader(MemberHeader&&) noexcept = default;
  auto operator=(MemberHeader const&) -> MemberHeader& = default;
  auto operator=(MemberHeader&&) noexcept -> MemberHeader& = default;

  /** \brief                 Get the name field of a raw header.
   *  \param  raw            Raw header
   *  \param  offset         Offset of the header in the archive, for diagnostics.
   *  \return                Name field with leading and trailing spaces removed.
   *  \throw  InvalidArchive The header terminator is wrong.
   */
  static auto name_field(Raw const& raw, std::size_t offset) -> std::string;

  /** \brief                 Decode a raw header.
   *  \param  raw            Raw header
   *  \param  offset         Offset of the header in the archive, for diagnostics.
   *  \param  lenient        If true mtime, uid, gid, and mode default to zero when they do not
   *                         parse.  The size must always parse.
   *  \return                Decoded header.
   *  \throw  InvalidArchive The terminator is wrong or a required field is not a number.
   */
  static auto decode(Raw const& raw, std::size_t offset, bool lenient = false) -> MemberHeader;

  /** \brief  Encode the header into its on-disk form.
   *  \throw  std::logic_error   The name is longer than name_len.
   *  \throw  std::runtime_error A number does not fit in its field.
   */
  [[nodiscard]] auto encode() const -> Raw;

  /** Get archive member name.  */
  [[nodiscard]] auto name() const noexcept -> std::string const&;

  /** Get archive member modification time (secs since 1 Jan 1970).  */
  [[nodiscard]] auto mtime() const noexcept -> std::time_t;

  /** \brief  Get archive member User ID.  */
  [[nodiscard]] auto uid() const noexcept -> uid_t;

  /** \brief  Get archive member Group ID.  */
  [[nodiscard]] auto gid() const noexcept -> gid_t;

  /** \brief  Get archive member mode. */
  [[nodiscard]] auto mode() const noexcept -> mode_t;

  /** \brief  Get archive member size.  */
  [[nodiscard]] auto size() const noexcept -> std::size_t;

  /** Equality comparison.  */
  auto operator==(MemberHeader const& rhs) const noexcept -> bool;

private:
  std::string name_;      ///< Member name
  std::time_t mtime_ = 0; ///< Member modification time (seconds since 1 Jan 1970)
  uid_t uid_ = 0;         ///< User ID
  gid_t gid_ = 0;         ///< Group ID
  mode_t mode_ = 0;       ///< Mode
  std::size_t size_ = 0;  ///< Size of member
};

}  // namespace Arx::Details

#endif  // ARX_AR_HEADER_HH_INCLUDED_
