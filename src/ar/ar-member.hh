/** \file   ar-member.hh
 *  \brief  Archive member variants and their classification
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef ARX_AR_MEMBER_HH_INCLUDED_
#define ARX_AR_MEMBER_HH_INCLUDED_

#include "ar-error.hh"
#include "ar-files.hh"
#include "ar-header.hh"

#include <fmt/format.h>

#include <cstddef>
#include <ctime>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace Arx {

namespace fs = std::filesystem;

/** \brief  Archive formats.  */
enum class Format {
  gnu,  ///< GNU/SVR4: short names end in '/', long names live in the string table.
  bsd,  ///< BSD: long names are stored inline after the header.
  deb   ///< Debian package: BSD short names only, fixed member order.
};

/** \brief  The on-disk encodings a member can take.  */
enum class MemberKind {
  gnu_short,         ///< GNU name <tt>name/</tt>.
  gnu_long,          ///< GNU name <tt>/offset</tt> into the string table.
  gnu_symbol_table,  ///< GNU symbol table <tt>/</tt>.
  gnu_string_table,  ///< GNU string table <tt>//</tt>.
  bsd_short,         ///< BSD name stored in the header.
  bsd_long,          ///< BSD name <tt>#1/length</tt> with the name after the header.
  bsd_symbol_table,  ///< BSD symbol table <tt>__.SYMDEF</tt>, bare or inline.
  deb_short          ///< Debian name stored in the header.
};

/** \brief  Member ID, unique within one archive session.  */
enum class MemberID : std::size_t {};

class StringTable;

/** \brief  Get the name of a format, for diagnostics.  */
constexpr auto format_name(Format format) noexcept -> char const*
{
  switch (format) {
  case Format::gnu:
    return "GNU";
  case Format::bsd:
    return "BSD";
  case Format::deb:
    return "Debian";
  }
  return "unknown";
}

namespace Details {

constexpr std::string_view gnu_symbol_table_name = "/";
constexpr std::string_view gnu_string_table_name = "//";
constexpr std::string_view bsd_symbol_table_name = "__.SYMDEF";
constexpr std::string_view bsd_sorted_symbol_table_name = "__.SYMDEF SORTED";
constexpr std::string_view bsd_long_name_prefix = "#1/";
constexpr std::string_view debian_binary_name = "debian-binary";

/** \brief  Get the name of a member kind, for diagnostics.  */
constexpr auto kind_name(MemberKind kind) noexcept -> char const*
{
  switch (kind) {
  case MemberKind::gnu_short:
    return "GNU short name";
  case MemberKind::gnu_long:
    return "GNU long name";
  case MemberKind::gnu_symbol_table:
    return "GNU symbol table";
  case MemberKind::gnu_string_table:
    return "GNU string table";
  case MemberKind::bsd_short:
    return "BSD short name";
  case MemberKind::bsd_long:
    return "BSD long name";
  case MemberKind::bsd_symbol_table:
    return "BSD symbol table";
  case MemberKind::deb_short:
    return "Debian short name";
  }
  return "unknown";
}

/** \brief  Which format family does \a kind belong to?  */
constexpr auto member_format(MemberKind kind) noexcept -> Format
{
  switch (kind) {
  case MemberKind::gnu_short:
  case MemberKind::gnu_long:
  case MemberKind::gnu_symbol_table:
  case MemberKind::gnu_string_table:
    return Format::gnu;
  case MemberKind::bsd_short:
  case MemberKind::bsd_long:
  case MemberKind::bsd_symbol_table:
    return Format::bsd;
  case MemberKind::deb_short:
    return Format::deb;
  }
  return Format::gnu;
}

/** \brief  Is \a kind an ordinary file member (as opposed to a symbol or string table)?  */
constexpr auto is_regular(MemberKind kind) noexcept -> bool
{
  return kind != MemberKind::gnu_symbol_table && kind != MemberKind::gnu_string_table &&
         kind != MemberKind::bsd_symbol_table;
}

/** \brief         Order in which to try member kinds when classifying a header.
 *  \param  format Format of the archive, or std::nullopt if not yet known.
 *
 * Symbol and string table literals are always tried before the generic name matches.  When the
 * format is unknown every GNU kind is tried, then every BSD kind.
 */
auto classification_order(std::optional<Format> format) noexcept -> std::span<MemberKind const>;

/** \brief  Order in which to try member kinds when adding a file to an archive of \a format.  */
auto creation_order(Format format) noexcept -> std::span<MemberKind const>;

/** \brief          Does the header name \a name have the shape of a \a kind member?
 *  \return         std::nullopt if not.  Otherwise the number of inline name bytes following the
 *                  header (zero for kinds that keep their name in the header).
 */
auto header_shape(MemberKind kind, std::string_view name) -> std::optional<std::size_t>;

/** \brief            Can a \a kind member represent a new file called \a filename?
 *
 * Symbol and string tables never represent an added file.
 */
auto accept_from_new_file(MemberKind kind, std::string_view filename) -> bool;

}  // namespace Details

/** \brief  An archive member.
 *
 * A member is one of the MemberKind encodings plus the common metadata.  Its payload comes
 * from exactly one place: the archive it was read from (at offset()) or, for a member added
 * from the filesystem and not yet saved, the file at source_path().
 *
 * Members are made by the classification functions: from_header() when reading an archive, and
 * from_file() when adding to one.
 */
class Member
{
public:
  ~Member() = default;
  Member(Member const&) = default;
  Member(Member&&) noexcept = default;
  auto operator=(Member const&) -> Member& = default;
  auto operator=(Member&&) noexcept -> Member& = default;

  /** \brief               Make a member from a decoded header.
   *  \param  kind         Kind to try.
   *  \param  id           ID to give the member.
   *  \param  header       Decoded header.
   *  \param  inline_name  Bytes following the header, as given by Details::header_shape().
   *  \param  data_offset  Offset of the payload in the archive.
   *  \param  strings      String table of the archive, or nullptr if there is none.
   *  \return              The member, or std::nullopt if \a header is not a \a kind member.
   *  \throw  InvalidArchive A GNU long name with no string table or a bad string table offset.
   *
   * Accepting a GNU long member registers its name in \a strings.
   */
  static auto from_header(MemberKind kind, MemberID id, Details::MemberHeader const& header,
                          std::string const& inline_name, std::size_t data_offset,
                          StringTable* strings) -> std::optional<Member>;

  /** \brief            Make a member for a file being added to an archive.
   *  \param  kind      Kind of member, which must accept \a metadata's file name.
   *  \param  id        ID to give the member.
   *  \param  metadata  Metadata of the file.
   *  \param  strings   String table to register a GNU long name in.
   *  \throw  std::logic_error \a kind cannot hold the file.
   */
  static auto from_file(MemberKind kind, MemberID id, Details::FileMetadata const& metadata,
                        StringTable* strings) -> Member;

  /** \brief          Make a symbol table member whose content is the file \a metadata.
   *  \param  format  Archive format, GNU or BSD.
   *  \param  sorted  Mark a BSD symbol table as sorted.
   *  \throw  WrongMemberType \a format has no symbol table.
   */
  static auto symbol_table(Format format, MemberID id, Details::FileMetadata const& metadata,
                           bool sorted) -> Member;

  [[nodiscard]] auto kind() const noexcept -> MemberKind { return kind_; }
  [[nodiscard]] auto id() const noexcept -> MemberID { return id_; }
  [[nodiscard]] auto format() const noexcept -> Format { return Details::member_format(kind_); }
  [[nodiscard]] auto is_regular() const noexcept -> bool { return Details::is_regular(kind_); }

  /** \brief  Name as stored in the header name field.  */
  [[nodiscard]] auto name() const -> std::string;

  /** \brief  Logical file name.  Empty for a GNU symbol or string table.  */
  [[nodiscard]] auto filename() const -> std::string const&;

  [[nodiscard]] auto mtime() const noexcept -> std::time_t { return mtime_; }
  [[nodiscard]] auto uid() const noexcept -> uid_t { return uid_; }
  [[nodiscard]] auto gid() const noexcept -> gid_t { return gid_; }
  [[nodiscard]] auto mode() const noexcept -> mode_t { return mode_; }

  /** \brief  Bytes following the header: inline name plus payload.  */
  [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }

  /** \brief  Bytes of payload.  */
  [[nodiscard]] auto filesize() const noexcept -> std::size_t { return size_ - inline_length_; }

  /** \brief  Bytes of inline name following the header.  */
  [[nodiscard]] auto inline_length() const noexcept -> std::size_t { return inline_length_; }

  /** \brief  Is this a sorted BSD symbol table?  */
  [[nodiscard]] auto sorted() const noexcept -> bool { return sorted_; }

  /** \brief  Offset of the payload in the archive, if it has been read or written.  */
  [[nodiscard]] auto offset() const noexcept -> std::optional<std::size_t> { return offset_; }

  /** \brief  File the payload is to be copied from, if not yet written to an archive.  */
  [[nodiscard]] auto source_path() const noexcept -> std::optional<fs::path> const&
  {
    return source_path_;
  }

  /** \brief  Header to write for this member.  */
  [[nodiscard]] auto header() const -> Details::MemberHeader;

  /** \brief  Bytes to write between the header and the payload.  */
  [[nodiscard]] auto inline_name() const -> std::string;

  /** \brief  Record that the payload is now at \a offset of the archive just written.  */
  void relocate(std::size_t offset) noexcept;

private:
  Member(MemberKind kind, MemberID id);

  MemberKind kind_;                        ///< Encoding
  MemberID id_;                            ///< ID
  std::string name_;                       ///< Header name, for kinds where it is literal.
  std::string filename_;                   ///< Logical name, unless a GNU long name.
  std::time_t mtime_ = 0;                  ///< Modification time
  uid_t uid_ = 0;                          ///< User ID
  gid_t gid_ = 0;                          ///< Group ID
  mode_t mode_ = 0;                        ///< Mode
  std::size_t size_ = 0;                   ///< Size of inline name and payload
  std::size_t inline_length_ = 0;          ///< Size of inline name
  bool sorted_ = false;                    ///< Sorted BSD symbol table?
  std::optional<std::size_t> offset_;      ///< Payload offset in the archive.
  std::optional<fs::path> source_path_;    ///< File to take the payload from.
  StringTable const* strings_ = nullptr;   ///< String table holding a GNU long name.
};

/** \brief  Describe \a member for diagnostics.  */
auto describe(Member const& member) -> std::string;

namespace Details {

/** \brief                Try to read a member of \a kind from an archive.
 *  \tparam IFType        Input file type
 *  \param  kind          Kind to try.
 *  \param  raw           Raw header, already read from \a file.
 *  \param  name          Name field of \a raw.
 *  \param  header_offset Offset of the header in \a file.
 *  \param  file          Archive, positioned just after the header.
 *  \param  strings       String table of the archive, or nullptr.
 *  \param  id            ID to give the member.
 *  \return               The member with \a file positioned at its payload, or std::nullopt
 *                        if the header is not a \a kind member.
 *  \throw  InvalidArchive The header matches \a kind's name shape but is malformed.
 *
 * On rejection \a file may have moved; callers seek back before trying another kind.
 */
template<typename IFType>
auto accept_from_header(MemberKind kind, MemberHeader::Raw const& raw, std::string const& name,
                        std::size_t header_offset, IFType& file, StringTable* strings,
                        MemberID id) -> std::optional<Member>
{
  auto inline_length = header_shape(kind, name);
  if (!inline_length.has_value()) {
    return std::nullopt;
  }

  /* Historical string table headers leave everything but the size blank.  */
  auto header = MemberHeader::decode(raw, header_offset, kind == MemberKind::gnu_string_table);
  if (*inline_length > header.size()) {
    throw InvalidArchive(
      fmt::format("Inline name of {} bytes is longer than the {} byte member at offset {}",
                  *inline_length, header.size(), header_offset));
  }

  std::string inline_name(*inline_length, '\0');
  if (!inline_name.empty()) {
    auto got = file.read_upto(std::span<char>(inline_name.data(), inline_name.size()));
    if (got != inline_name.size()) {
      throw InvalidArchive(fmt::format("Inline name of member at offset {} is truncated.",
                                       header_offset));
    }
  }

  return Member::from_header(kind, id, header, inline_name, file.offset_bytes(), strings);
}

}  // namespace Details
}  // namespace Arx

#endif  // ARX_AR_MEMBER_HH_INCLUDED_
