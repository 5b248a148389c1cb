/** \file   ar.hh
 *  \brief  Header file for the archive library
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef ARX_AR_HH_INCLUDED_
#define ARX_AR_HH_INCLUDED_

#include "util/file.hh"

#include "ar-error.hh"
#include "ar-files.hh"
#include "ar-header.hh"
#include "ar-member.hh"
#include "ar-string-table.hh"
#include "ar-transfer.hh"

#include <fmt/format.h>
#include <spdlog/logger.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

/** \brief  Namespace for the archive library.
 *
 * This reads and writes `ar` format archives in the GNU, BSD, and Debian package flavours.
 *
 * To read an archive and extract everything do:
 *
 * \code
 * Arx::FileArchive archive;
 * archive.load("libfoo.a");
 * for (auto const& member : archive) {
 *   std::cout << member.filename() << '\n';
 * }
 * archive.extract_all("out");
 * \endcode
 *
 * To build an archive do:
 *
 * \code
 * Arx::FileArchive archive(Arx::Format::bsd);
 * archive.add("alpha.o");
 * archive.add("a_rather_long_file_name.o");
 * archive.save("libfoo.a");
 * \endcode
 *
 * Archive members read from an archive keep referring to the archive's input file until the
 * archive is saved.  Input files are of a type implementing the IFType concept, output files the
 * OFType concept (see util/file.hh).
 */
namespace Arx {

namespace Details {

/** \brief  Get a logger that discards everything.  */
auto null_logger() -> std::shared_ptr<spdlog::logger>;

/** \brief                 Order the members of a Debian package for writing.
 *  \param  members        Members in their current order.
 *  \return                Indices into \a members: the first \c debian-binary, the first
 *                         \c control.tar*, the first \c data.tar*, then the rest in order.
 *  \throw  InvalidArchive One of the three required members is missing.
 */
auto debian_order(std::vector<Member> const& members) -> std::vector<std::size_t>;

}  // namespace Details

/** \brief         An archive session.
 *  \tparam IFType Type of the file archives are read from.
 *
 * An Archive holds the regular members of an archive in file order, together with the optional
 * symbol table and string table.  It is either loaded from an existing archive or built up with
 * add(), and written out with save().
 *
 * Diagnostics are sent at debug level to the logger given on construction.
 */
template<typename IFType>
class Archive
{
public:
  using const_iterator = std::vector<Member>::const_iterator;  ///< Iterator over members.

  /** \brief         Construct an empty archive.
   *  \param  format Format to use when building the archive.  Loading an archive replaces it.
   *  \param  logger Logger for diagnostics.  If null nothing is logged.
   */
  explicit Archive(Format format = Format::gnu, std::shared_ptr<spdlog::logger> logger = nullptr)
      : format_(format),
        logger_(logger != nullptr ? std::move(logger) : Details::null_logger())
  {
  }

  ~Archive() = default;
  Archive(Archive const&) = delete;
  Archive(Archive&&) noexcept = default;
  auto operator=(Archive const&) -> Archive& = delete;
  auto operator=(Archive&&) noexcept -> Archive& = default;

  /** \brief                 Get the archive format.
   *  \throw  InvalidArchive No format has been chosen or detected yet.
   */
  [[nodiscard]] auto format() const -> Format
  {
    if (!format_.has_value()) {
      throw InvalidArchive("Archive format has not been chosen or detected.");
    }
    return *format_;
  }

  /** \brief  Has a format been chosen or detected?  */
  [[nodiscard]] auto has_format() const noexcept -> bool { return format_.has_value(); }

  /** \brief                 Load an archive, replacing the current contents.
   *  \param  file           File to read from.  The archive keeps it to read payloads from.
   *  \throw  InvalidArchive The archive is malformed.
   *  \throw  WrongMemberType A member header has an unrecognised name.
   *
   * If loading fails the archive is left empty and the file is released.
   */
  void load(IFType&& file)
  {
    reset();
    try {
      in_.emplace(std::move(file));
      read_archive();
    }
    catch (...) {
      reset();
      throw;
    }
  }

  /** \brief  Load the archive at \a path, replacing the current contents.  */
  void load(fs::path const& path) { load(IFType(path.string())); }

  /** \brief         Write the archive.
   *  \tparam OFType Output file type.
   *  \param  file   File to write to.
   *
   * Afterwards every member refers to its location in \a file, and the archive has no input file
   * bound.  Payloads can no longer be extracted until the archive is loaded again.
   */
  template<typename OFType>
    requires(!std::is_convertible_v<OFType const&, fs::path>)
  void save(OFType& file)
  {
    auto placement = write_archive(file);
    relocate(placement);
    in_.reset();
  }

  /** \brief        Write the archive to \a path.
   *  \param  path  Destination.  Replaced only once the whole archive has been written.
   *  \param  mode  Mode of the written archive.
   *
   * Afterwards the archive reads its members from the file at \a path.
   */
  void save(fs::path const& path, mode_t mode = 0644)  // NOLINT
  {
    TxnWriteFile file(path, mode);
    auto placement = write_archive(file);
    file.commit();
    relocate(placement);
    if constexpr (std::is_constructible_v<IFType, std::string>) {
      in_.reset();
      in_.emplace(path.string());
    }
    else {
      in_.reset();
    }
  }

  /** \brief                  Add the file at \a path to the end of the archive.
   *  \return                 The new member.  Valid until the next change to the archive.
   *  \throw  WrongMemberType No member of the archive's format can hold the file's name.
   */
  auto add(fs::path const& path) -> Member const&
  {
    auto archive_format = format();
    auto metadata = Details::capture_metadata(path);
    for (auto kind : Details::creation_order(archive_format)) {
      if (!Details::accept_from_new_file(kind, metadata.filename)) {
        logger_->debug("{} cannot hold '{}'", Details::kind_name(kind),
                       Details::printable(metadata.filename));
        continue;
      }

      StringTable* strings = kind == MemberKind::gnu_long ? &ensure_string_table() : nullptr;
      auto& member = members_.emplace_back(Member::from_file(kind, next_id(), metadata, strings));
      logger_->debug("Added {}", describe(member));
      return member;
    }

    throw WrongMemberType(fmt::format("No {} archive member can hold '{}'.",
                                      format_name(archive_format),
                                      Details::printable(metadata.filename)));
  }

  /** \brief        Use the file at \a path as the archive's symbol table.
   *  \param  path   File holding the symbol table contents, copied verbatim.
   *  \param  sorted Mark a BSD symbol table as sorted.
   *  \throw  WrongMemberType The format has no symbol table of this sort.
   *  \throw  std::logic_error The archive already has a symbol table.
   */
  auto add_symbol_table(fs::path const& path, bool sorted = false) -> Member const&
  {
    auto archive_format = format();
    if (symbol_table_.has_value()) {
      throw std::logic_error("Archive already has a symbol table.");
    }
    auto metadata = Details::capture_metadata(path);
    symbol_table_.emplace(Member::symbol_table(archive_format, next_id(), metadata, sorted));
    logger_->debug("Added symbol table {}", describe(*symbol_table_));
    return *symbol_table_;
  }

  /** \brief                 Find the first regular member called \a filename.
   *  \throw  MemberNotFound There is no such member.
   */
  [[nodiscard]] auto lookup(std::string_view filename) const -> Member const&
  {
    auto it = std::find_if(members_.begin(), members_.end(),
                           [filename](Member const& m) { return m.filename() == filename; });
    if (it == members_.end()) {
      throw MemberNotFound(
        fmt::format("No member named '{}' in archive.", Details::printable(filename)));
    }
    return *it;
  }

  /** \brief  Regular members, in archive order.  */
  [[nodiscard]] auto members() const noexcept -> std::vector<Member> const& { return members_; }
  [[nodiscard]] auto begin() const noexcept -> const_iterator { return members_.begin(); }
  [[nodiscard]] auto end() const noexcept -> const_iterator { return members_.end(); }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return members_.size(); }
  [[nodiscard]] auto empty() const noexcept -> bool { return members_.empty(); }

  /** \brief  Get the symbol table, or nullptr if there is none.  */
  [[nodiscard]] auto symbol_table() const noexcept -> Member const*
  {
    return symbol_table_.has_value() ? &*symbol_table_ : nullptr;
  }

  /** \brief  Get the string table, or nullptr if there is none.  */
  [[nodiscard]] auto string_table() const noexcept -> StringTable const* { return strings_.get(); }

  /** \brief         Append the payload of \a member to \a file.
   *  \tparam OFType Output file type.
   */
  template<typename OFType>
  void copy_payload(Member const& member, OFType& file)
  {
    if (member.source_path().has_value()) {
      Details::transfer_from_file(*member.source_path(), file, member.filesize());
      return;
    }
    if (!member.offset().has_value() || !in_.has_value()) {
      throw std::runtime_error(fmt::format("No data available for member '{}'.",
                                           Details::printable(member.filename())));
    }
    Details::transfer(*in_, *member.offset(), file, member.filesize());
  }

  /** \brief      Extract \a member into the directory \a dir.
   *
   * The extracted file gets the member's mode and modification time, and its owner if we are
   * allowed to set it.
   */
  void extract(Member const& member, fs::path const& dir)
  {
    auto dest = Details::extraction_path(dir, member.filename());
    TxnWriteFile file(dest, member.mode());
    copy_payload(member, file);
    file.commit();
    Details::apply_metadata(dest, member.mode(), member.uid(), member.gid(), member.mtime(),
                            *logger_);
    logger_->debug("Extracted {} to {}", describe(member), dest.string());
  }

  /** \brief  Extract every regular member into the directory \a dir.  */
  void extract_all(fs::path const& dir)
  {
    for (auto const& member : members_) {
      extract(member, dir);
    }
  }

private:
  /** \brief  Where each unit of the archive ended up when written.  */
  struct Placement
  {
    std::optional<std::size_t> symbol_table;  ///< Offset of the symbol table payload.
    std::optional<std::size_t> string_table;  ///< Offset of the string table content.
    std::vector<std::size_t> members;         ///< Offset of each member's payload.
  };

  /** \brief  Discard all members and the input file.  Members go before the string table.  */
  void reset() noexcept
  {
    members_.clear();
    symbol_table_.reset();
    strings_.reset();
    in_.reset();
    format_.reset();
    next_id_ = 0;
  }

  auto next_id() noexcept -> MemberID { return MemberID(next_id_++); }

  auto ensure_string_table() -> StringTable&
  {
    if (strings_ == nullptr) {
      strings_ = std::make_unique<StringTable>(std::time(nullptr));
      logger_->debug("Created string table");
    }
    return *strings_;
  }

  /** \brief  Read the archive magic and then every member from in_.  */
  void read_archive()
  {
    auto& file = *in_;
    logger_->debug("Loading archive of {} bytes", file.size_bytes());

    std::array<char, Details::archive_magic.size()> magic{};
    auto len = file.read_upto(std::span<char>(magic));
    auto got = std::string_view(magic.data(), len);
    if (got != Details::archive_magic) {
      throw InvalidArchive(fmt::format("Bad archive magic: expected '{}', got '{}'.",
                                       Details::printable(Details::archive_magic),
                                       Details::printable(got)));
    }

    while (read_member()) {
      if ((file.offset_bytes() & 1) != 0) {
        auto pad_offset = file.offset_bytes();
        char pad = 0;
        if (file.read_upto(std::span<char>(&pad, 1)) != 1 || pad != Details::pad_byte) {
          throw InvalidArchive(fmt::format("Bad padding byte at offset {}.", pad_offset));
        }
      }
    }

    /* Only a bare header name marks a Debian package: GNU archives keep their string table.  */
    if (!members_.empty() && members_.front().kind() == MemberKind::bsd_short &&
        members_.front().filename() == Details::debian_binary_name) {
      format_ = Format::deb;
    }

    logger_->debug("Loaded {} archive with {} members",
                   format_.has_value() ? format_name(*format_) : "empty", members_.size());
  }

  /** \brief  Read the next member.
   *  \return False at the end of the archive.
   */
  auto read_member() -> bool
  {
    auto& file = *in_;
    auto header_offset = file.offset_bytes();
    Details::MemberHeader::Raw raw{};
    auto len = file.read_upto(std::span<char>(raw));
    if (len < raw.size()) {
      if (len != 0) {
        logger_->debug("Ignoring {} trailing bytes at offset {}", len, header_offset);
      }
      logger_->debug("End of archive at offset {}", header_offset);
      return false;
    }

    auto name = Details::MemberHeader::name_field(raw, header_offset);
    logger_->debug("Member header at offset {}: '{}'", header_offset, Details::printable(name));

    auto data_offset = file.offset_bytes();
    for (auto kind : Details::classification_order(format_)) {
      file.offset_bytes(data_offset);
      auto member = Details::accept_from_header(kind, raw, name, header_offset, file,
                                                strings_.get(), MemberID(next_id_));
      if (!member.has_value()) {
        logger_->trace("Not a {}", Details::kind_name(kind));
        continue;
      }

      ++next_id_;
      auto payload_offset = file.offset_bytes();
      if (payload_offset + member->filesize() > file.size_bytes()) {
        throw InvalidArchive(
          fmt::format("Member '{}' at offset {} is truncated: {} bytes needed, {} available.",
                      Details::printable(name), header_offset, member->filesize(),
                      file.size_bytes() - payload_offset));
      }

      auto payload_end = payload_offset + member->filesize();
      format_ = member->format();
      logger_->debug("Read {}", describe(*member));
      file_member(std::move(*member));
      file.offset_bytes(payload_end);
      return true;
    }

    throw WrongMemberType(fmt::format("Unknown archive entry '{}' at offset {}.",
                                      Details::printable(name), header_offset));
  }

  /** \brief  Put a member just read into its place in the archive.  */
  void file_member(Member&& member)
  {
    switch (member.kind()) {
    case MemberKind::gnu_symbol_table:
    case MemberKind::bsd_symbol_table:
      if (symbol_table_.has_value()) {
        throw InvalidArchive(
          fmt::format("Second symbol table at offset {}.", member.offset().value_or(0)));
      }
      symbol_table_.emplace(std::move(member));
      break;
    case MemberKind::gnu_string_table: {
      if (strings_ != nullptr) {
        throw InvalidArchive(
          fmt::format("Second string table at offset {}.", member.offset().value_or(0)));
      }
      auto offset = *member.offset();
      std::vector<char> data(member.size());
      in_->offset_bytes(offset);
      in_->read(std::span<char>(data));
      strings_ = std::make_unique<StringTable>(member.header(), offset, std::move(data));
      break;
    }
    case MemberKind::gnu_short:
    case MemberKind::gnu_long:
    case MemberKind::bsd_short:
    case MemberKind::bsd_long:
    case MemberKind::deb_short:
      members_.push_back(std::move(member));
      break;
    }
  }

  /** \brief  Write a pad byte if the file has an odd length.  */
  template<typename OFType>
  void write_padding(OFType& file)
  {
    if ((file.offset_bytes() & 1) != 0) {
      std::array<char, 1> pad = {Details::pad_byte};
      file.write(std::span<char const>(pad));
    }
  }

  /** \brief  Write header, inline name, and payload of \a member.
   *  \return Offset of the payload in \a file.
   */
  template<typename OFType>
  auto write_member(OFType& file, Member const& member) -> std::size_t
  {
    auto raw = member.header().encode();
    file.write(std::span<char const>(raw));
    auto inline_name = member.inline_name();
    file.write(std::span<char const>(inline_name.data(), inline_name.size()));
    auto offset = file.offset_bytes();
    copy_payload(member, file);
    write_padding(file);
    logger_->debug("Wrote {} at offset {}", describe(member), offset);
    return offset;
  }

  /** \brief  Write the string table.
   *  \return Offset of the table content in \a file.
   */
  template<typename OFType>
  auto write_string_table(OFType& file) -> std::size_t
  {
    auto content = strings_->content();
    auto raw = strings_->header().encode();
    file.write(std::span<char const>(raw));
    auto offset = file.offset_bytes();
    file.write(std::span<char const>(content.data(), content.size()));
    write_padding(file);
    logger_->debug("Wrote string table of {} entries at offset {}", strings_->entry_count(),
                   offset);
    return offset;
  }

  /** \brief  Write the whole archive to \a file, without changing where members are read from.
   */
  template<typename OFType>
  auto write_archive(OFType& file) -> Placement
  {
    auto archive_format = format();
    logger_->debug("Saving {} archive with {} members", format_name(archive_format),
                   members_.size());

    if (archive_format == Format::deb) {
      auto order = Details::debian_order(members_);
      std::vector<Member> ordered;
      ordered.reserve(members_.size());
      for (auto idx : order) {
        ordered.push_back(std::move(members_[idx]));
      }
      members_ = std::move(ordered);
    }

    if (strings_ != nullptr) {
      strings_->finalize();
    }

    Placement placement;
    file.write(std::span<char const>(Details::archive_magic.data(), Details::archive_magic.size()));
    if (symbol_table_.has_value()) {
      placement.symbol_table = write_member(file, *symbol_table_);
    }
    if (strings_ != nullptr && archive_format == Format::gnu) {
      placement.string_table = write_string_table(file);
    }
    placement.members.reserve(members_.size());
    for (auto const& member : members_) {
      placement.members.push_back(write_member(file, member));
    }

    logger_->debug("Saved archive of {} bytes", file.offset_bytes());
    return placement;
  }

  /** \brief  Point every member at where it was written.  */
  void relocate(Placement const& placement)
  {
    if (placement.symbol_table.has_value()) {
      symbol_table_->relocate(*placement.symbol_table);
    }
    if (placement.string_table.has_value()) {
      strings_->relocate(*placement.string_table);
    }
    for (std::size_t i = 0; i < members_.size(); ++i) {
      members_[i].relocate(placement.members[i]);
    }
  }

  std::optional<Format> format_;                 ///< Archive format, if known.
  std::vector<Member> members_;                  ///< Regular members in archive order.
  std::optional<Member> symbol_table_;           ///< Symbol table
  std::unique_ptr<StringTable> strings_;         ///< GNU string table
  std::optional<IFType> in_;                     ///< File members are read from.
  std::size_t next_id_ = 0;                      ///< Next member ID to hand out.
  std::shared_ptr<spdlog::logger> logger_;       ///< Diagnostics
};

/** \brief  Archive read from files on disk.  */
using FileArchive = Archive<InputFile>;

}  // namespace Arx

#endif  // ARX_AR_HH_INCLUDED_
