/** \file   ar-string-table.hh
 *  \brief  GNU archive string table
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef ARX_AR_STRING_TABLE_HH_INCLUDED_
#define ARX_AR_STRING_TABLE_HH_INCLUDED_

#include "ar-header.hh"
#include "ar-member.hh"

#include <cstddef>
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Arx {

/** \brief  GNU string table: the names too long for a member header.
 *
 * Each GNU long member registers its name here.  A name is stored followed by <tt>/\\n</tt>, so
 * the offset of an entry is the sum of the lengths of the earlier entries plus two for each.
 *
 * A table read from an archive also keeps its original bytes, which resolve() searches to find
 * the names of the long members being loaded.
 */
class StringTable
{
public:
  /** \brief  Registration phase.  */
  enum class Phase {
    collecting,  ///< Names may be added.
    finalized    ///< Offsets are fixed for writing.
  };

  /** \brief        Construct an empty table for a new archive.
   *  \param  mtime Modification time to record in the header.
   */
  explicit StringTable(std::time_t mtime);

  /** \brief         Construct a table read from an archive.
   *  \param  header Header of the table.
   *  \param  offset Offset of the table content in the archive.
   *  \param  data   Table content, header.size() bytes.
   */
  StringTable(Details::MemberHeader const& header, std::size_t offset, std::vector<char> data);

  ~StringTable() = default;
  StringTable(StringTable const&) = delete;
  StringTable(StringTable&&) noexcept = default;
  auto operator=(StringTable const&) -> StringTable& = delete;
  auto operator=(StringTable&&) noexcept -> StringTable& = default;

  /** \brief            Register the long name of member \a id.
   *  \throw  std::logic_error The table has been finalized or \a id is already registered.
   */
  void add(MemberID id, std::string filename);

  /** \brief  Get the name registered for \a id.
   *  \throw  std::out_of_range \a id is not registered.
   */
  [[nodiscard]] auto lookup(MemberID id) const -> std::string const&;

  /** \brief  Get the offset of the name registered for \a id.
   *  \throw  std::out_of_range \a id is not registered.
   */
  [[nodiscard]] auto offset(MemberID id) const -> std::size_t;

  /** \brief                 Find the name stored at \a offset of the original table content.
   *  \throw  InvalidArchive \a offset is outside the table, or no <tt>/\\n</tt> follows it.
   */
  [[nodiscard]] auto resolve(std::size_t offset) const -> std::string;

  /** \brief  Fix the offsets.  No more names may be added.  */
  void finalize() noexcept { phase_ = Phase::finalized; }

  [[nodiscard]] auto phase() const noexcept -> Phase { return phase_; }

  /** \brief  Number of registered names.  */
  [[nodiscard]] auto entry_count() const noexcept -> std::size_t { return entries_.size(); }

  /** \brief  Size of the table.
   *
   * For a table read from an archive this is the size in its header, which may include padding.
   * Otherwise it is the size of content().
   */
  [[nodiscard]] auto size() const noexcept -> std::size_t;

  /** \brief  Content to write to an archive.  */
  [[nodiscard]] auto content() const -> std::string;

  /** \brief  Header to write to an archive before content().  */
  [[nodiscard]] auto header() const -> Details::MemberHeader;

  /** \brief  Offset of the table content in the archive, if it has been read or written.  */
  [[nodiscard]] auto offset_bytes() const noexcept -> std::optional<std::size_t>
  {
    return offset_;
  }

  /** \brief  Record that the table has been written at \a offset.
   *
   * The table forgets its original content and accepts new names again.
   */
  void relocate(std::size_t offset);

  [[nodiscard]] auto mtime() const noexcept -> std::time_t { return mtime_; }
  [[nodiscard]] auto uid() const noexcept -> uid_t { return uid_; }
  [[nodiscard]] auto gid() const noexcept -> gid_t { return gid_; }
  [[nodiscard]] auto mode() const noexcept -> mode_t { return mode_; }

private:
  /** \brief  A registered name.  */
  struct Entry
  {
    MemberID id;           ///< Member the name belongs to.
    std::string filename;  ///< Name
    std::size_t offset;    ///< Offset of the name in content().
  };

  static constexpr mode_t default_mode = 0100644;  ///< Mode of a new table.

  std::vector<Entry> entries_;               ///< Names in registration order.
  std::map<MemberID, std::size_t> index_;    ///< Map from member ID to index in entries_.
  std::size_t total_ = 0;                    ///< Size of content().
  Phase phase_ = Phase::collecting;          ///< Registration phase.
  std::vector<char> data_;                   ///< Content read from the archive.
  std::optional<std::size_t> loaded_size_;   ///< Size from the header read from the archive.
  std::optional<std::size_t> offset_;        ///< Offset of content in the archive.
  std::time_t mtime_ = 0;                    ///< Modification time
  uid_t uid_ = 0;                            ///< User ID
  gid_t gid_ = 0;                            ///< Group ID
  mode_t mode_ = default_mode;               ///< Mode
};

}  // namespace Arx

#endif  // ARX_AR_STRING_TABLE_HH_INCLUDED_
