/** \file   ar-files.hh
 *  \brief  Filesystem operations used when adding and extracting members
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef ARX_AR_FILES_HH_INCLUDED_
#define ARX_AR_FILES_HH_INCLUDED_

#include <sys/types.h>

#include <spdlog/logger.h>

#include <cstddef>
#include <ctime>
#include <filesystem>
#include <string>

namespace Arx::Details {

namespace fs = std::filesystem;

/** \brief  Metadata of a file about to be added to an archive.  */
struct FileMetadata
{
  fs::path path;         ///< Path to the file.
  std::string filename;  ///< Last component of the path.
  std::time_t mtime;     ///< Modification time (seconds since 1 Jan 1970)
  uid_t uid;             ///< User ID
  gid_t gid;             ///< Group ID
  mode_t mode;           ///< Mode, including the file type bits.
  std::size_t size;      ///< Size in bytes.
};

/** \brief       Get the metadata of the regular file at \a path.
 *  \throw  std::system_error  \a path cannot be opened or examined.
 *  \throw  std::runtime_error \a path is not a regular file.
 */
auto capture_metadata(fs::path const& path) -> FileMetadata;

/** \brief            Work out where to extract a member to, creating \a dir if needed.
 *  \param  dir       Destination directory.
 *  \param  filename  Member file name.
 *  \return           Path of the file to write.
 *  \throw  std::runtime_error \a filename is empty or not a single path component.
 */
auto extraction_path(fs::path const& dir, std::string const& filename) -> fs::path;

/** \brief         Apply member metadata to an extracted file.
 *  \param  path   Extracted file.
 *  \param  mode   Mode
 *  \param  uid    User ID
 *  \param  gid    Group ID
 *  \param  mtime  Modification time
 *  \param  logger Where to report an owner change that failed.
 *  \throw  std::system_error Setting the mode or modification time failed.
 *
 * Changing the owner usually needs privileges, so a failure there is logged and ignored.
 */
void apply_metadata(fs::path const& path, mode_t mode, uid_t uid, gid_t gid, std::time_t mtime,
                    spdlog::logger& logger);

}  // namespace Arx::Details

#endif  // ARX_AR_FILES_HH_INCLUDED_
