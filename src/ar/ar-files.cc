/** \file   ar-files.cc
 *  \brief  Filesystem operations used when adding and extracting members.
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#include "ar-files.hh"

#include "util/file.hh"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

auto Arx::Details::capture_metadata(fs::path const& path) -> FileMetadata
{
  InputFile file(path.string());
  if (!S_ISREG(file.mode())) {
    throw std::runtime_error(fmt::format("{} is not a regular file.", file.name()));
  }
  return {path,       path.filename().string(), file.mtime(),     file.uid(),
          file.gid(), file.mode(),              file.size_bytes()};
}

auto Arx::Details::extraction_path(fs::path const& dir, std::string const& filename) -> fs::path
{
  auto name = fs::path(filename);
  if (filename.empty() || filename == "." || filename == ".." || name.has_parent_path() ||
      name.has_root_path()) {
    throw std::runtime_error(
      fmt::format("Refusing to extract member '{}': not a plain file name.", filename));
  }

  fs::create_directories(dir);
  return dir / name;
}

void Arx::Details::apply_metadata(fs::path const& path, mode_t mode, uid_t uid, gid_t gid,
                                  std::time_t mtime, spdlog::logger& logger)
{
  if (::chown(path.c_str(), uid, gid) == -1) {
    logger.debug("Unable to change owner of {} to {}:{}: {}", path.string(), uid, gid,
                 std::strerror(errno));
  }

  if (::chmod(path.c_str(), mode & 07777) == -1) {  // NOLINT
    throw std::system_error(errno, std::generic_category(),
                            "Whilst setting mode of " + path.string());
  }

  std::array<::timespec, 2> times{};
  times[0].tv_nsec = UTIME_OMIT;
  times[1].tv_sec = mtime;
  times[1].tv_nsec = 0;
  if (::utimensat(AT_FDCWD, path.c_str(), times.data(), 0) == -1) {
    throw std::system_error(errno, std::generic_category(),
                            "Whilst setting modification time of " + path.string());
  }
}
