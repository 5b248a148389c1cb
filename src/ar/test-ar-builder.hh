/** \file   test-ar-builder.hh
 *  \brief  Build archive images in memory for the ar unit tests
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef ARX_TEST_AR_BUILDER_HH_INCLUDED_
#define ARX_TEST_AR_BUILDER_HH_INCLUDED_

#include "util/file.hh"

#include <fmt/format.h>

#include <stdlib.h>

#include <cstddef>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ArxTest {

namespace fs = std::filesystem;

/** \brief  Modification time used for the members of generated archives.  */
constexpr std::time_t test_mtime = 1617235200;

/** \brief  Format a 60 byte member header.  */
inline auto header(std::string_view name, std::size_t size, std::time_t mtime = test_mtime,
                   unsigned uid = 1000, unsigned gid = 1000, unsigned mode = 0100644)  // NOLINT
  -> std::string
{
  return fmt::format("{:<16}{:<12}{:<6}{:<6}{:<8o}{:<10}`\n", name, mtime, uid, gid, mode, size);
}

/** \brief  Accumulates an archive image.  */
class ArchiveBuilder
{
public:
  ArchiveBuilder() : data_("!<arch>\n") {}

  /** \brief  Append a member with header name \a name, inline name bytes, and payload.  */
  auto add(std::string_view name, std::string_view payload, std::string_view inline_name = {},
           unsigned mode = 0100644) -> ArchiveBuilder&  // NOLINT
  {
    data_ += header(name, inline_name.size() + payload.size(), test_mtime, 1000, 1000, mode);
    data_ += inline_name;
    data_ += payload;
    pad();
    return *this;
  }

  /** \brief  Append raw bytes, not padded.  */
  auto raw(std::string_view bytes) -> ArchiveBuilder&
  {
    data_ += bytes;
    return *this;
  }

  /** \brief  Append a pad byte if the image has odd length.  */
  void pad()
  {
    if ((data_.size() & 1) != 0) {
      data_ += '\n';
    }
  }

  [[nodiscard]] auto str() const -> std::string const& { return data_; }

  /** \brief  Get an input file reading the image.  The builder must outlive it.  */
  [[nodiscard]] auto file() const -> Arx::MemorySpanInputFile
  {
    return Arx::MemorySpanInputFile(std::span<char const>(data_.data(), data_.size()));
  }

private:
  std::string data_;
};

/** \brief  Payload used for the member \a name of the sample archives.  */
inline auto payload_for(std::string_view name) -> std::string
{
  return fmt::format("Contents of {}.\n", name);
}

/** \brief  A BSD archive holding alpha.o, test.o, zeta.o and two long names.  */
inline auto bsd_sample() -> ArchiveBuilder
{
  ArchiveBuilder builder;
  builder.add("#1/20", "SYMBOLS!", std::string_view("__.SYMDEF SORTED\0\0\0\0", 20));
  builder.add("alpha.o", payload_for("alpha.o"));
  builder.add("test.o", payload_for("test.o"));
  builder.add("#1/28", payload_for("this_is_a_long_file_name.o"),
              std::string_view("this_is_a_long_file_name.o\0\0", 28));
  builder.add("zeta.o", payload_for("zeta.o"));
  builder.add("#1/24", payload_for("another_long_file_name.o"), "another_long_file_name.o");
  return builder;
}

/** \brief  A GNU archive holding the same members as bsd_sample().  */
inline auto gnu_sample() -> ArchiveBuilder
{
  ArchiveBuilder builder;
  builder.add("/", std::string_view("\0\0\0\0", 4));
  /* Real string tables leave every field but the size blank.  */
  std::string_view strings = "this_is_a_long_file_name.o/\nanother_long_file_name.o/\n";
  builder.raw(fmt::format("{:<48}{:<10}`\n", "//", strings.size())).raw(strings);
  builder.pad();
  builder.add("alpha.o/", payload_for("alpha.o"));
  builder.add("/0", payload_for("this_is_a_long_file_name.o"));
  builder.add("test.o/", payload_for("test.o"));
  builder.add("/28", payload_for("another_long_file_name.o"));
  builder.add("zeta.o/", payload_for("zeta.o"));
  return builder;
}

/** \brief  Temporary directory removed when the object goes out of scope.  */
class TempDir
{
public:
  TempDir()
  {
    auto pattern = (fs::temp_directory_path() / "arx-test-XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
      throw std::runtime_error("Unable to create temporary directory.");
    }
    path_ = pattern;
  }

  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(TempDir const&) = delete;
  TempDir(TempDir&&) = delete;
  auto operator=(TempDir const&) -> TempDir& = delete;
  auto operator=(TempDir&&) -> TempDir& = delete;

  [[nodiscard]] auto path() const -> fs::path const& { return path_; }

  /** \brief  Create the file \a name in the directory holding \a contents.  */
  auto write(std::string const& name, std::string_view contents) const -> fs::path
  {
    auto p = path_ / name;
    std::ofstream os(p, std::ios::binary);
    os.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!os) {
      throw std::runtime_error("Unable to write " + p.string());
    }
    return p;
  }

private:
  fs::path path_;
};

/** \brief  Read the whole file at \a path.  */
inline auto read_file(fs::path const& path) -> std::string
{
  std::ifstream is(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

/** \brief  Get the bytes written to \a writer as a string.  */
inline auto written(Arx::MemoryFileWriter const& writer) -> std::string
{
  auto data = writer.data();
  return std::string(reinterpret_cast<char const*>(data.data()), data.size());  // NOLINT
}

}  // namespace ArxTest

#endif  // ARX_TEST_AR_BUILDER_HH_INCLUDED_
