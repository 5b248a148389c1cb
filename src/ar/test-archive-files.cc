/** \file   test-archive-files.cc
 *  \brief  Tests for Arx::Archive adding, saving and extracting files on disk
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <sys/stat.h>

#include <cerrno>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "ar.hh"
#include "test-ar-builder.hh"

namespace {
namespace fs = std::filesystem;

auto filenames(Arx::FileArchive const& archive) -> std::vector<std::string>
{
  std::vector<std::string> result;
  for (auto const& member : archive) {
    result.push_back(member.filename());
  }
  return result;
}

auto stat_of(fs::path const& path) -> struct stat
{
  struct stat st{};
  if (::stat(path.c_str(), &st) == -1) {
    throw std::system_error(errno, std::generic_category(), "Unable to stat " + path.string());
  }
  return st;
}

/** \brief  Create the members used by the round trip tests in \a dir.  */
auto make_inputs(ArxTest::TempDir const& dir) -> std::vector<fs::path>
{
  return {dir.write("short.o", ArxTest::payload_for("short.o")),
          dir.write("sixteen_chars.oo", ArxTest::payload_for("sixteen_chars.oo")),
          dir.write("a_very_long_object_file_name.o",
                    ArxTest::payload_for("a_very_long_object_file_name.o")),
          dir.write("odd", "odd"), dir.write("empty.o", ""),
          dir.write("with space.o", ArxTest::payload_for("with space.o")),
          dir.write("trailing_space.o ", ArxTest::payload_for("trailing_space.o "))};
}

void check_round_trip(Arx::Format format)
{
  ArxTest::TempDir dir;
  auto inputs = make_inputs(dir);
  auto archive_path = dir.path() / "lib.a";

  Arx::FileArchive archive(format);
  for (auto const& input : inputs) {
    archive.add(input);
  }
  archive.save(archive_path);

  Arx::FileArchive reloaded;
  reloaded.load(archive_path);
  REQUIRE(reloaded.format() == format);
  REQUIRE(reloaded.size() == inputs.size());
  REQUIRE(reloaded.symbol_table() == nullptr);

  auto input = inputs.begin();
  for (auto const& member : reloaded) {
    auto st = stat_of(*input);
    REQUIRE(member.filename() == input->filename().string());
    REQUIRE(member.mode() == st.st_mode);
    REQUIRE(member.mtime() == st.st_mtime);
    REQUIRE(member.filesize() == static_cast<std::size_t>(st.st_size));

    Arx::MemoryFileWriter writer;
    reloaded.copy_payload(member, writer);
    REQUIRE(ArxTest::written(writer) == ArxTest::read_file(*input));
    ++input;
  }

  REQUIRE(ArxTest::read_file(archive_path).size() % 2 == 0);
}
}  // namespace

TEST_CASE("Arx::Archive - GNU round trip", "[ar][archive][files]")
{
  check_round_trip(Arx::Format::gnu);

  ArxTest::TempDir dir;
  auto inputs = make_inputs(dir);
  Arx::FileArchive archive(Arx::Format::gnu);
  for (auto const& input : inputs) {
    archive.add(input);
  }
  REQUIRE(archive.lookup("short.o").kind() == Arx::MemberKind::gnu_short);
  REQUIRE(archive.lookup("sixteen_chars.oo").kind() == Arx::MemberKind::gnu_long);
  REQUIRE(archive.lookup("a_very_long_object_file_name.o").kind() == Arx::MemberKind::gnu_long);
  REQUIRE(archive.lookup("with space.o").kind() == Arx::MemberKind::gnu_long);
  REQUIRE(archive.lookup("trailing_space.o ").kind() == Arx::MemberKind::gnu_long);
  REQUIRE(archive.string_table() != nullptr);
  REQUIRE(archive.string_table()->entry_count() == 4);
}

TEST_CASE("Arx::Archive - BSD round trip", "[ar][archive][files]")
{
  check_round_trip(Arx::Format::bsd);

  ArxTest::TempDir dir;
  auto inputs = make_inputs(dir);
  Arx::FileArchive archive(Arx::Format::bsd);
  for (auto const& input : inputs) {
    archive.add(input);
  }
  REQUIRE(archive.lookup("short.o").kind() == Arx::MemberKind::bsd_short);
  REQUIRE(archive.lookup("sixteen_chars.oo").kind() == Arx::MemberKind::bsd_short);
  REQUIRE(archive.lookup("a_very_long_object_file_name.o").kind() == Arx::MemberKind::bsd_long);
  REQUIRE(archive.lookup("with space.o").kind() == Arx::MemberKind::bsd_long);
  REQUIRE(archive.lookup("trailing_space.o ").kind() == Arx::MemberKind::bsd_long);
  REQUIRE(archive.string_table() == nullptr);
}

TEST_CASE("Arx::Archive - extract", "[ar][archive][files]")
{
  ArxTest::TempDir dir;
  auto sample = ArxTest::bsd_sample();
  auto archive_path = dir.write("lib.a", sample.str());
  auto out = dir.path() / "out";

  Arx::FileArchive archive;
  archive.load(archive_path);
  archive.extract_all(out);

  for (auto const& member : archive) {
    auto path = out / member.filename();
    auto st = stat_of(path);
    REQUIRE(ArxTest::read_file(path) == ArxTest::payload_for(member.filename()));
    REQUIRE(st.st_mtime == member.mtime());
    REQUIRE(static_cast<std::size_t>(st.st_size) == member.filesize());
    REQUIRE((st.st_mode & 07777) == (member.mode() & 07777));
  }
  REQUIRE_FALSE(fs::exists(out / "__.SYMDEF SORTED"));
}

TEST_CASE("Arx::Archive - extract unsaved member", "[ar][archive][files]")
{
  ArxTest::TempDir dir;
  auto input = dir.write("pending.o", "pending contents");

  Arx::FileArchive archive;
  auto const& member = archive.add(input);
  REQUIRE(member.source_path().has_value());
  REQUIRE_FALSE(member.offset().has_value());

  archive.extract(member, dir.path() / "out");
  REQUIRE(ArxTest::read_file(dir.path() / "out" / "pending.o") == "pending contents");
}

TEST_CASE("Arx::Archive - save reads from the new archive", "[ar][archive][files]")
{
  ArxTest::TempDir dir;
  auto input = dir.write("gone.o", "soon to be deleted");
  auto archive_path = dir.path() / "lib.a";

  Arx::FileArchive archive;
  archive.add(input);
  archive.save(archive_path);
  fs::remove(input);

  REQUIRE_FALSE(archive.begin()->source_path().has_value());
  REQUIRE(archive.begin()->offset().has_value());
  archive.extract_all(dir.path() / "out");
  REQUIRE(ArxTest::read_file(dir.path() / "out" / "gone.o") == "soon to be deleted");
}

TEST_CASE("Arx::Archive - save over the loaded archive", "[ar][archive][files]")
{
  ArxTest::TempDir dir;
  auto sample = ArxTest::gnu_sample();
  auto archive_path = dir.write("lib.a", sample.str());
  auto extra = dir.write("yet_another_long_name.o", "extra");

  Arx::FileArchive archive;
  archive.load(archive_path);
  archive.add(extra);
  archive.save(archive_path);

  Arx::FileArchive reloaded;
  reloaded.load(archive_path);
  REQUIRE(reloaded.size() == 6);
  REQUIRE(reloaded.string_table()->entry_count() == 3);
  REQUIRE(filenames(reloaded) == filenames(archive));

  Arx::MemoryFileWriter writer;
  reloaded.copy_payload(reloaded.lookup("another_long_file_name.o"), writer);
  REQUIRE(ArxTest::written(writer) == ArxTest::payload_for("another_long_file_name.o"));
}

TEST_CASE("Arx::Archive - add after save", "[ar][archive][files]")
{
  ArxTest::TempDir dir;
  auto first = dir.write("first_long_file_name.o", "first");
  auto second = dir.write("second_long_file_name.o", "second");
  auto archive_path = dir.path() / "lib.a";

  Arx::FileArchive archive(Arx::Format::gnu);
  archive.add(first);
  archive.save(archive_path);
  archive.add(second);
  archive.save(archive_path);

  Arx::FileArchive reloaded;
  reloaded.load(archive_path);
  REQUIRE(filenames(reloaded) ==
          std::vector<std::string>{"first_long_file_name.o", "second_long_file_name.o"});
}

TEST_CASE("Arx::Archive - Debian package", "[ar][archive][files]")
{
  ArxTest::TempDir dir;
  auto archive_path = dir.path() / "package.deb";

  Arx::FileArchive archive(Arx::Format::deb);
  archive.add(dir.write("control.tar.xz", "CONTROL"));
  archive.add(dir.write("data.tar.xz", "DATA"));
  archive.add(dir.write("debian-binary", "2.0\n"));
  for (auto const& member : archive) {
    REQUIRE(member.kind() == Arx::MemberKind::deb_short);
    REQUIRE(member.uid() == 0);
    REQUIRE(member.gid() == 0);
  }
  archive.save(archive_path);

  Arx::FileArchive reloaded;
  reloaded.load(archive_path);
  REQUIRE(reloaded.format() == Arx::Format::deb);
  REQUIRE(filenames(reloaded) ==
          std::vector<std::string>{"debian-binary", "control.tar.xz", "data.tar.xz"});

  /* Owner fields of the first header.  */
  auto bytes = ArxTest::read_file(archive_path);
  REQUIRE(bytes.substr(8, 16) == "debian-binary   ");
  REQUIRE(bytes.substr(8 + 28, 6) == "0     ");
  REQUIRE(bytes.substr(8 + 34, 6) == "0     ");
}

TEST_CASE("Arx::Archive - Debian names", "[ar][archive][files]")
{
  ArxTest::TempDir dir;
  Arx::FileArchive archive(Arx::Format::deb);
  REQUIRE_THROWS_AS(archive.add(dir.write("a_very_long_object_file_name.o", "x")),
                    Arx::WrongMemberType);
  REQUIRE_THROWS_AS(archive.add(dir.write("with space", "x")), Arx::WrongMemberType);
  REQUIRE(archive.empty());
}

TEST_CASE("Arx::Archive - add symbol table", "[ar][archive][files]")
{
  ArxTest::TempDir dir;
  auto symbols = dir.write("symbols", "SYMS");
  auto member = dir.write("alpha.o", ArxTest::payload_for("alpha.o"));
  auto archive_path = dir.path() / "lib.a";

  SECTION("BSD sorted")
  {
    Arx::FileArchive archive(Arx::Format::bsd);
    archive.add(member);
    auto const& table = archive.add_symbol_table(symbols, true);
    REQUIRE(table.name() == "#1/16");
    REQUIRE(table.filesize() == 4);
    REQUIRE_THROWS_AS(archive.add_symbol_table(symbols), std::logic_error);
    archive.save(archive_path);

    Arx::FileArchive reloaded;
    reloaded.load(archive_path);
    REQUIRE(reloaded.format() == Arx::Format::bsd);
    REQUIRE(reloaded.symbol_table() != nullptr);
    REQUIRE(reloaded.symbol_table()->sorted());
    REQUIRE(reloaded.symbol_table()->filename() == "__.SYMDEF SORTED");
    REQUIRE(filenames(reloaded) == std::vector<std::string>{"alpha.o"});

    Arx::MemoryFileWriter writer;
    reloaded.copy_payload(*reloaded.symbol_table(), writer);
    REQUIRE(ArxTest::written(writer) == "SYMS");
  }

  SECTION("GNU")
  {
    Arx::FileArchive archive(Arx::Format::gnu);
    REQUIRE_THROWS_AS(archive.add_symbol_table(symbols, true), Arx::WrongMemberType);
    archive.add_symbol_table(symbols);
    archive.add(member);
    archive.save(archive_path);

    auto bytes = ArxTest::read_file(archive_path);
    REQUIRE(bytes.substr(8, 16) == "/               ");

    Arx::FileArchive reloaded;
    reloaded.load(archive_path);
    REQUIRE(reloaded.symbol_table() != nullptr);
    REQUIRE(reloaded.symbol_table()->kind() == Arx::MemberKind::gnu_symbol_table);
    REQUIRE(reloaded.symbol_table()->filesize() == 4);
  }

  SECTION("Debian")
  {
    Arx::FileArchive archive(Arx::Format::deb);
    REQUIRE_THROWS_AS(archive.add_symbol_table(symbols), Arx::WrongMemberType);
  }
}

TEST_CASE("Arx::Archive - bad files", "[ar][archive][files]")
{
  ArxTest::TempDir dir;
  Arx::FileArchive archive;

  REQUIRE_THROWS_AS(archive.add(dir.path() / "missing.o"), std::system_error);
  REQUIRE_THROWS_AS(archive.add(dir.path()), std::runtime_error);
  REQUIRE_THROWS_AS(archive.load(dir.path() / "missing.a"), std::system_error);
  REQUIRE(archive.empty());
}

TEST_CASE("Arx::Details::extraction_path", "[ar][archive][files]")
{
  ArxTest::TempDir dir;
  auto out = dir.path() / "nested" / "out";

  REQUIRE(Arx::Details::extraction_path(out, "alpha.o") == out / "alpha.o");
  REQUIRE(fs::is_directory(out));

  REQUIRE_THROWS_AS(Arx::Details::extraction_path(out, ""), std::runtime_error);
  REQUIRE_THROWS_AS(Arx::Details::extraction_path(out, ".."), std::runtime_error);
  REQUIRE_THROWS_AS(Arx::Details::extraction_path(out, "../escape.o"), std::runtime_error);
  REQUIRE_THROWS_AS(Arx::Details::extraction_path(out, "/etc/passwd"), std::runtime_error);
}
