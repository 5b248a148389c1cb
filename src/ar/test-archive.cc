/** \file   test-archive.cc
 *  \brief  Tests for Arx::Archive reading and writing archives in memory
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <fmt/format.h>

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <set>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "ar.hh"
#include "test-ar-builder.hh"

namespace {
using MemoryArchive = Arx::Archive<Arx::MemorySpanInputFile>;

auto payload(MemoryArchive& archive, Arx::Member const& member) -> std::string
{
  Arx::MemoryFileWriter writer;
  archive.copy_payload(member, writer);
  return ArxTest::written(writer);
}

auto filenames(MemoryArchive const& archive) -> std::vector<std::string>
{
  std::vector<std::string> result;
  for (auto const& member : archive) {
    result.push_back(member.filename());
  }
  return result;
}

auto span_of(std::string const& s) -> Arx::MemorySpanInputFile
{
  return Arx::MemorySpanInputFile(std::span<char const>(s.data(), s.size()));
}

auto debian_sample() -> ArxTest::ArchiveBuilder
{
  ArxTest::ArchiveBuilder builder;
  builder.add("debian-binary", "2.0\n");
  builder.add("data.tar.xz", "DATA");
  builder.add("control.tar.xz", "CONTROL");
  builder.add("md5sums", "SUMS");
  return builder;
}

std::vector<std::string> const sample_names = {"alpha.o", "test.o", "this_is_a_long_file_name.o",
                                               "zeta.o", "another_long_file_name.o"};
}  // namespace

TEST_CASE("Arx::Archive - load BSD archive", "[ar][archive]")
{
  auto sample = ArxTest::bsd_sample();
  MemoryArchive archive;
  archive.load(sample.file());

  REQUIRE(archive.format() == Arx::Format::bsd);
  REQUIRE(archive.size() == 5);

  auto names = filenames(archive);
  REQUIRE(std::set<std::string>(names.begin(), names.end()) ==
          std::set<std::string>(sample_names.begin(), sample_names.end()));

  REQUIRE(archive.symbol_table() != nullptr);
  REQUIRE(archive.symbol_table()->sorted());
  REQUIRE(archive.symbol_table()->filesize() == 8);
  REQUIRE(payload(archive, *archive.symbol_table()) == "SYMBOLS!");
  REQUIRE(archive.string_table() == nullptr);

  auto const& test_o = archive.lookup("test.o");
  REQUIRE(test_o.mode() == 0100644);
  REQUIRE(test_o.mtime() == ArxTest::test_mtime);
  REQUIRE(test_o.uid() == 1000);
  REQUIRE(test_o.kind() == Arx::MemberKind::bsd_short);

  auto const& long_name = archive.lookup("this_is_a_long_file_name.o");
  REQUIRE(long_name.kind() == Arx::MemberKind::bsd_long);
  REQUIRE(long_name.filesize() == ArxTest::payload_for("this_is_a_long_file_name.o").size());

  for (auto const& member : archive) {
    REQUIRE(payload(archive, member) == ArxTest::payload_for(member.filename()));
  }
}

TEST_CASE("Arx::Archive - load GNU archive", "[ar][archive]")
{
  auto sample = ArxTest::gnu_sample();
  MemoryArchive archive(Arx::Format::bsd);
  archive.load(sample.file());

  REQUIRE(archive.format() == Arx::Format::gnu);
  REQUIRE(archive.size() == 5);
  REQUIRE(archive.symbol_table() != nullptr);
  REQUIRE(archive.symbol_table()->kind() == Arx::MemberKind::gnu_symbol_table);
  REQUIRE(archive.string_table() != nullptr);
  REQUIRE(archive.string_table()->entry_count() == 2);
  REQUIRE(archive.string_table()->size() == 54);

  auto names = filenames(archive);
  REQUIRE(std::set<std::string>(names.begin(), names.end()) ==
          std::set<std::string>(sample_names.begin(), sample_names.end()));

  auto const& first = archive.lookup("this_is_a_long_file_name.o");
  REQUIRE(first.kind() == Arx::MemberKind::gnu_long);
  REQUIRE(first.name() == "/0");
  auto const& second = archive.lookup("another_long_file_name.o");
  REQUIRE(second.name() == "/28");
  REQUIRE(archive.string_table()->resolve(28) == "another_long_file_name.o");

  REQUIRE(archive.lookup("alpha.o").name() == "alpha.o/");

  for (auto const& member : archive) {
    REQUIRE(payload(archive, member) == ArxTest::payload_for(member.filename()));
  }
}

TEST_CASE("Arx::Archive - save BSD archive unchanged", "[ar][archive]")
{
  auto sample = ArxTest::bsd_sample();
  MemoryArchive archive;
  archive.load(sample.file());

  Arx::MemoryFileWriter writer;
  archive.save(writer);
  REQUIRE(ArxTest::written(writer) == sample.str());
}

TEST_CASE("Arx::Archive - save GNU archive and reload", "[ar][archive]")
{
  auto sample = ArxTest::gnu_sample();
  MemoryArchive archive;
  archive.load(sample.file());

  Arx::MemoryFileWriter writer;
  archive.save(writer);
  auto first_save = ArxTest::written(writer);
  REQUIRE(first_save.size() % 2 == 0);

  MemoryArchive reloaded;
  reloaded.load(span_of(first_save));
  REQUIRE(reloaded.format() == Arx::Format::gnu);
  REQUIRE(filenames(reloaded) == filenames(archive));
  REQUIRE(reloaded.string_table() != nullptr);
  REQUIRE(reloaded.string_table()->size() == 54);

  auto it = archive.begin();
  for (auto const& member : reloaded) {
    REQUIRE(member.filename() == it->filename());
    REQUIRE(member.mode() == it->mode());
    REQUIRE(member.mtime() == it->mtime());
    REQUIRE(member.filesize() == it->filesize());
    REQUIRE(payload(reloaded, member) == ArxTest::payload_for(member.filename()));
    ++it;
  }

  Arx::MemoryFileWriter second_writer;
  reloaded.save(second_writer);
  REQUIRE(ArxTest::written(second_writer) == first_save);
}

TEST_CASE("Arx::Archive - save relocates members", "[ar][archive]")
{
  auto sample = ArxTest::gnu_sample();
  MemoryArchive archive;
  archive.load(sample.file());

  Arx::MemoryFileWriter writer;
  archive.save(writer);
  auto bytes = ArxTest::written(writer);

  for (auto const& member : archive) {
    REQUIRE(member.offset().has_value());
    REQUIRE(bytes.substr(*member.offset(), member.filesize()) ==
            ArxTest::payload_for(member.filename()));
  }
  REQUIRE(archive.string_table()->offset_bytes().has_value());
  REQUIRE(bytes.substr(*archive.string_table()->offset_bytes(), 54) ==
          archive.string_table()->content());

  /* The archive no longer has anything to read payloads from.  */
  REQUIRE_THROWS_AS(payload(archive, *archive.begin()), std::runtime_error);
}

TEST_CASE("Arx::Archive - empty archive", "[ar][archive]")
{
  std::string data = "!<arch>\n";
  MemoryArchive archive;
  archive.load(span_of(data));

  REQUIRE(archive.empty());
  REQUIRE_FALSE(archive.has_format());
  REQUIRE_THROWS_AS(archive.format(), Arx::InvalidArchive);
  REQUIRE(archive.symbol_table() == nullptr);
}

TEST_CASE("Arx::Archive - bad magic", "[ar][archive]")
{
  MemoryArchive archive;
  std::string wrong = "!<arhc>\n";
  REQUIRE_THROWS_AS(archive.load(span_of(wrong)), Arx::InvalidArchive);
  std::string short_magic = "!<ar";
  REQUIRE_THROWS_AS(archive.load(span_of(short_magic)), Arx::InvalidArchive);
  std::string nothing;
  REQUIRE_THROWS_AS(archive.load(span_of(nothing)), Arx::InvalidArchive);
}

TEST_CASE("Arx::Archive - bad padding", "[ar][archive]")
{
  ArxTest::ArchiveBuilder builder;
  builder.raw(ArxTest::header("odd.o/", 3)).raw("abc").raw("X");
  builder.add("next.o/", "data");

  MemoryArchive archive;
  REQUIRE_THROWS_AS(archive.load(builder.file()), Arx::InvalidArchive);
  REQUIRE(archive.empty());
  REQUIRE_FALSE(archive.has_format());
}

TEST_CASE("Arx::Archive - trailing bytes", "[ar][archive]")
{
  auto builder = ArxTest::bsd_sample();
  builder.raw("short");

  MemoryArchive archive;
  archive.load(builder.file());
  REQUIRE(archive.size() == 5);
}

TEST_CASE("Arx::Archive - malformed members", "[ar][archive]")
{
  MemoryArchive archive;

  SECTION("Unknown entry")
  {
    ArxTest::ArchiveBuilder builder;
    builder.add("/x/", "data");
    REQUIRE_THROWS_AS(archive.load(builder.file()), Arx::WrongMemberType);
  }

  SECTION("Short name in a GNU archive")
  {
    ArxTest::ArchiveBuilder builder;
    builder.add("alpha.o/", "data");
    builder.add("beta.o", "data");
    REQUIRE_THROWS_AS(archive.load(builder.file()), Arx::WrongMemberType);
  }

  SECTION("Truncated payload")
  {
    ArxTest::ArchiveBuilder builder;
    builder.raw(ArxTest::header("alpha.o/", 100)).raw("only a little data");
    REQUIRE_THROWS_AS(archive.load(builder.file()), Arx::InvalidArchive);
  }

  SECTION("Long name without a string table")
  {
    ArxTest::ArchiveBuilder builder;
    builder.add("/0", "data");
    REQUIRE_THROWS_AS(archive.load(builder.file()), Arx::InvalidArchive);
  }

  SECTION("Inline name longer than the member")
  {
    ArxTest::ArchiveBuilder builder;
    builder.raw(ArxTest::header("#1/40", 8)).raw("a_long_file_name");
    REQUIRE_THROWS_AS(archive.load(builder.file()), Arx::InvalidArchive);
  }

  SECTION("Bad header terminator")
  {
    ArxTest::ArchiveBuilder builder;
    auto hdr = ArxTest::header("alpha.o/", 4);
    hdr[58] = 'x';
    builder.raw(hdr).raw("data");
    REQUIRE_THROWS_AS(archive.load(builder.file()), Arx::InvalidArchive);
  }

  SECTION("Bad size field")
  {
    ArxTest::ArchiveBuilder builder;
    auto hdr = ArxTest::header("alpha.o/", 4);
    hdr[49] = 'x';
    builder.raw(hdr).raw("data");
    REQUIRE_THROWS_AS(archive.load(builder.file()), Arx::InvalidArchive);
  }

  REQUIRE(archive.empty());
}

TEST_CASE("Arx::Archive - reload discards previous contents", "[ar][archive]")
{
  auto gnu = ArxTest::gnu_sample();
  auto deb = debian_sample();
  MemoryArchive archive;
  archive.load(gnu.file());
  REQUIRE(archive.string_table() != nullptr);

  archive.load(deb.file());
  REQUIRE(archive.size() == 4);
  REQUIRE(archive.symbol_table() == nullptr);
  REQUIRE(archive.string_table() == nullptr);
}

TEST_CASE("Arx::Archive - Debian detection", "[ar][archive]")
{
  auto deb = debian_sample();
  MemoryArchive archive;
  archive.load(deb.file());
  REQUIRE(archive.format() == Arx::Format::deb);

  ArxTest::ArchiveBuilder shuffled;
  shuffled.add("control.tar.xz", "CONTROL");
  shuffled.add("debian-binary", "2.0\n");
  shuffled.add("data.tar.xz", "DATA");
  archive.load(shuffled.file());
  REQUIRE(archive.format() == Arx::Format::bsd);
}

TEST_CASE("Arx::Archive - Debian save order", "[ar][archive]")
{
  auto deb = debian_sample();
  MemoryArchive archive;
  archive.load(deb.file());

  Arx::MemoryFileWriter writer;
  archive.save(writer);
  REQUIRE(filenames(archive) == std::vector<std::string>{"debian-binary", "control.tar.xz",
                                                         "data.tar.xz", "md5sums"});

  auto bytes = ArxTest::written(writer);
  MemoryArchive reloaded;
  reloaded.load(span_of(bytes));
  REQUIRE(reloaded.format() == Arx::Format::deb);
  REQUIRE(filenames(reloaded) == filenames(archive));
  REQUIRE(payload(reloaded, reloaded.lookup("control.tar.xz")) == "CONTROL");
}

TEST_CASE("Arx::Archive - GNU archive starting with debian-binary", "[ar][archive]")
{
  ArxTest::ArchiveBuilder builder;
  std::string_view strings = "a_rather_long_member_name.o/\n";
  builder.raw(fmt::format("{:<48}{:<10}`\n", "//", strings.size())).raw(strings);
  builder.pad();
  builder.add("debian-binary/", "2.0\n");
  builder.add("control.tar.xz/", "CONTROL");
  builder.add("data.tar.xz/", "DATA");
  builder.add("/0", ArxTest::payload_for("a_rather_long_member_name.o"));

  MemoryArchive archive;
  archive.load(builder.file());
  REQUIRE(archive.format() == Arx::Format::gnu);
  REQUIRE(archive.lookup("debian-binary").kind() == Arx::MemberKind::gnu_short);

  Arx::MemoryFileWriter writer;
  archive.save(writer);
  auto bytes = ArxTest::written(writer);

  MemoryArchive reloaded;
  reloaded.load(span_of(bytes));
  REQUIRE(reloaded.format() == Arx::Format::gnu);
  REQUIRE(reloaded.string_table() != nullptr);
  REQUIRE(filenames(reloaded) ==
          std::vector<std::string>{"debian-binary", "control.tar.xz", "data.tar.xz",
                                   "a_rather_long_member_name.o"});
  REQUIRE(payload(reloaded, reloaded.lookup("a_rather_long_member_name.o")) ==
          ArxTest::payload_for("a_rather_long_member_name.o"));
}

TEST_CASE("Arx::Archive - Debian save needs all three members", "[ar][archive]")
{
  ArxTest::ArchiveBuilder builder;
  builder.add("debian-binary", "2.0\n");
  builder.add("control.tar.gz", "CONTROL");
  MemoryArchive archive;
  archive.load(builder.file());
  REQUIRE(archive.format() == Arx::Format::deb);

  Arx::MemoryFileWriter writer;
  REQUIRE_THROWS_AS(archive.save(writer), Arx::InvalidArchive);
  REQUIRE(archive.size() == 2);
}

TEST_CASE("Arx::Archive - lookup", "[ar][archive]")
{
  ArxTest::ArchiveBuilder builder;
  builder.add("dup.o/", "first");
  builder.add("other.o/", "other");
  builder.add("dup.o/", "second");
  MemoryArchive archive;
  archive.load(builder.file());

  REQUIRE(payload(archive, archive.lookup("dup.o")) == "first");
  REQUIRE_THROWS_AS(archive.lookup("missing.o"), Arx::MemberNotFound);
  REQUIRE_THROWS_AS(archive.lookup("dup.o/"), std::out_of_range);
}

TEST_CASE("Arx::Archive - logging", "[ar][archive]")
{
  std::ostringstream os;
  auto logger =
    std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::ostream_sink_st>(os));
  logger->set_level(spdlog::level::trace);
  logger->set_pattern("%v");

  auto sample = ArxTest::bsd_sample();
  MemoryArchive archive(Arx::Format::gnu, logger);
  archive.load(sample.file());
  logger->flush();

  auto log = os.str();
  REQUIRE(log.find("Member header at offset 8: '#1/20'") != std::string::npos);
  REQUIRE(log.find("Not a GNU symbol table") != std::string::npos);
  REQUIRE(log.find("Read <BSD symbol table") != std::string::npos);
  REQUIRE(log.find("End of archive") != std::string::npos);
  REQUIRE(log.find("Loaded BSD archive with 5 members") != std::string::npos);
}
