/** \file   test-member.cc
 *  \brief  Tests for Arx::Member classification
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "ar-member.hh"
#include "ar-string-table.hh"
#include "test-ar-builder.hh"

namespace {
constexpr std::array all_kinds = {
  Arx::MemberKind::gnu_short,        Arx::MemberKind::gnu_long,
  Arx::MemberKind::gnu_symbol_table, Arx::MemberKind::gnu_string_table,
  Arx::MemberKind::bsd_short,        Arx::MemberKind::bsd_long,
  Arx::MemberKind::bsd_symbol_table};

auto make_header(std::string name, std::size_t size) -> Arx::Details::MemberHeader
{
  return {std::move(name), ArxTest::test_mtime, 1000, 1000, 0100644, size};
}

auto metadata(std::string const& filename, std::size_t size = 10) -> Arx::Details::FileMetadata
{
  return {"/nonexistent/" + filename, filename, ArxTest::test_mtime, 1000, 100, 0100600, size};
}

/** \brief  A string table that resolves offset 0 to a long name.  */
auto loaded_strings() -> Arx::StringTable
{
  std::string content = "a_very_long_name_indeed.o/\n";
  return {make_header("//", content.size()), 68,
          std::vector<char>(content.begin(), content.end())};
}
}  // namespace

TEST_CASE("Arx::Details::header_shape", "[ar][member]")
{
  using Arx::Details::header_shape;
  using Arx::MemberKind;

  REQUIRE(header_shape(MemberKind::gnu_short, "alpha.o/") == 0);
  REQUIRE_FALSE(header_shape(MemberKind::gnu_short, "/"));
  REQUIRE_FALSE(header_shape(MemberKind::gnu_short, "//"));
  REQUIRE_FALSE(header_shape(MemberKind::gnu_short, "alpha.o"));
  REQUIRE_FALSE(header_shape(MemberKind::gnu_short, "al pha.o/"));

  REQUIRE(header_shape(MemberKind::gnu_long, "/0") == 0);
  REQUIRE(header_shape(MemberKind::gnu_long, "/1234") == 0);
  REQUIRE_FALSE(header_shape(MemberKind::gnu_long, "/"));
  REQUIRE_FALSE(header_shape(MemberKind::gnu_long, "//"));
  REQUIRE_FALSE(header_shape(MemberKind::gnu_long, "/12a"));

  REQUIRE(header_shape(MemberKind::gnu_symbol_table, "/") == 0);
  REQUIRE(header_shape(MemberKind::gnu_string_table, "//") == 0);

  REQUIRE(header_shape(MemberKind::bsd_short, "alpha.o") == 0);
  REQUIRE_FALSE(header_shape(MemberKind::bsd_short, "alpha.o/"));
  REQUIRE_FALSE(header_shape(MemberKind::bsd_short, "__.SYMDEF"));
  REQUIRE_FALSE(header_shape(MemberKind::bsd_short, "#1/20"));
  REQUIRE_FALSE(header_shape(MemberKind::bsd_short, ""));

  REQUIRE(header_shape(MemberKind::bsd_long, "#1/20") == 20);
  REQUIRE_FALSE(header_shape(MemberKind::bsd_long, "#1/"));
  REQUIRE_FALSE(header_shape(MemberKind::bsd_long, "#1/x"));

  REQUIRE(header_shape(MemberKind::bsd_symbol_table, "__.SYMDEF") == 0);
  REQUIRE(header_shape(MemberKind::bsd_symbol_table, "__.SYMDEF SORTED") == 0);
  REQUIRE(header_shape(MemberKind::bsd_symbol_table, "#1/20") == 20);
  REQUIRE_FALSE(header_shape(MemberKind::bsd_symbol_table, "alpha.o"));

  REQUIRE(header_shape(MemberKind::deb_short, "debian-binary") == 0);
}

TEST_CASE("Arx::Details::accept_from_new_file", "[ar][member]")
{
  using Arx::Details::accept_from_new_file;
  using Arx::MemberKind;

  std::string fifteen = "fifteen_chars.o";
  std::string sixteen = "sixteen_chars.oo";
  std::string seventeen = "seventeen_chars.o";
  REQUIRE(fifteen.size() == 15);
  REQUIRE(sixteen.size() == 16);
  REQUIRE(seventeen.size() == 17);

  REQUIRE(accept_from_new_file(MemberKind::gnu_short, fifteen));
  REQUIRE_FALSE(accept_from_new_file(MemberKind::gnu_long, fifteen));
  REQUIRE_FALSE(accept_from_new_file(MemberKind::gnu_short, sixteen));
  REQUIRE(accept_from_new_file(MemberKind::gnu_long, sixteen));
  REQUIRE_FALSE(accept_from_new_file(MemberKind::gnu_short, "a b.o"));
  REQUIRE(accept_from_new_file(MemberKind::gnu_long, "a b.o"));

  REQUIRE(accept_from_new_file(MemberKind::bsd_short, sixteen));
  REQUIRE_FALSE(accept_from_new_file(MemberKind::bsd_long, sixteen));
  REQUIRE_FALSE(accept_from_new_file(MemberKind::bsd_short, seventeen));
  REQUIRE(accept_from_new_file(MemberKind::bsd_long, seventeen));
  REQUIRE(accept_from_new_file(MemberKind::bsd_long, "a b.o"));
  REQUIRE_FALSE(accept_from_new_file(MemberKind::bsd_short, "__.SYMDEF"));

  REQUIRE(accept_from_new_file(MemberKind::deb_short, "debian-binary"));
  REQUIRE_FALSE(accept_from_new_file(MemberKind::deb_short, seventeen));

  for (auto kind : {MemberKind::gnu_symbol_table, MemberKind::gnu_string_table,
                    MemberKind::bsd_symbol_table}) {
    REQUIRE_FALSE(accept_from_new_file(kind, "alpha.o"));
    REQUIRE_FALSE(accept_from_new_file(kind, "__.SYMDEF"));
  }
}

TEST_CASE("Arx::Details::classification_order", "[ar][member]")
{
  auto gnu = Arx::Details::classification_order(Arx::Format::gnu);
  REQUIRE(gnu.size() == 4);
  REQUIRE(gnu.front() == Arx::MemberKind::gnu_symbol_table);
  REQUIRE(gnu.back() == Arx::MemberKind::gnu_short);

  auto bsd = Arx::Details::classification_order(Arx::Format::bsd);
  REQUIRE(bsd.size() == 3);
  REQUIRE(bsd.front() == Arx::MemberKind::bsd_symbol_table);

  auto any = Arx::Details::classification_order(std::nullopt);
  REQUIRE(any.size() == gnu.size() + bsd.size());
  for (auto kind : any) {
    REQUIRE(Arx::Details::is_regular(kind) != (kind == Arx::MemberKind::gnu_symbol_table ||
                                               kind == Arx::MemberKind::gnu_string_table ||
                                               kind == Arx::MemberKind::bsd_symbol_table));
  }
}

TEST_CASE("Arx::Member - at most one kind accepts a header", "[ar][member]")
{
  struct Case
  {
    std::string name;
    std::string inline_name;
  };
  std::vector<Case> cases = {
    {"/", ""},
    {"//", ""},
    {"/0", ""},
    {"alpha.o/", ""},
    {"alpha.o", ""},
    {"debian-binary", ""},
    {"__.SYMDEF", ""},
    {"__.SYMDEF SORTED", ""},
    {"#1/20", std::string("__.SYMDEF SORTED\0\0\0\0", 20)},
    {"#1/20", std::string("a_long_file_name.o\0\0", 20)},
    {"__.SYMDEF/", ""},
    {"a b", ""},
    {"#1/x", ""},
  };

  for (auto const& c : cases) {
    INFO("Header name: " << c.name);
    auto strings = loaded_strings();
    unsigned accepted = 0;
    for (auto kind : all_kinds) {
      auto shape = Arx::Details::header_shape(kind, c.name);
      if (!shape.has_value()) {
        continue;
      }
      auto inline_name = c.inline_name.substr(0, *shape);
      if (inline_name.size() != *shape) {
        continue;
      }
      auto member = Arx::Member::from_header(kind, Arx::MemberID(static_cast<std::size_t>(kind)),
                                             make_header(c.name, 100), inline_name, 128, &strings);
      if (member.has_value()) {
        ++accepted;
      }
    }
    REQUIRE(accepted <= 1);
  }
}

TEST_CASE("Arx::Member - GNU short from header", "[ar][member]")
{
  auto member = Arx::Member::from_header(Arx::MemberKind::gnu_short, Arx::MemberID(1),
                                         make_header("alpha.o/", 12), "", 128, nullptr);
  REQUIRE(member.has_value());
  REQUIRE(member->id() == Arx::MemberID(1));
  REQUIRE(member->filename() == "alpha.o");
  REQUIRE(member->name() == "alpha.o/");
  REQUIRE(member->size() == 12);
  REQUIRE(member->filesize() == 12);
  REQUIRE(member->offset() == 128);
  REQUIRE_FALSE(member->source_path().has_value());
  REQUIRE(member->format() == Arx::Format::gnu);
  REQUIRE(member->is_regular());
  REQUIRE(member->header() == make_header("alpha.o/", 12));
}

TEST_CASE("Arx::Member - GNU long from header", "[ar][member]")
{
  auto strings = loaded_strings();
  auto member = Arx::Member::from_header(Arx::MemberKind::gnu_long, Arx::MemberID(3),
                                         make_header("/0", 12), "", 128, &strings);
  REQUIRE(member.has_value());
  REQUIRE(member->filename() == "a_very_long_name_indeed.o");
  REQUIRE(member->name() == "/0");
  REQUIRE(strings.entry_count() == 1);

  REQUIRE_THROWS_AS(Arx::Member::from_header(Arx::MemberKind::gnu_long, Arx::MemberID(4),
                                             make_header("/0", 12), "", 128, nullptr),
                    Arx::InvalidArchive);
  REQUIRE_THROWS_AS(Arx::Member::from_header(Arx::MemberKind::gnu_long, Arx::MemberID(5),
                                             make_header("/500", 12), "", 128, &strings),
                    Arx::InvalidArchive);
}

TEST_CASE("Arx::Member - BSD long from header", "[ar][member]")
{
  auto member = Arx::Member::from_header(Arx::MemberKind::bsd_long, Arx::MemberID(1),
                                         make_header("#1/28", 40),
                                         std::string("this_is_a_long_file_name.o\0\0", 28), 128,
                                         nullptr);
  REQUIRE(member.has_value());
  REQUIRE(member->filename() == "this_is_a_long_file_name.o");
  REQUIRE(member->name() == "#1/28");
  REQUIRE(member->size() == 40);
  REQUIRE(member->filesize() == 12);
  REQUIRE(member->inline_name() == std::string("this_is_a_long_file_name.o\0\0", 28));

  auto symdef = Arx::Member::from_header(Arx::MemberKind::bsd_long, Arx::MemberID(2),
                                         make_header("#1/20", 40),
                                         std::string("__.SYMDEF SORTED\0\0\0\0", 20), 128, nullptr);
  REQUIRE_FALSE(symdef.has_value());
}

TEST_CASE("Arx::Member - BSD symbol table from header", "[ar][member]")
{
  auto bare = Arx::Member::from_header(Arx::MemberKind::bsd_symbol_table, Arx::MemberID(0),
                                       make_header("__.SYMDEF", 8), "", 68, nullptr);
  REQUIRE(bare.has_value());
  REQUIRE_FALSE(bare->sorted());
  REQUIRE_FALSE(bare->is_regular());
  REQUIRE(bare->name() == "__.SYMDEF");
  REQUIRE(bare->filesize() == 8);

  auto sorted = Arx::Member::from_header(
    Arx::MemberKind::bsd_symbol_table, Arx::MemberID(0), make_header("#1/20", 28),
    std::string("__.SYMDEF SORTED\0\0\0\0", 20), 88, nullptr);
  REQUIRE(sorted.has_value());
  REQUIRE(sorted->sorted());
  REQUIRE(sorted->name() == "#1/20");
  REQUIRE(sorted->filesize() == 8);

  auto plain = Arx::Member::from_header(Arx::MemberKind::bsd_symbol_table, Arx::MemberID(0),
                                        make_header("#1/8", 28), std::string("alpha.o\0", 8), 88,
                                        nullptr);
  REQUIRE_FALSE(plain.has_value());
}

TEST_CASE("Arx::Member - Debian short forces owner", "[ar][member]")
{
  auto loaded = Arx::Member::from_header(Arx::MemberKind::deb_short, Arx::MemberID(0),
                                         make_header("debian-binary", 4), "", 68, nullptr);
  REQUIRE(loaded.has_value());
  REQUIRE(loaded->uid() == 0);
  REQUIRE(loaded->gid() == 0);
  REQUIRE(loaded->format() == Arx::Format::deb);

  auto added = Arx::Member::from_file(Arx::MemberKind::deb_short, Arx::MemberID(1),
                                      metadata("data.tar.xz"), nullptr);
  REQUIRE(added.uid() == 0);
  REQUIRE(added.gid() == 0);
  REQUIRE(added.header().uid() == 0);
  REQUIRE(added.header().gid() == 0);
}

TEST_CASE("Arx::Member - from file", "[ar][member]")
{
  auto gnu_short =
    Arx::Member::from_file(Arx::MemberKind::gnu_short, Arx::MemberID(0), metadata("a.o"), nullptr);
  REQUIRE(gnu_short.name() == "a.o/");
  REQUIRE(gnu_short.filename() == "a.o");
  REQUIRE(gnu_short.uid() == 1000);
  REQUIRE(gnu_short.gid() == 100);
  REQUIRE(gnu_short.mode() == 0100600);
  REQUIRE_FALSE(gnu_short.offset().has_value());
  REQUIRE(gnu_short.source_path().has_value());
  REQUIRE(gnu_short.source_path()->string() == "/nonexistent/a.o");

  Arx::StringTable strings(ArxTest::test_mtime);
  auto first = Arx::Member::from_file(Arx::MemberKind::gnu_long, Arx::MemberID(1),
                                      metadata("this_is_a_long_file_name.o"), &strings);
  auto second = Arx::Member::from_file(Arx::MemberKind::gnu_long, Arx::MemberID(2),
                                       metadata("another_long_file_name.o"), &strings);
  REQUIRE(first.filename() == "this_is_a_long_file_name.o");
  REQUIRE(first.name() == "/0");
  REQUIRE(second.name() == "/28");
  REQUIRE(second.inline_name().empty());

  auto bsd_long = Arx::Member::from_file(Arx::MemberKind::bsd_long, Arx::MemberID(3),
                                         metadata("this_is_a_long_file_name.o", 10), nullptr);
  REQUIRE(bsd_long.name() == "#1/26");
  REQUIRE(bsd_long.size() == 36);
  REQUIRE(bsd_long.filesize() == 10);
  REQUIRE(bsd_long.inline_name() == "this_is_a_long_file_name.o");

  REQUIRE_THROWS_AS(Arx::Member::from_file(Arx::MemberKind::gnu_short, Arx::MemberID(4),
                                           metadata("this_is_a_long_file_name.o"), nullptr),
                    std::logic_error);
}

TEST_CASE("Arx::Member - relocate", "[ar][member]")
{
  auto member =
    Arx::Member::from_file(Arx::MemberKind::bsd_short, Arx::MemberID(0), metadata("a.o"), nullptr);
  REQUIRE(member.source_path().has_value());
  member.relocate(200);
  REQUIRE(member.offset() == 200);
  REQUIRE_FALSE(member.source_path().has_value());
}

TEST_CASE("Arx::Member - symbol tables", "[ar][member]")
{
  auto gnu = Arx::Member::symbol_table(Arx::Format::gnu, Arx::MemberID(0), metadata("syms", 8),
                                       false);
  REQUIRE(gnu.kind() == Arx::MemberKind::gnu_symbol_table);
  REQUIRE(gnu.name() == "/");
  REQUIRE(gnu.uid() == 0);
  REQUIRE(gnu.mode() == 0100644);

  auto bsd = Arx::Member::symbol_table(Arx::Format::bsd, Arx::MemberID(0), metadata("syms", 8),
                                       false);
  REQUIRE(bsd.name() == "__.SYMDEF");
  REQUIRE(bsd.inline_name().empty());
  REQUIRE(bsd.size() == 8);

  auto sorted = Arx::Member::symbol_table(Arx::Format::bsd, Arx::MemberID(0), metadata("syms", 8),
                                          true);
  REQUIRE(sorted.sorted());
  REQUIRE(sorted.name() == "#1/16");
  REQUIRE(sorted.inline_name() == "__.SYMDEF SORTED");
  REQUIRE(sorted.filesize() == 8);

  REQUIRE_THROWS_AS(
    Arx::Member::symbol_table(Arx::Format::deb, Arx::MemberID(0), metadata("syms", 8), false),
    Arx::WrongMemberType);
}

TEST_CASE("Arx::describe", "[ar][member]")
{
  auto member =
    Arx::Member::from_file(Arx::MemberKind::bsd_short, Arx::MemberID(0), metadata("a.o"), nullptr);
  auto text = Arx::describe(member);
  REQUIRE(text.find("BSD short name") != std::string::npos);
  REQUIRE(text.find("filename='a.o'") != std::string::npos);
  REQUIRE(text.find("mode=100600") != std::string::npos);
}
