/** \file   test-string-table.cc
 *  \brief  Tests for Arx::StringTable
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "ar-error.hh"
#include "ar-string-table.hh"

namespace {
auto load(std::string const& content, std::size_t header_size) -> Arx::StringTable
{
  Arx::Details::MemberHeader header("//", 0, 0, 0, 0, header_size);
  return {header, 68, std::vector<char>(content.begin(), content.end())};
}
}  // namespace

TEST_CASE("Arx::StringTable - offsets", "[ar][string-table]")
{
  Arx::StringTable table(1617235200);
  table.add(Arx::MemberID(4), "this_is_a_long_file_name.o");
  table.add(Arx::MemberID(2), "another_long_file_name.o");
  table.add(Arx::MemberID(7), "x");

  REQUIRE(table.entry_count() == 3);
  REQUIRE(table.offset(Arx::MemberID(4)) == 0);
  REQUIRE(table.offset(Arx::MemberID(2)) == 28);
  REQUIRE(table.offset(Arx::MemberID(7)) == 28 + 26);
  REQUIRE(table.lookup(Arx::MemberID(2)) == "another_long_file_name.o");
  REQUIRE(table.size() == 28 + 26 + 3);
  REQUIRE(table.content() ==
          "this_is_a_long_file_name.o/\nanother_long_file_name.o/\nx/\n");
  REQUIRE(table.content().size() == table.size());

  REQUIRE_THROWS_AS(table.lookup(Arx::MemberID(3)), std::out_of_range);
}

TEST_CASE("Arx::StringTable - same name twice", "[ar][string-table]")
{
  Arx::StringTable table(0);
  table.add(Arx::MemberID(0), "duplicate_long_name.o");
  table.add(Arx::MemberID(1), "duplicate_long_name.o");

  REQUIRE(table.offset(Arx::MemberID(0)) == 0);
  REQUIRE(table.offset(Arx::MemberID(1)) == 23);
  REQUIRE_THROWS_AS(table.add(Arx::MemberID(1), "other"), std::logic_error);
}

TEST_CASE("Arx::StringTable - phases", "[ar][string-table]")
{
  Arx::StringTable table(0);
  REQUIRE(table.phase() == Arx::StringTable::Phase::collecting);
  table.add(Arx::MemberID(0), "a_long_file_name.o");
  table.finalize();
  REQUIRE(table.phase() == Arx::StringTable::Phase::finalized);
  REQUIRE_THROWS_AS(table.add(Arx::MemberID(1), "b_long_file_name.o"), std::logic_error);

  table.relocate(76);
  REQUIRE(table.phase() == Arx::StringTable::Phase::collecting);
  REQUIRE(table.offset_bytes() == 76);
  table.add(Arx::MemberID(1), "b_long_file_name.o");
  REQUIRE(table.offset(Arx::MemberID(1)) == 20);
}

TEST_CASE("Arx::StringTable - new table header", "[ar][string-table]")
{
  Arx::StringTable table(1617235200);
  table.add(Arx::MemberID(0), "a_long_file_name.o");
  auto header = table.header();

  REQUIRE(table.mtime() == 1617235200);
  REQUIRE(table.uid() == 0);
  REQUIRE(table.gid() == 0);
  REQUIRE(table.mode() == 0100644);

  REQUIRE(header.name() == "//");
  REQUIRE(header.mtime() == 1617235200);
  REQUIRE(header.uid() == 0);
  REQUIRE(header.gid() == 0);
  REQUIRE(header.mode() == 0100644);
  REQUIRE(header.size() == 20);
}

TEST_CASE("Arx::StringTable - resolve", "[ar][string-table]")
{
  auto table = load("this_is_a_long_file_name.o/\nanother_long_file_name.o/\n", 54);

  REQUIRE(table.resolve(0) == "this_is_a_long_file_name.o");
  REQUIRE(table.resolve(28) == "another_long_file_name.o");
  REQUIRE(table.offset_bytes() == 68);
  REQUIRE(table.entry_count() == 0);
  REQUIRE(table.mtime() == 0);
  REQUIRE(table.mode() == 0);
}

TEST_CASE("Arx::StringTable - resolve keeps every byte of the name", "[ar][string-table]")
{
  auto table = load("trailing_space.o /\nleading\ttab.o/\n", 34);
  REQUIRE(table.resolve(0) == "trailing_space.o ");
  REQUIRE(table.resolve(19) == "leading\ttab.o");

  auto with_nul = load(std::string("nul_in_name.o\0/\n", 16), 16);
  REQUIRE(with_nul.resolve(0) == std::string("nul_in_name.o\0", 14));
}

TEST_CASE("Arx::StringTable - loaded size", "[ar][string-table]")
{
  /* An on-disk table may carry padding after the last name.  */
  auto table = load("a_long_file_name.o/\n\n\n\n\n", 24);
  REQUIRE(table.size() == 24);
  table.add(Arx::MemberID(0), table.resolve(0));
  REQUIRE(table.size() == 24);
  REQUIRE(table.header().size() == 20);
  REQUIRE(table.content() == "a_long_file_name.o/\n");

  table.relocate(100);
  REQUIRE(table.size() == 20);
}

TEST_CASE("Arx::StringTable - unterminated", "[ar][string-table]")
{
  auto table = load("first_long_name.o/\nsecond_long_name.o", 37);

  REQUIRE(table.resolve(0) == "first_long_name.o");
  REQUIRE_THROWS_AS(table.resolve(19), Arx::InvalidArchive);
  REQUIRE_THROWS_AS(table.resolve(37), Arx::InvalidArchive);
  REQUIRE_THROWS_AS(table.resolve(1000), Arx::InvalidArchive);

  auto slash_only = load("name_without_newline.o/", 23);
  REQUIRE_THROWS_AS(slash_only.resolve(0), Arx::InvalidArchive);
}
