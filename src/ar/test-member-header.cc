/** \file   test-member-header.cc
 *  \brief  Tests for Arx::Details::MemberHeader
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <algorithm>
#include <string>
#include <string_view>

#include "ar-error.hh"
#include "ar-header.hh"

namespace {
auto to_raw(std::string const& s) -> Arx::Details::MemberHeader::Raw
{
  Arx::Details::MemberHeader::Raw raw{};
  REQUIRE(s.size() == raw.size());
  std::copy(s.begin(), s.end(), raw.begin());
  return raw;
}
}  // namespace

TEST_CASE("Arx::Details::MemberHeader - Decode BSD", "[ar][member-header]")
{
  auto raw = to_raw("file            "
                    "123456789012"
                    "1     "
                    "    10"
                    "0660    "
                    "1234567890"
                    "`\n");
  auto mh = Arx::Details::MemberHeader::decode(raw, 8);

  REQUIRE(mh.name() == std::string("file"));
  REQUIRE(mh.mtime() == 123456789012);
  REQUIRE(mh.uid() == 1);
  REQUIRE(mh.gid() == 10);
  REQUIRE(mh.mode() == 0660);
  REQUIRE(mh.size() == 1234567890);
}

TEST_CASE("Arx::Details::MemberHeader - Decode BSD Long", "[ar][member-header]")
{
  auto raw = to_raw("#1/20           "
                    "123456789012"
                    "1     "
                    "    10"
                    "  0660  "
                    "1234567890"
                    "`\n");
  auto mh = Arx::Details::MemberHeader::decode(raw, 8);

  REQUIRE(mh.name() == std::string("#1/20"));
  REQUIRE(mh.mode() == 0660);
  REQUIRE(mh.size() == 1234567890);
}

TEST_CASE("Arx::Details::MemberHeader - Decode GNU", "[ar][member-header]")
{
  auto raw = to_raw("Fred in a shed/ "
                    "123456789012"
                    "1     "
                    "    10"
                    "0660    "
                    "1234567890"
                    "`\n");
  auto mh = Arx::Details::MemberHeader::decode(raw, 8);

  /* Only surrounding spaces go: the name is the member variant's business.  */
  REQUIRE(mh.name() == std::string("Fred in a shed/"));
  REQUIRE(mh.uid() == 1);
  REQUIRE(mh.gid() == 10);
}

TEST_CASE("Arx::Details::MemberHeader - Bad terminator", "[ar][member-header]")
{
  auto raw = to_raw("file            "
                    "123456789012"
                    "1     "
                    "    10"
                    "0660    "
                    "1234567890"
                    "\n`");
  REQUIRE_THROWS_AS(Arx::Details::MemberHeader::name_field(raw, 8), Arx::InvalidArchive);
  REQUIRE_THROWS_AS(Arx::Details::MemberHeader::decode(raw, 8), Arx::InvalidArchive);
}

TEST_CASE("Arx::Details::MemberHeader - Bad numbers", "[ar][member-header]")
{
  auto blank_mode = to_raw("file            "
                           "123456789012"
                           "1     "
                           "    10"
                           "        "
                           "12        "
                           "`\n");
  REQUIRE_THROWS_AS(Arx::Details::MemberHeader::decode(blank_mode, 8), Arx::InvalidArchive);

  auto octal_nine = to_raw("file            "
                           "123456789012"
                           "1     "
                           "    10"
                           "0699    "
                           "12        "
                           "`\n");
  REQUIRE_THROWS_AS(Arx::Details::MemberHeader::decode(octal_nine, 8), Arx::InvalidArchive);

  auto split_size = to_raw("file            "
                           "123456789012"
                           "1     "
                           "    10"
                           "0644    "
                           "12 3      "
                           "`\n");
  REQUIRE_THROWS_AS(Arx::Details::MemberHeader::decode(split_size, 8), Arx::InvalidArchive);
  REQUIRE_THROWS_AS(Arx::Details::MemberHeader::decode(split_size, 8, true), Arx::InvalidArchive);
}

TEST_CASE("Arx::Details::MemberHeader - Lenient decode", "[ar][member-header]")
{
  auto raw = to_raw("//              "
                    "            "
                    "      "
                    "      "
                    "        "
                    "54        "
                    "`\n");
  auto mh = Arx::Details::MemberHeader::decode(raw, 68, true);

  REQUIRE(mh.name() == "//");
  REQUIRE(mh.mtime() == 0);
  REQUIRE(mh.uid() == 0);
  REQUIRE(mh.gid() == 0);
  REQUIRE(mh.mode() == 0);
  REQUIRE(mh.size() == 54);

  REQUIRE_THROWS_AS(Arx::Details::MemberHeader::decode(raw, 68), Arx::InvalidArchive);
}

TEST_CASE("Arx::Details::MemberHeader - Encode", "[ar][member-header]")
{
  Arx::Details::MemberHeader mh("alpha.o/", 1617235200, 1000, 100, 0100644, 25);
  auto raw = mh.encode();

  REQUIRE(std::string(raw.begin(), raw.end()) == "alpha.o/        "
                                                  "1617235200  "
                                                  "1000  "
                                                  "100   "
                                                  "100644  "
                                                  "25        "
                                                  "`\n");
  REQUIRE(Arx::Details::MemberHeader::decode(raw, 0) == mh);
}

TEST_CASE("Arx::Details::MemberHeader - Encode zero", "[ar][member-header]")
{
  Arx::Details::MemberHeader mh("/", 0, 0, 0, 0, 0);
  auto raw = mh.encode();

  REQUIRE(std::string(raw.begin(), raw.end()) == "/               "
                                                  "0           "
                                                  "0     "
                                                  "0     "
                                                  "0       "
                                                  "0         "
                                                  "`\n");
}

TEST_CASE("Arx::Details::MemberHeader - Encode overflow", "[ar][member-header]")
{
  Arx::Details::MemberHeader long_name("a_seventeen_bytes", 0, 0, 0, 0, 0);
  REQUIRE_THROWS_AS(long_name.encode(), std::logic_error);

  Arx::Details::MemberHeader big_uid("a", 0, 1234567, 0, 0, 0);
  REQUIRE_THROWS_AS(big_uid.encode(), std::runtime_error);

  Arx::Details::MemberHeader big_size("a", 0, 0, 0, 0, 12345678901);
  REQUIRE_THROWS_AS(big_size.encode(), std::runtime_error);
}

TEST_CASE("Arx::Details::printable", "[ar][member-header]")
{
  REQUIRE(Arx::Details::printable("abc") == "abc");
  REQUIRE(Arx::Details::printable("!<arch>\n") == "!<arch>\\n");
  REQUIRE(Arx::Details::printable(std::string_view("a\0b", 3)) == "a\\x00b");
}
