/** \file   ar-header.cc
 *  \brief  Implement member header encoding and decoding.
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#include "ar-header.hh"

#include "ar-error.hh"

#include <fmt/format.h>

#include <algorithm>
#include <cassert>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace {

using MemberHeader = Arx::Details::MemberHeader;

constexpr std::size_t mtime_pos = MemberHeader::name_len;
constexpr std::size_t uid_pos = mtime_pos + MemberHeader::mtime_len;
constexpr std::size_t gid_pos = uid_pos + MemberHeader::uid_len;
constexpr std::size_t mode_pos = gid_pos + MemberHeader::gid_len;
constexpr std::size_t size_pos = mode_pos + MemberHeader::mode_len;
constexpr std::size_t fmag_pos = size_pos + MemberHeader::size_len;
static_assert(fmag_pos + MemberHeader::fmag_len == MemberHeader::header_len);

constexpr std::string_view fmag = "`\n";

/** \brief     Get a field of the raw header.  */
auto field(MemberHeader::Raw const& raw, std::size_t pos, std::size_t len) -> std::string_view
{
  return {raw.data() + pos, len};  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
}

/** \brief  Decode one numeric field, reporting where things went wrong.  */
template<typename T, unsigned Base = 10>  // NOLINT
auto decode_number(MemberHeader::Raw const& raw, std::size_t pos, std::size_t len,
                   char const* what, std::size_t offset, bool lenient) -> T
{
  auto v = field(raw, pos, len);
  auto result = Arx::Details::to_number<T, Base>(v);
  if (result.has_value()) {
    return *result;
  }
  if (lenient) {
    return T{0};
  }
  throw Arx::InvalidArchive(fmt::format("Bad {} field '{}' in member header at offset {}", what,
                                        Arx::Details::printable(v), offset));
}

/** \brief     Write a string into a header, padded with spaces.  */
void add_str(MemberHeader::Raw& out, std::size_t pos, std::string_view val, std::size_t len)
{
  assert(val.size() <= len);  // NOLINT
  auto it = std::copy(val.begin(), val.end(), out.begin() + static_cast<std::ptrdiff_t>(pos));
  std::fill_n(it, len - val.size(), ' ');
}

/** \brief  Write a number into a header.
 *  \tparam T     Type of number
 *  \tparam Base  Output base.
 *  \param  out   Header to write into
 *  \param  pos   Start of the field
 *  \param  val   Value to output
 *  \param  len   Number of characters to output.
 *
 * Output string to right padded with ' '.
 */
template<typename T, unsigned Base = 10>  // NOLINT
void add_number(MemberHeader::Raw& out, std::size_t pos, T val, std::size_t len)
{
  if constexpr (std::is_signed_v<T>) {
    if (val < 0) {
      throw std::runtime_error("Negative number cannot be represented in a member header.");
    }
  }

  auto res = std::string();
  while (val != 0) {
    res += static_cast<char>('0' + (val % Base));
    val /= Base;
  }
  std::reverse(res.begin(), res.end());
  if (res.empty()) {
    res = "0";
  }
  if (res.size() > len) {
    throw std::runtime_error("Number too big for output.");
  }
  add_str(out, pos, res, len);
}
}  // namespace

auto Arx::Details::printable(std::string_view bytes) -> std::string
{
  std::string result;
  for (char c : bytes) {
    auto u = static_cast<unsigned char>(c);
    if (c == '\n') {
      result += "\\n";
    }
    else if (u < 0x20 || u >= 0x7f) {  // NOLINT
      result += fmt::format("\\x{:02x}", u);
    }
    else {
      result += c;
    }
  }
  return result;
}

Arx::Details::MemberHeader::MemberHeader(std::string name, std::time_t mtime, uid_t uid, gid_t gid,
                                         mode_t mode, std::size_t size)
    : name_(std::move(name)), mtime_(mtime), uid_(uid), gid_(gid), mode_(mode), size_(size)
{
}

auto Arx::Details::MemberHeader::name_field(Raw const& raw, std::size_t offset) -> std::string
{
  auto magic = field(raw, fmag_pos, fmag_len);
  if (magic != fmag) {
    throw InvalidArchive(
      fmt::format("Bad end of header magic at offset {}: expected '{}', got '{}'", offset,
                  printable(fmag), printable(magic)));
  }

  auto name = field(raw, 0, name_len);
  auto begin = name.find_first_not_of(' ');
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = name.find_last_not_of(' ');
  return std::string(name.substr(begin, end - begin + 1));
}

auto Arx::Details::MemberHeader::decode(Raw const& raw, std::size_t offset, bool lenient)
  -> MemberHeader
{
  MemberHeader result;
  result.name_ = name_field(raw, offset);
  result.mtime_ = decode_number<std::time_t>(raw, mtime_pos, mtime_len, "mtime", offset, lenient);
  result.uid_ = decode_number<uid_t>(raw, uid_pos, uid_len, "uid", offset, lenient);
  result.gid_ = decode_number<gid_t>(raw, gid_pos, gid_len, "gid", offset, lenient);
  result.mode_ = decode_number<mode_t, 8>(raw, mode_pos, mode_len, "mode", offset,  // NOLINT
                                          lenient);
  result.size_ = decode_number<std::size_t>(raw, size_pos, size_len, "size", offset, false);
  return result;
}

auto Arx::Details::MemberHeader::encode() const -> Raw
{
  if (name_.size() > name_len) {
    throw std::logic_error(fmt::format("Member name '{}' does not fit in a header.", name_));
  }

  Raw result{};
  add_str(result, 0, name_, name_len);
  add_number(result, mtime_pos, mtime_, mtime_len);
  add_number(result, uid_pos, uid_, uid_len);
  add_number(result, gid_pos, gid_, gid_len);
  add_number<mode_t, 8>(result, mode_pos, mode_, mode_len);  // NOLINT
  add_number(result, size_pos, size_, size_len);
  add_str(result, fmag_pos, fmag, fmag_len);
  return result;
}

auto Arx::Details::MemberHeader::operator==(MemberHeader const& rhs) const noexcept -> bool
{
  return name_ == rhs.name_ && mtime_ == rhs.mtime_ && uid_ == rhs.uid_ && gid_ == rhs.gid_ &&
         mode_ == rhs.mode_ && size_ == rhs.size_;
}

auto Arx::Details::MemberHeader::name() const noexcept -> std::string const& { return name_; }
auto Arx::Details::MemberHeader::mtime() const noexcept -> std::time_t { return mtime_; }
auto Arx::Details::MemberHeader::uid() const noexcept -> uid_t { return uid_; }
auto Arx::Details::MemberHeader::gid() const noexcept -> gid_t { return gid_; }
auto Arx::Details::MemberHeader::mode() const noexcept -> mode_t { return mode_; }
auto Arx::Details::MemberHeader::size() const noexcept -> std::size_t { return size_; }
