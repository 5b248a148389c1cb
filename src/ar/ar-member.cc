/** \file   ar-member.cc
 *  \brief  Implement archive member classification.
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#include "ar-member.hh"

#include "ar-error.hh"
#include "ar-string-table.hh"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

using Arx::MemberKind;

/** \brief  Maximum length of a file name that fits in the header name field.  */
constexpr std::size_t short_name_max = Arx::Details::MemberHeader::name_len;

constexpr std::array gnu_classification = {MemberKind::gnu_symbol_table,
                                           MemberKind::gnu_string_table, MemberKind::gnu_long,
                                           MemberKind::gnu_short};
constexpr std::array bsd_classification = {MemberKind::bsd_symbol_table, MemberKind::bsd_long,
                                           MemberKind::bsd_short};
constexpr std::array deb_classification = {MemberKind::deb_short};
constexpr std::array any_classification = {
  MemberKind::gnu_symbol_table, MemberKind::gnu_string_table, MemberKind::gnu_long,
  MemberKind::gnu_short,        MemberKind::bsd_symbol_table, MemberKind::bsd_long,
  MemberKind::bsd_short};

constexpr std::array gnu_creation = {MemberKind::gnu_short, MemberKind::gnu_long};
constexpr std::array bsd_creation = {MemberKind::bsd_short, MemberKind::bsd_long};
constexpr std::array deb_creation = {MemberKind::deb_short};

auto has_whitespace(std::string_view name) -> bool
{
  return name.find_first_of(" \t\n\r\v\f") != std::string_view::npos;
}

/** \brief  Parse the decimal after \a prefix in \a name.  */
auto number_after(std::string_view name, std::string_view prefix) -> std::optional<std::size_t>
{
  if (!name.starts_with(prefix) || name.size() == prefix.size()) {
    return std::nullopt;
  }
  auto digits = name.substr(prefix.size());
  if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return std::nullopt;
  }
  return Arx::Details::to_number<std::size_t>(digits);
}

auto is_gnu_short_name(std::string_view name) -> bool
{
  return name.size() > 1 && name.back() == '/' && name.front() != '/' && !has_whitespace(name);
}

auto is_bsd_short_name(std::string_view name) -> bool
{
  return !name.empty() && name.find('/') == std::string_view::npos &&
         !name.starts_with(Arx::Details::bsd_symbol_table_name);
}

/** \brief  Logical name held in inline name bytes: everything up to the first NUL.  */
auto inline_filename(std::string const& inline_name) -> std::string
{
  return inline_name.substr(0, inline_name.find('\0'));
}
}  // namespace

auto Arx::Details::classification_order(std::optional<Format> format) noexcept
  -> std::span<MemberKind const>
{
  if (!format.has_value()) {
    return any_classification;
  }
  switch (*format) {
  case Format::gnu:
    return gnu_classification;
  case Format::bsd:
    return bsd_classification;
  case Format::deb:
    return deb_classification;
  }
  return any_classification;
}

auto Arx::Details::creation_order(Format format) noexcept -> std::span<MemberKind const>
{
  switch (format) {
  case Format::gnu:
    return gnu_creation;
  case Format::bsd:
    return bsd_creation;
  case Format::deb:
    return deb_creation;
  }
  return gnu_creation;
}

auto Arx::Details::header_shape(MemberKind kind, std::string_view name)
  -> std::optional<std::size_t>
{
  switch (kind) {
  case MemberKind::gnu_short:
    return is_gnu_short_name(name) ? std::optional<std::size_t>(0) : std::nullopt;
  case MemberKind::gnu_long:
    return number_after(name, gnu_symbol_table_name).has_value() ? std::optional<std::size_t>(0)
                                                                 : std::nullopt;
  case MemberKind::gnu_symbol_table:
    return name == gnu_symbol_table_name ? std::optional<std::size_t>(0) : std::nullopt;
  case MemberKind::gnu_string_table:
    return name == gnu_string_table_name ? std::optional<std::size_t>(0) : std::nullopt;
  case MemberKind::bsd_short:
  case MemberKind::deb_short:
    return is_bsd_short_name(name) ? std::optional<std::size_t>(0) : std::nullopt;
  case MemberKind::bsd_long:
    return number_after(name, bsd_long_name_prefix);
  case MemberKind::bsd_symbol_table:
    if (name == bsd_symbol_table_name || name == bsd_sorted_symbol_table_name) {
      return 0;
    }
    return number_after(name, bsd_long_name_prefix);
  }
  return std::nullopt;
}

auto Arx::Details::accept_from_new_file(MemberKind kind, std::string_view filename) -> bool
{
  if (filename.empty()) {
    return false;
  }

  switch (kind) {
  case MemberKind::gnu_short:
    return filename.size() < short_name_max && !has_whitespace(filename);
  case MemberKind::gnu_long:
    return filename.size() >= short_name_max || has_whitespace(filename);
  case MemberKind::bsd_short:
  case MemberKind::deb_short:
    return filename.size() <= short_name_max && !has_whitespace(filename) &&
           !filename.starts_with(bsd_symbol_table_name);
  case MemberKind::bsd_long:
    return (filename.size() > short_name_max || has_whitespace(filename)) &&
           !filename.starts_with(bsd_symbol_table_name);
  case MemberKind::gnu_symbol_table:
  case MemberKind::gnu_string_table:
  case MemberKind::bsd_symbol_table:
    return false;
  }
  return false;
}

Arx::Member::Member(MemberKind kind, MemberID id) : kind_(kind), id_(id) {}

auto Arx::Member::from_header(MemberKind kind, MemberID id, Details::MemberHeader const& header,
                              std::string const& inline_name, std::size_t data_offset,
                              StringTable* strings) -> std::optional<Member>
{
  auto const& name = header.name();
  auto shape = Details::header_shape(kind, name);
  if (!shape.has_value() || *shape != inline_name.size() || *shape > header.size()) {
    return std::nullopt;
  }

  Member result(kind, id);
  result.mtime_ = header.mtime();
  result.uid_ = header.uid();
  result.gid_ = header.gid();
  result.mode_ = header.mode();
  result.size_ = header.size();
  result.inline_length_ = inline_name.size();
  result.offset_ = data_offset;

  switch (kind) {
  case MemberKind::gnu_short:
    result.name_ = name;
    result.filename_ = name.substr(0, name.size() - 1);
    break;
  case MemberKind::gnu_long: {
    if (strings == nullptr) {
      throw InvalidArchive(fmt::format(
        "Member '{}' at offset {} needs a string table but the archive has none.",
        Details::printable(name), data_offset - Details::MemberHeader::header_len));
    }
    auto offset = Details::to_number<std::size_t>(name.substr(1));
    strings->add(id, strings->resolve(*offset));
    result.strings_ = strings;
    break;
  }
  case MemberKind::gnu_symbol_table:
  case MemberKind::gnu_string_table:
    result.name_ = name;
    break;
  case MemberKind::bsd_short:
    result.name_ = name;
    result.filename_ = name;
    break;
  case MemberKind::deb_short:
    result.name_ = name;
    result.filename_ = name;
    result.uid_ = 0;
    result.gid_ = 0;
    break;
  case MemberKind::bsd_long:
    result.filename_ = inline_filename(inline_name);
    if (result.filename_.starts_with(Details::bsd_symbol_table_name)) {
      return std::nullopt;
    }
    break;
  case MemberKind::bsd_symbol_table:
    if (inline_name.empty()) {
      result.name_ = name;
      result.filename_ = name;
    }
    else {
      result.filename_ = inline_filename(inline_name);
      if (!result.filename_.starts_with(Details::bsd_symbol_table_name)) {
        return std::nullopt;
      }
    }
    result.sorted_ = result.filename_.ends_with("SORTED");
    break;
  }

  return result;
}

auto Arx::Member::from_file(MemberKind kind, MemberID id, Details::FileMetadata const& metadata,
                            StringTable* strings) -> Member
{
  if (!Details::accept_from_new_file(kind, metadata.filename)) {
    throw std::logic_error(fmt::format("A {} member cannot hold '{}'.", Details::kind_name(kind),
                                       Details::printable(metadata.filename)));
  }

  Member result(kind, id);
  result.mtime_ = metadata.mtime;
  result.uid_ = metadata.uid;
  result.gid_ = metadata.gid;
  result.mode_ = metadata.mode;
  result.size_ = metadata.size;
  result.source_path_ = metadata.path;

  switch (kind) {
  case MemberKind::gnu_short:
    result.filename_ = metadata.filename;
    result.name_ = metadata.filename + "/";
    break;
  case MemberKind::gnu_long:
    if (strings == nullptr) {
      throw std::logic_error("GNU long name member created without a string table.");
    }
    strings->add(id, metadata.filename);
    result.strings_ = strings;
    break;
  case MemberKind::deb_short:
    result.uid_ = 0;
    result.gid_ = 0;
    [[fallthrough]];
  case MemberKind::bsd_short:
    result.filename_ = metadata.filename;
    result.name_ = metadata.filename;
    break;
  case MemberKind::bsd_long:
    result.filename_ = metadata.filename;
    result.inline_length_ = metadata.filename.size();
    result.size_ += result.inline_length_;
    break;
  case MemberKind::gnu_symbol_table:
  case MemberKind::gnu_string_table:
  case MemberKind::bsd_symbol_table:
    break;
  }

  return result;
}

auto Arx::Member::symbol_table(Format format, MemberID id, Details::FileMetadata const& metadata,
                               bool sorted) -> Member
{
  static constexpr mode_t table_mode = 0100644;

  MemberKind kind = MemberKind::gnu_symbol_table;
  switch (format) {
  case Format::gnu:
    if (sorted) {
      throw WrongMemberType("GNU symbol tables cannot be marked as sorted.");
    }
    kind = MemberKind::gnu_symbol_table;
    break;
  case Format::bsd:
    kind = MemberKind::bsd_symbol_table;
    break;
  case Format::deb:
    throw WrongMemberType("Debian archives do not have a symbol table.");
  }

  Member result(kind, id);
  result.mtime_ = std::time(nullptr);
  result.mode_ = table_mode;
  result.size_ = metadata.size;
  result.source_path_ = metadata.path;
  result.sorted_ = sorted;

  if (kind == MemberKind::gnu_symbol_table) {
    result.name_ = Details::gnu_symbol_table_name;
  }
  else if (!sorted) {
    result.name_ = Details::bsd_symbol_table_name;
    result.filename_ = Details::bsd_symbol_table_name;
  }
  else {
    /* Sorted tables are written with their name inline, as Darwin's ranlib does.  */
    result.filename_ = Details::bsd_sorted_symbol_table_name;
    result.inline_length_ = result.filename_.size();
    result.size_ += result.inline_length_;
  }
  return result;
}

auto Arx::Member::name() const -> std::string
{
  switch (kind_) {
  case MemberKind::gnu_long:
    return fmt::format("/{}", strings_->offset(id_));
  case MemberKind::bsd_long:
    return fmt::format("{}{}", Details::bsd_long_name_prefix, inline_length_);
  case MemberKind::bsd_symbol_table:
    if (inline_length_ != 0) {
      return fmt::format("{}{}", Details::bsd_long_name_prefix, inline_length_);
    }
    return name_;
  case MemberKind::gnu_short:
  case MemberKind::gnu_symbol_table:
  case MemberKind::gnu_string_table:
  case MemberKind::bsd_short:
  case MemberKind::deb_short:
    return name_;
  }
  return name_;
}

auto Arx::Member::filename() const -> std::string const&
{
  if (kind_ == MemberKind::gnu_long) {
    return strings_->lookup(id_);
  }
  return filename_;
}

auto Arx::Member::header() const -> Details::MemberHeader
{
  return {name(), mtime_, uid_, gid_, mode_, size_};
}

auto Arx::Member::inline_name() const -> std::string
{
  if (inline_length_ == 0) {
    return {};
  }
  auto result = filename_;
  result.resize(inline_length_, '\0');
  return result;
}

void Arx::Member::relocate(std::size_t offset) noexcept
{
  offset_ = offset;
  source_path_.reset();
}

auto Arx::describe(Member const& member) -> std::string
{
  return fmt::format("<{} filename='{}' name='{}' date={} uid={} gid={} mode={:o} size={}>",
                     Details::kind_name(member.kind()), Details::printable(member.filename()),
                     Details::printable(member.name()), member.mtime(), member.uid(),
                     member.gid(), member.mode(), member.filesize());
}
