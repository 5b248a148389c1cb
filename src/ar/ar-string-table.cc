/** \file   ar-string-table.cc
 *  \brief  Implement the GNU archive string table.
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#include "ar-string-table.hh"

#include "ar-error.hh"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace {
constexpr std::string_view terminator = "/\n";
}  // namespace

Arx::StringTable::StringTable(std::time_t mtime) : mtime_(mtime) {}

Arx::StringTable::StringTable(Details::MemberHeader const& header, std::size_t offset,
                              std::vector<char> data)
    : data_(std::move(data)), loaded_size_(header.size()), offset_(offset),
      mtime_(header.mtime()), uid_(header.uid()), gid_(header.gid()), mode_(header.mode())
{
}

void Arx::StringTable::add(MemberID id, std::string filename)
{
  if (phase_ != Phase::collecting) {
    throw std::logic_error(
      fmt::format("Cannot add '{}' to a finalized string table.", Details::printable(filename)));
  }
  if (index_.find(id) != index_.end()) {
    throw std::logic_error("Member already has a name in the string table.");
  }

  auto len = filename.size();
  index_.insert({id, entries_.size()});
  entries_.push_back({id, std::move(filename), total_});
  total_ += len + terminator.size();
}

auto Arx::StringTable::lookup(MemberID id) const -> std::string const&
{
  return entries_[index_.at(id)].filename;
}

auto Arx::StringTable::offset(MemberID id) const -> std::size_t
{
  return entries_[index_.at(id)].offset;
}

auto Arx::StringTable::resolve(std::size_t offset) const -> std::string
{
  if (offset >= data_.size()) {
    throw InvalidArchive(fmt::format("String table offset {} is outside the {} byte table.",
                                     offset, data_.size()));
  }

  auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
  auto end = std::search(begin, data_.end(), terminator.begin(), terminator.end());
  if (end == data_.end()) {
    throw InvalidArchive(fmt::format("Unterminated string table entry at offset {}.", offset));
  }

  return std::string(begin, end);
}

auto Arx::StringTable::size() const noexcept -> std::size_t
{
  return loaded_size_.value_or(total_);
}

auto Arx::StringTable::content() const -> std::string
{
  std::string result;
  result.reserve(total_);
  for (auto const& entry : entries_) {
    result += entry.filename;
    result += terminator;
  }
  return result;
}

auto Arx::StringTable::header() const -> Details::MemberHeader
{
  return {std::string(Details::gnu_string_table_name), mtime_, uid_, gid_, mode_, total_};
}

void Arx::StringTable::relocate(std::size_t offset)
{
  offset_ = offset;
  data_.clear();
  loaded_size_.reset();
  phase_ = Phase::collecting;
}
