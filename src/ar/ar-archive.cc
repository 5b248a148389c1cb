/** \file   ar-archive.cc
 *  \brief  Non-template parts of the archive session.
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#include "ar.hh"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {
constexpr std::string_view control_prefix = "control.tar";
constexpr std::string_view data_prefix = "data.tar";
}  // namespace

auto Arx::Details::null_logger() -> std::shared_ptr<spdlog::logger>
{
  return std::make_shared<spdlog::logger>("arx", std::make_shared<spdlog::sinks::null_sink_st>());
}

auto Arx::Details::debian_order(std::vector<Member> const& members) -> std::vector<std::size_t>
{
  std::optional<std::size_t> binary;
  std::optional<std::size_t> control;
  std::optional<std::size_t> data;
  std::vector<std::size_t> rest;

  for (std::size_t i = 0; i < members.size(); ++i) {
    auto const& name = members[i].filename();
    if (!binary.has_value() && name == debian_binary_name) {
      binary = i;
    }
    else if (!control.has_value() && name.starts_with(control_prefix)) {
      control = i;
    }
    else if (!data.has_value() && name.starts_with(data_prefix)) {
      data = i;
    }
    else {
      rest.push_back(i);
    }
  }

  if (!binary.has_value() || !control.has_value() || !data.has_value()) {
    throw InvalidArchive(fmt::format(
      "Debian packages need {}, {}*, and {}* members; missing:{}{}{}", debian_binary_name,
      control_prefix, data_prefix, binary.has_value() ? "" : " debian-binary",
      control.has_value() ? "" : " control.tar*", data.has_value() ? "" : " data.tar*"));
  }

  std::vector<std::size_t> result = {*binary, *control, *data};
  result.insert(result.end(), rest.begin(), rest.end());
  return result;
}
