/** \file   ar-transfer.hh
 *  \brief  Copy member payloads between files
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef ARX_AR_TRANSFER_HH_INCLUDED_
#define ARX_AR_TRANSFER_HH_INCLUDED_

#include "util/file.hh"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <vector>

namespace Arx::Details {

/** \brief  Largest number of bytes copied at once.  */
constexpr std::size_t transfer_block_size = 65535;

/** \brief         Copy \a length bytes starting at \a offset of \a src to the end of \a dest.
 *  \tparam IFType Input file type
 *  \tparam OFType Output file type
 *  \throw  std::runtime_error \a src ends before \a length bytes have been copied.
 */
template<typename IFType, typename OFType>
void transfer(IFType& src, std::size_t offset, OFType& dest, std::size_t length)
{
  src.offset_bytes(offset);
  std::vector<char> buffer(std::min(length, transfer_block_size));
  while (length != 0) {
    auto chunk = std::span<char>(buffer.data(), std::min(length, buffer.size()));
    auto got = src.read_upto(chunk);
    if (got != chunk.size()) {
      throw std::runtime_error(fmt::format(
        "Unexpected end of input at offset {}: {} more bytes needed.", offset + got, length - got));
    }
    dest.write(std::span<char const>(chunk.data(), got));
    offset += got;
    length -= got;
  }
}

/** \brief         Copy the first \a length bytes of the file at \a path to the end of \a dest.  */
template<typename OFType>
void transfer_from_file(std::filesystem::path const& path, OFType& dest, std::size_t length)
{
  InputFile src(path.string());
  transfer(src, 0, dest, length);
}

}  // namespace Arx::Details

#endif  // ARX_AR_TRANSFER_HH_INCLUDED_
