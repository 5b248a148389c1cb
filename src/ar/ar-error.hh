/** \file   ar-error.hh
 *  \brief  Exceptions raised by the archive library
 *  \author Copyright 2021, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef ARX_AR_ERROR_HH_INCLUDED_
#define ARX_AR_ERROR_HH_INCLUDED_

#include <stdexcept>

namespace Arx {

/** \brief  The archive is malformed: bad magic, bad padding, bad header, unterminated string
 *          table, or a Debian archive missing one of its required members.
 */
class InvalidArchive : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/** \brief  No member variant accepts a header or a new file name.  */
class WrongMemberType : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/** \brief  Lookup of a member by name found nothing.  */
class MemberNotFound : public std::out_of_range
{
public:
  using std::out_of_range::out_of_range;
};

}  // namespace Arx

#endif  // ARX_AR_ERROR_HH_INCLUDED_
