/** \file   test-libar-main.cc
 *  \brief  Main file for the archive library unit tests
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

auto main(int argc, char* argv[]) -> int
{
  Catch::Session session;
  if (auto result = session.applyCommandLine(argc, argv); result != 0) {
    return result;
  }

  return session.run();
}
