// This file is part of ttkit project <https://github.com/ttkit/ttkit>
//
// See ttkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each ttkit test file.

#ifndef TTKIT_CORE_API_BUILD_TEST_P_H_INCLUDED
#define TTKIT_CORE_API_BUILD_TEST_P_H_INCLUDED

#include <ttkit/core/api-build_p.h>

// tt::Build - Tests
// =================

//! \cond NEVER
// Make sure '#ifdef'ed unit tests are not disabled by IDE.
#if !defined(TT_TEST) && defined(__INTELLISENSE__)
  #define TT_TEST
#endif
//! \endcond

// Include a unit testing package if this is a `ttkit_test_runner` build.
#if defined(TT_TEST)

#include <gtest/gtest.h>

//! \cond INTERNAL
#define EXPECT_SUCCESS(...) EXPECT_EQ((__VA_ARGS__), TTResult(TT_SUCCESS))
#define ASSERT_SUCCESS(...) ASSERT_EQ((__VA_ARGS__), TTResult(TT_SUCCESS))
//! \endcond

#endif // TT_TEST

#endif // TTKIT_CORE_API_BUILD_TEST_P_H_INCLUDED
