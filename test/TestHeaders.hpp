#ifndef __FT_TEST_HEADERS__
#define __FT_TEST_HEADERS__

#include "Headers.hpp"

#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#ifndef FT_TEST_FIXTURE_DIR
#define FT_TEST_FIXTURE_DIR "test/fixtures/replay"
#endif

#endif  // __FT_TEST_HEADERS__
