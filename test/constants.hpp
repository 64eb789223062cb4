#pragma once

#include <string>

namespace test::constants {
// On-disk database in the temp directory, created by the test main and
// removed after the run.
extern const std::string TEST_DATABASE_PATH;
} // namespace test::constants
