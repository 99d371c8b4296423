// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Spool a resilient, durable telemetry relay.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include "common/Logging.hpp"
#include <cstdlib>
#include <filesystem>
#include <string>

namespace {

// Test runs log to a file only, at the level named by SPOOL_TEST_LOG_LEVEL
// (debug by default), so gtest output stays readable.
class LoggingEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        const char* level = std::getenv("SPOOL_TEST_LOG_LEVEL");
        spool::LogOptions options;
        options.path = (std::filesystem::temp_directory_path() / "spool-tests" / "spool-tests.log").string();
        options.level = level != nullptr ? spdlog::level::from_str(level) : spdlog::level::debug;
        options.console = false;
        spool::installLogger(options);
    }

    void TearDown() override {
        spdlog::shutdown();
    }
};

} // namespace

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new LoggingEnvironment);
    return RUN_ALL_TESTS();
}
