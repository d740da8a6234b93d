/*********************************************************************************
 * Modifications Copyright 2017-2019 eBay Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *    https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software distributed
 * under the License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied. See the License for the
 * specific language governing permissions and limitations under the License.
 *
 *********************************************************************************/
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "textra/logging/logging.h"
#include "textra/options/options.h"

TEXTRA_LOGGING_INIT(log_test_a, log_test_b)
TEXTRA_OPTIONS_ENABLE(logging)

namespace textra::testing {

TEST(LoggingTest, modules_registered_at_info) {
    EXPECT_EQ(logging::GetModuleLogLevel("base"), spdlog::level::level_enum::info);
    EXPECT_EQ(logging::GetModuleLogLevel("log_test_a"), spdlog::level::level_enum::info);
    EXPECT_EQ(logging::GetModuleLogLevel("log_test_b"), spdlog::level::level_enum::info);
    EXPECT_EQ(logging::GetModuleLogLevel("not_a_module"), spdlog::level::level_enum::off);
}

TEST(LoggingTest, set_module_level) {
    EXPECT_TRUE(logging::SetModuleLogLevel("log_test_a", spdlog::level::level_enum::debug));
    EXPECT_EQ(module_level_log_test_a, spdlog::level::level_enum::debug);
    EXPECT_EQ(module_level_log_test_b, spdlog::level::level_enum::info);
    EXPECT_FALSE(logging::SetModuleLogLevel("not_a_module", spdlog::level::level_enum::debug));

    const auto j = logging::GetAllModuleLogLevel();
    EXPECT_EQ(j["log_test_a"].get< std::string >(), "debug");
    EXPECT_EQ(j["log_test_b"].get< std::string >(), "info");

    logging::SetAllModuleLogLevel(spdlog::level::level_enum::warn);
    EXPECT_EQ(logging::GetModuleLogLevel("base"), spdlog::level::level_enum::warn);
    EXPECT_EQ(module_level_log_test_b, spdlog::level::level_enum::warn);
    logging::SetAllModuleLogLevel(spdlog::level::level_enum::info);
}

TEST(LoggingTest, log_from_other_thread) {
    std::thread t{[]() {
        LOGINFOMOD(log_test_a, "logging from thread {}", 1);
        EXPECT_EQ(logging::GetLogger().get(), spdlog::get("test_logging").get());
    }};
    t.join();
    LOGCRITICALMOD(log_test_b, "critical message from the main thread");
    EXPECT_NE(logging::GetCriticalLogger(), nullptr);
}

} // namespace textra::testing

int main(int argc, char* argv[]) {
    ::testing::InitGoogleTest(&argc, argv);
    TEXTRA_OPTIONS_LOAD(argc, argv, logging)
    textra::logging::SetLogger("test_logging");
    spdlog::set_pattern("[%D %T%z] [%^%l%$] [%t] %v");
    return RUN_ALL_TESTS();
}
