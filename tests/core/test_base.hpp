//===== test_base.hpp =====
#pragma once

#ifndef TESTING
#define TESTING
#endif

#include <gtest/gtest.h>
#include "shroud/core/logger.hpp"
#include "shroud/core/state_manager.hpp"

namespace shroud {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        StateManager::reset_instance();
        Logger::reset_for_tests();
        LoggerConfig config;
        config.min_level = LogLevel::WARNING;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        StateManager::reset_instance();
        Logger::reset_for_tests();
    }
};

}  // namespace testing
}  // namespace shroud
