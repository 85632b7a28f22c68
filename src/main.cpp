/**
 * @file main.cpp
 * @brief FizzBuzz console application entry point
 *
 * Reads a number per line from stdin until end of input and prints the
 * FizzBuzz sequence (or an error message) for each one.
 */

#include "fizzbuzz/common/config_manager.h"
#include "fizzbuzz/common/exceptions.h"
#include "fizzbuzz/common/logger.h"
#include "fizzbuzz/console_shell.h"
#include "fizzbuzz/workflow.h"

#include <iostream>
#include <spdlog/spdlog.h>

using fizzbuzz::common::ConfigManager;

int main() {
    auto& config = ConfigManager::getInstance();

    fizzbuzz::common::Logger::initialize(
        "fizzbuzz",
        config.getString(ConfigManager::LOG_LEVEL, ConfigManager::DEFAULT_LOG_LEVEL),
        config.getBool(ConfigManager::LOG_TO_FILE, false),
        config.getString(ConfigManager::LOG_FILE, ConfigManager::DEFAULT_LOG_FILE));

    try {
        fizzbuzz::ConsoleShell shell(std::cin, std::cout,
                                     fizzbuzz::FizzBuzzWorkflow::createDefault());
        int cycles = shell.run();
        spdlog::info("Exiting after {} request(s)", cycles);
    } catch (const fizzbuzz::common::FizzBuzzException& e) {
        spdlog::critical("{}", e.what());
        fizzbuzz::common::Logger::flush();
        return 1;
    }

    fizzbuzz::common::Logger::flush();
    return 0;
}
