#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include "utils/LogManager.hpp"

using utils::LogManager;

TEST_CASE("LogManager reads the logging section before config load", "[logging]") {
    const auto path = std::filesystem::temp_directory_path() / "textsense_tests_logging.toml";

    SECTION("Values from [logging] override the defaults") {
        {
            std::ofstream out(path);
            out << "[logging]\nlevel = 5\nappend = false\nverbose_pipeline = true\n";
        }
        LogManager::Options options;
        LogManager::ReadOptions(path.string(), options);
        REQUIRE(options.level == plog::debug);
        REQUIRE_FALSE(options.append);
        REQUIRE(options.verbose_pipeline);
    }

    SECTION("Out of range levels are ignored") {
        {
            std::ofstream out(path);
            out << "[logging]\nlevel = 42\n";
        }
        LogManager::Options options;
        LogManager::ReadOptions(path.string(), options);
        REQUIRE(options.level == plog::info);
    }

    SECTION("Malformed files leave the options untouched") {
        {
            std::ofstream out(path);
            out << "[logging\nlevel = ";
        }
        LogManager::Options options;
        options.append = false;
        LogManager::ReadOptions(path.string(), options);
        REQUIRE(options.level == plog::info);
        REQUIRE_FALSE(options.append);
    }

    SECTION("Missing files are fine") {
        std::filesystem::remove(path);
        LogManager::Options options;
        LogManager::ReadOptions(path.string(), options);
        REQUIRE(options.level == plog::info);
        REQUIRE(options.append);
    }

    std::filesystem::remove(path);
}
