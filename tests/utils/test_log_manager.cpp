#include <catch2/catch_test_macros.hpp>
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using utils::LogManager;

namespace {

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("Log manager lifecycle", "[utils][logging]") {
    const auto dir = std::filesystem::temp_directory_path() / "gtclient_log_manager_test";
    std::filesystem::remove_all(dir);
    const auto first = dir / "first.log";
    const auto second = dir / "nested" / "second.log";

    utils::LoggingConfig cfg;
    cfg.level = plog::debug;
    cfg.append = false;
    cfg.file = first.string();

    REQUIRE(LogManager::Initialize(cfg));
    REQUIRE(LogManager::IsInitialized());
    PLOG_INFO << "entry-one";
    PLOG_VERBOSE << "entry-filtered";
    LogManager::Shutdown();
    REQUIRE_FALSE(LogManager::IsInitialized());

    PLOG_ERROR << "entry-dropped";

    SECTION("Initialize after Shutdown writes to the new file only") {
        cfg.file = second.string();
        REQUIRE(LogManager::Initialize(cfg));
        PLOG_INFO << "entry-two";
        LogManager::Shutdown();

        std::string first_log = readFile(first);
        std::string second_log = readFile(second);
        REQUIRE(first_log.find("entry-one") != std::string::npos);
        REQUIRE(first_log.find("entry-filtered") == std::string::npos);
        REQUIRE(first_log.find("entry-dropped") == std::string::npos);
        REQUIRE(first_log.find("entry-two") == std::string::npos);
        REQUIRE(second_log.find("entry-two") != std::string::npos);
        REQUIRE(second_log.find("entry-one") == std::string::npos);
    }

    SECTION("Severity follows the new configuration") {
        cfg.file = second.string();
        cfg.level = plog::warning;
        REQUIRE(LogManager::Initialize(cfg));
        PLOG_INFO << "entry-quiet";
        PLOG_WARNING << "entry-loud";
        LogManager::Shutdown();

        std::string second_log = readFile(second);
        REQUIRE(second_log.find("entry-quiet") == std::string::npos);
        REQUIRE(second_log.find("entry-loud") != std::string::npos);
    }

    SECTION("Out of range levels fall back to info") {
        REQUIRE(LogManager::ToSeverity(42) == plog::info);
        REQUIRE(LogManager::ToSeverity(-1) == plog::info);
        REQUIRE(LogManager::ToSeverity(plog::debug) == plog::debug);
    }

    std::filesystem::remove_all(dir);
}
