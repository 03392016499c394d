#pragma once

#include <string>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// [logging] table of config.toml
struct LoggingConfig
{
    int level = plog::info; // plog::Severity, 0 (none) .. 6 (verbose)
    std::string file = "logs/gtclient.log";
    bool append = true;
    bool console = false;
    bool verbose_payloads = false;
};

// Owns the appenders behind the default plog logger. plog cannot detach an
// appender once added, so the logger is wired once to a switch appender and
// Initialize()/Shutdown() only swap what sits behind it.
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        bool append = true;
        plog::Severity level = plog::info;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Applies the [logging] settings and registers the default logger.
    // Calling it again after Shutdown() starts a fresh set of appenders.
    static bool Initialize(const LoggingConfig& config);

    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsInitialized();
    static void PrepareLogDirectory(const std::string& filepath);

    static plog::Severity ToSeverity(int level);

private:
    LogManager() = default;

    static bool s_initialized;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
