#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Diagnostics.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace
{

class SwitchAppender : public plog::IAppender
{
public:
    void write(const plog::Record& record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto* target : targets_)
            target->write(record);
    }

    void add(plog::IAppender* target)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets_.push_back(target);
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets_.clear();
    }

private:
    std::mutex mutex_;
    std::vector<plog::IAppender*> targets_;
};

SwitchAppender& switchAppender()
{
    static SwitchAppender instance;
    return instance;
}

} // namespace

namespace utils
{

bool LogManager::s_initialized = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const LoggingConfig& config)
{
    if (s_initialized)
        return true;

    Diagnostics::SetVerbose(config.verbose_payloads);

    PrepareLogDirectory(config.file);

    if (!RegisterLogger({ .name = "main",
                          .filepath = config.file,
                          .append = config.append,
                          .level = ToSeverity(config.level),
                          .add_console_appender = config.console }))
    {
        return false;
    }
    s_initialized = true;

    PLOG_INFO << "Logging initialized (level " << plog::severityToString(ToSeverity(config.level)) << ", file "
              << config.file << ")";
    return true;
}

bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    try
    {
        if (!config.append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        if (auto logger = plog::get<0>())
            logger->setMaxSeverity(config.level);
        else
            plog::init<0>(config.level, &switchAppender());

        switchAppender().add(file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            switchAppender().add(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

void LogManager::Shutdown()
{
    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    switchAppender().clear();
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

plog::Severity LogManager::ToSeverity(int level)
{
    if (level < plog::none || level > plog::verbose)
        return plog::info;
    return static_cast<plog::Severity>(level);
}

} // namespace utils
