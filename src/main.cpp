#include "config/ClientConfig.hpp"
#include "config/ConfigManager.hpp"
#include "translate/GoogleTranslator.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <cstring>
#include <iostream>
#include <string>

namespace
{

constexpr const char* kVersion = "0.1.0";

void PrintVersion() { std::cout << "gtclient-cli " << kVersion << "\n"; }

void PrintUsage(const char* program)
{
    std::cout << "Usage: " << program << " [options] TEXT\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config PATH   Configuration file (default: config.toml)\n";
    std::cout << "  --from ISO      Source language code (default: auto)\n";
    std::cout << "  --to ISO        Target language code (default: en)\n";
    std::cout << "  --lite          Translation only, skip dictionary data\n";
    std::cout << "  --json          Print the full result as JSON\n";
    std::cout << "  --languages     List supported languages and exit\n";
    std::cout << "  --verbose       Log full request and response payloads\n";
    std::cout << "  --version       Show version information\n";
    std::cout << "  --help          Show this help message\n";
}

void PrintPendingErrors()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << utils::ErrorReporter::SeverityToString(report.severity) << ": ";
        if (!report.languagePair().empty())
            std::cerr << "[" << report.languagePair() << "] ";
        std::cerr << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << " (" << report.technical_details << ")";
        std::cerr << "\n";
    }
}

} // namespace

int main(int argc, char* argv[])
{
    std::string config_path = "config.toml";
    std::string from = "auto";
    std::string to = "en";
    std::string text;
    bool opt_lite = false;
    bool opt_json = false;
    bool opt_languages = false;
    bool opt_verbose = false;

    for (int i = 1; i < argc; ++i)
    {
        auto needsValue = [&](const char* flag) -> const char*
        {
            if (i + 1 >= argc)
            {
                std::cerr << "ERROR: " << flag << " expects a value\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (strcmp(argv[i], "--version") == 0)
        {
            PrintVersion();
            return 0;
        }
        else if (strcmp(argv[i], "--help") == 0)
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (strcmp(argv[i], "--config") == 0)
        {
            const char* v = needsValue("--config");
            if (!v)
                return 2;
            config_path = v;
        }
        else if (strcmp(argv[i], "--from") == 0)
        {
            const char* v = needsValue("--from");
            if (!v)
                return 2;
            from = v;
        }
        else if (strcmp(argv[i], "--to") == 0)
        {
            const char* v = needsValue("--to");
            if (!v)
                return 2;
            to = v;
        }
        else if (strcmp(argv[i], "--lite") == 0)
        {
            opt_lite = true;
        }
        else if (strcmp(argv[i], "--json") == 0)
        {
            opt_json = true;
        }
        else if (strcmp(argv[i], "--languages") == 0)
        {
            opt_languages = true;
        }
        else if (strcmp(argv[i], "--verbose") == 0)
        {
            opt_verbose = true;
        }
        else if (argv[i][0] == '-' && argv[i][1] == '-')
        {
            std::cerr << "ERROR: unknown option " << argv[i] << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
        else
        {
            if (!text.empty())
                text += ' ';
            text += argv[i];
        }
    }

    ClientConfig cfg;
    ConfigManager config(config_path);
    if (!registerClientConfig(config, cfg))
    {
        std::cerr << "ERROR: " << config.lastError() << "\n";
        return 1;
    }
    bool config_ok = config.load();

    if (opt_verbose)
        cfg.logging.verbose_payloads = true;
    if (!utils::LogManager::Initialize(cfg.logging))
    {
        std::cerr << "WARNING: logging is disabled\n";
    }
    if (!config_ok)
        PLOG_WARNING << "Continuing with default settings: " << config.lastError();

    translate::GoogleTranslator translator;
    if (!translator.configure(cfg.translator))
    {
        PrintPendingErrors();
        utils::LogManager::Shutdown();
        return 1;
    }

    if (opt_languages)
    {
        for (const auto& lang : translator.catalog().languages())
            std::cout << lang.iso639 << "\t" << lang.full_name << "\n";
        utils::LogManager::Shutdown();
        return 0;
    }

    if (text.empty())
    {
        PrintUsage(argv[0]);
        utils::LogManager::Shutdown();
        return 2;
    }

    auto outcome = opt_lite ? translator.translateLite(text, from, to) : translator.translate(text, from, to);
    if (!outcome.ok())
    {
        std::cerr << "ERROR: " << translate::toString(outcome.error) << ": " << outcome.message << "\n";
        PrintPendingErrors();
        utils::LogManager::Shutdown();
        return 1;
    }

    if (opt_json)
        std::cout << translate::toJsonString(outcome.result) << "\n";
    else
        std::cout << outcome.result.mergedTranslation() << "\n";

    utils::LogManager::Shutdown();
    return 0;
}
