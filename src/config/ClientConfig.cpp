#include "ClientConfig.hpp"
#include "ConfigManager.hpp"

#include <plog/Log.h>
#include <algorithm>

namespace
{

void readMillis(const toml::table& t, const char* key, int& out)
{
    if (auto v = t[key].value<int>())
    {
        if (*v < 0)
        {
            PLOG_WARNING << "Ignoring negative " << key << " = " << *v;
            return;
        }
        out = *v;
    }
}

} // namespace

void loadTranslatorTable(const toml::table& t, translate::TranslatorConfig& cfg)
{
    if (auto v = t["domain"].value<std::string>(); v && !v->empty())
        cfg.domain = *v;
    if (auto v = t["handshake_url"].value<std::string>(); v && !v->empty())
        cfg.handshake_url = *v;
    if (auto v = t["seed_url"].value<std::string>(); v && !v->empty())
        cfg.seed_url = *v;
    if (auto v = t["user_agent"].value<std::string>(); v && !v->empty())
        cfg.user_agent = *v;
    if (auto v = t["proxy"].value<std::string>())
        cfg.proxy = *v;
    if (auto v = t["languages_file"].value<std::string>())
        cfg.languages_file = *v;

    readMillis(t, "timeout_ms", cfg.timeout_ms);
    readMillis(t, "connect_timeout_ms", cfg.connect_timeout_ms);
    readMillis(t, "courtesy_delay_min_ms", cfg.courtesy_delay_min_ms);
    readMillis(t, "courtesy_delay_max_ms", cfg.courtesy_delay_max_ms);

    if (cfg.courtesy_delay_min_ms > cfg.courtesy_delay_max_ms)
    {
        PLOG_WARNING << "courtesy_delay_min_ms exceeds courtesy_delay_max_ms, swapping";
        std::swap(cfg.courtesy_delay_min_ms, cfg.courtesy_delay_max_ms);
    }
}

void loadLoggingTable(const toml::table& t, utils::LoggingConfig& cfg)
{
    if (auto v = t["level"].value<int>())
        cfg.level = std::clamp(*v, 0, 6);
    if (auto v = t["file"].value<std::string>(); v && !v->empty())
        cfg.file = *v;
    if (auto v = t["append"].value<bool>())
        cfg.append = *v;
    if (auto v = t["console"].value<bool>())
        cfg.console = *v;
    if (auto v = t["verbose_payloads"].value<bool>())
        cfg.verbose_payloads = *v;
}

bool registerClientConfig(ConfigManager& mgr, ClientConfig& cfg)
{
    bool ok = mgr.registerTable("translator",
                                { .load = [&cfg](const toml::table& t) { loadTranslatorTable(t, cfg.translator); } },
                                { "domain", "handshake_url", "seed_url", "user_agent", "proxy", "timeout_ms",
                                  "connect_timeout_ms", "courtesy_delay_min_ms", "courtesy_delay_max_ms",
                                  "languages_file" });
    ok = mgr.registerTable("logging", { .load = [&cfg](const toml::table& t) { loadLoggingTable(t, cfg.logging); } },
                           { "level", "file", "append", "console", "verbose_payloads" }) &&
         ok;
    return ok;
}
