#pragma once

#include "../translate/ITranslator.hpp"
#include "../utils/LogManager.hpp"

#include <toml++/toml.h>

class ConfigManager;

// Everything config.toml can set. Absent keys keep the defaults below.
struct ClientConfig
{
    translate::TranslatorConfig translator;
    utils::LoggingConfig logging;
};

// Binds the [translator] and [logging] tables to cfg. cfg must outlive mgr.load().
bool registerClientConfig(ConfigManager& mgr, ClientConfig& cfg);

void loadTranslatorTable(const toml::table& t, translate::TranslatorConfig& cfg);
void loadLoggingTable(const toml::table& t, utils::LoggingConfig& cfg);
