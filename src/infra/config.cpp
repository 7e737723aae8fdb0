/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file config.cpp
 * @brief cJSON based configuration loading.
 */

#include "ulidkit/infra/config.hpp"

#include "ulidkit/error.hpp"

#include <algorithm>
#include <cJSON.h>
#include <cctype>
#include <fstream>
#include <sstream>

namespace ulidkit::infra {

namespace {

/**
 * @brief RAII owner for a parsed cJSON tree.
 */
struct JsonDocument {
    cJSON* root;

    explicit JsonDocument(cJSON* r) : root(r) {}
    ~JsonDocument() { cJSON_Delete(root); }

    JsonDocument(const JsonDocument&) = delete;
    JsonDocument& operator=(const JsonDocument&) = delete;
};

bool read_bool(const cJSON* item)
{
    if (!cJSON_IsBool(item)) {
        throw ConfigError("'" + std::string(item->string) + "' must be a boolean");
    }
    return cJSON_IsTrue(item) != 0;
}

std::string read_string(const cJSON* item)
{
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        throw ConfigError("'" + std::string(item->string) + "' must be a string");
    }
    return item->valuestring;
}

} // namespace

generator::Config Settings::to_generator_config() const
{
    env::Environment environment = env::Environment::detect();
    environment.random_device = random_device;

    generator::Config config;
    config.monotonic = monotonic;
    config.allow_insecure = allow_insecure;
    config.allow_imprecise = allow_imprecise;
    config.dependencies = env::Resolver::resolve(environment, allow_insecure, allow_imprecise);
    return config;
}

LogLevel ConfigLoader::parse_level(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")
        return LogLevel::TRACE;
    if (lower == "debug")
        return LogLevel::DEBUG;
    if (lower == "info")
        return LogLevel::INFO;
    if (lower == "warn" || lower == "warning")
        return LogLevel::WARN;
    if (lower == "error")
        return LogLevel::ERROR;
    if (lower == "fatal")
        return LogLevel::FATAL;

    throw ConfigError("unknown log level '" + name + "'");
}

/**
 * @brief Merges a JSON object over base settings.
 *
 * Operational Logic:
 * 1. **Ingest**: Parse the document; reject syntax errors and non-object roots.
 * 2. **Merge**: Walk the members once, type-checking each recognized key.
 * 3. **Report**: Unknown keys are logged and skipped.
 */
Settings ConfigLoader::parse(const std::string& json, const Settings& base)
{
    JsonDocument doc(cJSON_Parse(json.c_str()));
    if (!doc.root) {
        throw ConfigError("invalid JSON syntax");
    }
    if (!cJSON_IsObject(doc.root)) {
        throw ConfigError("root must be a JSON object");
    }

    Settings settings = base;

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, doc.root)
    {
        std::string key = item->string ? item->string : "";

        if (key == "monotonic") {
            settings.monotonic = read_bool(item);
        } else if (key == "allow_insecure") {
            settings.allow_insecure = read_bool(item);
        } else if (key == "allow_imprecise") {
            settings.allow_imprecise = read_bool(item);
        } else if (key == "random_device") {
            settings.random_device = read_string(item);
            if (settings.random_device.empty()) {
                throw ConfigError("'random_device' must not be empty");
            }
        } else if (key == "log_level") {
            settings.log_level = parse_level(read_string(item));
        } else {
            Logger::log(LogLevel::WARN, "Config: ignoring unknown key '" + key + "'");
        }
    }

    return settings;
}

Settings ConfigLoader::load_file(const std::string& path, const Settings& base)
{
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open '" + path + "'");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw ConfigError("failed to read '" + path + "'");
    }

    return parse(buffer.str(), base);
}

} // namespace ulidkit::infra
