//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Settings file parsing and environment-driven session options
//==========================================================================================================

#include <fstream>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpsession/Config.h"
#include "mcpsession/errors/Errors.h"
#include "mcpsession/version.h"

namespace mcpsession {

namespace {

using errors::ConfigError;

std::string requireString(const JSONValue& v, const std::string& what) {
    if (!v.IsString()) {
        throw ConfigError(what + " must be a string");
    }
    return std::get<std::string>(v.value);
}

ServerConfig parseServer(const std::string& key, const JSONValue& entry) {
    if (!entry.IsObject()) {
        throw ConfigError("mcpServers." + key + " must be an object");
    }
    const std::string where = "mcpServers." + key;
    ServerConfig cfg;
    cfg.name = key;
    cfg.command = "uvx";
    if (const JSONValue* command = FindMember(entry, "command")) {
        cfg.command = requireString(*command, where + ".command");
    }
    if (cfg.command.empty()) {
        throw ConfigError(where + ".command is empty");
    }
    if (const JSONValue* args = FindMember(entry, "args")) {
        if (!args->IsArray()) {
            throw ConfigError(where + ".args must be an array of strings");
        }
        for (const auto& a : std::get<JSONValue::Array>(args->value)) {
            cfg.args.push_back(requireString(*a, where + ".args[]"));
        }
    }
    if (const JSONValue* env = FindMember(entry, "env")) {
        if (!env->IsObject()) {
            throw ConfigError(where + ".env must be an object of strings");
        }
        for (const auto& [name, value] : std::get<JSONValue::Object>(env->value)) {
            cfg.env[name] = requireString(*value, where + ".env." + name);
        }
    }
    if (const JSONValue* cwd = FindMember(entry, "cwd")) {
        if (!cwd->IsNull()) {
            cfg.cwd = requireString(*cwd, where + ".cwd");
        }
    }
    if (const JSONValue* disabled = FindMember(entry, "disabled")) {
        if (!std::holds_alternative<bool>(disabled->value)) {
            throw ConfigError(where + ".disabled must be a boolean");
        }
        cfg.disabled = std::get<bool>(disabled->value);
    }
    return cfg;
}

std::chrono::milliseconds durationFromEnv(const char* name, std::chrono::milliseconds fallback) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return fallback;
    }
    std::optional<uint64_t> ms = ParseUint64(raw);
    if (!ms.has_value() || *ms == 0 || *ms > SessionOptions::MaxDurationMs) {
        LOG_WARN("Ignoring {}='{}': expected milliseconds in 1..{}", name, raw, SessionOptions::MaxDurationMs);
        return fallback;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(*ms));
}

} // namespace

ServerConfigStore ServerConfigStore::LoadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open settings file '" + path + "'");
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        throw ConfigError("error reading settings file '" + path + "'");
    }
    LOG_DEBUG("Loaded settings from {}", path);
    return LoadString(oss.str());
}

ServerConfigStore ServerConfigStore::LoadString(const std::string& json) {
    JSONValue root;
    try {
        root = ParseJSONValue(json);
    } catch (const std::runtime_error& e) {
        throw ConfigError(std::string("settings are not valid JSON: ") + e.what());
    }
    if (!root.IsObject()) {
        throw ConfigError("settings root must be an object");
    }

    ServerConfigStore store;
    const JSONValue* servers = FindMember(root, "mcpServers");
    if (servers == nullptr) {
        LOG_WARN("Settings contain no mcpServers section");
        return store;
    }
    if (!servers->IsObject()) {
        throw ConfigError("mcpServers must be an object");
    }
    for (const auto& [key, entry] : std::get<JSONValue::Object>(servers->value)) {
        store.servers.emplace(key, parseServer(key, *entry));
    }
    return store;
}

const ServerConfig& ServerConfigStore::Get(const std::string& key) const {
    if (!key.empty()) {
        auto it = servers.find(key);
        if (it == servers.end()) {
            throw ConfigError("no server named '" + key + "' in mcpServers");
        }
        return it->second;
    }
    for (const auto& [name, cfg] : servers) {
        if (!cfg.disabled) {
            return cfg;
        }
    }
    throw ConfigError("no enabled server in mcpServers");
}

std::vector<std::string> ServerConfigStore::Keys() const {
    std::vector<std::string> keys;
    keys.reserve(servers.size());
    for (const auto& kv : servers) {
        keys.push_back(kv.first);
    }
    return keys;
}

SessionOptions::SessionOptions()
    : clientInfo("mcpsession", getVersionString()) {
    JSONValue::Object caps;
    caps["tools"] = std::make_shared<JSONValue>(JSONValue::Object{});
    capabilities = JSONValue{caps};
}

SessionOptions SessionOptions::FromEnvironment() {
    SessionOptions opts;
    opts.initializeTimeout = durationFromEnv("MCPSESSION_INIT_TIMEOUT_MS", opts.initializeTimeout);
    opts.requestTimeout = durationFromEnv("MCPSESSION_REQUEST_TIMEOUT_MS", opts.requestTimeout);
    opts.shutdownGrace = durationFromEnv("MCPSESSION_SHUTDOWN_GRACE_MS", opts.shutdownGrace);
    return opts;
}

} // namespace mcpsession
