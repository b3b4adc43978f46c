//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command-line MCP session client: start a configured server, list tools, call one tool
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpsession/Config.h"
#include "mcpsession/DocumentationClient.hpp"
#include "mcpsession/Session.h"
#include "mcpsession/ToolInvoker.h"
#include "mcpsession/errors/Errors.h"
#include "env/EnvVars.h"
#include <iostream>
#include <stdexcept>

using namespace mcpsession;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--server")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

// Every value of a repeatable key=value option, in order.
static std::vector<std::string> getArgValues(int argc, char** argv, const std::string& key) {
    std::vector<std::string> values;
    const std::string prefix = key + "=";
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind(prefix, 0) == 0) {
            values.push_back(a.substr(prefix.size()));
        }
    }
    return values;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static void printUsage() {
    std::cerr << "usage: mcpsession_cli [--config=mcp-settings.json] [--server=KEY]\n"
                 "                      [--command=EXE --arg=A --arg=B ...]\n"
                 "                      [--call=TOOL [--args=JSON]] [--search=PHRASE] [--read=URL]\n"
                 "                      [--service=NAME] [--ping]\n"
                 "                      [--timeout_ms=N] [--log=DEBUG|INFO|WARN|ERROR]\n";
}

static ServerConfig resolveServer(int argc, char** argv) {
    if (auto command = getArgValue(argc, argv, "--command")) {
        ServerConfig cfg;
        cfg.name = *command;
        cfg.command = *command;
        cfg.args = getArgValues(argc, argv, "--arg");
        return cfg;
    }
    const std::string path = getArgValue(argc, argv, "--config").value_or(ServerConfigStore::DefaultFileName);
    auto store = ServerConfigStore::LoadFile(path);
    return store.Get(getArgValue(argc, argv, "--server").value_or(""));
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (hasFlag(argc, argv, "--help")) {
        printUsage();
        return 0;
    }
    if (auto level = getArgValue(argc, argv, "--log")) {
        Logger::setLogLevel(Logger::levelFromString(*level));
    }

    SessionOptions options = SessionOptions::FromEnvironment();
    if (auto timeout = getArgValue(argc, argv, "--timeout_ms")) {
        std::optional<uint64_t> ms = ParseUint64(*timeout);
        if (!ms || *ms == 0 || *ms > SessionOptions::MaxDurationMs) {
            LOG_ERROR("Invalid --timeout_ms value: {}", *timeout);
            printUsage();
            return 2;
        }
        options.requestTimeout = std::chrono::milliseconds(static_cast<int64_t>(*ms));
    }

    try {
        Session session(resolveServer(argc, argv), options);
        session.Start();
        ToolInvoker tools(session);

        if (hasFlag(argc, argv, "--ping")) {
            DocumentationClient docs(tools);
            const bool ok = docs.TestConnection();
            std::cout << (ok ? "ok" : "unreachable") << std::endl;
            session.Close();
            return ok ? 0 : 1;
        } else if (auto service = getArgValue(argc, argv, "--service")) {
            DocumentationClient docs(tools);
            auto doc = docs.GetServiceDocumentation(*service);
            if (!doc) {
                LOG_WARN("No documentation found for service: {}", *service);
            } else {
                std::cout << doc->title << "\n" << doc->url << "\n" << doc->description << "\n\n"
                          << doc->content << std::endl;
            }
        } else if (auto url = getArgValue(argc, argv, "--read")) {
            DocumentationClient docs(tools);
            std::cout << docs.ReadDocumentation(*url).value_or("") << std::endl;
        } else if (auto phrase = getArgValue(argc, argv, "--search")) {
            DocumentationClient docs(tools);
            for (const auto& hit : docs.SearchDocumentation(*phrase)) {
                std::cout << SerializeJSONValue(hit.raw) << std::endl;
            }
        } else if (auto toolName = getArgValue(argc, argv, "--call")) {
            JSONValue arguments{JSONValue::Object{}};
            if (auto rawArgs = getArgValue(argc, argv, "--args")) {
                try {
                    arguments = ParseJSONValue(*rawArgs);
                } catch (const std::runtime_error& e) {
                    LOG_ERROR("--args is not valid JSON: {}", e.what());
                    return 2;
                }
            }
            JSONValue result = tools.CallTool(*toolName, arguments);
            std::cout << SerializeJSONValue(result) << std::endl;
        } else {
            for (const auto& t : tools.ListTools()) {
                std::cout << t.name << "\t" << t.description << std::endl;
            }
        }
        session.Close();
    } catch (const errors::ConfigError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        return 2;
    } catch (const errors::SessionError& e) {
        LOG_ERROR("Session error: {}", e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("{}", e.what());
        return 2;
    }
    return 0;
}
