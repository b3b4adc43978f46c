//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StubSupport.h
// Purpose: Shared helpers for tests that drive the stub MCP server
//==========================================================================================================

#pragma once

#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "mcpsession/Config.h"
#include "mcpsession/MessageCodec.h"

#ifndef STUB_SERVER_PATH
#error "STUB_SERVER_PATH must point at the mcpsession_stub_server executable"
#endif

namespace stubtest {

inline mcpsession::ServerConfig stubConfig(const std::string& mode) {
    mcpsession::ServerConfig cfg;
    cfg.name = "stub-" + mode;
    cfg.command = STUB_SERVER_PATH;
    cfg.args = {mode};
    return cfg;
}

inline mcpsession::SessionOptions fastOptions() {
    mcpsession::SessionOptions opts;
    opts.initializeTimeout = std::chrono::seconds(5);
    opts.requestTimeout = std::chrono::seconds(5);
    opts.shutdownGrace = std::chrono::seconds(1);
    return opts;
}

// Fresh per-test capture file; the stub appends every line it receives.
inline std::string captureFile(const std::string& tag) {
    std::string path = ::testing::TempDir() + "mcpsession_capture_" + std::to_string(::getpid()) + "_" + tag + ".jsonl";
    std::remove(path.c_str());
    return path;
}

inline std::vector<std::string> readLines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

inline std::vector<mcpsession::Message> readMessages(const std::string& path) {
    std::vector<mcpsession::Message> out;
    for (const auto& line : readLines(path)) {
        out.push_back(mcpsession::MessageCodec::Decode(line));
    }
    return out;
}

// Polls pred every 10 ms until it holds or timeout elapses.
template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace stubtest
