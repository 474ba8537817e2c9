//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientOptions.cpp
// Purpose: Client options defaults, environment override and config string parsing
//==========================================================================================================

#include <cstdint>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "stun/ClientOptions.h"

namespace stun {

ClientOptions ClientOptions::Defaults() {
    ClientOptions opts;
    if (auto rate = GetEnvUint64("STUN_CLIENT_TIMEOUT_RATE_MS"); rate.has_value() && *rate > 0) {
        opts.timeoutRate = std::chrono::milliseconds(static_cast<int64_t>(*rate));
    }
    return opts;
}

ClientOptions ClientOptions::FromConfigString(const std::string& config) {
    ClientOptions opts = Defaults();
    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("ClientOptions: ignoring token without '=': {}", token);
            continue;
        }
        const auto key = token.substr(0, eq);
        const auto val = token.substr(eq + 1);
        const auto parsed = ParseUint64(val);
        if (!parsed.has_value() || *parsed == 0) {
            LOG_WARN("ClientOptions: ignoring invalid value for {}: '{}'", key, val);
            continue;
        }
        const uint64_t v = *parsed;
        if (key == "timeout_rate_ms") {
            opts.timeoutRate = std::chrono::milliseconds(static_cast<int64_t>(v));
        } else if (key == "read_poll_ms") {
            opts.readPollInterval = std::chrono::milliseconds(static_cast<int64_t>(v));
        } else if (key == "request_timeout_ms") {
            opts.requestTimeout = std::chrono::milliseconds(static_cast<int64_t>(v));
        } else if (key == "max_message_size") {
            opts.maxMessageSize = static_cast<std::size_t>(v);
        } else {
            LOG_WARN("ClientOptions: unknown key {}", key);
        }
    }
    return opts;
}

} // namespace stun
