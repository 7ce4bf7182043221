//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayConfig.cpp
// Purpose: Environment and command-line configuration loading
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <functional>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpgw/GatewayConfig.h"
#include "mcpgw/version.h"

namespace mcpgw {

namespace {

bool isPort(const std::string& v) {
    if (v.empty() || v.size() > 5 ||
        !std::all_of(v.begin(), v.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
        return false;
    }
    return std::stoul(v) <= 65535ul;
}

std::optional<long long> parseMillis(const std::string& v) {
    if (v.empty() || v.size() > 12 ||
        !std::all_of(v.begin(), v.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::stoll(v);
}

// One tunable: where it comes from and how it is applied. apply() returns false to reject the value.
struct Setting {
    const char* env;
    const char* cli;
    std::function<bool(GatewayConfig&, const std::string&)> apply;
};

const std::vector<Setting>& settings() {
    static const std::vector<Setting> table = {
        {"MCPGW_ADDRESS", "--address", [](GatewayConfig& c, const std::string& v) {
            c.address = v;
            return true;
        }},
        {"MCPGW_HTTP_PORT", "--http-port", [](GatewayConfig& c, const std::string& v) {
            if (!isPort(v)) { return false; }
            c.httpPort = v;
            return true;
        }},
        {"MCPGW_WS_PORT", "--ws-port", [](GatewayConfig& c, const std::string& v) {
            if (!isPort(v)) { return false; }
            c.wsPort = v;
            return true;
        }},
        {"MCPGW_HTTP_SCHEME", "--scheme", [](GatewayConfig& c, const std::string& v) {
            if (v != "http" && v != "https") { return false; }
            c.scheme = v;
            return true;
        }},
        {"MCPGW_TLS_CERT", "--cert", [](GatewayConfig& c, const std::string& v) {
            c.certFile = v;
            return true;
        }},
        {"MCPGW_TLS_KEY", "--key", [](GatewayConfig& c, const std::string& v) {
            c.keyFile = v;
            return true;
        }},
        {"MCPGW_TOOL_TIMEOUT_MS", "--tool-timeout-ms", [](GatewayConfig& c, const std::string& v) {
            auto ms = parseMillis(v);
            if (!ms.has_value() || *ms <= 0) { return false; }
            c.toolTimeout = std::chrono::milliseconds(*ms);
            return true;
        }},
        {"MCPGW_HANDSHAKE_POLICY", "--handshake", [](GatewayConfig& c, const std::string& v) {
            auto p = HandshakePolicyFromString(v);
            if (!p.has_value()) { return false; }
            c.handshakePolicy = *p;
            return true;
        }},
        {"MCPGW_PROTOCOL_VERSION", "--protocol-version", [](GatewayConfig& c, const std::string& v) {
            c.protocolVersion = v;
            return true;
        }},
        {"MCPGW_EXECUTOR_CHANNEL", "--executor", [](GatewayConfig& c, const std::string& v) {
            c.executorChannel = v;
            return true;
        }},
        {"MCPGW_SSE_KEEPALIVE_MS", "--sse-keepalive-ms", [](GatewayConfig& c, const std::string& v) {
            auto ms = parseMillis(v);
            if (!ms.has_value()) { return false; }
            c.sseKeepAlive = std::chrono::milliseconds(*ms);
            return true;
        }},
        {"MCPGW_SERVER_NAME", "--name", [](GatewayConfig& c, const std::string& v) {
            c.serverName = v;
            return true;
        }},
    };
    return table;
}

void applyValue(GatewayConfig& cfg, const Setting& s, const char* source, const std::string& value) {
    if (!s.apply(cfg, value)) {
        LOG_WARN("Ignoring invalid value '{}' for {}", value, source);
    }
}

} // namespace

GatewayConfig::GatewayConfig()
    : serverVersion(getVersionString()) {}

void GatewayConfig::ApplyEnvironment() {
    for (const auto& s : settings()) {
        const std::string value = GetEnvOrDefault(s.env, "");
        if (!value.empty()) {
            applyValue(*this, s, s.env, value);
        }
    }
}

void GatewayConfig::ApplyArguments(int argc, char** argv) {
    for (const auto& s : settings()) {
        if (auto v = GetArgValue(argc, argv, s.cli); v.has_value()) {
            applyValue(*this, s, s.cli, v.value());
        }
    }
}

GatewayConfig GatewayConfig::Load(int argc, char** argv) {
    GatewayConfig cfg;
    cfg.ApplyEnvironment();
    cfg.ApplyArguments(argc, argv);
    return cfg;
}

std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

} // namespace mcpgw
