//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Serialization helpers for protocol structures
//==========================================================================================================

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "mcpgw/Protocol.h"

namespace mcpgw {

JSONValue SerializeServerCapabilities(const ServerCapabilities& caps) {
    JSONValue::Object obj;
    if (caps.tools.has_value()) {
        JSONValue::Object toolsObj;
        toolsObj["listChanged"] = std::make_shared<JSONValue>(caps.tools->listChanged);
        obj["tools"] = std::make_shared<JSONValue>(toolsObj);
    }
    if (caps.logging.has_value()) {
        obj["logging"] = std::make_shared<JSONValue>(JSONValue::Object{});
    }
    return JSONValue{obj};
}

JSONValue SerializeImplementation(const Implementation& impl) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(impl.name);
    obj["version"] = std::make_shared<JSONValue>(impl.version);
    if (!impl.description.empty()) {
        obj["description"] = std::make_shared<JSONValue>(impl.description);
    }
    return JSONValue{obj};
}

JSONValue MakeTextContent(const std::string& text) {
    JSONValue::Object item;
    item["type"] = std::make_shared<JSONValue>(std::string("text"));
    item["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{item};
}

JSONValue SerializeCallToolResult(const CallToolResult& result) {
    JSONValue::Object obj;
    JSONValue::Array content;
    for (const auto& v : result.content) {
        content.push_back(std::make_shared<JSONValue>(v));
    }
    obj["content"] = std::make_shared<JSONValue>(content);
    if (result.isError) {
        obj["isError"] = std::make_shared<JSONValue>(true);
    }
    if (result.meta.has_value()) {
        obj["_meta"] = std::make_shared<JSONValue>(result.meta.value());
    }
    return JSONValue{obj};
}

std::string MakeTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm buf{};
    ::gmtime_r(&secs, &buf);
    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace mcpgw
