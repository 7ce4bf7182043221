//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeDecoder.cpp
// Purpose: JSON-RPC envelope classification
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpgw/EnvelopeDecoder.h"

namespace mcpgw {

namespace {

DecodedEnvelope invalid(std::string detail, JSONRPCId id = nullptr) {
    DecodedEnvelope env;
    env.kind = DecodedEnvelope::Kind::Invalid;
    env.id = std::move(id);
    env.detail = std::move(detail);
    return env;
}

} // namespace

const char* EnvelopeKindName(DecodedEnvelope::Kind kind) {
    switch (kind) {
        case DecodedEnvelope::Kind::Request: return "request";
        case DecodedEnvelope::Kind::Notification: return "notification";
        case DecodedEnvelope::Kind::Response: return "response";
        case DecodedEnvelope::Kind::Invalid: return "invalid";
        case DecodedEnvelope::Kind::ParseError: return "parse-error";
    }
    return "invalid";
}

DecodedEnvelope DecodeEnvelope(const std::string& text) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(text);
    } catch (const std::exception& e) {
        DecodedEnvelope env;
        env.kind = DecodedEnvelope::Kind::ParseError;
        env.detail = e.what();
        return env;
    }

    if (doc.IsArray()) {
        return invalid("Batch requests are not supported");
    }
    if (!doc.IsObject()) {
        return invalid("Envelope must be a JSON object");
    }

    // Read the id first so later failures can still echo it.
    const JSONValue* idVal = FindMember(doc, "id");
    std::optional<JSONRPCId> id;
    if (idVal != nullptr) {
        id = IdFromJSON(*idVal);
        if (!id.has_value()) {
            return invalid("id must be a string, an integer or null");
        }
    }
    const JSONRPCId echoId = id.value_or(JSONRPCId{nullptr});

    auto version = GetStringMember(doc, "jsonrpc");
    if (!version.has_value() || *version != "2.0") {
        return invalid("jsonrpc must be \"2.0\"", echoId);
    }

    const JSONValue* methodVal = FindMember(doc, "method");
    if (methodVal == nullptr) {
        if (FindMember(doc, "result") != nullptr || FindMember(doc, "error") != nullptr) {
            DecodedEnvelope env;
            env.kind = DecodedEnvelope::Kind::Response;
            env.id = echoId;
            return env;
        }
        return invalid("Missing method", echoId);
    }
    if (!methodVal->IsString()) {
        return invalid("method must be a string", echoId);
    }

    DecodedEnvelope env;
    env.method = std::get<std::string>(methodVal->value);
    env.id = echoId;
    if (const JSONValue* p = FindMember(doc, "params")) {
        if (!p->IsObject() && !p->IsArray()) {
            return invalid("params must be an object or an array", echoId);
        }
        env.params = *p;
    }
    env.kind = id.has_value() ? DecodedEnvelope::Kind::Request : DecodedEnvelope::Kind::Notification;
    return env;
}

} // namespace mcpgw
