//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeDecoder.h
// Purpose: Parse and classify one inbound JSON-RPC text frame
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {

//==========================================================================================================
// DecodedEnvelope
// Purpose: Classification of one text frame.
// Kinds:
//   Request: has method and a valid id; a response is owed.
//   Notification: has method and no id member.
//   Response: carries result or error without method (a client answering us); ignored by the gateway.
//   Invalid: well-formed JSON that is not a usable envelope (-32600); id is echoed when it could be read.
//   ParseError: not JSON at all (-32700).
// Fields:
//   detail: Human-readable reason for Invalid / ParseError.
//==========================================================================================================
struct DecodedEnvelope {
    enum class Kind {
        Request,
        Notification,
        Response,
        Invalid,
        ParseError
    };

    Kind kind{Kind::Invalid};
    JSONRPCId id{nullptr};
    std::string method;
    std::optional<JSONValue> params;
    std::string detail;
};

const char* EnvelopeKindName(DecodedEnvelope::Kind kind);

//==========================================================================================================
// DecodeEnvelope
// Purpose: Single parse of the frame followed by structural checks:
//   - top level must be an object (arrays are batches and are not supported)
//   - jsonrpc must be the string "2.0"
//   - method must be a string
//   - id, when present, must be a string, an integer or null
//   - params, when present, must be an object or an array
// Never throws.
//==========================================================================================================
DecodedEnvelope DecodeEnvelope(const std::string& text);

} // namespace mcpgw
