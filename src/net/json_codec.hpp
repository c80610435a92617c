#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <roomassign/model.hpp>

namespace roomassign::net
{

// ─── Minimal JSON document ───────────────────────────────────────────────────
// Enough for the scheduler wire format and the settings file.

struct JsonValue
{
    enum class Type
    {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    Type                     type    = Type::Null;
    bool                     boolean = false;
    double                   number  = 0.0;
    std::string              string;
    std::vector<JsonValue>   items;   // Array elements, or object values
    std::vector<std::string> keys;    // Object keys, parallel to items

    bool is_null() const { return type == Type::Null; }
    bool is_bool() const { return type == Type::Bool; }
    bool is_number() const { return type == Type::Number; }
    bool is_string() const { return type == Type::String; }
    bool is_array() const { return type == Type::Array; }
    bool is_object() const { return type == Type::Object; }

    // Member lookup on objects; nullptr if absent or not an object.
    const JsonValue* find(std::string_view key) const;
};

// Returns std::nullopt on malformed input or trailing garbage.
std::optional<JsonValue> parse_json(std::string_view text);

std::string escape_json(std::string_view s);

// Shortest text that reads back to the same double.
std::string format_json_number(double value);

// ─── Scheduler wire format ───────────────────────────────────────────────────

// {"participants":[{"name":..,"preferences":[..],"group":[..]}]}; "group" omitted when empty.
std::string encode_request(const DebateRequest& request);

// Parses a success body. Throws TransportError(status, ...) when the body is malformed.
ScheduleResult decode_response(std::string_view body, int status = 200);

std::string encode_response(const ScheduleResult& result);

// The "detail" string of an error body, or the generic failure message.
std::string decode_error_detail(std::string_view body);

}   // namespace roomassign::net
