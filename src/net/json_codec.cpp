#include "json_codec.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <sstream>

#include <roomassign/errors.hpp>

namespace roomassign::net
{

// ─── Reader ──────────────────────────────────────────────────────────────────

namespace
{

constexpr int MAX_DEPTH = 64;

class JsonReader
{
   public:
    explicit JsonReader(std::string_view text) : text_(text) {}

    bool read_document(JsonValue& out)
    {
        skip_ws();
        if (!read_value(out, 0))
            return false;
        skip_ws();
        return pos_ == text_.size();
    }

   private:
    std::string_view text_;
    size_t           pos_ = 0;

    void skip_ws()
    {
        while (pos_ < text_.size()
               && (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n'
                   || text_[pos_] == '\r'))
            ++pos_;
    }

    bool consume(char c)
    {
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == c)
        {
            ++pos_;
            return true;
        }
        return false;
    }

    bool literal(std::string_view word)
    {
        if (text_.substr(pos_, word.size()) != word)
            return false;
        pos_ += word.size();
        return true;
    }

    bool read_value(JsonValue& out, int depth)
    {
        if (depth > MAX_DEPTH)
            return false;
        skip_ws();
        if (pos_ >= text_.size())
            return false;

        switch (text_[pos_])
        {
            case '{':
                return read_object(out, depth);
            case '[':
                return read_array(out, depth);
            case '"':
                out.type = JsonValue::Type::String;
                return read_string(out.string);
            case 't':
                out.type    = JsonValue::Type::Bool;
                out.boolean = true;
                return literal("true");
            case 'f':
                out.type    = JsonValue::Type::Bool;
                out.boolean = false;
                return literal("false");
            case 'n':
                out.type = JsonValue::Type::Null;
                return literal("null");
            default:
                return read_number(out);
        }
    }

    bool read_object(JsonValue& out, int depth)
    {
        out.type = JsonValue::Type::Object;
        ++pos_;   // '{'
        if (consume('}'))
            return true;
        do
        {
            skip_ws();
            std::string key;
            if (pos_ >= text_.size() || text_[pos_] != '"' || !read_string(key))
                return false;
            if (!consume(':'))
                return false;
            JsonValue value;
            if (!read_value(value, depth + 1))
                return false;
            out.keys.push_back(std::move(key));
            out.items.push_back(std::move(value));
        } while (consume(','));
        return consume('}');
    }

    bool read_array(JsonValue& out, int depth)
    {
        out.type = JsonValue::Type::Array;
        ++pos_;   // '['
        if (consume(']'))
            return true;
        do
        {
            JsonValue value;
            if (!read_value(value, depth + 1))
                return false;
            out.items.push_back(std::move(value));
        } while (consume(','));
        return consume(']');
    }

    bool read_number(JsonValue& out)
    {
        const size_t start = pos_;
        if (pos_ < text_.size() && text_[pos_] == '-')
            ++pos_;
        while (pos_ < text_.size()
               && ((text_[pos_] >= '0' && text_[pos_] <= '9') || text_[pos_] == '.'
                   || text_[pos_] == 'e' || text_[pos_] == 'E' || text_[pos_] == '+'
                   || text_[pos_] == '-'))
            ++pos_;
        if (pos_ == start)
            return false;

        double value = 0.0;
        auto [ptr, ec] = std::from_chars(text_.data() + start, text_.data() + pos_, value);
        if (ec != std::errc() || ptr != text_.data() + pos_)
            return false;
        out.type   = JsonValue::Type::Number;
        out.number = value;
        return true;
    }

    static void append_utf8(std::string& out, uint32_t cp)
    {
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    bool read_hex4(uint32_t& cp)
    {
        if (pos_ + 4 > text_.size())
            return false;
        cp = 0;
        for (int i = 0; i < 4; ++i)
        {
            const char c = text_[pos_++];
            cp <<= 4;
            if (c >= '0' && c <= '9')
                cp |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f')
                cp |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F')
                cp |= static_cast<uint32_t>(c - 'A' + 10);
            else
                return false;
        }
        return true;
    }

    bool read_string(std::string& out)
    {
        ++pos_;   // opening quote
        while (pos_ < text_.size())
        {
            const char c = text_[pos_++];
            if (c == '"')
                return true;
            if (static_cast<unsigned char>(c) < 0x20)
                return false;
            if (c != '\\')
            {
                out += c;
                continue;
            }
            if (pos_ >= text_.size())
                return false;
            const char esc = text_[pos_++];
            switch (esc)
            {
                case '"':
                    out += '"';
                    break;
                case '\\':
                    out += '\\';
                    break;
                case '/':
                    out += '/';
                    break;
                case 'b':
                    out += '\b';
                    break;
                case 'f':
                    out += '\f';
                    break;
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'u':
                {
                    uint32_t cp = 0;
                    if (!read_hex4(cp))
                        return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF)
                    {
                        uint32_t low = 0;
                        if (!literal("\\u") || !read_hex4(low) || low < 0xDC00 || low > 0xDFFF)
                            return false;
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return false;
            }
        }
        return false;
    }
};

[[noreturn]] void malformed(int status, const std::string& what)
{
    throw TransportError(status, "Malformed scheduler response: " + what);
}

const JsonValue& require(const JsonValue& obj, std::string_view key, int status)
{
    const JsonValue* v = obj.find(key);
    if (!v)
        malformed(status, "missing \"" + std::string(key) + "\"");
    return *v;
}

std::string require_string(const JsonValue& obj, std::string_view key, int status)
{
    const JsonValue& v = require(obj, key, status);
    if (!v.is_string())
        malformed(status, "\"" + std::string(key) + "\" is not a string");
    return v.string;
}

double require_number(const JsonValue& obj, std::string_view key, int status)
{
    const JsonValue& v = require(obj, key, status);
    if (!v.is_number())
        malformed(status, "\"" + std::string(key) + "\" is not a number");
    return v.number;
}

// Whole number within [lo, hi]; fractional or out-of-range values are malformed.
double require_whole(const JsonValue& obj, std::string_view key, double lo, double hi, int status)
{
    const double v = require_number(obj, key, status);
    if (!std::isfinite(v) || std::trunc(v) != v || v < lo || v > hi)
        malformed(status, "\"" + std::string(key) + "\" is not a whole number in range");
    return v;
}

}   // namespace

const JsonValue* JsonValue::find(std::string_view key) const
{
    if (type != Type::Object)
        return nullptr;
    for (size_t i = 0; i < keys.size(); ++i)
    {
        if (keys[i] == key)
            return &items[i];
    }
    return nullptr;
}

std::optional<JsonValue> parse_json(std::string_view text)
{
    JsonValue  value;
    JsonReader reader(text);
    if (!reader.read_document(value))
        return std::nullopt;
    return value;
}

// ─── Writer ──────────────────────────────────────────────────────────────────

std::string escape_json(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string format_json_number(double value)
{
    if (!std::isfinite(value))
        return "0";
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc())
        return "0";
    return std::string(buf, ptr);
}

std::string encode_request(const DebateRequest& request)
{
    std::ostringstream os;
    os << "{\"participants\":[";
    for (size_t i = 0; i < request.participants.size(); ++i)
    {
        const auto& p = request.participants[i];
        if (i > 0)
            os << ",";
        os << "{\"name\":\"" << escape_json(p.name) << "\",\"preferences\":[";
        for (size_t k = 0; k < p.preferences.size(); ++k)
        {
            if (k > 0)
                os << ",";
            os << p.preferences[k];
        }
        os << "]";
        if (!p.groups.empty())
        {
            os << ",\"group\":[";
            for (size_t g = 0; g < p.groups.size(); ++g)
            {
                if (g > 0)
                    os << ",";
                os << "\"" << escape_json(p.groups[g]) << "\"";
            }
            os << "]";
        }
        os << "}";
    }
    os << "]}";
    return os.str();
}

ScheduleResult decode_response(std::string_view body, int status)
{
    auto doc = parse_json(body);
    if (!doc || !doc->is_object())
        malformed(status, "body is not a JSON object");

    const JsonValue& rooms = require(*doc, "rooms", status);
    if (!rooms.is_array())
        malformed(status, "\"rooms\" is not an array");

    ScheduleResult result;
    for (const auto& room_value : rooms.items)
    {
        if (!room_value.is_object())
            malformed(status, "room entry is not an object");

        Room room;
        room.name = require_string(room_value, "name", status);

        const JsonValue& assignments = require(room_value, "assignments", status);
        if (!assignments.is_array())
            malformed(status, "\"assignments\" is not an array");

        for (const auto& a : assignments.items)
        {
            if (!a.is_object())
                malformed(status, "assignment entry is not an object");

            Assignment assignment;
            assignment.name       = require_string(a, "name", status);
            assignment.role       = require_string(a, "role", status);
            assignment.preference = static_cast<int>(require_whole(
                a, "preference", std::numeric_limits<int>::min(), std::numeric_limits<int>::max(), status));

            const JsonValue* group = a.find("group");
            if (group && group->is_string())
                assignment.group = group->string;
            else if (group && !group->is_null())
                malformed(status, "\"group\" is not a string");

            room.assignments.push_back(std::move(assignment));
        }
        result.rooms.push_back(std::move(room));
    }

    // 2^53 keeps the double-to-int64 conversion exact.
    result.total_preference = static_cast<int64_t>(
        require_whole(*doc, "total_preference", -9007199254740992.0, 9007199254740992.0, status));
    result.average_preference = require_number(*doc, "average_preference", status);
    return result;
}

std::string encode_response(const ScheduleResult& result)
{
    std::ostringstream os;
    os << "{\n  \"rooms\": [";
    for (size_t r = 0; r < result.rooms.size(); ++r)
    {
        const auto& room = result.rooms[r];
        os << (r > 0 ? "," : "") << "\n    {\n";
        os << "      \"name\": \"" << escape_json(room.name) << "\",\n";
        os << "      \"assignments\": [";
        for (size_t i = 0; i < room.assignments.size(); ++i)
        {
            const auto& a = room.assignments[i];
            os << (i > 0 ? "," : "") << "\n        {";
            os << "\"name\": \"" << escape_json(a.name) << "\", ";
            os << "\"role\": \"" << escape_json(a.role) << "\", ";
            os << "\"preference\": " << a.preference << ", ";
            os << "\"group\": \"" << escape_json(a.group) << "\"}";
        }
        os << (room.assignments.empty() ? "]\n" : "\n      ]\n");
        os << "    }";
    }
    os << (result.rooms.empty() ? "],\n" : "\n  ],\n");
    os << "  \"total_preference\": " << result.total_preference << ",\n";
    os << "  \"average_preference\": " << format_json_number(result.average_preference) << "\n";
    os << "}\n";
    return os.str();
}

std::string decode_error_detail(std::string_view body)
{
    auto doc = parse_json(body);
    if (doc)
    {
        const JsonValue* detail = doc->find("detail");
        if (detail && detail->is_string() && !detail->string.empty())
            return detail->string;
    }
    return TransportError::GENERIC_DETAIL;
}

}   // namespace roomassign::net
