#ifndef PROMPTGUARD_SERVICE_JSON_CODEC_HPP
#define PROMPTGUARD_SERVICE_JSON_CODEC_HPP

#include <cctype>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @file json_codec.hpp
 * @brief Minimal JSON helpers for the gateway's small request/response bodies.
 *
 * DESIGN GOALS:
 *   - Header-only, no external JSON library: the bodies exchanged with chat
 *     clients and the completion server are flat objects.
 *   - extractStringField() walks the top level of one object and decodes the
 *     named string member, escapes included (\uXXXX and surrogate pairs are
 *     converted to UTF-8). Nested objects and arrays are skipped, never searched.
 *   - escapeJson() produces a valid JSON string body for any input bytes.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace promptguard::service;
 *   auto msg = extractStringField(R"({"message":"Hi \"there\""})", "message");
 *   // *msg == "Hi \"there\""
 *   std::string body = "{\"response\":\"" + escapeJson(*msg) + "\"}";
 *   @endcode
 */

namespace promptguard {
namespace service {

inline std::string escapeJson(const std::string &in)
{
    std::string out;
    out.reserve(in.size() + 8);
    for (unsigned char c : in) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

namespace detail {

inline void skipWhitespace(const std::string &s, size_t &pos)
{
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
}

inline void appendUtf8(std::string &out, unsigned long cp)
{
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline unsigned long parseHex4(const std::string &s, size_t pos)
{
    if (pos + 4 > s.size()) {
        throw std::runtime_error("json: truncated \\u escape");
    }
    unsigned long value = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        char c = s[i];
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= static_cast<unsigned long>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<unsigned long>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value |= static_cast<unsigned long>(c - 'A' + 10);
        } else {
            throw std::runtime_error("json: bad hex digit in \\u escape");
        }
    }
    return value;
}

/**
 * @brief Decode the string starting at s[pos] == '"'; pos ends after the closing quote.
 */
inline std::string parseString(const std::string &s, size_t &pos)
{
    if (pos >= s.size() || s[pos] != '"') {
        throw std::runtime_error("json: expected string");
    }
    ++pos;
    std::string out;
    while (pos < s.size()) {
        char c = s[pos++];
        if (c == '"') {
            return out;
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (pos >= s.size()) {
            break;
        }
        char e = s[pos++];
        switch (e) {
            case '"':  out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/'); break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'u': {
                unsigned long cp = parseHex4(s, pos);
                pos += 4;
                if (cp >= 0xD800 && cp <= 0xDBFF && pos + 6 <= s.size()
                    && s[pos] == '\\' && s[pos + 1] == 'u') {
                    unsigned long low = parseHex4(s, pos + 2);
                    if (low >= 0xDC00 && low <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        pos += 6;
                    }
                }
                appendUtf8(out, cp);
                break;
            }
            default:
                throw std::runtime_error(std::string("json: invalid escape \\") + e);
        }
    }
    throw std::runtime_error("json: unterminated string");
}

/**
 * @brief Skip one value of any type; pos ends just after it.
 */
inline void skipValue(const std::string &s, size_t &pos)
{
    skipWhitespace(s, pos);
    if (pos >= s.size()) {
        throw std::runtime_error("json: expected value");
    }
    if (s[pos] == '"') {
        parseString(s, pos);
        return;
    }
    if (s[pos] == '{' || s[pos] == '[') {
        int depth = 0;
        while (pos < s.size()) {
            char c = s[pos];
            if (c == '"') {
                parseString(s, pos);
                continue;
            }
            if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                --depth;
                if (depth == 0) {
                    ++pos;
                    return;
                }
            }
            ++pos;
        }
        throw std::runtime_error("json: unterminated container");
    }
    // number, true, false, null
    size_t start = pos;
    while (pos < s.size() && s[pos] != ',' && s[pos] != '}' && s[pos] != ']'
           && !std::isspace(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
    if (pos == start) {
        throw std::runtime_error("json: expected value");
    }
}

} // namespace detail

/**
 * @brief Decode the top-level string member @p key of the JSON object @p json.
 * @return std::nullopt if the member is absent or not a string.
 * @throw std::runtime_error if @p json is not a well-formed object.
 */
inline std::optional<std::string> extractStringField(const std::string &json, const std::string &key)
{
    size_t pos = 0;
    detail::skipWhitespace(json, pos);
    if (pos >= json.size() || json[pos] != '{') {
        throw std::runtime_error("json: not an object");
    }
    ++pos;
    std::optional<std::string> found;
    detail::skipWhitespace(json, pos);
    if (pos < json.size() && json[pos] == '}') {
        return found;
    }
    while (pos < json.size()) {
        detail::skipWhitespace(json, pos);
        std::string name = detail::parseString(json, pos);
        detail::skipWhitespace(json, pos);
        if (pos >= json.size() || json[pos] != ':') {
            throw std::runtime_error("json: expected ':' after member name");
        }
        ++pos;
        detail::skipWhitespace(json, pos);
        if (name == key && !found && pos < json.size() && json[pos] == '"') {
            found = detail::parseString(json, pos);
        } else {
            detail::skipValue(json, pos);
        }
        detail::skipWhitespace(json, pos);
        if (pos < json.size() && json[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < json.size() && json[pos] == '}') {
            return found;
        }
        break;
    }
    throw std::runtime_error("json: unterminated object");
}

} // namespace service
} // namespace promptguard

#endif // PROMPTGUARD_SERVICE_JSON_CODEC_HPP
