#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <cstdint>
#include <charconv>
#include <map>
#include <optional>
#include <stdexcept>
#include <boost/json.hpp>

namespace passgen {

// Request-level input validation and decoding helpers.
class InputValidator {
public:
    static constexpr size_t MAX_JSON_DEPTH = 8;

    /**
     * Parses a base-10 signed integer occupying the whole input.
     * Rejects empty strings, whitespace, trailing garbage, "+5" and values outside int64.
     */
    static std::optional<int64_t> parse_int64(std::string_view text) {
        return parse_whole<int64_t>(text);
    }

    // Same rules as parse_int64, for the unsigned 64-bit range.
    static std::optional<uint64_t> parse_uint64(std::string_view text) {
        return parse_whole<uint64_t>(text);
    }

    /**
     * Decodes application/x-www-form-urlencoded text ('+' is a space, %XX is a byte).
     * @throws std::invalid_argument on a truncated or non-hex escape.
     */
    static std::string url_decode(std::string_view in) {
        std::string out;
        out.reserve(in.size());
        for (size_t i = 0; i < in.size(); ++i) {
            char c = in[i];
            if (c == '+') {
                out += ' ';
            } else if (c == '%') {
                if (i + 2 >= in.size() || !std::isxdigit(static_cast<unsigned char>(in[i + 1])) ||
                    !std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
                    throw std::invalid_argument("Malformed percent-encoding");
                }
                out += static_cast<char>((hex_value(in[i + 1]) << 4) | hex_value(in[i + 2]));
                i += 2;
            } else {
                out += c;
            }
        }
        return out;
    }

    /**
     * Replaces every ill-formed UTF-8 sequence with U+FFFD, one replacement per maximal
     * invalid subpart. Well-formed input is returned unchanged.
     */
    static std::string to_valid_utf8(std::string_view in) {
        static const char kReplacement[] = "\xEF\xBF\xBD";
        std::string out;
        out.reserve(in.size());

        size_t i = 0;
        while (i < in.size()) {
            const auto lead = static_cast<unsigned char>(in[i]);
            if (lead < 0x80) {
                out += in[i++];
                continue;
            }

            size_t needed = 0;
            unsigned char lo = 0x80, hi = 0xBF;  // allowed range of the first continuation byte
            if (lead >= 0xC2 && lead <= 0xDF) {
                needed = 1;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                needed = 2;
                if (lead == 0xE0) lo = 0xA0;
                if (lead == 0xED) hi = 0x9F;
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                needed = 3;
                if (lead == 0xF0) lo = 0x90;
                if (lead == 0xF4) hi = 0x8F;
            } else {
                out += kReplacement;
                ++i;
                continue;
            }

            size_t len = 1;
            while (len <= needed && i + len < in.size()) {
                const auto c = static_cast<unsigned char>(in[i + len]);
                const bool ok = (len == 1) ? (c >= lo && c <= hi) : (c >= 0x80 && c <= 0xBF);
                if (!ok) break;
                ++len;
            }

            if (len == needed + 1) {
                out.append(in.data() + i, len);
            } else {
                out += kReplacement;
            }
            i += len;
        }
        return out;
    }

    /**
     * Splits a query string into decoded key/value pairs. A repeated key keeps its last value.
     * A key without '=' maps to an empty value. Decoded bytes that are not UTF-8 become U+FFFD.
     * @throws std::invalid_argument on malformed percent-encoding.
     */
    static std::map<std::string, std::string> parse_query(std::string_view query) {
        std::map<std::string, std::string> params;
        size_t pos = 0;
        while (pos <= query.size()) {
            size_t amp = query.find('&', pos);
            if (amp == std::string_view::npos) amp = query.size();
            std::string_view pair = query.substr(pos, amp - pos);
            if (!pair.empty()) {
                size_t eq = pair.find('=');
                std::string key = to_valid_utf8(url_decode(pair.substr(0, eq)));
                std::string value = (eq == std::string_view::npos)
                                        ? std::string()
                                        : to_valid_utf8(url_decode(pair.substr(eq + 1)));
                params[std::move(key)] = std::move(value);
            }
            pos = amp + 1;
        }
        return params;
    }

    /**
     * JSON parsing with a recursion depth limit to prevent stack exhaustion.
     * @throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = MAX_JSON_DEPTH;
        return boost::json::parse(input, {}, opt);
    }

private:
    template <typename T>
    static std::optional<T> parse_whole(std::string_view text) {
        if (text.empty()) return std::nullopt;
        T value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    static int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return c - 'A' + 10;
    }
};

}
