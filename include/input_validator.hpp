#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <algorithm>
#include <boost/json.hpp>

namespace chathub {

// Input validation for inbound envelopes and their text fields.
class InputValidator {
public:
    // Strips leading and trailing ASCII whitespace.
    static std::string trim(std::string_view input) {
        auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
        auto begin = std::find_if_not(input.begin(), input.end(), is_space);
        auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
        if (begin >= end) return {};
        return std::string(begin, end);
    }

    // Number of code points in a UTF-8 string (continuation bytes are not counted).
    static size_t char_length(std::string_view input) {
        return static_cast<size_t>(std::count_if(input.begin(), input.end(), [](char c) {
            return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        }));
    }

    // Unicode letters and digits, space, '-' and '_'. Rejects malformed UTF-8.
    static bool is_valid_name_charset(std::string_view name);

    /**
     * Returns the trimmed chat text or throws ValidationError when it is empty
     * or longer than `max_length` characters.
     */
    static std::string normalize_chat_text(std::string_view text, size_t max_length);

    // Returns the trimmed display name or throws ValidationError.
    static std::string normalize_display_name(std::string_view name, size_t min_length, size_t max_length);

    static std::string normalize_prompt(std::string_view prompt, size_t max_length);

    /**
     * JSON parsing with a recursion depth limit to prevent stack exhaustion.
     * Throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(std::string_view input, size_t max_depth = 16) {
        boost::json::parse_options opt;
        opt.max_depth = max_depth;
        return boost::json::parse(input, {}, opt);
    }
};

}
