#include "input_validator.hpp"
#include "errors.hpp"

#include <locale>
#include <boost/locale/boundary.hpp>
#include <boost/locale/generator.hpp>
#include <boost/locale/utf.hpp>

namespace chathub {

namespace {

const std::locale& unicode_locale() {
    static const std::locale loc = boost::locale::generator()("en_US.UTF-8");
    return loc;
}

// A single code point is a letter or digit when word-break analysis tags it as a word.
bool is_word_character(std::string::const_iterator begin, std::string::const_iterator end) {
    namespace boundary = boost::locale::boundary;
    boundary::ssegment_index index(boundary::word, begin, end, boundary::word_any, unicode_locale());
    return index.begin() != index.end();
}

}

bool InputValidator::is_valid_name_charset(std::string_view name) {
    using utf8 = boost::locale::utf::utf_traits<char>;
    const std::string text(name);
    auto it = text.cbegin();
    while (it != text.cend()) {
        auto start = it;
        boost::locale::utf::code_point cp = utf8::decode(it, text.cend());
        if (cp == boost::locale::utf::illegal || cp == boost::locale::utf::incomplete) {
            return false;
        }
        if (cp < 0x80) {
            char c = static_cast<char>(cp);
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != ' ' && c != '-' && c != '_') {
                return false;
            }
        } else if (!is_word_character(start, it)) {
            return false;
        }
    }
    return true;
}

std::string InputValidator::normalize_chat_text(std::string_view text, size_t max_length) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        throw ValidationError("Message cannot be empty.");
    }
    if (char_length(trimmed) > max_length) {
        throw ValidationError("Message is too long (max " + std::to_string(max_length) + " characters).");
    }
    return trimmed;
}

std::string InputValidator::normalize_display_name(std::string_view name, size_t min_length,
                                                   size_t max_length) {
    std::string trimmed = trim(name);
    size_t length = char_length(trimmed);
    if (length < min_length || length > max_length) {
        throw ValidationError("Naam moet tussen " + std::to_string(min_length) + " en " +
                              std::to_string(max_length) + " tekens zijn.");
    }
    if (!is_valid_name_charset(trimmed)) {
        throw ValidationError("Naam mag alleen letters, cijfers, spaties, - en _ bevatten.");
    }
    return trimmed;
}

std::string InputValidator::normalize_prompt(std::string_view prompt, size_t max_length) {
    std::string trimmed = trim(prompt);
    if (trimmed.empty()) {
        throw ValidationError("Geef een vraag op. Gebruik: /ai <vraag>");
    }
    if (char_length(trimmed) > max_length) {
        throw ValidationError("Vraag is te lang (max " + std::to_string(max_length) + " tekens).");
    }
    return trimmed;
}

}
