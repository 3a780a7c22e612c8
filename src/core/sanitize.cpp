/**
 * @file sanitize.cpp
 * @brief Path redaction and length bounding for diagnostic text.
 *
 * A path starts at a '/' that is not preceded by a path-ish character and
 * is followed by at least one name character; it extends over name characters
 * and further separators. "/" alone and fractions like "1/2" are left alone.
 */

#include "core/sanitize.hpp"

#include <cctype>

namespace jobtier {

namespace {

bool is_path_char(char c) {
    auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '-' || c == '.' || c == '/' || c == '~'
        || c == '+' || c == '@';
}

bool starts_path(std::string_view text, std::size_t i) {
    if (text[i] != '/') return false;
    if (i + 1 >= text.size() || !is_path_char(text[i + 1]) || text[i + 1] == '/') return false;
    if (i == 0) return true;
    char prev = text[i - 1];
    return !std::isalnum(static_cast<unsigned char>(prev)) && prev != '_' && prev != '.'
        && prev != '-';
}

}  // anonymous namespace

std::string sanitize_error_message(std::string_view message, std::size_t max_length) {
    std::string out;
    out.reserve(message.size());

    for (std::size_t i = 0; i < message.size();) {
        if (starts_path(message, i)) {
            while (i < message.size() && is_path_char(message[i])) ++i;
            out += kRedactedPath;
            continue;
        }
        char c = message[i++];
        if (c == '\n' || c == '\t') {
            out += ' ';
        } else if (!std::iscntrl(static_cast<unsigned char>(c))) {
            out += c;
        }
    }

    // Trailing whitespace from a child's last newline
    while (!out.empty() && out.back() == ' ') out.pop_back();

    if (out.size() > max_length) {
        if (max_length <= 3) return out.substr(0, max_length);
        out.resize(max_length - 3);
        out += "...";
    }
    return out;
}

std::string sanitize_job_id(std::string_view id) {
    std::string out;
    out.reserve(id.size());
    for (char c : id) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.') {
            out += c;
        }
    }
    return out;
}

}  // namespace jobtier
