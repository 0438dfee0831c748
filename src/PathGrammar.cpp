/**
 * @file PathGrammar.cpp
 * @brief Implementation of path tokenizing and formatting
 */

#include "keypath/PathGrammar.hpp"
#include "keypath/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace keypath {

Segment Segment::field(std::string name) {
    Segment seg;
    seg.type = Type::Field;
    seg.name = std::move(name);
    return seg;
}

Segment Segment::at(std::size_t position) {
    Segment seg;
    seg.type = Type::Index;
    seg.index = position;
    return seg;
}

Segment Segment::any_index() {
    Segment seg;
    seg.type = Type::Index;
    return seg;
}

std::optional<std::size_t> parse_position(std::string_view token) {
    if (token.empty()) {
        return std::nullopt;
    }
    // No leading zeros except "0" itself
    if (token[0] == '0' && token.size() > 1) {
        return std::nullopt;
    }
    std::size_t value = 0;
    constexpr auto max = std::numeric_limits<std::size_t>::max();
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        auto d = static_cast<std::size_t>(c - '0');
        if (value > (max - d) / 10) {
            return std::nullopt;
        }
        value = value * 10 + d;
    }
    return value;
}

namespace {
    /**
     * @brief Consume a chain of "[index]" groups starting at text[i]
     * @return false if a group is unterminated or has invalid contents
     */
    bool parse_brackets(std::string_view text, size_t& i, Path& segments) {
        while (i < text.size() && text[i] == '[') {
            size_t close = text.find(']', i + 1);
            if (close == std::string_view::npos) {
                return false;
            }
            std::string_view token = text.substr(i + 1, close - i - 1);
            if (token == kWildcardIndex) {
                segments.push_back(Segment::any_index());
            } else if (auto position = parse_position(token)) {
                segments.push_back(Segment::at(*position));
            } else {
                return false;
            }
            i = close + 1;
        }
        return true;
    }
}

std::optional<Path> parse_path(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    Path segments;
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        if (text[i] != '[') {
            size_t end = i;
            while (end < n && text[end] != kSeparator && text[end] != '[') {
                if (text[end] == ']') return std::nullopt;
                ++end;
            }
            if (end == i) {
                return std::nullopt; // empty segment
            }
            segments.push_back(Segment::field(std::string(text.substr(i, end - i))));
            i = end;
        }

        // Brackets either form the whole segment or follow a field name
        if (!parse_brackets(text, i, segments)) {
            return std::nullopt;
        }

        if (i == n) {
            break;
        }
        if (text[i] != kSeparator) {
            return std::nullopt; // e.g. "a[0]b"
        }
        ++i;
        if (i == n) {
            return std::nullopt; // trailing separator
        }
    }

    return segments;
}

bool is_index_token(std::string_view token) {
    return token == kWildcardIndex || parse_position(token).has_value();
}

bool is_well_formed(std::string_view text) {
    return parse_path(text).has_value();
}

std::string format_path(const Path& path) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& seg : path) {
        if (seg.is_index()) {
            oss << '[';
            if (seg.index) {
                oss << *seg.index;
            } else {
                oss << kWildcardIndex;
            }
            oss << ']';
        } else {
            if (!first) oss << kSeparator;
            oss << seg.name;
        }
        first = false;
    }
    return oss.str();
}

std::string append_field(const std::string& prefix, const std::string& name) {
    if (prefix.empty()) {
        return name;
    }
    return prefix + kSeparator + name;
}

std::string append_index(const std::string& prefix, const std::string& position) {
    return prefix + '[' + position + ']';
}

bool is_addressable_key(std::string_view name) {
    if (name.empty() || name == kWildcardKey) return false;
    if (name.find_first_of("[]") != std::string_view::npos) return false;
    if (name.front() == kSeparator || name.back() == kSeparator) return false;
    return name.find("..") == std::string_view::npos;
}

std::string instantiate_pattern(std::string_view pattern, std::size_t index,
                                std::string_view key) {
    auto parsed = parse_path(pattern);
    if (!parsed) {
        throw InvalidPathError(std::string(pattern), "malformed pattern");
    }

    for (auto& seg : *parsed) {
        if (seg.is_wildcard_index()) {
            seg.index = index;
        } else if (seg.is_field() && seg.name == kWildcardKey) {
            seg.name = std::string(key);
        }
    }
    return format_path(*parsed);
}

} // namespace keypath
