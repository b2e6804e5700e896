// ==============================================================================
// json_extract.cpp - MOD-0008: Выделение JSON из вывода команды
// ==============================================================================

#include "flexscan/json_extract.hpp"

namespace flexscan::io {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

}  // anonymous namespace

std::optional<std::string> extract_json(std::string_view raw) {
    size_t line_start = 0;
    while (line_start < raw.size()) {
        size_t line_end = raw.find('\n', line_start);
        if (line_end == std::string_view::npos) {
            line_end = raw.size();
        }

        size_t pos = line_start;
        while (pos < line_end && is_blank(raw[pos])) {
            ++pos;
        }
        if (pos < line_end && (raw[pos] == '{' || raw[pos] == '[')) {
            return std::string(raw.substr(line_start));
        }

        line_start = line_end + 1;
    }
    return std::nullopt;
}

std::optional<std::string> extract_json(const std::string& raw) {
    return extract_json(std::string_view(raw));
}

std::optional<std::string> extract_json(const char* raw) {
    if (raw == nullptr) {
        return std::nullopt;
    }
    return extract_json(std::string_view(raw));
}

std::optional<std::string> extract_json(const std::optional<std::string>& raw) {
    if (!raw.has_value()) {
        return std::nullopt;
    }
    return extract_json(std::string_view(*raw));
}

}  // namespace flexscan::io
