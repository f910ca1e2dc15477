#include "rangeget/detail/http_headers.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace rangeget::detail {

namespace {

std::string_view trim(std::string_view text) {
    const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::string toLower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<std::pair<std::string, std::string>> parseHeaderLine(std::string_view line) {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    const auto name = trim(line.substr(0, colon));
    if (name.empty()) {
        return std::nullopt;
    }
    return std::make_pair(toLower(name), std::string(trim(line.substr(colon + 1))));
}

bool isStatusLine(std::string_view line) {
    return line.size() >= 5 && toLower(line.substr(0, 5)) == "http/";
}

bool acceptsByteRanges(std::string_view value) {
    return toLower(trim(value)) == "bytes";
}

std::string formatRange(std::uint64_t start, std::uint64_t end) {
    return fmt::format("{}-{}", start, end);
}

std::string redactAuthorization(std::string_view header_text) {
    std::string result;
    result.reserve(header_text.size());

    std::size_t pos = 0;
    while (pos < header_text.size()) {
        auto eol = header_text.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = header_text.size();
        } else {
            ++eol;
        }
        const auto line = header_text.substr(pos, eol - pos);
        const auto header = parseHeaderLine(line);
        if (header && header->first == "authorization") {
            result.append(line.substr(0, line.find(':') + 1));
            result.append(" <redacted>");
            if (!line.empty() && line.back() == '\n') {
                result.append(line.size() >= 2 && line[line.size() - 2] == '\r' ? "\r\n" : "\n");
            }
        } else {
            result.append(line);
        }
        pos = eol;
    }
    return result;
}

} // namespace rangeget::detail
