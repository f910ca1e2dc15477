#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rangeget::detail {

// Splits "Name: value" into a lower-cased name and a trimmed value.
[[nodiscard]] std::optional<std::pair<std::string, std::string>> parseHeaderLine(std::string_view line);

[[nodiscard]] bool isStatusLine(std::string_view line);

// True when an Accept-Ranges value announces byte ranges.
[[nodiscard]] bool acceptsByteRanges(std::string_view value);

// "start-end" as expected by CURLOPT_RANGE.
[[nodiscard]] std::string formatRange(std::uint64_t start, std::uint64_t end);

// Replaces the value of an Authorization header line with "<redacted>".
[[nodiscard]] std::string redactAuthorization(std::string_view header_text);

} // namespace rangeget::detail
