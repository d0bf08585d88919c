#include "cli/ParseArgsInternals.h"

#include <charconv>
#include <system_error>
#include <utility>

namespace pytdc::cli::detail {
    /***
     * Name: pytdc::cli::detail::parseVersionValue
     * Purpose: Parse a dotted version of one to three non-negative components.
     */
    bool parseVersionValue(const std::string_view value, std::vector<int> &out) {
        constexpr std::size_t kMaxComponents = 3;
        std::vector<int> parts;
        std::size_t pos = 0;
        while (true) {
            const std::size_t dot = value.find('.', pos);
            const std::string_view piece = value.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);
            int number = 0;
            const auto [end, ec] = std::from_chars(piece.data(), piece.data() + piece.size(), number);
            if (piece.empty() || ec != std::errc{} || end != piece.data() + piece.size() || number < 0) { return false; }
            parts.push_back(number);
            if (dot == std::string_view::npos) { break; }
            pos = dot + 1;
        }
        if (parts.size() > kMaxComponents) { return false; }
        out = std::move(parts);
        return true;
    }
} // namespace pytdc::cli::detail
