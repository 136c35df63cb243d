#pragma once
#include <algorithm>
#include <cctype>
#include <string_view>

namespace SM {

// ASCII case-insensitive equality; used for state, ease, cycle-mode and color names.
inline auto equals_ignore_case(std::string_view lhs, std::string_view rhs) -> bool {
    return lhs.size() == rhs.size()
           && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                  return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
              });
}

} // namespace SM
