#pragma once
/** @file  Strings.hpp
 *  @brief Small ASCII text helpers shared by the dialogue components.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace genesis::core {

  inline std::string trim(std::string_view text) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(text.begin(), text.end(), isSpace);
    auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    return first < last ? std::string(first, last) : std::string();
  }

  inline std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
  }

} // namespace genesis::core
