#include "utils/strings.hpp"
#include <algorithm>
#include <cctype>

std::string to_upper_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return s;
}

std::string_view trim_ascii(std::string_view s) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))  s.remove_suffix(1);
    return s;
}

std::string normalize_symbol(std::string_view raw) {
    return to_upper_ascii(std::string(trim_ascii(raw)));
}
