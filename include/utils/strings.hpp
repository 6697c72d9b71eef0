#pragma once
#include <string>
#include <string_view>

std::string to_upper_ascii(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string_view trim_ascii(std::string_view s);

// Trimmed, upper-cased symbol as stored in the instrument registry.
std::string normalize_symbol(std::string_view raw);
