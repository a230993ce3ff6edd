#pragma once

#include <string>
#include <string_view>

namespace utils
{

// Standard alphabet, '=' padded
std::string Base64Encode(std::string_view data);

// Returns false on characters outside the alphabet or bad padding
bool Base64Decode(std::string_view encoded, std::string& out);

} // namespace utils
