#pragma once

#include <string>
#include <string_view>

namespace Webscout {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);

// ASCII case-insensitive substring test.
bool icontains(std::string_view haystack, std::string_view needle);

}  // namespace Text
}  // namespace Utils
}  // namespace Webscout
