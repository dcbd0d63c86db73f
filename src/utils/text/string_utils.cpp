#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace Webscout {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

namespace {

bool ichar_equals(char c1, char c2) {
    return std::tolower(static_cast<unsigned char>(c1))
           == std::tolower(static_cast<unsigned char>(c2));
}

}  // namespace

bool icontains(std::string_view haystack, std::string_view needle) {
    auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(), ichar_equals);
    return it != haystack.end();
}

}  // namespace Text
}  // namespace Utils
}  // namespace Webscout
