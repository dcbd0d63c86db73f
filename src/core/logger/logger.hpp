#pragma once
#include <mutex>
#include <string>

namespace Webscout {
namespace Core {

enum LogLevel {
    LOG_NONE    = 0,
    LOG_INFO    = 1 << 0,
    LOG_WARN    = 1 << 1,
    LOG_ERROR   = 1 << 2,
    LOG_SUCCESS = 1 << 3,
    LOG_ALL     = LOG_INFO | LOG_WARN | LOG_ERROR | LOG_SUCCESS
};

class Logger {
public:
    static void set_level(int level);
    static int  level();
    static void info(const std::string& message);
    static void success(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // Raw colored line for reporters that format their own prefix.
    static void print(const std::string& color, const std::string& message);

private:
    static int        level_;
    static std::mutex mutex_;
};

namespace Color {
inline constexpr const char* RESET  = "\033[0m";
inline constexpr const char* RED    = "\033[31m";
inline constexpr const char* GREEN  = "\033[32m";
inline constexpr const char* YELLOW = "\033[33m";
inline constexpr const char* BLUE   = "\033[34m";
inline constexpr const char* CYAN   = "\033[36m";
}  // namespace Color

}  // namespace Core
}  // namespace Webscout
