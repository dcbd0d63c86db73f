#include "disk_storage.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>
#include "../core/logger/logger.hpp"

namespace Webscout {
namespace Storage {

using Webscout::Core::Logger;

DiskStorage::DiskStorage(const std::string& base_path)
    : base_path_(base_path.empty() ? "." : base_path) {
}

std::string DiskStorage::path_for(const std::string& key) const {
    std::filesystem::path path(base_path_);
    path /= key;
    return path.string();
}

bool DiskStorage::save(const std::string& key, const std::string& content) {
    std::filesystem::path path(path_for(key));
    std::filesystem::path tmp = path;
    tmp += ".tmp";

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            Logger::error("Failed to create storage directory: " + path.parent_path().string()
                          + " (" + ec.message() + ")");
            return false;
        }
    }

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("Write Error: " + tmp.string());
            return false;
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file) {
            Logger::error("Write Error: " + tmp.string());
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        Logger::error("FS Error: " + ec.message() + " renaming to " + path.string());
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return false;
    }

    Logger::success("Saved: " + path.string());
    return true;
}

}  // namespace Storage
}  // namespace Webscout
