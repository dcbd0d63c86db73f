#pragma once
#include <string>
#include "storage.hpp"

namespace Webscout {
namespace Storage {

class DiskStorage : public Storage {
public:
    explicit DiskStorage(const std::string& base_path);
    ~DiskStorage() override = default;

    // Writes through a temporary sibling and renames, so readers never see
    // a half-written report. Returns false on any filesystem error.
    bool        save(const std::string& key, const std::string& content) override;
    std::string path_for(const std::string& key) const override;

private:
    std::string base_path_;
};

}  // namespace Storage
}  // namespace Webscout
