#pragma once
#include <string>

namespace Webscout {
namespace Storage {

// Sink for finished artifacts, keyed by a path relative to the store root.
class Storage {
public:
    virtual ~Storage() = default;

    virtual bool save(const std::string& key, const std::string& content) = 0;
    virtual std::string path_for(const std::string& key) const = 0;
};

}  // namespace Storage
}  // namespace Webscout
