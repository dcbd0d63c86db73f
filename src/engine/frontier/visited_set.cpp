#include "visited_set.hpp"

namespace Webscout {
namespace Engine {

bool VisitedSet::try_claim(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.insert(key).second;
}

std::size_t VisitedSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.size();
}

}  // namespace Engine
}  // namespace Webscout
