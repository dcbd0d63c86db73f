#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

namespace Webscout {
namespace Engine {

// Dedup ledger keyed by normalized URL. Exact, so no novel URL is ever lost.
class VisitedSet {
public:
    // True exactly once per key over the lifetime of the set.
    bool try_claim(const std::string& key);

    std::size_t size() const;

private:
    mutable std::mutex              mutex_;
    std::unordered_set<std::string> claimed_;
};

}  // namespace Engine
}  // namespace Webscout
