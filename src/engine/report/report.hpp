#pragma once
#include <nlohmann/json.hpp>
#include <string>

#include "../results/result_set.hpp"

namespace Webscout {
namespace Engine {

class Report {
public:
    static nlohmann::json build(const ResultSnapshot& snapshot,
                                const StatsSnapshot&  stats,
                                const std::string&    seed,
                                int                   max_depth);

    // `<host>[_port]_security_scan.json` for the seed's authority.
    static std::string file_name(const std::string& seed);
};

}  // namespace Engine
}  // namespace Webscout
