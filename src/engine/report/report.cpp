#include "report.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"

namespace Webscout {
namespace Engine {

nlohmann::json Report::build(const ResultSnapshot& snapshot,
                             const StatsSnapshot&  stats,
                             const std::string&    seed,
                             int                   max_depth) {
    // std::set iteration is already sorted.
    nlohmann::json report;
    report["target"]            = seed;
    report["html_pages"]        = snapshot.html_pages;
    report["backend_endpoints"] = snapshot.backend_endpoints;
    report["functions"]         = snapshot.functions;
    report["stats"]             = {
        {"total_html", snapshot.html_pages.size()},
        {"total_backend", snapshot.backend_endpoints.size()},
        {"total_functions", snapshot.functions.size()},
        {"max_depth", max_depth},
        {"fetched", stats.fetched},
        {"failed", stats.failed},
        {"depth_limited", stats.depth_limited},
    };
    return report;
}

std::string Report::file_name(const std::string& seed) {
    return Utils::Url::to_report_name(seed) + Core::Constants::REPORT_SUFFIX;
}

}  // namespace Engine
}  // namespace Webscout
