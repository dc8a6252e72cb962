#include "scan/whitelist.hpp"
#include "core/pathutil.hpp"

namespace cleanbook::scan {

using core::PathUtil;

Whitelist::Whitelist(const std::vector<fs::path>& sanctuaries) {
    sanctuaries_.reserve(sanctuaries.size());
    for (const auto& sanctuary : sanctuaries) {
        sanctuaries_.push_back(PathUtil::resolveLenient(sanctuary));
    }
}

bool Whitelist::isWhitelisted(const fs::path& path) const {
    std::error_code ec;
    auto resolved = PathUtil::resolve(path, ec);
    if (!resolved) {
        // Unresolvable paths are never scanned
        return true;
    }

    for (const auto& sanctuary : sanctuaries_) {
        if (PathUtil::isWithin(*resolved, sanctuary)) {
            return true;
        }
    }
    return false;
}

} // namespace cleanbook::scan
