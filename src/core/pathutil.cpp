#include "core/pathutil.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <pwd.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace cleanbook::core {

namespace {

    int64_t mtimeNs(const struct stat& st) {
        return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
               static_cast<int64_t>(st.st_mtim.tv_nsec);
    }

    fs::path normalized(const fs::path& path) {
        fs::path result = path.lexically_normal();
        // "/a/b/" normalises to "/a/b/" with an empty filename
        if (!result.has_filename() && result.has_parent_path() &&
            result != result.root_path()) {
            result = result.parent_path();
        }
        return result;
    }

    std::string errnoMessage(const char* what) {
        return std::string(what) + ": " + std::strerror(errno);
    }
}

fs::path PathUtil::homeDirectory() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home);
    }
    if (const struct passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return fs::path(pw->pw_dir);
    }
    return fs::path("/");
}

fs::path PathUtil::expandUser(const fs::path& path) {
    const std::string raw = path.string();
    if (raw.empty() || raw[0] != '~') {
        return path;
    }
    if (raw.size() == 1) {
        return homeDirectory();
    }
    if (raw[1] == '/') {
        return homeDirectory() / raw.substr(2);
    }
    // "~user" forms are left alone
    return path;
}

std::optional<fs::path> PathUtil::resolve(const fs::path& path, std::error_code& ec) {
    ec.clear();
    fs::path resolved = fs::canonical(expandUser(path), ec);
    if (ec) {
        return std::nullopt;
    }
    return resolved;
}

fs::path PathUtil::resolveLenient(const fs::path& path) {
    std::error_code ec;
    fs::path expanded = expandUser(path);
    fs::path resolved = fs::weakly_canonical(expanded, ec);
    if (ec) {
        return normalized(fs::absolute(expanded, ec));
    }
    return normalized(resolved);
}

bool PathUtil::isWithin(const fs::path& candidate, const fs::path& base) {
    const fs::path c = normalized(candidate);
    const fs::path b = normalized(base);

    auto cit = c.begin();
    for (auto bit = b.begin(); bit != b.end(); ++bit, ++cit) {
        if (cit == c.end() || *cit != *bit) {
            return false;
        }
    }
    return true;
}

size_t PathUtil::componentCount(const fs::path& path) {
    const fs::path p = normalized(path);
    size_t count = 0;
    for (const auto& part : p) {
        if (!part.empty()) {
            ++count;
        }
    }
    return count;
}

TreeMeasurement PathUtil::measureTree(const fs::path& path) {
    TreeMeasurement result;

    struct stat st;
    if (lstat(path.c_str(), &st) == -1) {
        result.errors.push_back({path, errnoMessage("lstat failed")});
        return result;
    }

    result.entryCount = 1;
    result.newestMtimeNs = mtimeNs(st);

    if (S_ISREG(st.st_mode)) {
        result.totalBytes = static_cast<uint64_t>(st.st_size);
        return result;
    }
    if (!S_ISDIR(st.st_mode)) {
        return result;
    }

    std::vector<fs::path> pending{path};
    while (!pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            result.errors.push_back({dir, ec.message()});
            continue;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            const fs::path& entry = it->path();
            struct stat est;
            if (lstat(entry.c_str(), &est) == -1) {
                result.errors.push_back({entry, errnoMessage("lstat failed")});
                continue;
            }

            ++result.entryCount;
            result.newestMtimeNs = std::max(result.newestMtimeNs, mtimeNs(est));

            if (S_ISREG(est.st_mode)) {
                result.totalBytes += static_cast<uint64_t>(est.st_size);
            } else if (S_ISDIR(est.st_mode)) {
                pending.push_back(entry);
            }
        }
        if (ec) {
            result.errors.push_back({dir, ec.message()});
        }
    }

    return result;
}

} // namespace cleanbook::core
