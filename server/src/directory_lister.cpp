#include "directory_lister.hpp"

#include <Poco/String.h>
#include <Poco/Logger.h>

#include <algorithm>
#include <chrono>
#include <system_error>

namespace {
    std::uint64_t seconds_since(const fs::file_time_type& ftime) {
        auto age = std::chrono::duration_cast<std::chrono::seconds>(fs::file_time_type::clock::now() - ftime);
        return age.count() > 0 ? static_cast<std::uint64_t>(age.count()) : 0;
    }

    bool listing_order(const DirectoryEntry& a, const DirectoryEntry& b) {
        if (a.is_directory() != b.is_directory()) {
            return a.is_directory();
        }
        int c = Poco::icompare(a.name, b.name);
        if (c != 0) return c < 0;
        return a.name < b.name;
    }
}

std::vector<DirectoryEntry> DirectoryLister::list(const SandboxedPath& dir) const {
    std::vector<DirectoryEntry> result;
    std::error_code ec;
    fs::directory_iterator it(dir.path(), ec);
    if (ec) {
        Poco::Logger::get("leak.Lister").warning("Cannot list " + dir.string() + ": " + ec.message());
        return result;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        const fs::directory_entry& entry = *it;
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;

        DirectoryEntry info{name, DirectoryEntry::Kind::File, 0, 0};
        std::error_code meta_ec;
        if (entry.is_directory(meta_ec)) {
            info.kind = DirectoryEntry::Kind::Directory;
        } else {
            std::uintmax_t size = entry.file_size(meta_ec);
            if (!meta_ec) info.size = size;
        }
        meta_ec.clear();
        auto ftime = entry.last_write_time(meta_ec);
        if (!meta_ec) info.age_seconds = seconds_since(ftime);

        result.push_back(std::move(info));
    }

    std::sort(result.begin(), result.end(), listing_order);
    return result;
}
