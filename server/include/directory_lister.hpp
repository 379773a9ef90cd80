#pragma once

#include "path_resolver.hpp"

#include <string>
#include <vector>
#include <cstdint>

struct DirectoryEntry {
    enum class Kind { File, Directory };

    std::string name;
    Kind kind;
    std::uintmax_t size;       // 0 for directories
    std::uint64_t age_seconds; // time since last modification

    bool is_directory() const { return kind == Kind::Directory; }
};


class DirectoryLister {
public:
    // Visible entries of dir (names starting with '.' are left out), directories
    // first, then by name ignoring case. Metadata that cannot be read is reported
    // as zero instead of failing the listing.
    std::vector<DirectoryEntry> list(const SandboxedPath& dir) const;
};
