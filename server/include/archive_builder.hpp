#pragma once

#include "path_resolver.hpp"

#include <string>
#include <vector>
#include <set>
#include <ostream>

namespace Poco { namespace Zip { class Compress; } }

// Builds a ZIP archive in memory from request-relative selections. Files are stored
// under their base name, directories are flattened as "dir/sub/file". Selections that
// do not resolve inside root are skipped; the rest of the archive is still built.
class ArchiveBuilder {
public:
    explicit ArchiveBuilder(const PathResolver& resolver);

    /**
     * @brief Archive bytes for the given selections (DEFLATE compressed).
     * @param selections Request paths such as "/docs/report.pdf" or "/photos/".
     * @throws InternalFailureException if the archive could not be written.
     */
    std::string build(const std::vector<std::string>& selections) const;

private:
    const PathResolver& resolver_;

    void add_file(Poco::Zip::Compress& zip, std::set<std::string>& names, const SandboxedPath& file, const std::string& entry_name) const;
    void add_directory(Poco::Zip::Compress& zip, std::set<std::string>& names, const SandboxedPath& dir, const std::string& prefix) const;
};
