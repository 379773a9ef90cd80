#pragma once

#include <string>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

class PathResolver;

// An absolute, canonical location that lies inside the served root.
// Only PathResolver can make one, so holding a SandboxedPath is proof that
// the location was checked.
class SandboxedPath {
public:
    const fs::path& path() const { return path_; }
    std::string string() const { return path_.string(); }
    std::string filename() const { return path_.filename().string(); }

    bool operator==(const SandboxedPath& other) const { return path_ == other.path_; }
    bool operator!=(const SandboxedPath& other) const { return path_ != other.path_; }

private:
    friend class PathResolver;
    explicit SandboxedPath(fs::path p) : path_(std::move(p)) {}

    fs::path path_;
};


class PathResolver {
public:
    // Throws ResourceNotFoundException if root does not exist or is not a directory.
    explicit PathResolver(const fs::path& root);

    const SandboxedPath& root() const { return root_; }

    /**
     * @brief Maps a request path (e.g. "/docs/My%20File.txt") to a location inside root.
     * The path is percent-decoded, joined under root and canonicalized (symlinks and ".."
     * resolved). An empty path is root itself.
     * @throws PathEscapeException if the result lies outside root.
     * @throws ResourceNotFoundException if the location does not exist or cannot be decoded.
     */
    SandboxedPath resolve(const std::string& request_path) const;

    // Canonicalizes a filesystem path that was built from a SandboxedPath (a directory
    // entry found while walking) and checks it again. Empty if it vanished or now
    // points outside root.
    std::optional<SandboxedPath> revalidate(const fs::path& candidate) const;

    /**
     * @brief Destination for a new file called @p name inside @p dir.
     * The file itself need not exist. @p dir is canonicalized again so a directory
     * swapped for a symlink since it was resolved is caught here.
     * @throws BadRequestException if name is empty, ".", ".." or has a separator.
     * @throws PathEscapeException if dir no longer lies inside root, or the name is
     *         an existing symlink that leads out of it.
     */
    SandboxedPath child(const SandboxedPath& dir, const std::string& name) const;

    // True if candidate is base or a descendant of base, compared component by
    // component. Both paths must already be canonical.
    static bool isWithin(const fs::path& base, const fs::path& candidate);

private:
    SandboxedPath root_;

    static std::string decode(const std::string& request_path);
};
