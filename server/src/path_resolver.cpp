#include "path_resolver.hpp"
#include "errors.hpp"

#include <Poco/URI.h>
#include <Poco/Logger.h>

#include <iterator>
#include <system_error>

namespace {
    fs::path canonical_root(const fs::path& root) {
        std::error_code ec;
        fs::path canonical = fs::canonical(root, ec);
        if (ec || !fs::is_directory(canonical, ec)) {
            throw ResourceNotFoundException("Root directory not found", root.string());
        }
        return canonical;
    }

    std::string strip_leading_slashes(const std::string& s) {
        std::size_t pos = s.find_first_not_of('/');
        return pos == std::string::npos ? std::string() : s.substr(pos);
    }
}

PathResolver::PathResolver(const fs::path& root) : root_(canonical_root(root)) {}

bool PathResolver::isWithin(const fs::path& base, const fs::path& candidate) {
    auto base_it = base.begin();
    auto cand_it = candidate.begin();
    for (; base_it != base.end(); ++base_it, ++cand_it) {
        // A trailing separator shows up as an empty final element; it adds nothing.
        if (base_it->empty() && std::next(base_it) == base.end()) break;
        if (cand_it == candidate.end() || *cand_it != *base_it) return false;
    }
    return true;
}

std::string PathResolver::decode(const std::string& request_path) {
    std::string raw = request_path.substr(0, request_path.find_first_of("?#"));
    std::string decoded;
    try {
        Poco::URI::decode(strip_leading_slashes(raw), decoded);
    } catch (const Poco::SyntaxException&) {
        throw ResourceNotFoundException("Malformed percent-encoding", request_path);
    }
    if (decoded.find('\0') != std::string::npos) {
        throw ResourceNotFoundException("Embedded NUL in path", request_path);
    }
    return strip_leading_slashes(decoded);
}

SandboxedPath PathResolver::resolve(const std::string& request_path) const {
    std::string decoded = decode(request_path);
    if (decoded.empty()) {
        return root_;
    }

    // Reject lexical escapes before any filesystem call is made for them.
    fs::path joined = (root_.path() / decoded).lexically_normal();
    if (!isWithin(root_.path(), joined)) {
        throw PathEscapeException(request_path);
    }

    std::error_code ec;
    fs::path canonical = fs::canonical(joined, ec);
    if (ec) {
        throw ResourceNotFoundException(request_path);
    }
    if (!isWithin(root_.path(), canonical)) {
        Poco::Logger::get("leak.PathResolver").warning("Symlink escape rejected: " + request_path + " -> " + canonical.string());
        throw PathEscapeException(request_path);
    }
    return SandboxedPath(canonical);
}

std::optional<SandboxedPath> PathResolver::revalidate(const fs::path& candidate) const {
    std::error_code ec;
    fs::path canonical = fs::canonical(candidate, ec);
    if (ec || !isWithin(root_.path(), canonical)) {
        return std::nullopt;
    }
    return SandboxedPath(canonical);
}

SandboxedPath PathResolver::child(const SandboxedPath& dir, const std::string& name) const {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos || name.find('\0') != std::string::npos) {
        throw BadRequestException("Invalid file name", name);
    }
    auto parent = revalidate(dir.path());
    if (!parent) {
        throw PathEscapeException(dir.string());
    }
    fs::path destination = parent->path() / name;
    std::error_code ec;
    if (fs::is_symlink(fs::symlink_status(destination, ec)) && !revalidate(destination)) {
        throw PathEscapeException(destination.string());
    }
    return SandboxedPath(destination);
}
