#include "archive_builder.hpp"
#include "errors.hpp"

#include <Poco/Zip/Compress.h>
#include <Poco/Zip/ZipException.h>
#include <Poco/FileStream.h>
#include <Poco/File.h>
#include <Poco/DateTime.h>
#include <Poco/Path.h>
#include <Poco/StringTokenizer.h>
#include <Poco/Logger.h>

#include <sstream>
#include <utility>
#include <system_error>

namespace {
    Poco::Logger& logger() {
        return Poco::Logger::get("leak.Archive");
    }

    // Entry path built segment by segment so names such as "~" are taken literally.
    Poco::Path entry_path(const std::string& entry_name) {
        Poco::StringTokenizer segments(entry_name, "/", Poco::StringTokenizer::TOK_IGNORE_EMPTY);
        Poco::Path path(false);
        for (std::size_t i = 0; i + 1 < segments.count(); ++i) {
            path.pushDirectory(segments[i]);
        }
        if (segments.count() > 0) path.setFileName(segments[segments.count() - 1]);
        return path;
    }
}

ArchiveBuilder::ArchiveBuilder(const PathResolver& resolver) : resolver_(resolver) {}

std::string ArchiveBuilder::build(const std::vector<std::string>& selections) const {
    std::ostringstream out(std::ios::out | std::ios::binary);
    std::set<std::string> names;
    try {
        Poco::Zip::Compress zip(out, true);
        for (const auto& selection : selections) {
            SandboxedPath target = resolver_.root();
            try {
                target = resolver_.resolve(selection);
            } catch (const LeakException& e) {
                logger().information("Skipping selection " + selection + ": " + e.displayText());
                continue;
            }

            // Only a root of "/" has no file name.
            std::string name = target.filename();
            if (name.empty()) name = "root";

            std::error_code ec;
            if (fs::is_regular_file(target.path(), ec)) {
                add_file(zip, names, target, name);
            } else if (fs::is_directory(target.path(), ec)) {
                add_directory(zip, names, target, name);
            }
        }
        zip.close();
    } catch (const Poco::Exception& e) {
        logger().error("ZIP creation failed: " + e.displayText());
        throw InternalFailureException("ZIP creation failed", e.displayText());
    } catch (const std::ios_base::failure& e) {
        logger().error(std::string("ZIP creation failed: ") + e.what());
        throw InternalFailureException("ZIP creation failed", e.what());
    }
    return out.str();
}

void ArchiveBuilder::add_file(Poco::Zip::Compress& zip, std::set<std::string>& names, const SandboxedPath& file, const std::string& entry_name) const {
    if (!names.insert(entry_name).second) {
        logger().information("Skipping duplicate entry " + entry_name);
        return;
    }
    Poco::FileInputStream input;
    try {
        input.open(file.string(), std::ios::in | std::ios::binary);
    } catch (const Poco::Exception& e) {
        logger().warning("Skipping unreadable file " + file.string() + ": " + e.displayText());
        names.erase(entry_name);
        return;
    }
    // Compress checks the entry name before writing anything, so a rejected
    // entry leaves the archive intact.
    try {
        Poco::DateTime modified(Poco::File(file.string()).getLastModified());
        zip.addFile(input, modified, entry_path(entry_name));
    } catch (const Poco::Exception& e) {
        logger().warning("Skipping entry " + entry_name + ": " + e.displayText());
        names.erase(entry_name);
    }
}

void ArchiveBuilder::add_directory(Poco::Zip::Compress& zip, std::set<std::string>& names, const SandboxedPath& dir, const std::string& prefix) const {
    // Explicit work-list instead of recursion so deep trees cannot exhaust the stack.
    std::vector<std::pair<SandboxedPath, std::string>> pending;
    std::set<fs::path> visited;
    pending.emplace_back(dir, prefix);

    while (!pending.empty()) {
        auto [current, current_prefix] = std::move(pending.back());
        pending.pop_back();
        if (!visited.insert(current.path()).second) continue; // symlink cycle

        std::error_code ec;
        fs::directory_iterator it(current.path(), ec);
        if (ec) {
            logger().warning("Cannot read directory " + current.string() + ": " + ec.message());
            continue;
        }
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) break;
            std::string name = it->path().filename().string();
            if (name.empty() || name[0] == '.') continue;

            auto entry = resolver_.revalidate(it->path());
            if (!entry) {
                logger().information("Skipping entry outside root: " + it->path().string());
                continue;
            }
            std::string entry_name = current_prefix.empty() ? name : current_prefix + "/" + name;

            std::error_code type_ec;
            if (fs::is_regular_file(entry->path(), type_ec)) {
                add_file(zip, names, *entry, entry_name);
            } else if (fs::is_directory(entry->path(), type_ec)) {
                pending.emplace_back(*entry, entry_name);
            }
        }
    }
}
