#include "format.hpp"

#include <Poco/NumberFormatter.h>
#include <Poco/URI.h>

std::string formatSize(std::uint64_t bytes) {
    const std::uint64_t KB = 1024;
    const std::uint64_t MB = 1024 * KB;
    const std::uint64_t GB = 1024 * MB;
    if (bytes >= GB) return Poco::NumberFormatter::format(static_cast<double>(bytes) / GB, 1) + " GB";
    if (bytes >= MB) return Poco::NumberFormatter::format(static_cast<double>(bytes) / MB, 1) + " MB";
    if (bytes >= KB) return Poco::NumberFormatter::format(static_cast<double>(bytes) / KB, 1) + " KB";
    return std::to_string(bytes) + " B";
}

std::string formatSpeed(std::uint64_t bytes, std::uint64_t elapsed_ms) {
    if (elapsed_ms == 0) return formatSize(bytes) + "/s";
    double per_second = static_cast<double>(bytes) / static_cast<double>(elapsed_ms) * 1000.0;
    return formatSize(static_cast<std::uint64_t>(per_second)) + "/s";
}

std::string encodePathSegment(const std::string& name) {
    std::string encoded;
    Poco::URI::encode(name, "!#$&'()*+,/:;=?@[]", encoded);
    return encoded;
}
