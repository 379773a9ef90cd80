#pragma once

#include <string>
#include <cstdint>

// Human-readable byte count: "512 B", "1.5 KB", "12.0 MB", "2.3 GB".
std::string formatSize(std::uint64_t bytes);

// Transfer rate for log lines, e.g. "4.2 MB/s".
std::string formatSpeed(std::uint64_t bytes, std::uint64_t elapsed_ms);

// Percent-encodes everything except A-Z a-z 0-9 - _ . ~ so a file name can be
// placed into a URL path as a single segment.
std::string encodePathSegment(const std::string& name);
