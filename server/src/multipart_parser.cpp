#include "multipart_parser.hpp"
#include "protocol.hpp"

#include <Poco/String.h>

#include <sstream>

namespace {
    const std::string CRLF = "\r\n";
    const std::string HEADER_END = "\r\n\r\n";
    const std::string FILENAME_ATTR = "filename=\"";

    bool starts_with(const std::string& s, std::size_t pos, const std::string& prefix) {
        return s.compare(pos, prefix.size(), prefix) == 0;
    }
}

std::vector<UploadedPart> MultipartParser::parse(const std::string& body, const std::string& boundary) const {
    std::vector<UploadedPart> parts;
    if (boundary.empty()) {
        return parts;
    }
    const std::string delimiter = "--" + boundary;

    // Offsets just past each delimiter occurrence.
    std::vector<std::size_t> starts;
    for (std::size_t pos = body.find(delimiter); pos != std::string::npos; pos = body.find(delimiter, pos + delimiter.size())) {
        starts.push_back(pos + delimiter.size());
    }

    for (std::size_t i = 0; i < starts.size(); ++i) {
        std::size_t begin = starts[i];
        std::size_t end = (i + 1 < starts.size()) ? starts[i + 1] - delimiter.size() : body.size();
        if (begin >= end) continue;

        if (starts_with(body, begin, CRLF)) begin += CRLF.size();
        if (starts_with(body, begin, "--")) continue; // closing delimiter

        std::size_t header_end = body.find(HEADER_END, begin);
        if (header_end == std::string::npos || header_end >= end) continue;

        std::string headers = body.substr(begin, header_end - begin);
        std::size_t data_begin = header_end + HEADER_END.size();
        std::size_t data_end = end;
        if (data_end - data_begin >= CRLF.size() && body.compare(data_end - CRLF.size(), CRLF.size(), CRLF) == 0) {
            data_end -= CRLF.size();
        }

        auto filename = filenameFrom(headers);
        if (!filename || filename->empty()) continue;

        parts.push_back(UploadedPart{*filename, body.substr(data_begin, data_end - data_begin)});
    }
    return parts;
}

std::optional<std::string> MultipartParser::filenameFrom(const std::string& headers) {
    std::istringstream lines(headers);
    std::string line;
    while (std::getline(lines, line)) {
        if (Poco::toLower(line).find("content-disposition") == std::string::npos) continue;

        std::size_t pos = line.find(FILENAME_ATTR);
        if (pos == std::string::npos) continue;
        std::size_t start = pos + FILENAME_ATTR.size();
        std::size_t close = line.find('"', start);
        if (close == std::string::npos) continue;

        std::string name = line.substr(start, close - start);
        std::size_t sep = name.find_last_of("/\\");
        return sep == std::string::npos ? name : name.substr(sep + 1);
    }
    return std::nullopt;
}

std::optional<std::string> MultipartParser::boundaryFrom(const std::string& content_type) {
    if (content_type.find(ContentTypes::MULTIPART_FORM_DATA) == std::string::npos) {
        return std::nullopt;
    }
    const std::string key = "boundary=";
    std::size_t pos = content_type.find(key);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string value = content_type.substr(pos + key.size());
    value = value.substr(0, value.find(';'));
    Poco::trimInPlace(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}
