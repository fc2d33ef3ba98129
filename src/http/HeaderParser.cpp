#include "http/HeaderParser.hpp"
#include "http/PercentDecode.hpp"
#include "http/StringUtils.hpp"

namespace formdrop {
namespace http {

namespace {

std::vector<std::string> splitOutsideQuotes(const std::string& value, char delimiter) {
    std::vector<std::string> segments;
    std::string current;
    bool inQuotes = false;

    for (char c : value) {
        if (c == '"') {
            inQuotes = !inQuotes;
        }
        if (c == delimiter && !inQuotes) {
            segments.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    segments.push_back(current);
    return segments;
}

} // namespace

PartHeaders HeaderParser::parseHeaders(const std::string& headerBlock) {
    PartHeaders headers;

    size_t pos = 0;
    while (pos < headerBlock.size()) {
        size_t eol = headerBlock.find("\r\n", pos);
        std::string line = (eol == std::string::npos)
            ? headerBlock.substr(pos)
            : headerBlock.substr(pos, eol - pos);
        pos = (eol == std::string::npos) ? headerBlock.size() : eol + 2;

        auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        trim(name);
        trim(value);
        toLower(name);
        if (name.empty()) continue;

        headers.emplace(name, value);
    }

    return headers;
}

std::vector<HeaderParam> HeaderParser::parseParams(const std::string& value, std::string& token) {
    std::vector<HeaderParam> params;
    std::vector<std::string> segments = splitOutsideQuotes(value, ';');

    token = segments.front();
    trim(token);

    for (size_t i = 1; i < segments.size(); ++i) {
        std::string segment = segments[i];
        trim(segment);
        if (segment.empty()) continue;

        HeaderParam param;
        auto eq = segment.find('=');
        if (eq == std::string::npos) {
            param.key = segment;
        } else {
            param.key = segment.substr(0, eq);
            param.value = segment.substr(eq + 1);
        }
        trim(param.key);
        trim(param.value);
        toLower(param.key);

        // A quoted value ends at the first closing quote; text after it is dropped
        if (!param.value.empty() && param.value.front() == '"') {
            size_t close = param.value.find('"', 1);
            if (close != std::string::npos) {
                param.value = param.value.substr(1, close - 1);
                param.quoted = true;
            }
        }
        params.push_back(param);
    }

    return params;
}

Disposition HeaderParser::parseDisposition(const std::string& headerBlock, const std::string& expectedField) {
    Disposition disposition;

    PartHeaders headers = parseHeaders(headerBlock);
    auto it = headers.find("content-disposition");
    if (it == headers.end()) {
        return disposition;
    }

    std::string type;
    std::vector<HeaderParam> params = parseParams(it->second, type);
    if (!iequals(type, "form-data") || params.empty()) {
        return disposition;
    }

    const HeaderParam& name = params[0];
    if (name.key != "name" || !name.quoted) {
        return disposition;
    }
    disposition.fieldName = name.value;

    if (params.size() < 2 || !iequals(name.value, expectedField)) {
        return disposition;
    }

    const HeaderParam& filename = params[1];
    if (filename.key == "filename" && filename.quoted && !filename.value.empty()) {
        disposition.filename = percentDecode(filename.value);
    }

    return disposition;
}

} // namespace http
} // namespace formdrop
