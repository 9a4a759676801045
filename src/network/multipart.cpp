#include "vidup/network/multipart.hpp"

#include <strings.h>

namespace vidup {
namespace network {

namespace {

constexpr size_t kMaxBoundaryLength = 70;

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && strncasecmp(a.data(), b.data(), a.size()) == 0;
}

bool istarts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}

} // namespace

std::optional<std::string> MultipartParser::header_parameter(std::string_view value, const std::string& key) {
    size_t pos = value.find(';');
    while (pos != std::string_view::npos) {
        ++pos;
        const size_t eq = value.find('=', pos);
        if (eq == std::string_view::npos) {
            return std::nullopt;
        }
        const std::string_view param = trim(value.substr(pos, eq - pos));

        size_t cursor = eq + 1;
        std::string param_value;
        if (cursor < value.size() && value[cursor] == '"') {
            ++cursor;
            while (cursor < value.size() && value[cursor] != '"') {
                if (value[cursor] == '\\' && cursor + 1 < value.size()) {
                    ++cursor;
                }
                param_value += value[cursor++];
            }
            ++cursor;
        } else {
            const size_t end = value.find(';', cursor);
            param_value = std::string(trim(value.substr(cursor, end == std::string_view::npos
                                                                    ? std::string_view::npos
                                                                    : end - cursor)));
            cursor = end == std::string_view::npos ? value.size() : end;
        }

        if (iequals(param, key)) {
            return param_value;
        }
        pos = cursor < value.size() ? value.find(';', cursor) : std::string_view::npos;
    }
    return std::nullopt;
}

Result<std::string> MultipartParser::extract_boundary(const std::string& content_type) {
    if (!istarts_with(trim(content_type), "multipart/form-data")) {
        return Err<std::string, std::string>("Expected multipart/form-data, got '" + content_type + "'");
    }

    auto boundary = header_parameter(content_type, "boundary");
    if (!boundary || boundary->empty()) {
        return Err<std::string, std::string>("Missing multipart boundary");
    }
    if (boundary->size() > kMaxBoundaryLength) {
        return Err<std::string, std::string>("Multipart boundary longer than 70 characters");
    }
    return Ok(*boundary);
}

Result<MultipartForm> MultipartParser::parse(const std::vector<uint8_t>& body, const std::string& content_type) {
    auto boundary = extract_boundary(content_type);
    if (boundary.is_error()) {
        return Fail(boundary.error());
    }
    const std::string_view view(reinterpret_cast<const char*>(body.data()), body.size());
    return parse_with_boundary(view, boundary.value());
}

Result<MultipartForm> MultipartParser::parse_with_boundary(std::string_view body, const std::string& boundary) {
    const std::string delimiter = "--" + boundary;
    const std::string next_delimiter = "\r\n" + delimiter;

    size_t pos = body.find(delimiter);
    if (pos == std::string_view::npos) {
        return Err<MultipartForm, std::string>("Multipart boundary not found in body");
    }
    pos += delimiter.size();

    MultipartForm form;
    while (true) {
        if (body.substr(pos, 2) == "--") {
            return Ok(std::move(form));
        }

        // Transport padding may follow the delimiter
        while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t')) {
            ++pos;
        }
        if (body.substr(pos, 2) != "\r\n") {
            return Err<MultipartForm, std::string>("Malformed multipart delimiter line");
        }
        pos += 2;

        // Searching from the delimiter's CRLF also finds an empty header block
        const size_t headers_end = body.find("\r\n\r\n", pos - 2);
        if (headers_end == std::string_view::npos) {
            return Err<MultipartForm, std::string>("Unterminated multipart part headers");
        }
        const std::string_view header_block =
            headers_end > pos ? body.substr(pos, headers_end - pos) : std::string_view{};

        auto headers = parse_part_headers(header_block);
        if (headers.is_error()) {
            return Fail(headers.error());
        }

        const size_t content_start = headers_end + 4;
        const size_t content_end = body.find(next_delimiter, content_start);
        if (content_end == std::string_view::npos) {
            return Err<MultipartForm, std::string>("Missing closing multipart boundary");
        }
        const std::string_view content = body.substr(content_start, content_end - content_start);

        auto& part = headers.value();
        if (part.filename) {
            FilePart file;
            file.field_name = part.name;
            file.filename = *part.filename;
            file.content_type = part.content_type.empty() ? "application/octet-stream" : part.content_type;
            file.data = reinterpret_cast<const uint8_t*>(content.data());
            file.size = content.size();
            form.files[part.name] = std::move(file);
        } else {
            form.fields[part.name] = std::string(content);
        }

        pos = content_end + next_delimiter.size();
    }
}

Result<MultipartParser::PartHeaders> MultipartParser::parse_part_headers(std::string_view block) {
    PartHeaders headers;
    bool has_disposition = false;

    size_t pos = 0;
    while (pos < block.size()) {
        size_t eol = block.find("\r\n", pos);
        if (eol == std::string_view::npos) {
            eol = block.size();
        }
        const std::string_view line = block.substr(pos, eol - pos);
        pos = eol + 2;

        const size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            return Err<PartHeaders, std::string>("Malformed part header: " + std::string(line));
        }
        const std::string_view name = trim(line.substr(0, colon));
        const std::string_view value = trim(line.substr(colon + 1));

        if (iequals(name, "Content-Disposition")) {
            if (!istarts_with(value, "form-data")) {
                return Err<PartHeaders, std::string>("Part is not form-data: " + std::string(value));
            }
            auto field_name = header_parameter(value, "name");
            if (!field_name || field_name->empty()) {
                return Err<PartHeaders, std::string>("Part without a field name");
            }
            headers.name = *field_name;
            headers.filename = header_parameter(value, "filename");
            has_disposition = true;
        } else if (iequals(name, "Content-Type")) {
            headers.content_type = std::string(value);
        }
    }

    if (!has_disposition) {
        return Err<PartHeaders, std::string>("Part without Content-Disposition");
    }
    return Ok(std::move(headers));
}

} // namespace network
} // namespace vidup
