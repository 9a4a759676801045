#pragma once

#include "vidup/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vidup {
namespace network {

/**
 * @brief A file part of a multipart/form-data body
 *
 * `data` points into the request body the form was parsed from; the body
 * must outlive the part.
 */
struct FilePart {
    std::string field_name;
    std::string filename;
    std::string content_type;
    const uint8_t* data = nullptr;
    size_t size = 0;
};

struct MultipartForm {
    std::map<std::string, std::string> fields;   // Plain text parts, later duplicates win
    std::map<std::string, FilePart> files;       // Keyed by field name

    std::optional<std::string> field(const std::string& name) const {
        auto it = fields.find(name);
        if (it == fields.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    const FilePart* file(const std::string& name) const {
        auto it = files.find(name);
        return it == files.end() ? nullptr : &it->second;
    }
};

/**
 * @brief RFC 7578 multipart/form-data parser over a fully buffered body
 *
 * File contents are not copied. A part is a file part when its
 * Content-Disposition carries a filename parameter.
 */
class MultipartParser {
public:
    /**
     * @brief Boundary parameter of a multipart/form-data Content-Type
     *
     * Accepts quoted and unquoted values; fails for other media types.
     */
    static Result<std::string> extract_boundary(const std::string& content_type);

    static Result<MultipartForm> parse(const std::vector<uint8_t>& body, const std::string& content_type);

    static Result<MultipartForm> parse_with_boundary(std::string_view body, const std::string& boundary);

private:
    struct PartHeaders {
        std::string name;
        std::optional<std::string> filename;
        std::string content_type;
    };

    static Result<PartHeaders> parse_part_headers(std::string_view block);
    static std::optional<std::string> header_parameter(std::string_view header_value, const std::string& key);
};

} // namespace network
} // namespace vidup
