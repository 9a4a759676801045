#include "vidup/server/upload_routes.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <string>

namespace vidup::server {

using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;
using json = nlohmann::json;

namespace {

constexpr const char* kChunkField = "chunk";

HttpResponse make_error(HttpStatus status, const std::string& message) {
    return make_json_response(status, json{{"error", message}});
}

HttpResponse make_upload_error(const UploadError& error) {
    return make_json_response(status_for(error.kind),
                              json{{"error", error.message}, {"kind", to_string(error.kind)}});
}

template<typename T>
Result<T> parse_unsigned(const network::MultipartForm& form, const std::string& name) {
    auto raw = form.field(name);
    if (!raw) {
        return Err<T, std::string>("Missing field: " + name);
    }
    T value{};
    const char* first = raw->data();
    const char* last = first + raw->size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (raw->empty() || ec != std::errc() || ptr != last) {
        return Err<T, std::string>("Field " + name + " must be a non-negative integer, got '" + *raw + "'");
    }
    return Ok(value);
}

// Percentage with two decimals
double progress_percent(std::size_t received, std::uint32_t total) {
    if (total == 0) {
        return 0.0;
    }
    return std::round(static_cast<double>(received) * 10000.0 / total) / 100.0;
}

json session_to_json(const upload::UploadSessionInfo& info) {
    json j;
    j["upload_id"] = info.descriptor.session_id;
    j["filename"] = info.descriptor.filename;
    j["total_chunks"] = info.descriptor.total_chunks;
    j["total_size"] = info.descriptor.total_size;
    j["received"] = info.received.size();
    j["received_indices"] = info.received;
    j["state"] = upload::to_string(info.state);
    j["progress"] = progress_percent(info.received.size(), info.descriptor.total_chunks);
    return j;
}

} // namespace

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpStatus status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return HttpStatus::BAD_REQUEST;
        case ErrorKind::PayloadTooLarge: return HttpStatus::PAYLOAD_TOO_LARGE;
        case ErrorKind::ChunkWrite:
        case ErrorKind::MissingChunk:
        case ErrorKind::SizeMismatch:
        case ErrorKind::Finalize: return HttpStatus::INTERNAL_SERVER_ERROR;
        case ErrorKind::Cancelled: return HttpStatus::SERVICE_UNAVAILABLE;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

Result<upload::ChunkRequest> parse_chunk_request(const network::MultipartForm& form) {
    upload::ChunkRequest request;

    auto upload_id = form.field("upload_id");
    if (!upload_id || upload_id->empty()) {
        return Err<upload::ChunkRequest, std::string>("Missing field: upload_id");
    }
    request.descriptor.session_id = *upload_id;

    auto filename = form.field("filename");
    if (!filename || filename->empty()) {
        return Err<upload::ChunkRequest, std::string>("Missing field: filename");
    }
    request.descriptor.filename = *filename;

    auto chunk_index = parse_unsigned<std::uint32_t>(form, "chunk_index");
    if (chunk_index.is_error()) {
        return Fail(chunk_index.error());
    }
    auto total_chunks = parse_unsigned<std::uint32_t>(form, "total_chunks");
    if (total_chunks.is_error()) {
        return Fail(total_chunks.error());
    }
    auto total_size = parse_unsigned<std::uint64_t>(form, "total_size");
    if (total_size.is_error()) {
        return Fail(total_size.error());
    }

    if (total_chunks.value() == 0) {
        return Err<upload::ChunkRequest, std::string>("total_chunks must be at least 1");
    }
    if (chunk_index.value() >= total_chunks.value()) {
        return Err<upload::ChunkRequest, std::string>(
            "chunk_index " + std::to_string(chunk_index.value()) + " out of range for " +
            std::to_string(total_chunks.value()) + " chunks");
    }

    request.chunk_index = chunk_index.value();
    request.descriptor.total_chunks = total_chunks.value();
    request.descriptor.total_size = total_size.value();
    return Ok(request);
}

json outcome_to_json(const upload::SessionDescriptor& descriptor, const upload::ChunkOutcome& outcome) {
    json j;
    j["status"] = upload::to_string(outcome.status);
    j["upload_id"] = descriptor.session_id;

    if (outcome.status == upload::ChunkStatus::Complete && outcome.final_path) {
        j["filename"] = descriptor.filename;
        j["stored_as"] = outcome.final_path->filename().string();
        j["size"] = outcome.final_size;
        return j;
    }

    j["received"] = outcome.received;
    j["total_chunks"] = outcome.total_chunks;
    j["progress"] = progress_percent(outcome.received, outcome.total_chunks);
    return j;
}

void register_upload_routes(network::HttpRouter& router,
                            upload::UploadService& service,
                            const events::MetricsComponent* metrics) {
    router.post("/upload_chunk", [&service](const HttpContext& ctx) {
        auto form = network::MultipartParser::parse(ctx.request.body, ctx.request.get_header("Content-Type"));
        if (form.is_error()) {
            return make_error(HttpStatus::BAD_REQUEST, form.error());
        }

        auto request = parse_chunk_request(form.value());
        if (request.is_error()) {
            return make_error(HttpStatus::BAD_REQUEST, request.error());
        }

        const network::FilePart* chunk = form.value().file(kChunkField);
        if (chunk == nullptr) {
            return make_error(HttpStatus::BAD_REQUEST, "Missing file part: chunk");
        }

        upload::MemorySource payload(chunk->data, chunk->size);
        auto outcome = service.handle_chunk(request.value(), payload, ctx.request.cancellation_token());
        if (outcome.is_error()) {
            return make_upload_error(outcome.error());
        }
        return make_json_response(HttpStatus::OK,
                                  outcome_to_json(request.value().descriptor, outcome.value()));
    });

    router.get("/api/uploads/:id", [&service](const HttpContext& ctx) {
        const auto upload_id = ctx.get_param("id");
        auto info = service.session_info(upload_id);
        if (!info) {
            return make_error(HttpStatus::NOT_FOUND, "No active upload " + upload_id);
        }
        return make_json_response(HttpStatus::OK, session_to_json(*info));
    });

    router.get("/healthz", [&service, metrics](const HttpContext&) {
        json body;
        body["status"] = "ok";
        body["active_sessions"] = service.active_sessions();
        body["max_concurrent_chunks"] = service.config().max_concurrent_chunks;
        if (metrics != nullptr) {
            const auto& stats = metrics->get_stats();
            body["uploads_completed"] = stats.uploads_completed.load();
            body["uploads_failed"] = stats.uploads_failed.load();
            body["bytes_received"] = stats.bytes_received.load();
        }
        return make_json_response(HttpStatus::OK, body);
    });

    spdlog::debug("Registered {} upload routes", router.route_count());
}

} // namespace vidup::server
