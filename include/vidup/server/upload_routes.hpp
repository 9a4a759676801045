#pragma once

#include "vidup/core/error.hpp"
#include "vidup/core/result.hpp"
#include "vidup/events/components.hpp"
#include "vidup/network/http_router.hpp"
#include "vidup/network/multipart.hpp"
#include "vidup/upload/service.hpp"
#include "vidup/upload/types.hpp"

#include <nlohmann/json.hpp>

namespace vidup::server {

/**
 * @brief Register the upload API on a router
 *
 *   POST /upload_chunk       multipart chunk ingestion
 *   GET  /api/uploads/:id    state of an active session
 *   GET  /healthz            liveness plus counters
 *
 * `service` and `metrics` must outlive the router. `metrics` may be null.
 */
void register_upload_routes(network::HttpRouter& router,
                            upload::UploadService& service,
                            const events::MetricsComponent* metrics = nullptr);

/**
 * @brief Read upload_id, chunk_index, total_chunks, filename and total_size
 *
 * Numbers must be plain non-negative decimal integers that fit their type;
 * "12abc", "-1" and "" are rejected.
 */
Result<upload::ChunkRequest> parse_chunk_request(const network::MultipartForm& form);

network::HttpStatus status_for(ErrorKind kind);

network::HttpResponse make_json_response(network::HttpStatus status, const nlohmann::json& body);

/**
 * @brief Response body for a handled chunk
 *
 * in_progress/finalizing: upload_id, received, total_chunks, progress
 * complete: upload_id, filename (as sent by the client), stored_as, size
 */
nlohmann::json outcome_to_json(const upload::SessionDescriptor& descriptor, const upload::ChunkOutcome& outcome);

} // namespace vidup::server
