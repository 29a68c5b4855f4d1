#pragma once

#include <taskd/task_service.hpp>

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>

#include <string>

namespace taskd::server {

/**
 * Create an error response from a service status.
 *
 * InvalidArgument -> 400 and NotFound -> 404, both carrying the status
 * message as {"error": ...}. Anything else -> 500 with context as the
 * message; the full status is logged.
 */
drogon::HttpResponsePtr MakeErrorResponse(const rocksdb::Status& status,
                                          const std::string& context);

/**
 * Parse a JSON request body. An empty body yields an empty object.
 * Returns false if the body is not valid JSON or not an object.
 */
bool ParseJsonBody(const drogon::HttpRequestPtr& req, Json::Value* out);

/**
 * Register the task, health and request-logging handlers with the Drogon app.
 * Uses lambda handlers to capture the TaskService pointer.
 */
void RegisterHandlers(TaskService* service);

}  // namespace taskd::server
