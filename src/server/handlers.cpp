#include <taskd/server/handlers.hpp>

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>

#include <memory>

namespace taskd::server {

namespace {

using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

std::string StatusMessage(const rocksdb::Status& status) {
  const char* state = status.getState();
  return state ? std::string(state) : status.ToString();
}

drogon::HttpResponsePtr MakeTaskResponse(const Task& task,
                                         drogon::HttpStatusCode code) {
  auto resp = drogon::HttpResponse::newHttpJsonResponse(TaskToJson(task));
  resp->setStatusCode(code);
  return resp;
}

drogon::HttpResponsePtr MakeMalformedBodyResponse() {
  Json::Value error;
  error["error"] = "Malformed JSON body";
  auto resp = drogon::HttpResponse::newHttpJsonResponse(error);
  resp->setStatusCode(drogon::k400BadRequest);
  return resp;
}

TaskFields ReadTaskFields(const Json::Value& body) {
  TaskFields fields;

  const Json::Value& description = body["description"];
  if (description.isString()) {
    fields.description = description.asString();
  }

  const Json::Value& status = body["status"];
  if (!status.isNull()) {
    // Non-string statuses fail validation downstream.
    fields.status = status.isString() ? status.asString() : std::string();
  }
  return fields;
}

}  // namespace

// --- Error Response Helper ---

drogon::HttpResponsePtr MakeErrorResponse(const rocksdb::Status& status,
                                          const std::string& context) {
  Json::Value json;
  drogon::HttpStatusCode http_code = drogon::k500InternalServerError;

  if (status.IsInvalidArgument()) {
    json["error"] = StatusMessage(status);
    http_code = drogon::k400BadRequest;
  } else if (status.IsNotFound()) {
    json["error"] = StatusMessage(status);
    http_code = drogon::k404NotFound;
  } else {
    LOG_ERROR << context << ": " << status.ToString();
    json["error"] = context;
  }

  auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
  resp->setStatusCode(http_code);
  return resp;
}

bool ParseJsonBody(const drogon::HttpRequestPtr& req, Json::Value* out) {
  auto body = req->body();
  if (body.empty()) {
    *out = Json::Value(Json::objectValue);
    return true;
  }

  // getJsonObject() only parses application/json bodies; fall back to a
  // manual parse for clients that omit the content type.
  auto json = req->getJsonObject();
  if (json) {
    *out = *json;
  } else {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), out, &errors)) {
      return false;
    }
  }
  return out->isObject();
}

// --- Handler Registration ---

void RegisterHandlers(TaskService* service) {
  auto& app = drogon::app();

  // Log every request and any non-empty body. Pre-routing, so requests that
  // match no route (404/405) are logged too.
  app.registerPreRoutingAdvice([](const drogon::HttpRequestPtr& req) {
    std::string target = req->path();
    if (!req->query().empty()) {
      target += "?" + req->query();
    }
    LOG_INFO << "Incoming request: " << req->methodString() << " " << target;
    if (!req->body().empty()) {
      LOG_INFO << "Body: " << std::string(req->body());
    }
  });

  // ==========================================================================
  // Task Endpoints
  // ==========================================================================

  // POST /tasks - Create a task
  app.registerHandler(
      "/tasks",
      [service](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Json::Value body;
        if (!ParseJsonBody(req, &body)) {
          callback(MakeMalformedBodyResponse());
          return;
        }

        Task task;
        auto status = service->Create(ReadTaskFields(body), &task);
        if (!status.ok()) {
          callback(MakeErrorResponse(status, "Failed to save tasks"));
          return;
        }

        callback(MakeTaskResponse(task, drogon::k201Created));
      },
      {drogon::Post});

  // GET /tasks[?status=S] - List tasks, optionally filtered by status
  app.registerHandler(
      "/tasks",
      [service](const drogon::HttpRequestPtr& req, Callback&& callback) {
        std::vector<Task> tasks;
        auto status = service->List(req->getParameter("status"), &tasks);
        if (!status.ok()) {
          callback(MakeErrorResponse(status, "Failed to list tasks"));
          return;
        }

        auto resp = drogon::HttpResponse::newHttpJsonResponse(TasksToJson(tasks));
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});

  // PUT /tasks/{id} - Overwrite the provided fields
  app.registerHandler(
      "/tasks/{id}",
      [service](const drogon::HttpRequestPtr& req, Callback&& callback,
                const std::string& id) {
        Json::Value body;
        if (!ParseJsonBody(req, &body)) {
          callback(MakeMalformedBodyResponse());
          return;
        }

        Task task;
        auto status = service->Update(id, ReadTaskFields(body), &task);
        if (!status.ok()) {
          callback(MakeErrorResponse(status, "Failed to save tasks"));
          return;
        }

        callback(MakeTaskResponse(task, drogon::k200OK));
      },
      {drogon::Put});

  // DELETE /tasks/{id} - Remove a task
  app.registerHandler(
      "/tasks/{id}",
      [service](const drogon::HttpRequestPtr& req, Callback&& callback,
                const std::string& id) {
        auto status = service->Delete(id);
        if (!status.ok()) {
          callback(MakeErrorResponse(status, "Failed to save tasks"));
          return;
        }

        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::k204NoContent);
        callback(resp);
      },
      {drogon::Delete});

  // PATCH /tasks/{id}/status - Set only the status
  app.registerHandler(
      "/tasks/{id}/status",
      [service](const drogon::HttpRequestPtr& req, Callback&& callback,
                const std::string& id) {
        Json::Value body;
        if (!ParseJsonBody(req, &body)) {
          callback(MakeMalformedBodyResponse());
          return;
        }

        // A missing or non-string status is as invalid as an unknown one.
        const Json::Value& status_field = body["status"];
        std::string new_status =
            status_field.isString() ? status_field.asString() : std::string();

        Task task;
        auto status = service->UpdateStatus(id, new_status, &task);
        if (!status.ok()) {
          callback(MakeErrorResponse(status, "Failed to save tasks"));
          return;
        }

        callback(MakeTaskResponse(task, drogon::k200OK));
      },
      {drogon::Patch});

  // ==========================================================================
  // Health Endpoints
  // ==========================================================================

  // GET /health - Liveness check
  app.registerHandler(
      "/health",
      [](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Json::Value json;
        json["status"] = "healthy";

        auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});

  // GET /health/ready - Readiness check; a strict read so that a store which
  // degrades to empty on Load() still reports unhealthy here.
  app.registerHandler(
      "/health/ready",
      [service](const drogon::HttpRequestPtr& req, Callback&& callback) {
        std::vector<Task> tasks;
        auto status = service->store()->Read(&tasks);

        Json::Value json;
        if (status.ok()) {
          Json::Value by_status(Json::objectValue);
          for (auto s : {TaskStatus::kTodo, TaskStatus::kInProgress,
                         TaskStatus::kDone}) {
            by_status[ToString(s)] = 0;
          }
          for (const auto& task : tasks) {
            by_status[ToString(task.status)] =
                by_status[ToString(task.status)].asUInt64() + 1;
          }

          json["status"] = "healthy";
          json["backend"] = ToString(service->store()->backend());
          json["total_tasks"] = static_cast<Json::UInt64>(tasks.size());
          json["tasks_by_status"] = by_status;

          auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
          resp->setStatusCode(drogon::k200OK);
          callback(resp);
        } else {
          json["status"] = "unhealthy";
          json["error"] = status.ToString();

          auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
          resp->setStatusCode(drogon::k503ServiceUnavailable);
          callback(resp);
        }
      },
      {drogon::Get});
}

}  // namespace taskd::server
