#include "vidingest/http/route_registration.h"

#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <Poco/Exception.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/MessageHeader.h>
#include <Poco/Net/MultipartReader.h>
#include <Poco/Net/NameValueCollection.h>
#include <Poco/StreamCopier.h>
#include <Poco/String.h>

#include "vidingest/core/logger.h"
#include "vidingest/observability/metrics.h"
#include "vidingest/upload/session_manager.h"

namespace vidingest::http {
namespace {

namespace bhttp = boost::beast::http;

constexpr int kDefaultMetricsLimit = 100;
constexpr int kMaxMetricsLimit = 1000;

std::string GetQueryParam(const std::string& target, const std::string& key) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return "";
    }
    auto query = target.substr(pos + 1);
    std::stringstream ss(query);
    std::string item;
    while (std::getline(ss, item, '&')) {
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        if (item.substr(0, eq) == key) {
            return item.substr(eq + 1);
        }
    }
    return "";
}

std::optional<int> ParsePositiveInt(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed <= 0) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

HttpResponse JsonResponse(int version, bhttp::status status, const Poco::JSON::Object::Ptr& body) {
    std::stringstream ss;
    body->stringify(ss);
    HttpResponse response{status, version};
    response.set(bhttp::field::content_type, "application/json");
    response.body() = ss.str();
    response.prepare_payload();
    return response;
}

HttpResponse JsonOk(int version, const Poco::JSON::Object::Ptr& body) {
    return JsonResponse(version, bhttp::status::ok, body);
}

Poco::JSON::Object::Ptr ErrorEnvelope(const std::string& code, const std::string& message,
                                      const std::string& request_id) {
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", code);
    error->set("message", message);
    error->set("request_id", request_id);
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("error", error);
    return root;
}

HttpResponse JsonError(int version, const std::string& code, const std::string& message,
                       const std::string& request_id, bhttp::status status) {
    return JsonResponse(version, status, ErrorEnvelope(code, message, request_id));
}

bhttp::status StatusFor(core::ErrorCode code) {
    switch (code) {
        case core::ErrorCode::kInvalidArgument:
        case core::ErrorCode::kIncompleteUpload:
            return bhttp::status::bad_request;
        case core::ErrorCode::kPayloadTooLarge:
            return bhttp::status::payload_too_large;
        case core::ErrorCode::kNotFound:
        case core::ErrorCode::kExpired:
            return bhttp::status::not_found;
        case core::ErrorCode::kConflict:
            return bhttp::status::conflict;
        case core::ErrorCode::kRateLimited:
            return bhttp::status::too_many_requests;
        case core::ErrorCode::kStorageUnavailable:
            return bhttp::status::service_unavailable;
        case core::ErrorCode::kIntegrityError:
        case core::ErrorCode::kInternal:
        case core::ErrorCode::kOk:
            break;
    }
    return bhttp::status::internal_server_error;
}

HttpResponse ErrorFrom(const RequestContext& ctx, const HttpRequest& req,
                       const core::Error& error, int retry_after_seconds = 0) {
    const auto status = StatusFor(error.code);
    if (status == bhttp::status::internal_server_error) {
        core::LogError("request " + ctx.request_id + " failed: " + error.message);
    }
    auto response = JsonError(req.version(), core::ErrorCodeName(error.code), error.message,
                              ctx.request_id, status);
    if (error.code == core::ErrorCode::kRateLimited) {
        response.set(bhttp::field::retry_after,
                     std::to_string(retry_after_seconds > 0 ? retry_after_seconds : 1));
    }
    return response;
}

/// Rate-limit identity. Client-supplied headers are not trusted here; the peer address is.
std::string ClientIdentity(const RequestContext& ctx) { return "ip:" + ctx.remote_host; }

Poco::JSON::Object::Ptr ParseJsonObject(const std::string& body) {
    Poco::JSON::Parser parser;
    auto result = parser.parse(body);
    return result.extract<Poco::JSON::Object::Ptr>();
}

Poco::JSON::Array::Ptr ToJsonArray(const std::vector<int>& values) {
    Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
    for (int value : values) {
        arr->add(value);
    }
    return arr;
}

struct ChunkForm {
    std::string upload_id;
    std::string chunk_number;
    std::string chunk;
    bool has_chunk{false};
};

core::Result<ChunkForm> ParseChunkForm(const HttpRequest& req) {
    const std::string content_type(req[bhttp::field::content_type]);
    std::string media_type;
    Poco::Net::NameValueCollection params;
    Poco::Net::MessageHeader::splitParameters(content_type, media_type, params);
    if (Poco::toLower(media_type) != "multipart/form-data" || !params.has("boundary")) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "expected multipart/form-data with a boundary"};
    }

    ChunkForm form;
    try {
        std::istringstream body(req.body());
        Poco::Net::MultipartReader reader(body, params.get("boundary"));
        while (reader.hasNextPart()) {
            Poco::Net::MessageHeader header;
            reader.nextPart(header);
            std::string disposition;
            Poco::Net::NameValueCollection disposition_params;
            Poco::Net::MessageHeader::splitParameters(header.get("Content-Disposition", ""),
                                                      disposition, disposition_params);
            const auto name = disposition_params.get("name", "");
            std::string value;
            Poco::StreamCopier::copyToString(reader.stream(), value);
            if (name == "upload_id") {
                form.upload_id = Poco::trim(value);
            } else if (name == "chunk_number") {
                form.chunk_number = Poco::trim(value);
            } else if (name == "chunk") {
                form.chunk = std::move(value);
                form.has_chunk = true;
            }
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "malformed multipart body: " + ex.displayText()};
    }
    return form;
}

Poco::JSON::Object::Ptr SessionJson(const upload::SessionView& view) {
    const auto& session = view.session;
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("upload_id", session.id);
    root->set("video_id", session.video_id);
    root->set("filename", session.filename);
    root->set("file_size", static_cast<Poco::UInt64>(session.file_size));
    root->set("chunk_size", static_cast<Poco::UInt64>(session.chunk_size));
    root->set("status", std::string(metadata::ToString(session.status)));
    root->set("progress_percent", view.progress.percent());
    root->set("uploaded_chunks", view.progress.uploaded_count);
    root->set("total_chunks", session.total_chunks);
    root->set("uploaded_chunk_list", ToJsonArray(view.progress.uploaded));
    root->set("missing_chunk_list", ToJsonArray(view.progress.missing));
    root->set("missing_count", static_cast<int>(view.progress.missing.size()));
    root->set("is_complete", session.status == metadata::SessionStatus::kCompleted);
    root->set("created_at", session.created_at);
    root->set("expires_at", session.expires_at);
    if (!session.completed_at.empty()) {
        root->set("completed_at", session.completed_at);
    }
    return root;
}

Poco::JSON::Object::Ptr VideoJson(const metadata::Video& video) {
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("id", video.id);
    root->set("title", video.title);
    root->set("filename", video.filename);
    root->set("original_filename", video.original_filename);
    root->set("file_size", static_cast<Poco::UInt64>(video.file_size));
    root->set("final_size", static_cast<Poco::UInt64>(video.final_size));
    root->set("file_hash", video.file_hash);
    root->set("mime_type", video.mime_type);
    root->set("status", std::string(metadata::ToString(video.status)));
    root->set("upload_method", video.upload_method);
    root->set("uploader_id", video.uploader_id);
    root->set("created_at", video.created_at);
    root->set("uploaded_at", video.uploaded_at);
    return root;
}

}  // namespace

void RegisterUploadRoutes(Router& router, std::shared_ptr<upload::SessionManager> sessions) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("status", "ok");
                   root->set("request_id", ctx.request_id);
                   return JsonOk(req.version(), root);
               });

    router.Add("GET", "/readyz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("status", "ready");
                   root->set("request_id", ctx.request_id);
                   return JsonOk(req.version(), root);
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{bhttp::status::ok, req.version()};
                   response.set(bhttp::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add("POST", "/upload/init",
               [sessions](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   upload::InitRequest request;
                   try {
                       auto obj = ParseJsonObject(req.body());
                       if (!obj || !obj->has("filename") || !obj->has("file_size") ||
                           !obj->has("total_chunks")) {
                           return JsonError(req.version(), "VALIDATION_ERROR",
                                            "filename, file_size and total_chunks are required",
                                            ctx.request_id, bhttp::status::bad_request);
                       }
                       request.filename = obj->getValue<std::string>("filename");
                       request.file_size = obj->getValue<Poco::UInt64>("file_size");
                       request.total_chunks = obj->getValue<int>("total_chunks");
                       if (obj->has("chunk_size") && !obj->isNull("chunk_size")) {
                           request.chunk_size = obj->getValue<Poco::UInt64>("chunk_size");
                           if (request.chunk_size == 0) {
                               return JsonError(req.version(), "VALIDATION_ERROR",
                                                "chunk_size must be positive", ctx.request_id,
                                                bhttp::status::bad_request);
                           }
                       }
                       request.mime_type = obj->optValue<std::string>("mime_type", "");
                       request.uploader_id = obj->optValue<std::string>("uploader_id", "");
                       request.title = obj->optValue<std::string>("title", "");
                   } catch (const Poco::Exception& ex) {
                       return JsonError(req.version(), "VALIDATION_ERROR",
                                        "invalid init body: " + ex.displayText(), ctx.request_id,
                                        bhttp::status::bad_request);
                   }
                   request.identity = ClientIdentity(ctx);

                   int retry_after = 0;
                   auto created = sessions->Init(request, &retry_after);
                   if (!created.ok()) {
                       return ErrorFrom(ctx, req, created.error(), retry_after);
                   }
                   const auto& session = created.value();
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("upload_id", session.id);
                   root->set("video_id", session.video_id);
                   root->set("filename", session.filename);
                   root->set("total_chunks", session.total_chunks);
                   root->set("chunk_size", static_cast<Poco::UInt64>(session.chunk_size));
                   root->set("uploaded_chunks", 0);
                   root->set("progress_percent", 0.0);
                   root->set("is_complete", false);
                   root->set("status", std::string(metadata::ToString(session.status)));
                   root->set("expires_at", session.expires_at);
                   return JsonResponse(req.version(), bhttp::status::created, root);
               });

    router.Add("POST", "/upload/chunk",
               [sessions](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   auto form = ParseChunkForm(req);
                   if (!form.ok()) {
                       return ErrorFrom(ctx, req, form.error());
                   }
                   if (form.value().upload_id.empty() || !form.value().has_chunk) {
                       return JsonError(req.version(), "VALIDATION_ERROR",
                                        "upload_id, chunk_number and chunk are required",
                                        ctx.request_id, bhttp::status::bad_request);
                   }
                   auto chunk_number = ParsePositiveInt(form.value().chunk_number);
                   if (!chunk_number) {
                       return JsonError(req.version(), "VALIDATION_ERROR",
                                        "chunk_number must be a positive integer", ctx.request_id,
                                        bhttp::status::bad_request);
                   }

                   int retry_after = 0;
                   auto accepted = sessions->AcceptChunk(form.value().upload_id, *chunk_number,
                                                         form.value().chunk,
                                                         ClientIdentity(ctx), &retry_after);
                   if (!accepted.ok()) {
                       return ErrorFrom(ctx, req, accepted.error(), retry_after);
                   }
                   const auto& outcome = accepted.value();
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("upload_id", outcome.session_id);
                   root->set("chunk_number", outcome.chunk_number);
                   root->set("uploaded_chunks", outcome.uploaded_chunks);
                   root->set("total_chunks", outcome.total_chunks);
                   root->set("progress_percent", outcome.progress_percent);
                   root->set("duplicate", outcome.duplicate);
                   return JsonOk(req.version(), root);
               });

    router.Add("POST", "/upload/complete",
               [sessions](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   std::string upload_id;
                   std::string title;
                   try {
                       auto obj = ParseJsonObject(req.body());
                       if (!obj || !obj->has("upload_id")) {
                           return JsonError(req.version(), "VALIDATION_ERROR",
                                            "upload_id is required", ctx.request_id,
                                            bhttp::status::bad_request);
                       }
                       upload_id = obj->getValue<std::string>("upload_id");
                       title = obj->optValue<std::string>("title", "");
                   } catch (const Poco::Exception& ex) {
                       return JsonError(req.version(), "VALIDATION_ERROR",
                                        "invalid complete body: " + ex.displayText(),
                                        ctx.request_id, bhttp::status::bad_request);
                   }

                   std::vector<int> missing;
                   auto completed = sessions->Complete(upload_id, title, &missing);
                   if (!completed.ok()) {
                       if (completed.code() == core::ErrorCode::kIncompleteUpload) {
                           auto root = ErrorEnvelope("INCOMPLETE_UPLOAD",
                                                     completed.error().message, ctx.request_id);
                           root->set("missing_chunks", ToJsonArray(missing));
                           root->set("missing_count", static_cast<int>(missing.size()));
                           return JsonResponse(req.version(), bhttp::status::bad_request, root);
                       }
                       return ErrorFrom(ctx, req, completed.error());
                   }
                   const auto& result = completed.value();
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("id", result.video_id);
                   root->set("upload_id", result.session_id);
                   root->set("status", std::string(metadata::ToString(result.status)));
                   root->set("file_hash", result.file_hash);
                   root->set("file_size", static_cast<Poco::UInt64>(result.file_size));
                   root->set("is_complete", true);
                   root->set("upload_duration_ms",
                             static_cast<Poco::Int64>(result.upload_duration_ms));
                   root->set("assembly_duration_ms",
                             static_cast<Poco::Int64>(result.assembly_duration_ms));
                   root->set("throughput_bps", static_cast<Poco::UInt64>(result.throughput_bps));
                   return JsonOk(req.version(), root);
               });

    router.Add("GET", "/upload/{upload_id}/status",
               [sessions](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams& params) {
                   auto status = sessions->Status(params.at("upload_id"));
                   if (!status.ok()) {
                       return ErrorFrom(ctx, req, status.error());
                   }
                   return JsonOk(req.version(), SessionJson(status.value()));
               });

    router.Add("GET", "/upload/metrics",
               [sessions](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   int limit = kDefaultMetricsLimit;
                   const auto limit_text = GetQueryParam(std::string(req.target()), "limit");
                   if (!limit_text.empty()) {
                       auto parsed = ParsePositiveInt(limit_text);
                       if (!parsed || *parsed > kMaxMetricsLimit) {
                           return JsonError(req.version(), "VALIDATION_ERROR",
                                            "limit must be between 1 and " +
                                                std::to_string(kMaxMetricsLimit),
                                            ctx.request_id, bhttp::status::bad_request);
                       }
                       limit = *parsed;
                   }
                   auto metrics = sessions->ListMetrics(limit);
                   if (!metrics.ok()) {
                       return ErrorFrom(ctx, req, metrics.error());
                   }

                   Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
                   double duration_sum = 0;
                   double throughput_sum = 0;
                   for (const auto& metric : metrics.value()) {
                       Poco::JSON::Object::Ptr item = new Poco::JSON::Object();
                       item->set("video_id", metric.video_id);
                       item->set("file_size", static_cast<Poco::UInt64>(metric.file_size));
                       item->set("upload_duration_ms",
                                 static_cast<Poco::Int64>(metric.upload_duration_ms));
                       item->set("assembly_duration_ms",
                                 static_cast<Poco::Int64>(metric.assembly_duration_ms));
                       item->set("throughput_bps",
                                 static_cast<Poco::UInt64>(metric.throughput_bps));
                       item->set("retry_count", metric.retry_count);
                       item->set("created_at", metric.created_at);
                       arr->add(item);
                       duration_sum += static_cast<double>(metric.upload_duration_ms);
                       throughput_sum += static_cast<double>(metric.throughput_bps);
                   }
                   const auto count = metrics.value().size();
                   Poco::JSON::Object::Ptr averages = new Poco::JSON::Object();
                   averages->set("upload_duration_ms", count ? duration_sum / count : 0.0);
                   averages->set("throughput_bps", count ? throughput_sum / count : 0.0);

                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("count", static_cast<int>(count));
                   root->set("averages", averages);
                   root->set("data", arr);
                   return JsonOk(req.version(), root);
               });

    router.Add("GET", "/videos/{video_id}",
               [sessions](const RequestContext& ctx, const HttpRequest& req,
                          const RouteParams& params) {
                   auto video = sessions->GetVideo(params.at("video_id"));
                   if (!video.ok()) {
                       return ErrorFrom(ctx, req, video.error());
                   }
                   return JsonOk(req.version(), VideoJson(video.value()));
               });
}

}  // namespace vidingest::http
