#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/Timestamp.h>
#include <string>
#include "core/inference_context.hpp"
#include "core/inference_error.hpp"
#include "core/inference_pipeline.hpp"
#include "core/inference_request.hpp"
#include "logging/logger.hpp"
#include "server_config.hpp"

using json = nlohmann::json;

class RouteHandlers
{
public:
    static void setupRoutes(httplib::Server &svr, InferenceContext &context)
    {
        svr.Get(ServerConfig::HEALTH_PATH, [&context](const httplib::Request &req, httplib::Response &res)
                { handleHealth(req, res, context); });

        svr.Post(ServerConfig::INFERENCE_PATH, [&context](const httplib::Request &req, httplib::Response &res)
                 { handleInference(req, res, context); });

        svr.Get(ServerConfig::STATS_PATH, [&context](const httplib::Request &req, httplib::Response &res)
                { handleStats(req, res, context); });

        // Fires for every status >= 400; only unrouted requests arrive without a body
        svr.set_error_handler([](const httplib::Request &req, httplib::Response &res)
                              { handleError(req, res); });

        svr.set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep)
                                  { handleUncaught(req, res, ep); });
    }

    static void handleHealth(const httplib::Request &, httplib::Response &res, InferenceContext &context)
    {
        bool loaded = context.isReady();
        json body = {
            {"status", loaded ? "healthy" : "unhealthy"},
            {"service", ServerConfig::SERVICE_NAME},
            {"version", ServerConfig::SERVICE_VERSION},
            {"model", context.modelName()},
            {"model_status", loaded ? "loaded" : "not_loaded"},
            {"detection_method", context.detectionMethod()},
            {"timestamp", Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FRAC_FORMAT)}};
        res.status = loaded ? 200 : 503;
        res.set_content(body.dump(), "application/json");
    }

    static void handleInference(const httplib::Request &req, httplib::Response &res, InferenceContext &context)
    {
        Logger::trace("Received inference request");

        json body = json::parse(req.body, nullptr, false);
        if (req.body.empty() || body.is_discarded() || !body.is_object() || body.empty())
        {
            sendError(res, 400, "Invalid request", "Request body must be JSON");
            return;
        }

        try
        {
            InferenceRequest request = InferenceRequest::fromJson(body);
            InferencePipeline pipeline(context);
            InferenceResponse response = pipeline.run(request);
            res.status = 200;
            res.set_content(response.toJson().dump(), "application/json");
        }
        catch (const InferenceException &e)
        {
            Logger::error(std::string("Inference error (") + inferenceErrorName(e.code()) + "): " + e.what());
            sendError(res, statusFor(e.code()), errorTitle(e.code()), e.what());
        }
        catch (const std::exception &e)
        {
            Logger::error("Inference error: " + std::string(e.what()));
            sendError(res, 500, "Inference failed", e.what());
        }
    }

    static void handleStats(const httplib::Request &, httplib::Response &res, InferenceContext &context)
    {
        json body = context.stats().toJson();
        body["model_status"] = context.isReady() ? "loaded" : "not_loaded";
        body["detection_method"] = context.detectionMethod();
        res.set_content(body.dump(), "application/json");
    }

    static void handleError(const httplib::Request &req, httplib::Response &res)
    {
        if (!res.body.empty())
        {
            return;
        }
        if (res.status == 404)
        {
            Logger::debug("No route for " + req.method + " " + req.path);
            sendError(res, 404, "Not found", "Endpoint not found");
        }
        else if (res.status == 405)
        {
            sendError(res, 405, "Method not allowed", req.method + " is not supported on " + req.path);
        }
        else if (res.status == 413)
        {
            sendError(res, 413, "Payload too large", "Request body exceeds the configured limit");
        }
    }

    static void handleUncaught(const httplib::Request &req, httplib::Response &res, std::exception_ptr ep)
    {
        std::string detail = "unknown error";
        try
        {
            std::rethrow_exception(ep);
        }
        catch (const std::exception &e)
        {
            detail = e.what();
        }
        catch (...)
        {
            detail = "non-standard exception";
        }
        Logger::error("Unhandled error on " + req.path + ": " + detail);
        sendError(res, 500, "Internal server error", "An error occurred during inference");
    }

    static int statusFor(InferenceErrorCode code)
    {
        switch (code)
        {
        case InferenceErrorCode::INVALID_INPUT:
        case InferenceErrorCode::UNSUPPORTED_MEDIA_TYPE:
            return 400;
        case InferenceErrorCode::CLASSIFIER_UNAVAILABLE:
            return 503;
        case InferenceErrorCode::AGGREGATION_PRECONDITION:
        case InferenceErrorCode::INFERENCE_FAILURE:
            return 500;
        }
        return 500;
    }

    static std::string errorTitle(InferenceErrorCode code)
    {
        switch (code)
        {
        case InferenceErrorCode::INVALID_INPUT:
            return "Invalid request";
        case InferenceErrorCode::UNSUPPORTED_MEDIA_TYPE:
            return "Unsupported media type";
        case InferenceErrorCode::CLASSIFIER_UNAVAILABLE:
            return "Service Unavailable";
        case InferenceErrorCode::AGGREGATION_PRECONDITION:
        case InferenceErrorCode::INFERENCE_FAILURE:
            return "Inference failed";
        }
        return "Inference failed";
    }

private:
    static void sendError(httplib::Response &res, int status, const std::string &error, const std::string &message)
    {
        res.status = status;
        res.set_content(json{{"error", error}, {"message", message}}.dump(), "application/json");
    }
};
