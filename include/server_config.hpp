#pragma once

#include <cstddef>

class ServerConfig
{
public:
    static constexpr const char *SERVICE_NAME = "deepfake-detection-ml-service";
    static constexpr const char *SERVICE_VERSION = "2.0.0";
    static constexpr const char *DEFAULT_CONFIG_PATH = "config/config.json";

    static constexpr const char *HEALTH_PATH = "/health";
    static constexpr const char *INFERENCE_PATH = "/api/v1/inference";
    static constexpr const char *STATS_PATH = "/api/v1/stats";

    // Requests carry frame paths, not pixels
    static constexpr size_t MAX_REQUEST_BODY_BYTES = 1024 * 1024;
};
