#pragma once

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>

/**
 * @brief Process-lifetime counters exposed by /api/v1/stats
 */
struct InferenceStats
{
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> failures{0};
    std::atomic<uint64_t> frames_processed{0};
    std::atomic<uint64_t> faces_cropped{0};
    std::atomic<uint64_t> full_image_fallbacks{0};
    std::atomic<uint64_t> frames_skipped{0};

    nlohmann::json toJson() const
    {
        return {
            {"requests", requests.load()},
            {"failures", failures.load()},
            {"frames_processed", frames_processed.load()},
            {"faces_cropped", faces_cropped.load()},
            {"full_image_fallbacks", full_image_fallbacks.load()},
            {"frames_skipped", frames_skipped.load()}};
    }
};
