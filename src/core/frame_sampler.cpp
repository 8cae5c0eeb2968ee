#include "core/frame_sampler.hpp"
#include "core/inference_error.hpp"
#include <algorithm>

std::vector<size_t> FrameSampler::sampleIndices(size_t count, std::optional<size_t> max_frames)
{
    if (max_frames && *max_frames == 0)
    {
        throw InferenceException(InferenceErrorCode::INVALID_INPUT, "max_frames must be positive");
    }

    std::vector<size_t> indices;
    if (!max_frames || count <= *max_frames)
    {
        indices.reserve(count);
        for (size_t i = 0; i < count; ++i)
        {
            indices.push_back(i);
        }
        return indices;
    }

    size_t stride = std::max<size_t>(1, count / *max_frames);
    indices.reserve(*max_frames);
    for (size_t i = 0; i < count && indices.size() < *max_frames; i += stride)
    {
        indices.push_back(i);
    }
    return indices;
}
