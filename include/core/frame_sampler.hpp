#pragma once

#include <cstddef>
#include <optional>
#include <vector>

/**
 * @brief Fixed-stride frame subsampling
 *
 * With count > max_frames the stride is floor(count / max_frames); every stride-th
 * frame from index 0 is kept and the list is cut at max_frames. Spacing is only
 * approximately even when count is not a multiple of the stride, and the tail of the
 * clip can be left out.
 */
class FrameSampler
{
public:
    /**
     * @brief Indices of the frames to keep, ascending
     * @param count Number of frames available
     * @param max_frames Upper bound; std::nullopt keeps every frame
     * @throws InferenceException (INVALID_INPUT) when max_frames is 0
     */
    static std::vector<size_t> sampleIndices(size_t count, std::optional<size_t> max_frames);

    /**
     * @brief Subsample an ordered list of frame identifiers, preserving order
     */
    template <typename T>
    static std::vector<T> sample(const std::vector<T> &frames, std::optional<size_t> max_frames)
    {
        if (!max_frames || frames.size() <= *max_frames)
        {
            return frames;
        }

        std::vector<T> sampled;
        for (size_t index : sampleIndices(frames.size(), max_frames))
        {
            sampled.push_back(frames[index]);
        }
        return sampled;
    }
};
