#pragma once

#include <functional>
#include <string>
#include "core/detection_types.hpp"

/**
 * @brief What a classifier label means for the "is it synthetic" question
 */
struct SemanticLabel
{
    enum class Kind
    {
        FAKE,
        REAL,
        UNKNOWN
    };

    Kind kind;
    std::string raw_text; // original label, kept for UNKNOWN diagnostics

    static SemanticLabel fake(const std::string &text) { return SemanticLabel{Kind::FAKE, text}; }
    static SemanticLabel real(const std::string &text) { return SemanticLabel{Kind::REAL, text}; }
    static SemanticLabel unknown(const std::string &text) { return SemanticLabel{Kind::UNKNOWN, text}; }
};

// Maps a backend's label text to its meaning; swap per classifier vocabulary
using LabelMapper = std::function<SemanticLabel(const std::string &)>;

/**
 * @brief Reduces one classifier result to P(synthetic)
 *
 * Rules, first match wins:
 *  1. any FAKE label -> its score
 *  2. any REAL label -> 1 - its score
 *  3. otherwise the first entry's raw score (binary model, polarity unknown)
 *  4. empty result -> 0.5
 */
class FakeProbabilityExtractor
{
public:
    static constexpr double UNCERTAIN_PROBABILITY = 0.5;

    explicit FakeProbabilityExtractor(LabelMapper mapper = substringLabelMapper);

    /**
     * @brief Extract the fake probability
     * @param result Label/score pairs of one image, order not relied upon
     * @return Probability in [0,1]
     * @throws InferenceException (INVALID_INPUT) on a non-finite score
     */
    FrameProbability extract(const ClassifierResult &result) const;

    /**
     * @brief Default mapper: case-insensitive substring match
     *
     * "fake", "deepfake", "synthetic" -> FAKE; "real", "authentic" -> REAL.
     */
    static SemanticLabel substringLabelMapper(const std::string &label);

private:
    LabelMapper mapper_;
};
