#include "core/fake_probability_extractor.hpp"
#include "core/inference_error.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <utility>
#include <vector>

namespace
{
    std::string toLower(const std::string &text)
    {
        std::string lowered = text;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }

    bool containsAny(const std::string &haystack, std::initializer_list<const char *> needles)
    {
        for (const char *needle : needles)
        {
            if (haystack.find(needle) != std::string::npos)
            {
                return true;
            }
        }
        return false;
    }

    double checkedScore(const LabelScore &entry)
    {
        if (!std::isfinite(entry.score))
        {
            throw InferenceException(InferenceErrorCode::INVALID_INPUT,
                                     "Non-finite score for label '" + entry.label + "'");
        }
        return std::min(1.0, std::max(0.0, entry.score));
    }
}

FakeProbabilityExtractor::FakeProbabilityExtractor(LabelMapper mapper)
    : mapper_(std::move(mapper))
{
}

SemanticLabel FakeProbabilityExtractor::substringLabelMapper(const std::string &label)
{
    std::string lowered = toLower(label);
    if (containsAny(lowered, {"fake", "deepfake", "synthetic"}))
    {
        return SemanticLabel::fake(label);
    }
    if (containsAny(lowered, {"real", "authentic"}))
    {
        return SemanticLabel::real(label);
    }
    return SemanticLabel::unknown(label);
}

FrameProbability FakeProbabilityExtractor::extract(const ClassifierResult &result) const
{
    if (result.empty())
    {
        return UNCERTAIN_PROBABILITY;
    }

    std::vector<SemanticLabel> meanings;
    meanings.reserve(result.size());
    for (const auto &entry : result)
    {
        meanings.push_back(mapper_(entry.label));
    }

    for (size_t i = 0; i < result.size(); ++i)
    {
        if (meanings[i].kind == SemanticLabel::Kind::FAKE)
        {
            return checkedScore(result[i]);
        }
    }

    for (size_t i = 0; i < result.size(); ++i)
    {
        if (meanings[i].kind == SemanticLabel::Kind::REAL)
        {
            return 1.0 - checkedScore(result[i]);
        }
    }

    // No recognisable label anywhere: treat the first entry as the dominant class
    return checkedScore(result.front());
}
