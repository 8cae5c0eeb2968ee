#include "core/score_aggregator.hpp"
#include "core/inference_error.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <locale>
#include <numeric>
#include <sstream>
#include <string>

namespace
{
    double clampPercent(double value)
    {
        return std::min(100.0, std::max(0.0, value));
    }

    // numpy's _lerp formulation, so results match numpy.percentile bit for bit
    double lerp(double a, double b, double t)
    {
        double diff = b - a;
        return t >= 0.5 ? b - diff * (1.0 - t) : a + diff * t;
    }
}

double ScoreAggregator::percentile(std::vector<double> values, double percent)
{
    if (values.empty())
    {
        throw InferenceException(InferenceErrorCode::AGGREGATION_PRECONDITION, "percentile of an empty sequence");
    }

    std::sort(values.begin(), values.end());
    double rank = (percent / 100.0) * static_cast<double>(values.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(rank));
    size_t upper = std::min(lower + 1, values.size() - 1);
    return lerp(values[lower], values[upper], rank - static_cast<double>(lower));
}

double ScoreAggregator::mean(const std::vector<double> &values)
{
    if (values.empty())
    {
        throw InferenceException(InferenceErrorCode::AGGREGATION_PRECONDITION, "mean of an empty sequence");
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double ScoreAggregator::populationVariance(const std::vector<double> &values)
{
    double average = mean(values);
    double sum_squares = 0.0;
    for (double v : values)
    {
        sum_squares += (v - average) * (v - average);
    }
    return sum_squares / static_cast<double>(values.size());
}

double ScoreAggregator::roundTo2(double value)
{
    // Fixed-point formatting rounds the exact binary value, ties to even, like Python's round()
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::fixed << std::setprecision(2) << value;

    std::istringstream in(out.str());
    in.imbue(std::locale::classic());
    double rounded = 0.0;
    in >> rounded;
    return rounded;
}

AggregatedReport ScoreAggregator::aggregate(const std::vector<FrameProbability> &probabilities,
                                            MediaType media_type,
                                            const BlendPolicy &policy)
{
    if (probabilities.empty())
    {
        throw InferenceException(InferenceErrorCode::AGGREGATION_PRECONDITION,
                                 "ScoreAggregator called with no frame probabilities");
    }

    for (size_t i = 0; i < probabilities.size(); ++i)
    {
        double p = probabilities[i];
        if (!std::isfinite(p) || p < 0.0 || p > 1.0)
        {
            throw InferenceException(InferenceErrorCode::INVALID_INPUT,
                                     "Frame " + std::to_string(i) + " probability out of range: " + std::to_string(p));
        }
    }

    double video_score = percentile(probabilities, VIDEO_PERCENTILE) * 100.0;
    double peak_risk = *std::max_element(probabilities.begin(), probabilities.end()) * 100.0;
    double mean_risk = mean(probabilities) * 100.0;

    double temporal_consistency = 100.0;
    if (media_type == MediaType::VIDEO && probabilities.size() >= 2)
    {
        temporal_consistency = clampPercent(100.0 - populationVariance(probabilities) * VARIANCE_PENALTY);
    }

    // No separate audio path yet; AUDIO mirrors the visual score
    double audio_score = media_type == MediaType::AUDIO ? video_score : 0.0;

    double certainty_sum = 0.0;
    for (double p : probabilities)
    {
        certainty_sum += std::max(p, 1.0 - p);
    }
    double confidence = certainty_sum / static_cast<double>(probabilities.size()) * 100.0;

    double risk_score = video_score;
    if (peak_risk > video_score + policy.gap_threshold)
    {
        risk_score = video_score * policy.video_weight + peak_risk * policy.peak_weight;
    }

    AggregatedReport report;
    report.video_score = roundTo2(clampPercent(video_score));
    report.peak_risk = roundTo2(clampPercent(peak_risk));
    report.mean_risk = roundTo2(clampPercent(mean_risk));
    report.audio_score = roundTo2(clampPercent(audio_score));
    report.gan_fingerprint = report.video_score;
    report.temporal_consistency = roundTo2(temporal_consistency);
    report.risk_score = roundTo2(clampPercent(risk_score));
    report.confidence = roundTo2(clampPercent(confidence));
    return report;
}
