#pragma once

#include <vector>
#include "core/detection_types.hpp"
#include "core/media_types.hpp"

/**
 * @brief Composite manipulation-risk report, every field in [0,100]
 */
struct AggregatedReport
{
    double video_score;          // P90 of per-frame probabilities
    double peak_risk;            // max
    double mean_risk;            // mean
    double audio_score;          // mirrors video_score for AUDIO, otherwise 0
    double gan_fingerprint;      // same definition as video_score
    double temporal_consistency; // variance-derived, 100 for single frames / non-video
    double risk_score;           // video_score, pulled toward peak_risk by outliers
    double confidence;           // mean distance from 0.5, as a percentage

    AggregatedReport()
        : video_score(0.0), peak_risk(0.0), mean_risk(0.0), audio_score(0.0),
          gan_fingerprint(0.0), temporal_consistency(100.0), risk_score(0.0), confidence(0.0) {}
};

/**
 * @brief Outlier blending applied to risk_score
 *
 * When peak_risk exceeds video_score by more than gap_threshold points,
 * risk_score = video_score * video_weight + peak_risk * peak_weight.
 * The defaults are kept for compatibility with existing clients; they are not
 * derived from a calibration run.
 */
struct BlendPolicy
{
    double gap_threshold = 10.0;
    double video_weight = 0.7;
    double peak_weight = 0.3;
};

class ScoreAggregator
{
public:
    static constexpr double VIDEO_PERCENTILE = 90.0;
    static constexpr double VARIANCE_PENALTY = 1000.0;

    /**
     * @brief Reduce per-frame probabilities to the report
     * @param probabilities One value in [0,1] per frame, frame order
     * @param media_type Drives temporal consistency and audio score
     * @param policy Outlier blending constants
     * @throws InferenceException AGGREGATION_PRECONDITION when probabilities is empty,
     *         INVALID_INPUT when a value is non-finite or outside [0,1]
     */
    static AggregatedReport aggregate(const std::vector<FrameProbability> &probabilities,
                                      MediaType media_type,
                                      const BlendPolicy &policy = BlendPolicy());

    // Linear-interpolation percentile (numpy "linear" method); values need not be sorted
    static double percentile(std::vector<double> values, double percent);

    static double mean(const std::vector<double> &values);

    // Population variance (divides by n)
    static double populationVariance(const std::vector<double> &values);

    // 2 decimals, matching Python's round(x, 2): 0.125 -> 0.12, 2.675 -> 2.67
    static double roundTo2(double value);
};
