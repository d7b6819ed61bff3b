#pragma once

#include "types.hpp"
#include "config.hpp"
#include <memory>
#include <string>
#include <vector>

class AnomalyDetector {
public:
    static constexpr size_t kMinBars = 5;

    virtual ~AnomalyDetector() = default;

    // Fewer than kMinBars bars yields an empty report
    AnomalyReport detect(const std::vector<Bar>& bars) const;

    virtual std::string name() const = 0;

protected:
    virtual std::vector<AnomalyRecord> scan(const std::vector<Bar>& bars) const = 0;
};

// Outliers of quote volume against relative price change, plus bars whose
// net inflow dominates their quote volume. Keeps every record.
class RatioAnomalyDetector : public AnomalyDetector {
public:
    static constexpr double kFlowDominance = 0.7;
    static constexpr double kFlowDeviation = 2.0;

    std::string name() const override { return "ratio"; }

protected:
    std::vector<AnomalyRecord> scan(const std::vector<Bar>& bars) const override;
};

// Z-scores over raw volume and raw net inflow, one record per bar, only the
// most recent kMaxRecords kept.
class ZScoreAnomalyDetector : public AnomalyDetector {
public:
    static constexpr double kZThreshold = 2.0;
    static constexpr double kMismatchPricePct = 1.0;
    static constexpr size_t kMaxRecords = 5;

    std::string name() const override { return "zscore"; }

protected:
    std::vector<AnomalyRecord> scan(const std::vector<Bar>& bars) const override;
};

std::unique_ptr<AnomalyDetector> make_anomaly_detector(AnomalyMode mode);
