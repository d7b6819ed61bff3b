#pragma once

#include "types.hpp"
#include "config.hpp"
#include <memory>
#include <string>
#include <vector>

class PressureAnalyzer {
public:
    static constexpr size_t kFlowWindow = 10;
    static constexpr size_t kReversalWindow = 5;
    static constexpr double kScoreThreshold = 0.1;
    static constexpr double kStrongStrength = 0.7;

    virtual ~PressureAnalyzer() = default;

    // The result's imbalance is always book.imbalance, untouched
    PressureResult analyze(const std::vector<Bar>& bars, const OrderBookStats& book) const;

    virtual std::string name() const = 0;

protected:
    // Weighted combination of the flow and book metrics
    virtual double score(const PressureMetrics& metrics) const = 0;
    virtual bool detects_reversals() const = 0;
};

// 0.4 flow + 0.2 volume imbalance + 0.2 value imbalance + 0.2 near-touch imbalance,
// with a reversal override
class CompositePressureAnalyzer : public PressureAnalyzer {
public:
    std::string name() const override { return "composite"; }

protected:
    double score(const PressureMetrics& metrics) const override;
    bool detects_reversals() const override { return true; }
};

// 0.6 flow + 0.4 volume imbalance, no reversal override
class FlowPressureAnalyzer : public PressureAnalyzer {
public:
    std::string name() const override { return "flow"; }

protected:
    double score(const PressureMetrics& metrics) const override;
    bool detects_reversals() const override { return false; }
};

std::unique_ptr<PressureAnalyzer> make_pressure_analyzer(PressureModel model);
