#include "anomaly.hpp"
#include "util.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

namespace {
    // A zero spread still yields a usable z-score
    double z_score(double value, double mean, double sigma) {
        return (value - mean) / (sigma == 0.0 ? 1.0 : sigma);
    }

    Severity direction_of(double z) {
        return z >= 0.0 ? Severity::High : Severity::Low;
    }
}

AnomalyReport AnomalyDetector::detect(const std::vector<Bar>& bars) const {
    AnomalyReport report;
    if (bars.size() < kMinBars) {
        spdlog::warn("Anomaly scan skipped: {} bars, need {}", bars.size(), kMinBars);
        return report;
    }

    report.anomalies = scan(bars);
    report.has_anomalies = !report.anomalies.empty();

    spdlog::debug("Anomalies [{}]: {} records over {} bars", name(), report.anomalies.size(), bars.size());
    return report;
}

std::vector<AnomalyRecord> RatioAnomalyDetector::scan(const std::vector<Bar>& bars) const {
    std::vector<double> volumes;
    std::vector<double> price_changes;
    volumes.reserve(bars.size());
    price_changes.reserve(bars.size());
    for (const auto& bar : bars) {
        volumes.push_back(bar.quote_volume);
        price_changes.push_back(std::abs(bar.close - bar.open) / bar.open);
    }

    const double vol_mean = util::mean(volumes);
    const double vol_std = util::std_dev(volumes);
    const double pc_mean = util::mean(price_changes);
    const double pc_std = util::std_dev(price_changes);

    std::vector<AnomalyRecord> records;
    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];
        const double qv = bar.quote_volume;
        const double pc = price_changes[i];

        // Heavy volume that did not move the price
        if (qv > vol_mean + 2.0 * vol_std && pc < pc_mean + 0.5 * pc_std) {
            AnomalyRecord record;
            record.time = bar.open_time;
            record.kinds.push_back(AnomalyKind::HighVolumeLowPriceChange);
            record.volume = Deviation{qv, z_score(qv, vol_mean, vol_std), Severity::High};
            records.push_back(std::move(record));
        }

        // Large move on thin volume
        if (pc > pc_mean + 2.0 * pc_std && qv < vol_mean + 0.5 * vol_std) {
            AnomalyRecord record;
            record.time = bar.open_time;
            record.kinds.push_back(AnomalyKind::HighPriceChangeLowVolume);
            record.mismatch = PriceVolumeMismatch{pc * 100.0, z_score(qv, vol_mean, vol_std)};
            records.push_back(std::move(record));
        }

        if (bar.net_inflow > 0.0 && bar.net_inflow > kFlowDominance * qv) {
            AnomalyRecord record;
            record.time = bar.open_time;
            record.kinds.push_back(AnomalyKind::ExtremeNetInflow);
            record.net_inflow = Deviation{bar.net_inflow, kFlowDeviation, Severity::High};
            record.flow_ratio = qv > 0.0 ? bar.net_inflow / qv : 0.0;
            records.push_back(std::move(record));
        }

        if (bar.net_inflow < 0.0 && std::abs(bar.net_inflow) > kFlowDominance * qv) {
            AnomalyRecord record;
            record.time = bar.open_time;
            record.kinds.push_back(AnomalyKind::ExtremeNetOutflow);
            record.net_inflow = Deviation{bar.net_inflow, -kFlowDeviation, Severity::Low};
            record.flow_ratio = qv > 0.0 ? std::abs(bar.net_inflow) / qv : 0.0;
            records.push_back(std::move(record));
        }
    }
    return records;
}

std::vector<AnomalyRecord> ZScoreAnomalyDetector::scan(const std::vector<Bar>& bars) const {
    std::vector<double> volumes;
    std::vector<double> inflows;
    volumes.reserve(bars.size());
    inflows.reserve(bars.size());
    for (const auto& bar : bars) {
        volumes.push_back(bar.volume);
        inflows.push_back(bar.net_inflow);
    }

    const double vol_mean = util::mean(volumes);
    const double vol_std = util::std_dev(volumes);
    const double inflow_mean = util::mean(inflows);
    const double inflow_std = util::std_dev(inflows);

    std::vector<AnomalyRecord> records;
    for (const auto& bar : bars) {
        const double vol_z = z_score(bar.volume, vol_mean, vol_std);
        const double inflow_z = z_score(bar.net_inflow, inflow_mean, inflow_std);

        AnomalyRecord record;
        record.time = bar.open_time;

        if (std::abs(vol_z) > kZThreshold) {
            record.kinds.push_back(AnomalyKind::VolumeSpike);
            record.volume = Deviation{bar.volume, vol_z, direction_of(vol_z)};
        }
        if (std::abs(inflow_z) > kZThreshold) {
            record.kinds.push_back(AnomalyKind::NetInflowSpike);
            record.net_inflow = Deviation{bar.net_inflow, inflow_z, direction_of(inflow_z)};
        }
        if (std::abs(bar.price_change_pct) > kMismatchPricePct && vol_z < 0.0) {
            record.kinds.push_back(AnomalyKind::PriceVolumeMismatch);
            record.mismatch = PriceVolumeMismatch{bar.price_change_pct, vol_z};
        }

        if (!record.kinds.empty()) {
            records.push_back(std::move(record));
        }
    }

    if (records.size() > kMaxRecords) {
        records.erase(records.begin(), records.end() - static_cast<std::ptrdiff_t>(kMaxRecords));
    }
    return records;
}

std::unique_ptr<AnomalyDetector> make_anomaly_detector(AnomalyMode mode) {
    switch (mode) {
        case AnomalyMode::Ratio:
            return std::make_unique<RatioAnomalyDetector>();
        case AnomalyMode::ZScore:
            return std::make_unique<ZScoreAnomalyDetector>();
    }
    throw std::runtime_error("Unhandled anomaly mode");
}
