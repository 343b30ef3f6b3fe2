#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace mabt {

enum class SignalKind { Buy, Sell, Hold };

enum class Position { Flat, Long };

/// How the engine turns price/MA relationships into signals.
enum class PolicyKind {
    LevelCount,               // latest bar only: count closes below the long MA
    PlainCrossover,           // stateful short/long crossover with position gating
    ThresholdGatedCrossover   // crossover that only acts when close is within theta of an MA
};

/// Policy selection. theta is only read by ThresholdGatedCrossover.
struct SignalPolicy {
    PolicyKind kind{PolicyKind::PlainCrossover};
    double theta{0.001};

    static SignalPolicy levelCount() { return {PolicyKind::LevelCount, 0.0}; }
    static SignalPolicy plainCrossover() { return {PolicyKind::PlainCrossover, 0.0}; }
    static SignalPolicy thresholdGated(double theta = 0.001) {
        return {PolicyKind::ThresholdGatedCrossover, theta};
    }

    bool stateful() const { return kind != PolicyKind::LevelCount; }
};

/// One entry of a ticker's signal history. Immutable once recorded.
struct SignalEvent {
    std::size_t bar_index{0};
    std::string date;
    SignalKind kind{SignalKind::Hold};
    double price{0};
    Position position_after{Position::Flat};
    std::optional<double> portfolio_value;  // nullopt = undefined (division by zero)
    std::optional<double> short_ma;
    std::optional<double> long_ma;
};

inline const char* signalLabel(SignalKind kind) {
    switch (kind) {
        case SignalKind::Buy: return "BUY";
        case SignalKind::Sell: return "SELL";
        case SignalKind::Hold: return "HOLD";
    }
    return "HOLD";
}

inline const char* positionLabel(Position p) {
    return p == Position::Long ? "Holding" : "Not Holding";
}

inline const char* policyName(PolicyKind kind) {
    switch (kind) {
        case PolicyKind::LevelCount: return "level";
        case PolicyKind::PlainCrossover: return "crossover";
        case PolicyKind::ThresholdGatedCrossover: return "gated";
    }
    return "crossover";
}

} // namespace mabt
