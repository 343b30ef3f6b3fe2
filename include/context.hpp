#pragma once

#include "bar.hpp"
#include "signal.hpp"
#include <optional>

namespace mabt {

/// View of the run a strategy sees while the engine walks the series.
class IContext {
public:
    virtual ~IContext() = default;

    /// Request a signal at the current bar. Buy opens, Sell closes; the engine
    /// ignores requests that do not match the current position.
    virtual void signal(SignalKind kind) = 0;

    /// Current position (before any signal on this bar).
    virtual Position position() const = 0;

    /// Index of the bar being processed (0-based).
    virtual std::size_t barIndex() const = 0;

    /// Full series. Strategies must not read past barIndex() (no look-ahead).
    virtual const Series& series() const = 0;

    /// Moving averages at bar i; nullopt while history is insufficient.
    virtual std::optional<double> shortMa(std::size_t i) const = 0;
    virtual std::optional<double> longMa(std::size_t i) const = 0;

    virtual int longWindow() const = 0;
};

} // namespace mabt
