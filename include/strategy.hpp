#pragma once

#include "bar.hpp"
#include "signal.hpp"
#include <memory>

namespace mabt {

class IContext;  // forward declaration

/// Interface a signal policy implements.
/// The engine calls onBar() for each bar in date order (no look-ahead).
class IStrategy {
public:
    virtual ~IStrategy() = default;

    /// Called once per bar. Use ctx to request signals and read state.
    virtual void onBar(const Bar& bar, IContext& ctx) = 0;

    /// Optional: called before the first bar.
    virtual void onStart(IContext& /*ctx*/) {}

    /// Optional: called after the last bar, with barIndex() still on the last bar.
    virtual void onEnd(IContext& /*ctx*/) {}
};

/// Factory: strategy object for a policy. A fresh instance per run keeps runs independent.
std::unique_ptr<IStrategy> createStrategy(const SignalPolicy& policy);

} // namespace mabt
