#pragma once

#include <cmath>

namespace trade_analytics {

/**
 * A scalar result that may have no meaningful value.
 *
 * UNDEFINED covers zero variance, zero drawdown, too few observations and any
 * non-finite intermediate. UNBOUNDED is the "no losses at all" reading of
 * ratios like profit factor. Neither is an error.
 */
class Metric {
public:
    enum class State { VALUE, UNDEFINED, UNBOUNDED };

    Metric() = default;

    // Non-finite input collapses to UNDEFINED.
    static Metric of(double v) {
        if (!std::isfinite(v)) return undefined();
        Metric m;
        m.state_ = State::VALUE;
        m.value_ = v;
        return m;
    }

    static Metric undefined() { return Metric{}; }

    static Metric unbounded() {
        Metric m;
        m.state_ = State::UNBOUNDED;
        return m;
    }

    State state() const { return state_; }
    bool has_value() const { return state_ == State::VALUE; }
    bool is_undefined() const { return state_ == State::UNDEFINED; }
    bool is_unbounded() const { return state_ == State::UNBOUNDED; }

    // Only meaningful when has_value().
    double value() const { return value_; }

    bool operator==(const Metric& other) const {
        if (state_ != other.state_) return false;
        return state_ != State::VALUE || value_ == other.value_;
    }
    bool operator!=(const Metric& other) const { return !(*this == other); }

private:
    State state_{State::UNDEFINED};
    double value_{0.0};
};

} // namespace trade_analytics
