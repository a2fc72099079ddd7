#pragma once

#include <optional>
#include <stdexcept>

namespace fdr {

    // Value written by upstream tools for "redacted / unavailable"
    constexpr double REDACTED_SENTINEL = -999.0;

    // One telemetry cell: either a measurement or an explicit no-data marker.
    // The sentinel only exists at the I/O boundary (from_wire / to_wire).
    class Sample {
    public:
        Sample() = default;

        static Sample measured(double value) { return Sample(value); }
        static Sample redacted() { return Sample(); }

        static Sample from_wire(double raw) {
            return raw == REDACTED_SENTINEL ? Sample() : Sample(raw);
        }

        bool is_redacted() const { return !_value.has_value(); }
        bool is_measured() const { return _value.has_value(); }

        double value() const {
            if (!_value) throw std::runtime_error("Called value on a redacted Sample");
            return *_value;
        }

        double value_or(double fallback) const { return _value.value_or(fallback); }

        double to_wire() const { return _value.value_or(REDACTED_SENTINEL); }

        bool operator==(const Sample& other) const { return _value == other._value; }
        bool operator!=(const Sample& other) const { return !(*this == other); }

    private:
        explicit Sample(double value) : _value(value) {}

        std::optional<double> _value;
    };

} // namespace fdr
