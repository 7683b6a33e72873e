// File: src/encoding/numeric_transforms.cpp
#include "encoding/numeric_transforms.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace medeq {

double LogFeature(double q) {
    if (!std::isfinite(q) || q <= 0.0) {
        std::ostringstream oss;
        oss << "Quantity must be positive for log transform, got " << q;
        throw InvalidQuantity(oss.str());
    }
    return std::log(q);
}

double RatioFeature(double q, double q_ref) {
    if (!std::isfinite(q) || !std::isfinite(q_ref)) {
        throw InvalidQuantity("Quantities must be finite for ratio transform");
    }
    if (q_ref == 0.0) {
        throw InvalidQuantity("Reference quantity is zero in ratio transform");
    }
    double ratio = q / q_ref;
    if (!std::isfinite(ratio)) {
        throw InvalidQuantity("Ratio transform overflows");
    }
    return ratio;
}

size_t BinFeature(double q, const std::vector<double>& breakpoints) {
    auto it = std::upper_bound(breakpoints.begin(), breakpoints.end(), q);
    return static_cast<size_t>(it - breakpoints.begin());
}

void ValidateBreakpoints(const std::vector<double>& breakpoints) {
    for (size_t i = 0; i < breakpoints.size(); ++i) {
        if (!std::isfinite(breakpoints[i])) {
            throw ConfigurationError("Bin breakpoints must be finite");
        }
        if (i > 0 && breakpoints[i] <= breakpoints[i - 1]) {
            throw ConfigurationError("Bin breakpoints must be strictly increasing");
        }
    }
}

std::vector<double> DefaultQuantityBreakpoints() {
    return {10.0, 100.0, 500.0};
}

} // namespace medeq
