// File: src/encoding/numeric_transforms.hpp
#pragma once

#include <cstddef>
#include <vector>

namespace medeq {

/// Natural logarithm of a quantity
/// @throws InvalidQuantity if q <= 0 or q is not finite
double LogFeature(double q);

/// Ratio of a quantity to its reference quantity
/// @throws InvalidQuantity if q_ref == 0 or either operand is not finite
double RatioFeature(double q, double q_ref);

/// Index of the half-open bucket q falls into.
/// Buckets are (-inf, b0), [b0, b1), ..., [b_{n-1}, +inf), so the result is
/// the number of breakpoints <= q, in [0, breakpoints.size()].
/// @param breakpoints Strictly increasing, finite breakpoints
size_t BinFeature(double q, const std::vector<double>& breakpoints);

/// Check a breakpoint set
/// @throws ConfigurationError if not strictly increasing or not finite
void ValidateBreakpoints(const std::vector<double>& breakpoints);

/// Default quantity breakpoints
std::vector<double> DefaultQuantityBreakpoints();

} // namespace medeq
