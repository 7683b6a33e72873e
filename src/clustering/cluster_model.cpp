// File: src/clustering/cluster_model.cpp
#include "clustering/cluster_model.hpp"
#include "core/errors.hpp"

namespace medeq {

void FitParameters::Validate() const {
    if (k == 0) {
        throw ConfigurationError("k must be greater than 0");
    }
    if (n_restarts == 0) {
        throw ConfigurationError("n_restarts must be greater than 0");
    }
    if (!(tolerance >= 0.0)) {
        throw ConfigurationError("tolerance must be non-negative");
    }
}

} // namespace medeq
