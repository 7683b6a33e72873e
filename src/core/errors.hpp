// File: src/core/errors.hpp
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace medeq {

/// Base of the named failure conditions raised by the equivalence engine.
/// Callers catch the concrete type to tell bad input data, impossible
/// configuration and unanswerable queries apart.
class MedEqError : public std::runtime_error {
public:
    explicit MedEqError(const std::string& what) : std::runtime_error(what) {}
};

/// Non-positive quantity fed to a logarithm, or zero reference quantity fed
/// to a ratio. Recovered per record: the record is excluded from the run.
class InvalidQuantity : public MedEqError {
public:
    explicit InvalidQuantity(const std::string& what) : MedEqError(what) {}
};

/// Fewer valid vectors than the requested cluster count. Fatal to a fit.
class InsufficientData : public MedEqError {
public:
    InsufficientData(size_t available, size_t requested)
        : MedEqError("Insufficient data: " + std::to_string(available) +
                     " valid vectors for " + std::to_string(requested) + " clusters"),
          available_(available), requested_(requested) {}

    size_t available() const { return available_; }
    size_t requested() const { return requested_; }

private:
    size_t available_;
    size_t requested_;
};

/// Every restart of a fit ended with an empty cluster after the bounded
/// number of reseeds.
class DegenerateCluster : public MedEqError {
public:
    explicit DegenerateCluster(const std::string& what) : MedEqError(what) {}
};

/// The query record belongs to no cluster (unknown, or excluded from training).
class UnresolvableQuery : public MedEqError {
public:
    explicit UnresolvableQuery(const std::string& what) : MedEqError(what) {}
};

/// Configuration that cannot be honoured (weights, breakpoints, k, ...).
class ConfigurationError : public MedEqError {
public:
    explicit ConfigurationError(const std::string& what) : MedEqError(what) {}
};

} // namespace medeq
