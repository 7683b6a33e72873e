// File: src/core/feature_vector.hpp
#pragma once

#include <cstddef>
#include <vector>
#include <string>
#include <iosfwd>

namespace medeq {

/// Weighted coordinates of one medication record.
///
/// Components are stored in double precision so that rank + count/divisor
/// scores stay distinguishable for large frequency tables. All binary
/// operations require both operands to have the same number of components
/// and throw std::invalid_argument otherwise.
class FeatureVector {
public:
    using Components = std::vector<double>;

    FeatureVector() = default;
    explicit FeatureVector(size_t dimension);
    explicit FeatureVector(Components components);

    size_t Dimension() const { return components_.size(); }

    double operator[](size_t index) const { return components_[index]; }
    double& operator[](size_t index) { return components_[index]; }

    const Components& Data() const { return components_; }

    /// Distance used for similarity scores
    double EuclideanDistance(const FeatureVector& other) const;

    /// Distance used for assignment and inertia
    double SquaredDistance(const FeatureVector& other) const;

    /// Component-wise accumulation (centroid sums)
    FeatureVector& operator+=(const FeatureVector& other);

    /// Uniform scaling (centroid means)
    FeatureVector& operator*=(double factor);

    /// Equal when every component differs by at most 1e-12
    bool operator==(const FeatureVector& other) const;
    bool operator!=(const FeatureVector& other) const { return !(*this == other); }

    /// Blob layout: uint32 component count, then raw doubles
    void Serialize(std::ostream& out) const;
    static FeatureVector Deserialize(std::istream& in);

    /// "(c0, c1, ..., +N)" with at most `shown` components printed
    std::string ToString(size_t shown = 6) const;

private:
    void RequireSameDimension(const FeatureVector& other, const char* operation) const;

    Components components_;
};

} // namespace medeq
