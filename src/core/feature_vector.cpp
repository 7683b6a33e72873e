// File: src/core/feature_vector.cpp
#include "core/feature_vector.hpp"
#include <cmath>
#include <cstdint>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace medeq {

FeatureVector::FeatureVector(size_t dimension) : components_(dimension, 0.0) {}

FeatureVector::FeatureVector(Components components) : components_(std::move(components)) {}

void FeatureVector::RequireSameDimension(const FeatureVector& other, const char* operation) const {
    if (components_.size() != other.components_.size()) {
        std::ostringstream msg;
        msg << operation << " between vectors of dimension " << components_.size()
            << " and " << other.components_.size();
        throw std::invalid_argument(msg.str());
    }
}

double FeatureVector::SquaredDistance(const FeatureVector& other) const {
    RequireSameDimension(other, "Distance");

    double total = 0.0;
    auto theirs = other.components_.begin();
    for (double mine : components_) {
        const double delta = mine - *theirs++;
        total += delta * delta;
    }
    return total;
}

double FeatureVector::EuclideanDistance(const FeatureVector& other) const {
    return std::sqrt(SquaredDistance(other));
}

FeatureVector& FeatureVector::operator+=(const FeatureVector& other) {
    RequireSameDimension(other, "Accumulation");
    for (size_t i = 0; i < components_.size(); ++i) {
        components_[i] += other.components_[i];
    }
    return *this;
}

FeatureVector& FeatureVector::operator*=(double factor) {
    for (double& component : components_) {
        component *= factor;
    }
    return *this;
}

bool FeatureVector::operator==(const FeatureVector& other) const {
    if (components_.size() != other.components_.size()) {
        return false;
    }
    auto theirs = other.components_.begin();
    for (double mine : components_) {
        if (std::fabs(mine - *theirs++) > 1e-12) {
            return false;
        }
    }
    return true;
}

void FeatureVector::Serialize(std::ostream& out) const {
    const uint32_t count = static_cast<uint32_t>(components_.size());
    out.write(reinterpret_cast<const char*>(&count), sizeof(count));
    if (count > 0) {
        out.write(reinterpret_cast<const char*>(components_.data()),
                  static_cast<std::streamsize>(count * sizeof(double)));
    }
}

FeatureVector FeatureVector::Deserialize(std::istream& in) {
    uint32_t count = 0;
    if (!in.read(reinterpret_cast<char*>(&count), sizeof(count))) {
        throw std::runtime_error("Vector blob is missing its component count");
    }

    Components components(count);
    if (count > 0 &&
        !in.read(reinterpret_cast<char*>(components.data()),
                 static_cast<std::streamsize>(count * sizeof(double)))) {
        throw std::runtime_error("Vector blob holds fewer than " +
                                 std::to_string(count) + " components");
    }
    return FeatureVector(std::move(components));
}

std::string FeatureVector::ToString(size_t shown) const {
    std::ostringstream oss;
    oss.precision(4);
    oss << std::fixed << "(";

    const size_t printed = components_.size() < shown ? components_.size() : shown;
    for (size_t i = 0; i < printed; ++i) {
        oss << (i == 0 ? "" : ", ") << components_[i];
    }
    if (components_.size() > printed) {
        oss << ", +" << (components_.size() - printed);
    }
    oss << ")";
    return oss.str();
}

} // namespace medeq
