// File: src/core/equivalence_engine.hpp
#pragma once

#include "clustering/kmeans_cluster_model.hpp"
#include "core/trained_model.hpp"
#include "encoding/categorical_encoder.hpp"
#include "encoding/validity_classifier.hpp"
#include "encoding/vector_assembler.hpp"
#include "equivalence/batch_homologation.hpp"
#include "equivalence/equivalence_resolver.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace medeq {

/// EquivalenceEngine - Train, publish and query equivalence models
///
/// Training runs the full pipeline over one batch: eligibility, frequency
/// tables, vector assembly, scaling and clustering. The result is an
/// immutable TrainedModel. Publishing swaps it in atomically; queries
/// always run against one complete model and never block on training.
class EquivalenceEngine {
public:
    /// Configuration for the equivalence engine
    struct Config {
        Config() = default;

        EligibilityRules eligibility;
        CategoricalEncoder::Config encoder;
        VectorAssembler::Config assembler;
        FitParameters clustering;
        EquivalenceResolver::Config resolver;

        /// Choose k with the elbow heuristic instead of clustering.k
        bool auto_select_k{false};

        bool debug_logging{false};
    };

    /// Summary of the published model
    struct Statistics {
        bool has_model{false};
        SnapshotID snapshot_id;
        size_t records{0};
        size_t eligible{0};
        size_t training_members{0};
        size_t excluded{0};
        size_t cluster_count{0};
        double inertia{0.0};
        std::vector<size_t> cluster_sizes;
    };

    EquivalenceEngine();

    /// @param model Clustering algorithm; k-means when null
    /// @throws ConfigurationError for invalid weights or breakpoints
    explicit EquivalenceEngine(const Config& config,
                               std::unique_ptr<ClusterModel> model = nullptr);

    // Disable copy and move
    EquivalenceEngine(const EquivalenceEngine&) = delete;
    EquivalenceEngine& operator=(const EquivalenceEngine&) = delete;
    EquivalenceEngine(EquivalenceEngine&&) = delete;
    EquivalenceEngine& operator=(EquivalenceEngine&&) = delete;

    // ========================================================================
    // Training
    // ========================================================================

    /// Train a model over one batch without publishing it.
    /// Records failing a numeric transform are excluded and reported.
    /// @throws std::invalid_argument on duplicate CUMs
    /// @throws InsufficientData if fewer training members than clusters
    std::shared_ptr<const TrainedModel> Train(const std::vector<MedicationRecord>& records) const;

    /// Make a model visible to queries
    /// @throws std::invalid_argument if model is null
    void Publish(std::shared_ptr<const TrainedModel> model);

    /// Train and publish; the previous model stays live if training fails
    std::shared_ptr<const TrainedModel> TrainAndPublish(const std::vector<MedicationRecord>& records);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Currently published model, null before the first publish
    std::shared_ptr<const TrainedModel> GetModel() const;

    bool HasModel() const { return GetModel() != nullptr; }

    /// Resolver bound to the currently published model
    /// @throws UnresolvableQuery if no model is published
    EquivalenceResolver GetResolver() const;

    /// Substitutes of a known record
    /// @throws UnresolvableQuery
    CandidateSequence Query(const RecordID& cum,
                            const QueryOptions& options = QueryOptions::Default()) const;

    /// Substitutes of an ad-hoc weighted vector
    CandidateSequence QueryVector(const FeatureVector& vector,
                                  const QueryOptions& options = QueryOptions::Default(),
                                  const std::optional<std::string>& query_atc = std::nullopt) const;

    /// Substitutes of a record outside the batch
    CandidateSequence QueryRecord(const MedicationRecord& record,
                                  const QueryOptions& options = QueryOptions::Default()) const;

    /// Homologate a list of CUMs against the published model
    HomologationSummary Homologate(const std::vector<std::string>& cums,
                                   const QueryOptions& options = QueryOptions::Default()) const;

    /// Record of the published model
    std::optional<MedicationRecord> GetRecord(const RecordID& cum) const;

    // ========================================================================
    // Statistics & Information
    // ========================================================================

    Statistics GetStatistics() const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    ValidityClassifier classifier_;
    CategoricalEncoder encoder_;
    VectorAssembler assembler_;
    std::unique_ptr<ClusterModel> model_;

    mutable std::mutex train_mutex_;
    std::shared_ptr<const TrainedModel> current_;

    std::shared_ptr<const TrainedModel> RequireModel() const;

    void LogDebug(const std::string& message) const;
};

} // namespace medeq
