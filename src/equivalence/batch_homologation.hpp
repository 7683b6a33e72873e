// File: src/equivalence/batch_homologation.hpp
#pragma once

#include "equivalence/equivalence_resolver.hpp"
#include <optional>
#include <string>
#include <vector>

namespace medeq {

/// Outcome of homologating one CUM
enum class HomologationStatus : uint8_t {
    FOUND = 0,           // At least one substitute
    NO_SUBSTITUTE = 1,   // Resolved, but no candidate passed
    UNRESOLVABLE = 2,    // Unknown CUM or record without a vector
};

const char* ToString(HomologationStatus status);

/// Quote a CSV field when it contains a separator, quote or newline
std::string EscapeCsvField(const std::string& value);

/// One output row, in input order
struct HomologationRow {
    RecordID query;
    HomologationStatus status{HomologationStatus::UNRESOLVABLE};
    std::optional<size_t> cluster_label;
    std::vector<Candidate> substitutes;   // Best first, at most top_k
    std::string message;                  // Reason when UNRESOLVABLE
};

/// Rows plus per-status counts
struct HomologationSummary {
    std::vector<HomologationRow> rows;
    size_t found{0};
    size_t no_substitute{0};
    size_t unresolvable{0};
    size_t skipped{0};                    // Blank or repeated input lines

    /// Comma-separated table: query, status, cluster, substitute, distance, similarity
    std::string ToCsv() const;
};

/// BatchHomologation: Resolves a list of CUMs against one resolver.
///
/// Input CUMs are trimmed; blank entries and repeats of an earlier CUM are
/// skipped. Output rows follow input order. An unresolvable CUM becomes an
/// UNRESOLVABLE row rather than aborting the batch.
class BatchHomologation {
public:
    explicit BatchHomologation(const EquivalenceResolver& resolver);

    HomologationSummary Run(const std::vector<std::string>& cums,
                            const QueryOptions& options = QueryOptions::Default()) const;

    /// Trimmed, de-duplicated CUMs in input order
    static std::vector<std::string> NormalizeInput(const std::vector<std::string>& cums,
                                                   size_t* skipped = nullptr);

private:
    const EquivalenceResolver& resolver_;
};

} // namespace medeq
