// File: src/equivalence/batch_homologation.cpp
#include "equivalence/batch_homologation.hpp"
#include "core/errors.hpp"
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace medeq {

namespace {

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

} // anonymous namespace

const char* ToString(HomologationStatus status) {
    switch (status) {
        case HomologationStatus::FOUND: return "FOUND";
        case HomologationStatus::NO_SUBSTITUTE: return "NO_SUBSTITUTE";
        case HomologationStatus::UNRESOLVABLE: return "UNRESOLVABLE";
        default: return "UNKNOWN";
    }
}

std::string EscapeCsvField(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string HomologationSummary::ToCsv() const {
    std::ostringstream oss;
    oss << std::setprecision(6);
    oss << "query,status,cluster,substitute,distance,similarity\n";
    for (const auto& row : rows) {
        std::string cluster = row.cluster_label ? std::to_string(*row.cluster_label) : "";
        if (row.substitutes.empty()) {
            oss << EscapeCsvField(row.query) << "," << ToString(row.status) << ","
                << cluster << ",,,\n";
            continue;
        }
        for (const auto& candidate : row.substitutes) {
            oss << EscapeCsvField(row.query) << "," << ToString(row.status) << ","
                << cluster << "," << EscapeCsvField(candidate.cum) << ","
                << candidate.distance << "," << candidate.similarity << "\n";
        }
    }
    return oss.str();
}

BatchHomologation::BatchHomologation(const EquivalenceResolver& resolver)
    : resolver_(resolver)
{
}

std::vector<std::string> BatchHomologation::NormalizeInput(
    const std::vector<std::string>& cums,
    size_t* skipped
) {
    std::vector<std::string> normalized;
    std::unordered_set<std::string> seen;
    size_t skip_count = 0;

    for (const auto& raw : cums) {
        std::string cum = Trim(raw);
        if (cum.empty() || !seen.insert(cum).second) {
            skip_count++;
            continue;
        }
        normalized.push_back(std::move(cum));
    }

    if (skipped != nullptr) {
        *skipped = skip_count;
    }
    return normalized;
}

HomologationSummary BatchHomologation::Run(
    const std::vector<std::string>& cums,
    const QueryOptions& options
) const {
    HomologationSummary summary;
    auto queries = NormalizeInput(cums, &summary.skipped);
    summary.rows.reserve(queries.size());

    for (auto& cum : queries) {
        HomologationRow row;
        row.query = cum;
        try {
            CandidateSequence sequence = resolver_.Query(cum, options);
            row.cluster_label = sequence.GetClusterLabel();
            row.substitutes = sequence.Results();
            if (row.substitutes.empty()) {
                row.status = HomologationStatus::NO_SUBSTITUTE;
                summary.no_substitute++;
            } else {
                row.status = HomologationStatus::FOUND;
                summary.found++;
            }
        } catch (const UnresolvableQuery& e) {
            row.status = HomologationStatus::UNRESOLVABLE;
            row.message = e.what();
            summary.unresolvable++;
        }
        summary.rows.push_back(std::move(row));
    }

    return summary;
}

} // namespace medeq
