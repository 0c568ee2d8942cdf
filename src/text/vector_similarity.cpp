#include "text/vector_similarity.hpp"
#include <algorithm>
#include <cmath>

namespace nugget {

namespace {

void check_components(const std::vector<float>& v, const char* name) {
    for (size_t i = 0; i < v.size(); ++i) {
        if (!std::isfinite(v[i])) {
            throw VectorSimilarityError(
                VectorSimilarityError::Kind::InvalidComponent,
                std::string("Invalid component in ") + name +
                " at index " + std::to_string(i),
                i
            );
        }
    }
}

double magnitude(const std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * static_cast<double>(x);
    }
    return std::sqrt(sum);
}

} // anonymous namespace

double cosine_similarity(const std::vector<float>& u, const std::vector<float>& v) {
    if (u.empty() || v.empty()) {
        throw VectorSimilarityError(
            VectorSimilarityError::Kind::EmptyVector,
            "Vectors cannot be empty"
        );
    }

    if (u.size() != v.size()) {
        throw VectorSimilarityError(
            VectorSimilarityError::Kind::DimensionMismatch,
            "Vector dimension mismatch: " + std::to_string(u.size()) +
            " vs " + std::to_string(v.size())
        );
    }

    check_components(u, "first vector");
    check_components(v, "second vector");

    double mag_u = magnitude(u);
    double mag_v = magnitude(v);
    if (mag_u == 0.0 || mag_v == 0.0) {
        return 0.0;
    }

    double dot = 0.0;
    for (size_t i = 0; i < u.size(); ++i) {
        dot += static_cast<double>(u[i]) * static_cast<double>(v[i]);
    }

    return std::max(-1.0, std::min(1.0, dot / (mag_u * mag_v)));
}

std::vector<float> normalize_vector(const std::vector<float>& v) {
    double mag = magnitude(v);
    if (mag == 0.0) {
        return std::vector<float>(v.size(), 0.0f);
    }

    std::vector<float> result;
    result.reserve(v.size());
    for (float x : v) {
        result.push_back(static_cast<float>(x / mag));
    }
    return result;
}

std::vector<double> batch_cosine_similarity(
    const std::vector<std::vector<float>>& us,
    const std::vector<std::vector<float>>& vs
) {
    if (us.size() != vs.size()) {
        throw VectorSimilarityError(
            VectorSimilarityError::Kind::BatchSizeMismatch,
            "Batch size mismatch: " + std::to_string(us.size()) +
            " vs " + std::to_string(vs.size())
        );
    }

    std::vector<double> results;
    results.reserve(us.size());

    for (size_t i = 0; i < us.size(); ++i) {
        try {
            results.push_back(cosine_similarity(us[i], vs[i]));
        } catch (const VectorSimilarityError& e) {
            throw VectorSimilarityError(
                e.kind(),
                "Error calculating similarity for pair " + std::to_string(i) +
                ": " + e.what(),
                e.component_index(),
                i
            );
        }
    }

    return results;
}

SimilarityMatch find_most_similar(
    const std::vector<float>& query,
    const std::vector<std::vector<float>>& candidates,
    double threshold
) {
    SimilarityMatch best;
    double best_similarity = -1.0;

    for (size_t i = 0; i < candidates.size(); ++i) {
        double similarity = 0.0;
        try {
            similarity = cosine_similarity(query, candidates[i]);
        } catch (const VectorSimilarityError&) {
            best.skipped++;
            continue;
        }

        if (similarity >= threshold && (!best.found || similarity > best_similarity)) {
            best_similarity = similarity;
            best.index = static_cast<int>(i);
            best.similarity = similarity;
            best.found = true;
        }
    }

    return best;
}

std::vector<std::vector<size_t>> group_by_similarity(
    const std::vector<std::vector<float>>& vectors,
    double threshold
) {
    std::vector<std::vector<size_t>> groups;
    std::vector<bool> grouped(vectors.size(), false);

    for (size_t i = 0; i < vectors.size(); ++i) {
        if (grouped[i]) continue;

        std::vector<size_t> group = {i};
        grouped[i] = true;

        for (size_t j = i + 1; j < vectors.size(); ++j) {
            if (grouped[j]) continue;

            try {
                if (cosine_similarity(vectors[i], vectors[j]) >= threshold) {
                    group.push_back(j);
                    grouped[j] = true;
                }
            } catch (const VectorSimilarityError&) {
                // Malformed pair: j stays available for a later representative
            }
        }

        groups.push_back(std::move(group));
    }

    return groups;
}

double group_cohesion(const std::vector<std::vector<float>>& vectors) {
    if (vectors.size() < 2) {
        return 1.0;
    }

    double total = 0.0;
    size_t comparisons = 0;

    for (size_t i = 0; i < vectors.size(); ++i) {
        for (size_t j = i + 1; j < vectors.size(); ++j) {
            try {
                total += cosine_similarity(vectors[i], vectors[j]);
                comparisons++;
            } catch (const VectorSimilarityError&) {
                continue;
            }
        }
    }

    return comparisons > 0 ? total / static_cast<double>(comparisons) : 0.0;
}

} // namespace nugget
