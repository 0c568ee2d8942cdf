#include "pipeline/consensus.hpp"
#include "text/text_normalize.hpp"
#include "text/vector_similarity.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_map>

namespace nugget {

namespace {

// Strip ASCII punctuation from both ends so "gate." and "gate" count as one word
std::string strip_punctuation(const std::string& word) {
    size_t begin = 0;
    size_t end = word.size();
    while (begin < end && std::ispunct(static_cast<unsigned char>(word[begin]))) ++begin;
    while (end > begin && std::ispunct(static_cast<unsigned char>(word[end - 1]))) --end;
    return word.substr(begin, end - begin);
}

std::vector<float> centroid_of(const std::vector<std::vector<float>>& vectors) {
    std::vector<float> centroid(vectors.front().size(), 0.0f);
    for (const auto& v : vectors) {
        for (size_t i = 0; i < v.size(); ++i) {
            centroid[i] += v[i];
        }
    }
    for (auto& component : centroid) {
        component /= static_cast<float>(vectors.size());
    }
    return centroid;
}

struct Member {
    size_t run;
    const RawCandidate* candidate;
};

struct RankedGroup {
    size_t first_member;        ///< Position of the earliest member
    ConsensusCandidate consensus;
};

} // anonymous namespace

std::vector<std::vector<float>> term_frequency_vectors(const std::vector<std::string>& passages) {
    std::unordered_map<std::string, size_t> vocabulary;
    std::vector<std::vector<size_t>> word_ids(passages.size());

    for (size_t p = 0; p < passages.size(); ++p) {
        for (const auto& token : tokenize_words(advanced_normalize(passages[p]))) {
            std::string word = strip_punctuation(token);
            if (word.empty()) continue;

            auto inserted = vocabulary.emplace(word, vocabulary.size());
            word_ids[p].push_back(inserted.first->second);
        }
    }

    // Keep at least one dimension so empty passages compare as zero vectors
    size_t dimensions = std::max<size_t>(1, vocabulary.size());

    std::vector<std::vector<float>> vectors;
    vectors.reserve(passages.size());
    for (const auto& ids : word_ids) {
        std::vector<float> v(dimensions, 0.0f);
        for (size_t id : ids) {
            v[id] += 1.0f;
        }
        vectors.push_back(std::move(v));
    }
    return vectors;
}

std::vector<ConsensusCandidate> build_consensus(
    const std::vector<std::vector<RawCandidate>>& runs,
    double similarity_threshold,
    int min_supporting_runs
) {
    if (runs.empty()) {
        return {};
    }

    std::vector<Member> members;
    std::vector<std::string> passages;
    for (size_t r = 0; r < runs.size(); ++r) {
        for (const auto& candidate : runs[r]) {
            members.push_back({r, &candidate});
            passages.push_back(candidate.full_content);
        }
    }

    std::vector<std::vector<float>> vectors = term_frequency_vectors(passages);

    // Nugget types in order of first appearance
    std::vector<NuggetType> types;
    for (const auto& member : members) {
        if (std::find(types.begin(), types.end(), member.candidate->type) == types.end()) {
            types.push_back(member.candidate->type);
        }
    }

    std::vector<RankedGroup> ranked;
    for (NuggetType type : types) {
        std::vector<size_t> indices;
        std::vector<std::vector<float>> type_vectors;
        for (size_t m = 0; m < members.size(); ++m) {
            if (members[m].candidate->type == type) {
                indices.push_back(m);
                type_vectors.push_back(vectors[m]);
            }
        }

        for (const auto& group : group_by_similarity(type_vectors, similarity_threshold)) {
            std::vector<std::vector<float>> group_vectors;
            std::set<size_t> group_runs;
            for (size_t g : group) {
                group_vectors.push_back(type_vectors[g]);
                group_runs.insert(members[indices[g]].run);
            }

            SimilarityMatch nearest = find_most_similar(centroid_of(group_vectors), group_vectors, -1.0);
            size_t representative = indices[group[nearest.found ? static_cast<size_t>(nearest.index) : 0]];

            RankedGroup entry;
            entry.first_member = indices[group.front()];
            entry.consensus.candidate = *members[representative].candidate;
            entry.consensus.supporting_runs = static_cast<int>(group_runs.size());
            entry.consensus.group_size = static_cast<int>(group.size());
            entry.consensus.agreement =
                static_cast<double>(group_runs.size()) / static_cast<double>(runs.size());
            entry.consensus.cohesion = group_cohesion(group_vectors);
            entry.consensus.candidate.confidence = entry.consensus.agreement;

            if (entry.consensus.supporting_runs >= min_supporting_runs) {
                ranked.push_back(std::move(entry));
            }
        }
    }

    std::sort(ranked.begin(), ranked.end(), [](const RankedGroup& a, const RankedGroup& b) {
        if (a.consensus.supporting_runs != b.consensus.supporting_runs) {
            return a.consensus.supporting_runs > b.consensus.supporting_runs;
        }
        return a.first_member < b.first_member;
    });

    std::vector<ConsensusCandidate> result;
    result.reserve(ranked.size());
    for (auto& entry : ranked) {
        result.push_back(std::move(entry.consensus));
    }
    return result;
}

} // namespace nugget
