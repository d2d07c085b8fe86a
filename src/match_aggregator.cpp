#include "peptigram/match_aggregator.hpp"
#include "peptigram/sequence_matcher.hpp"

#include <algorithm>
#include <iterator>

namespace peptigram {

bool occurrence_before(const Occurrence& a, const Occurrence& b) {
    if (a.start != b.start) return a.start < b.start;
    return (a.end - a.start) < (b.end - b.start);
}

std::vector<Occurrence> aggregate(const std::vector<std::string>& peptides,
                                  const std::string& protein,
                                  int budget) {
    if (budget < 0) {
        throw ConfigurationError("budget", budget, "must be >= 0");
    }

    std::vector<Occurrence> all;
    for (const auto& peptide : peptides) {
        auto hits = find_occurrences(peptide, protein, budget);
        all.insert(all.end(),
                   std::make_move_iterator(hits.begin()),
                   std::make_move_iterator(hits.end()));
    }

    std::stable_sort(all.begin(), all.end(), occurrence_before);
    return all;
}

}  // namespace peptigram
