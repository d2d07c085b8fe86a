#include "peptigram/sequence_matcher.hpp"

#include <algorithm>
#include <utility>

namespace peptigram {

int count_mismatches(const std::string& a, const std::string& b) {
    const size_t n = std::min(a.size(), b.size());
    int diff = 0;
    for (size_t i = 0; i < n; ++i) {
        if (a[i] != b[i]) ++diff;
    }
    return diff;
}

// Hamming distance of peptide against protein[offset, offset+len).
// Stops counting once the budget is exceeded; callers only need the exact
// value for windows that qualify.
static int window_mismatches(const char* peptide, const char* window,
                             size_t len, int budget) {
    int diff = 0;
    for (size_t k = 0; k < len; ++k) {
        if (peptide[k] != window[k]) {
            if (++diff > budget) break;
        }
    }
    return diff;
}

std::vector<Occurrence> find_occurrences(const std::string& peptide,
                                         const std::string& protein,
                                         int budget) {
    if (budget < 0) {
        throw ConfigurationError("budget", budget, "must be >= 0");
    }

    std::vector<Occurrence> hits;
    const size_t pep_len = peptide.size();
    const size_t prot_len = protein.size();

    // Peptide cannot occur
    if (pep_len == 0 || pep_len > prot_len) {
        return hits;
    }

    const char* pep = peptide.data();
    const char* prot = protein.data();

    for (size_t i = 0; i + pep_len <= prot_len; ++i) {
        const int diff = window_mismatches(pep, prot + i, pep_len, budget);
        if (diff > budget) continue;

        Occurrence occ;
        occ.peptide = peptide;
        occ.start = static_cast<Position>(i + 1);  // 1-based
        occ.end = static_cast<Position>(i + pep_len);
        occ.mismatches = diff;
        occ.matched_text.assign(prot + i, pep_len);
        hits.push_back(std::move(occ));
    }

    return hits;
}

}  // namespace peptigram
