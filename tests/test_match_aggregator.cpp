// Unit tests for per-protein match aggregation
// Compile: g++ -std=c++17 -I../include -o test_match_aggregator test_match_aggregator.cpp \
//          ../src/match_aggregator.cpp ../src/sequence_matcher.cpp

#include "peptigram/match_aggregator.hpp"
#include "peptigram/sequence_matcher.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using peptigram::aggregate;

void test_empty_peptide_list() {
    std::cout << "Testing empty peptide list... ";
    assert(aggregate({}, "MKVLATG", 0).empty());
    assert(aggregate({}, "MKVLATG", 3).empty());
    std::cout << "PASSED\n";
}

void test_sorted_by_start() {
    std::cout << "Testing sort by start... ";
    std::string protein = "MKVLATGKVLAT";
    auto hits = aggregate({"LAT", "MKV", "GKV"}, protein, 0);
    assert(hits.size() == 4);
    assert(hits[0].peptide == "MKV" && hits[0].start == 1);
    assert(hits[1].peptide == "LAT" && hits[1].start == 4);
    assert(hits[2].peptide == "GKV" && hits[2].start == 7);
    assert(hits[3].peptide == "LAT" && hits[3].start == 10);
    std::cout << "PASSED\n";
}

void test_shorter_first_at_same_start() {
    std::cout << "Testing shorter span first at same start... ";
    auto hits = aggregate({"KVLAT", "KV", "KVL"}, "MKVLATG", 0);
    assert(hits.size() == 3);
    assert(hits[0].peptide == "KV");
    assert(hits[1].peptide == "KVL");
    assert(hits[2].peptide == "KVLAT");
    for (const auto& h : hits) assert(h.start == 2);
    std::cout << "PASSED\n";
}

void test_no_deduplication() {
    std::cout << "Testing duplicates kept... ";
    // Same peptide listed twice and a second peptide covering the same span
    auto hits = aggregate({"KVL", "KVL", "KVI"}, "MKVLATG", 1);
    assert(hits.size() == 3);
    for (const auto& h : hits) {
        assert(h.start == 2 && h.end == 4);
        assert(h.matched_text == "KVL");
    }
    // Stable: equal keys keep peptide order
    assert(hits[0].peptide == "KVL" && hits[0].mismatches == 0);
    assert(hits[1].peptide == "KVL");
    assert(hits[2].peptide == "KVI" && hits[2].mismatches == 1);
    std::cout << "PASSED\n";
}

void test_union_of_individual_searches() {
    std::cout << "Testing union of per-peptide results... ";
    std::string protein = "ACDEFGHIKLMNPQRSTVWYACDEFGHIKL";
    std::vector<std::string> peptides = {"ACD", "GHIK", "WYA", "QQQ", "EFGHIKLMNPQRSTVWYACDEFGHIKLAAAA"};
    size_t expected = 0;
    for (const auto& p : peptides) {
        expected += peptigram::find_occurrences(p, protein, 1).size();
    }
    auto hits = aggregate(peptides, protein, 1);
    assert(hits.size() == expected);
    for (size_t i = 1; i < hits.size(); ++i) {
        assert(!peptigram::occurrence_before(hits[i], hits[i - 1]));
    }
    std::cout << "PASSED\n";
}

void test_negative_budget_before_search() {
    std::cout << "Testing negative budget... ";
    bool threw = false;
    try {
        (void)aggregate({}, "MKVLATG", -2);
    } catch (const peptigram::ConfigurationError& e) {
        threw = true;
        assert(e.parameter() == "budget");
    }
    assert(threw);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "=== MatchAggregator Tests ===\n";
    test_empty_peptide_list();
    test_sorted_by_start();
    test_shorter_first_at_same_start();
    test_no_deduplication();
    test_union_of_individual_searches();
    test_negative_budget_before_search();
    std::cout << "All tests passed.\n";
    return 0;
}
