#include "peptigram/peptide_mapper.hpp"
#include "peptigram/match_aggregator.hpp"
#include "peptigram/row_packer.hpp"

namespace peptigram {

void validate_config(int budget, const LayoutConfig& layout) {
    if (budget < 0) {
        throw ConfigurationError("budget", budget, "must be >= 0");
    }
    validate_layout(layout);
}

ProteinLayout map_protein(const ProteinSequence& protein,
                          const std::vector<std::string>& peptides,
                          int budget,
                          const LayoutConfig& layout) {
    validate_config(budget, layout);

    ProteinLayout result;
    result.protein_id = protein.id;
    result.protein_length = protein.residues.size();
    result.occurrences = aggregate(peptides, protein.residues, budget);
    result.assignment = pack(result.occurrences, layout);
    return result;
}

std::vector<ProteinLayout> map_proteins(const std::vector<ProteinSequence>& proteins,
                                        const std::vector<std::string>& peptides,
                                        int budget,
                                        const LayoutConfig& layout,
                                        const MappingProgressFn& progress) {
    validate_config(budget, layout);

    std::vector<ProteinLayout> layouts;
    layouts.reserve(proteins.size());
    for (size_t i = 0; i < proteins.size(); ++i) {
        layouts.push_back(map_protein(proteins[i], peptides, budget, layout));
        if (progress) progress(i, proteins.size(), layouts.back());
    }
    return layouts;
}

}  // namespace peptigram
