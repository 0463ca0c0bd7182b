#pragma once

#include "pepsolver/core/iproblem.hpp"
#include "pepsolver/core/scoring.hpp"

namespace pepsolver::core {

    //----------------- DEFINITION OF PROBLEM SPECIFIC TYPES -----------------------
    enum class ELengthPolicy { FIXED = 1, VARIABLE };

    struct TPeptideOptions
    {
        ELengthPolicy length = ELengthPolicy::FIXED;    // fixed: length == motif length
        int minLength = 8;                              // variable mode only
        int maxLength = 16;                             // variable mode only
    };

    //--------------------------------------------------------------------------
    // Class: PeptideProblem
    // Description: peptide design against the reference motif catalog.
    // The scoring configuration is copied at construction and never changes.
    //--------------------------------------------------------------------------
    class PeptideProblem : public IProblem {
        public:
            PeptideProblem(std::shared_ptr<const IScoringProvider> scoring,
                           TScoringConfig config,
                           TPeptideOptions options = {});

            TSeq randomIndividual(SearchContext &ctx) const override;
            double evaluate(const TSeq &s) const override;
            std::vector<TNeighbour> neighbourhood(SearchContext &ctx, const TSeq &s, int size) const override;
            void applyMove(TSeq &s, const TMove &mv) const override;
            void repair(TSeq &s, SearchContext &ctx) const override;
            bool isValid(const TSeq &s) const override;
            double localScore(Symbol left, Symbol sym) const override;

            int getDimension() const override { return targetLength_; }
            int alphabetSize() const override { return scoring_->alphabetSize(); }
            bool fixedLength() const override { return options_.length == ELengthPolicy::FIXED; }

            // substitution term only (configured motif or best motif of the catalog)
            double motifEnergy(const TSeq &s) const;

            // adjacency term only
            double adjacencyEnergy(const TSeq &s) const;


        private:
            double motifEnergy(const TSeq &s, const TSeq &motif) const;

            std::shared_ptr<const IScoringProvider> scoring_;
            const TScoringConfig config_;
            const TPeptideOptions options_;
            int targetLength_;
    };

    //-------------------------- DOMAIN VALIDITY --------------------------

    /**
     * Method: MeanHydropathy
     * Description: average Kyte-Doolittle hydropathy of the sequence (0 if empty)
     */
    double MeanHydropathy(const TSeq &s);

    /**
     * Method: IsBiologicallyValid
     * Description: fast heuristics for a plausible, soluble peptide.
     * 1. non-empty, symbols inside the alphabet
     * 2. average hydropathy in [-1.5, 3.0]
     * 3. no "CC" or "PP" adjacent pair
     * 4. no run of 4 or more identical residues
     */
    bool IsBiologicallyValid(const TSeq &s);
}
