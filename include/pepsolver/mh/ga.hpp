#pragma once

#include "pepsolver/core/data.hpp"
#include "pepsolver/core/iproblem.hpp"
#include "pepsolver/core/context.hpp"

namespace pepsolver::mh {

    /**
     * Class: GeneticAlgorithm
     * Description: generational Genetic Algorithm without elitism.
     * Features:
     * - Tournament selection (sampling with replacement).
     * - Single-point or uniform crossover.
     * - One weighted mutation per child: substitution, insertion, deletion or swap.
     * For a fixed-length problem the length bounds collapse to the target length.
     */
    class GeneticAlgorithm {
        public:
            GeneticAlgorithm(const core::TGAParams &params, const core::IProblem &problem);

            core::TRunResult<core::TGenStats> run(unsigned int seed) const;

            // one weighted mutation (gated by mutationProb)
            void mutate(core::TSeq &s, core::SearchContext &ctx) const;

            int minLength() const { return minLen_; }
            int maxLength() const { return maxLen_; }

        private:
            std::vector<core::TSol> evolve(const std::vector<core::TSol> &Pop, core::SearchContext &ctx) const;
            core::TSeq crossover(const core::TSeq &p1, const core::TSeq &p2, core::SearchContext &ctx) const;

            const core::TGAParams params_;
            const core::IProblem &problem_;
            int minLen_;
            int maxLen_;
    };

} // namespace pepsolver::mh
