#pragma once

#include "pepsolver/core/data.hpp"
#include "pepsolver/core/iproblem.hpp"
#include "pepsolver/core/context.hpp"

namespace pepsolver::mh {

    /**
     * Thrown when the validity regeneration loop exhausts its retry budget
     * without drawing a single valid individual.
     */
    class UnsatisfiablePredicateError : public std::runtime_error {
        public:
            explicit UnsatisfiablePredicateError(int retries)
                : std::runtime_error("validity predicate unsatisfiable after " + std::to_string(retries) + " retries"),
                  retries_(retries) {}

            int retries() const { return retries_; }

        private:
            int retries_;
    };

    /**
     * Class: NeighbourGA
     * Description: Genetic Algorithm with problem-aware recombination.
     * Features:
     * - Tournament selection of size 3.
     * - Uniform, guided (full fitness) or approximate guided (local score) crossover.
     * - Length-preserving mutation (substitution, inversion) followed by repair.
     * - Optional positional hill-climbing of the children.
     * - Domain-validity filter with capped regeneration.
     * - Optional elitism: the previous best survives into the next generation.
     */
    class NeighbourGA {
        public:
            static constexpr int TOURNAMENT_SIZE = 3;

            NeighbourGA(const core::TNGAParams &params, const core::IProblem &problem);

            core::TRunResult<core::TGenStats> run(unsigned int seed) const;

            // fresh valid individual, throws UnsatisfiablePredicateError after maxValidityRetries draws
            core::TSeq regenerateValid(core::SearchContext &ctx) const;


        private:
            void stepGeneration(std::vector<core::TSol> &Pop, core::SearchContext &ctx) const;
            std::pair<core::TSeq, core::TSeq> recombine(const core::TSeq &a, const core::TSeq &b,
                                                        core::SearchContext &ctx) const;
            void refine(core::TSol &child, core::SearchContext &ctx) const;

            const core::TNGAParams params_;
            const core::IProblem &problem_;
    };

} // namespace pepsolver::mh
