#pragma once

#include "pepsolver/core/data.hpp"
#include "pepsolver/core/context.hpp"
#include "pepsolver/core/iproblem.hpp"

namespace pepsolver::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------
    bool sortByFitness(const TSol &lhs, const TSol &rhs);

    double get_time_in_seconds();

    // index of the lowest fitness, lowest index on ties
    int BestIndex(const std::vector<TSol> &Pop);

    // min / max / mean fitness of a population
    TGenStats PopulationStats(int generation, const std::vector<TSol> &Pop);

    // -----------------------------------------------------------------------------
    // Solution & Population Management
    // -----------------------------------------------------------------------------
    void CreateInitialSolutions(TSol &s, const IProblem &problem, SearchContext &ctx);
    std::vector<TSol> CreatePopulation(const IProblem &problem, int sizePop, SearchContext &ctx);

    // -----------------------------------------------------------------------------
    // Selection
    // -----------------------------------------------------------------------------

    /**
     * Method: TournamentSelection
     * Description: k individuals sampled with replacement, the first one with
     * the lowest fitness wins. Returns its index in Pop.
     */
    int TournamentSelection(const std::vector<TSol> &Pop, int k, SearchContext &ctx);

    // -----------------------------------------------------------------------------
    // Crossover Operators
    // -----------------------------------------------------------------------------

    // A[0..cut) + B[cut..], cut uniform in [1, min(|A|, |B|)); clone of A without a legal cut
    TSeq SinglePointCrossover(const TSeq &a, const TSeq &b, SearchContext &ctx);

    // clone of A where each position of the common prefix takes B's allele with probability 1/2
    TSeq UniformCrossover(const TSeq &a, const TSeq &b, SearchContext &ctx);

    // two complementary children of a uniform crossover
    std::pair<TSeq, TSeq> UniformCrossoverPair(const TSeq &a, const TSeq &b, SearchContext &ctx);

    /**
     * Method: GuidedCrossover
     * Description: start from A; where A and B disagree keep the allele giving the
     * lower full fitness (A on ties). The first locus then takes B's allele with
     * probability 1/2.
     */
    TSeq GuidedCrossover(const TSeq &a, const TSeq &b, const IProblem &problem, SearchContext &ctx);

    /**
     * Method: GuidedCrossoverApprox
     * Description: like GuidedCrossover but alleles are compared by their local
     * score against the already fixed left neighbour. Position 0 keeps A's allele
     * before the diversity step.
     */
    TSeq GuidedCrossoverApprox(const TSeq &a, const TSeq &b, const IProblem &problem, SearchContext &ctx);

    // -----------------------------------------------------------------------------
    // Mutation Operators
    // -----------------------------------------------------------------------------
    void SubstitutionMutation(TSeq &s, int alphabetSize, bool distinct, SearchContext &ctx);
    void InsertionMutation(TSeq &s, int alphabetSize, SearchContext &ctx);
    void DeletionMutation(TSeq &s, SearchContext &ctx);
    void SwapMutation(TSeq &s, SearchContext &ctx);
    void InversionMutation(TSeq &s, SearchContext &ctx);

    // -----------------------------------------------------------------------------
    // Local Search
    // -----------------------------------------------------------------------------

    /**
     * Method: HillClimb
     * Description: one positional pass. At every position try all other symbols,
     * keep only valid sequences, commit the best improving one. A valid input
     * stays valid. Updates s.ofv.
     */
    void HillClimb(TSol &s, const IProblem &problem);

} // namespace pepsolver::core
