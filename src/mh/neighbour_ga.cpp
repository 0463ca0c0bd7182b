#include "pepsolver/mh/neighbour_ga.hpp"

// internal dependencies
#include "pepsolver/core/method.hpp"

namespace pepsolver::mh {

    using namespace pepsolver::core;

    // =========================================================================
    // HELPER FUNCTIONS (INTERNAL)
    // =========================================================================

    static void CheckProbability(double p, const char* name)
    {
        if (!(p >= 0.0 && p <= 1.0)) {
            throw std::invalid_argument(std::string("NGA: ") + name + " must be in [0, 1], got " + std::to_string(p));
        }
    }

    // -------------------------------------------------------------------------
    // Method: MutateAll
    // Description: substitution and inversion, each with probability p
    // -------------------------------------------------------------------------
    static void MutateAll(TSeq &s, double p, int alphabetSize, SearchContext &ctx)
    {
        if (ctx.randomico(0, 1) < p) {
            SubstitutionMutation(s, alphabetSize, false, ctx);
        }
        if (ctx.randomico(0, 1) < p) {
            InversionMutation(s, ctx);
        }
    }

    // =========================================================================
    // NeighbourGA
    // =========================================================================

    NeighbourGA::NeighbourGA(const TNGAParams &params, const IProblem &problem)
        : params_(params), problem_(problem)
    {
        if (params_.populationSize <= 0)
            throw std::invalid_argument("NGA: population size must be > 0");
        if (params_.generations <= 0)
            throw std::invalid_argument("NGA: number of generations must be > 0");
        CheckProbability(params_.crossoverProb, "crossover probability");
        CheckProbability(params_.mutationProb, "mutation probability");
        CheckProbability(params_.localSearchGate, "local search gate");
        CheckProbability(params_.shortProb, "short sequence local search probability");
        CheckProbability(params_.longProb, "long sequence local search probability");
        if (params_.shortLength < 0)
            throw std::invalid_argument("NGA: short length must be >= 0");
        if (params_.maxValidityRetries <= 0)
            throw std::invalid_argument("NGA: validity retry cap must be > 0");
    }

    TRunResult<TGenStats> NeighbourGA::run(unsigned int seed) const
    {
        SearchContext ctx(seed);
        TRunResult<TGenStats> result;
        result.trace.reserve(params_.generations);

        std::vector<TSol> Pop = CreatePopulation(problem_, params_.populationSize, ctx);

        for (int g = 0; g < params_.generations; g++)
        {
            stepGeneration(Pop, ctx);

            TGenStats st = PopulationStats(g, Pop);
            result.trace.push_back(st);

            if (params_.debug) {
                printf("\n[NGA] gen %d min %.4f max %.4f avg %.4f", g, st.minOfv, st.maxOfv, st.meanOfv);
            }
        }

        result.best = Pop[BestIndex(Pop)];
        return result;
    }

    void NeighbourGA::stepGeneration(std::vector<TSol> &Pop, SearchContext &ctx) const
    {
        const int sizePop = params_.populationSize;
        const TSol elite = Pop[BestIndex(Pop)];     // best of the previous generation
        // an elite that fails the validity filter is never carried forward
        const bool keepElite = params_.elitism == EElitism::KEEP_BEST && problem_.isValid(elite.seq);

        std::vector<TSol> PopNew;
        PopNew.reserve(sizePop);

        while ((int)PopNew.size() < sizePop)
        {
            const TSeq &parentA = Pop[TournamentSelection(Pop, TOURNAMENT_SIZE, ctx)].seq;
            const TSeq &parentB = Pop[TournamentSelection(Pop, TOURNAMENT_SIZE, ctx)].seq;

            TSol childA, childB;
            if (ctx.randomico(0, 1) < params_.crossoverProb) {
                std::tie(childA.seq, childB.seq) = recombine(parentA, parentB, ctx);
            } else {
                childA.seq = parentA;
                childB.seq = parentB;
            }

            MutateAll(childA.seq, params_.mutationProb, problem_.alphabetSize(), ctx);
            MutateAll(childB.seq, params_.mutationProb, problem_.alphabetSize(), ctx);

            problem_.repair(childA.seq, ctx);
            problem_.repair(childB.seq, ctx);

            refine(childA, ctx);
            refine(childB, ctx);

            // ---- domain-validity filter ----
            if (!problem_.isValid(childA.seq)) childA.seq = regenerateValid(ctx);
            if (!problem_.isValid(childB.seq)) childB.seq = regenerateValid(ctx);

            childA.ofv = problem_.evaluate(childA.seq);
            PopNew.push_back(std::move(childA));

            if ((int)PopNew.size() < sizePop) {
                childB.ofv = problem_.evaluate(childB.seq);
                PopNew.push_back(std::move(childB));
            }
        }

        Pop = std::move(PopNew);

        if (keepElite)
        {
            bool present = std::any_of(Pop.begin(), Pop.end(),
                                       [&](const TSol &ind) { return ind.seq == elite.seq; });
            if (!present) {
                Pop[ctx.irandomico(0, sizePop - 1)] = elite;
            }
        }
    }

    std::pair<TSeq, TSeq> NeighbourGA::recombine(const TSeq &a, const TSeq &b, SearchContext &ctx) const
    {
        switch (params_.crossover)
        {
            case ECrossoverStrategy::GUIDED_EXACT: {
                TSeq ca = GuidedCrossover(a, b, problem_, ctx);
                TSeq cb = GuidedCrossover(b, a, problem_, ctx);
                return {ca, cb};
            }
            case ECrossoverStrategy::GUIDED_APPROX: {
                TSeq ca = GuidedCrossoverApprox(a, b, problem_, ctx);
                TSeq cb = GuidedCrossoverApprox(b, a, problem_, ctx);
                return {ca, cb};
            }
            default:
                return UniformCrossoverPair(a, b, ctx);
        }
    }

    // -------------------------------------------------------------------------
    // Method: refine
    // Description: hill-climbing with a length dependent probability
    // -------------------------------------------------------------------------
    void NeighbourGA::refine(TSol &child, SearchContext &ctx) const
    {
        if (!params_.localSearch) return;
        if (!(ctx.randomico(0, 1) < params_.localSearchGate)) return;

        double prob = ((int)child.seq.size() <= params_.shortLength) ? params_.shortProb : params_.longProb;
        if (ctx.randomico(0, 1) < prob) {
            HillClimb(child, problem_);
        }
    }

    TSeq NeighbourGA::regenerateValid(SearchContext &ctx) const
    {
        for (int attempt = 0; attempt < params_.maxValidityRetries; attempt++)
        {
            TSeq cand = problem_.randomIndividual(ctx);
            problem_.repair(cand, ctx);
            if (problem_.isValid(cand)) return cand;
        }
        throw UnsatisfiablePredicateError(params_.maxValidityRetries);
    }

} // namespace pepsolver::mh
