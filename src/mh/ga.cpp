#include "pepsolver/mh/ga.hpp"

// internal dependencies
#include "pepsolver/core/method.hpp"

namespace pepsolver::mh {

    using namespace pepsolver::core;

    static void CheckProbability(double p, const char* name)
    {
        if (!(p >= 0.0 && p <= 1.0)) {
            throw std::invalid_argument(std::string("GA: ") + name + " must be in [0, 1], got " + std::to_string(p));
        }
    }

    // -------------------------------------------------------------------------
    // Constructor: validates the configuration
    // -------------------------------------------------------------------------
    GeneticAlgorithm::GeneticAlgorithm(const TGAParams &params, const IProblem &problem)
        : params_(params), problem_(problem), minLen_(params.minLength), maxLen_(params.maxLength)
    {
        if (params_.populationSize <= 0)
            throw std::invalid_argument("GA: population size must be > 0");
        if (params_.generations <= 0)
            throw std::invalid_argument("GA: number of generations must be > 0");
        if (params_.tournamentSize <= 0)
            throw std::invalid_argument("GA: tournament size must be > 0");
        CheckProbability(params_.crossoverProb, "crossover probability");
        CheckProbability(params_.mutationProb, "mutation probability");

        if (params_.minLength < 1 || params_.minLength > params_.maxLength)
            throw std::invalid_argument("GA: length bounds must satisfy 1 <= minLength <= maxLength");

        const double w[] = {params_.wSubst, params_.wInsert, params_.wDelete, params_.wSwap};
        double total = 0.0;
        for (double x : w) {
            if (!(x >= 0.0) || !std::isfinite(x))
                throw std::invalid_argument("GA: mutation weights must be finite and >= 0");
            total += x;
        }
        if (total <= 0.0)
            throw std::invalid_argument("GA: at least one mutation weight must be > 0");

        // fixed-length problems never grow or shrink
        if (problem_.fixedLength()) {
            minLen_ = problem_.getDimension();
            maxLen_ = problem_.getDimension();
        }
    }

    // -------------------------------------------------------------------------
    // Main Algorithm: GA
    // -------------------------------------------------------------------------
    TRunResult<TGenStats> GeneticAlgorithm::run(unsigned int seed) const
    {
        SearchContext ctx(seed);
        TRunResult<TGenStats> result;
        result.trace.reserve(params_.generations);

        // initialize population
        std::vector<TSol> Pop = CreatePopulation(problem_, params_.populationSize, ctx);

        // run the evolutionary process
        for (int g = 0; g < params_.generations; g++)
        {
            Pop = evolve(Pop, ctx);

            TGenStats st = PopulationStats(g, Pop);
            result.trace.push_back(st);

            if (params_.debug) {
                printf("\n[GA] gen %d min %.4f max %.4f avg %.4f", g, st.minOfv, st.maxOfv, st.meanOfv);
            }
        }

        result.best = Pop[BestIndex(Pop)];
        return result;
    }

    // -------------------------------------------------------------------------
    // One generation: selection, crossover and mutation until refilled
    // -------------------------------------------------------------------------
    std::vector<TSol> GeneticAlgorithm::evolve(const std::vector<TSol> &Pop, SearchContext &ctx) const
    {
        std::vector<TSol> PopNew;               // offsprings
        PopNew.reserve(params_.populationSize);

        while ((int)PopNew.size() < params_.populationSize)
        {
            const TSeq &parent1 = Pop[TournamentSelection(Pop, params_.tournamentSize, ctx)].seq;
            const TSeq &parent2 = Pop[TournamentSelection(Pop, params_.tournamentSize, ctx)].seq;

            TSeq offspring = crossover(parent1, parent2, ctx);
            mutate(offspring, ctx);

            double ofv = problem_.evaluate(offspring);
            PopNew.emplace_back(std::move(offspring), ofv);
        }

        return PopNew;
    }

    TSeq GeneticAlgorithm::crossover(const TSeq &p1, const TSeq &p2, SearchContext &ctx) const
    {
        // check the probability of crossover
        if (ctx.randomico(0, 1) < params_.crossoverProb)
        {
            if (params_.crossover == EGACrossover::UNIFORM)
                return UniformCrossover(p1, p2, ctx);
            return SinglePointCrossover(p1, p2, ctx);
        }
        return p1;
    }

    void GeneticAlgorithm::mutate(TSeq &s, SearchContext &ctx) const
    {
        if (!(ctx.randomico(0, 1) < params_.mutationProb)) return;

        // weighted draw; an operator that does not apply falls through to the next one
        const double cSubst = params_.wSubst;
        const double cInsert = cSubst + params_.wInsert;
        const double cDelete = cInsert + params_.wDelete;
        const double total = cDelete + params_.wSwap;
        const int len = (int)s.size();

        double r = ctx.randomico(0, total);

        if (r < cSubst) {
            SubstitutionMutation(s, problem_.alphabetSize(), true, ctx);
        }
        else if (r < cInsert && len < maxLen_) {
            InsertionMutation(s, problem_.alphabetSize(), ctx);
        }
        else if (r < cDelete && len > minLen_) {
            DeletionMutation(s, ctx);
        }
        else if (len >= 2) {
            SwapMutation(s, ctx);
        }
    }

} // namespace pepsolver::mh
