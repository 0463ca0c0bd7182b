#pragma once

#include "pepsolver/core/common.hpp"

namespace pepsolver::core {

    //--------------------------------------------------------------------------
    // Basic types
    //--------------------------------------------------------------------------
    using Symbol = std::uint8_t;                // index into the alphabet
    using TSeq = std::vector<Symbol>;           // one candidate sequence (individual)

    constexpr int ALPHABET_SIZE = 20;

    //--------------------------------------------------------------------------
    // Struct: TSol
    // Description: a sequence together with its cached objective function value
    //--------------------------------------------------------------------------
    struct TSol
    {
        TSeq seq;                                               // symbol sequence
        double ofv = std::numeric_limits<double>::infinity();   // objective function value (lower is better)

        TSol() = default;
        TSol(TSeq s, double f) : seq(std::move(s)), ofv(f) {}
    };

    //--------------------------------------------------------------------------
    // Struct: TMove
    // Description: elementary transformation between two sequences.
    // Unused fields are kept at zero so that field-wise equality is exact.
    //--------------------------------------------------------------------------
    enum class EMoveType { SUBST = 1, SWAP, INSERT, DELETE };

    struct TMove
    {
        EMoveType type = EMoveType::SUBST;
        int p1 = 0;                     // position (substitution, insertion, deletion) or first swap position
        int p2 = 0;                     // second swap position
        Symbol oldSym = 0;              // replaced symbol (substitution) or removed symbol (deletion)
        Symbol newSym = 0;              // written symbol (substitution) or inserted symbol (insertion)

        static TMove Subst(int pos, Symbol oldS, Symbol newS) { return {EMoveType::SUBST, pos, 0, oldS, newS}; }
        static TMove Swap(int a, int b)                       { return {EMoveType::SWAP, a, b, 0, 0}; }
        static TMove Insert(int pos, Symbol s)                { return {EMoveType::INSERT, pos, 0, 0, s}; }
        static TMove Delete(int pos, Symbol s)                { return {EMoveType::DELETE, pos, 0, s, 0}; }

        bool operator==(const TMove &other) const = default;
    };

    // a sampled neighbour and the move that produced it
    using TNeighbour = std::pair<TSeq, TMove>;

    //--------------------------------------------------------------------------
    // Trace records
    //--------------------------------------------------------------------------
    struct TTabuStep
    {
        int iteration = 0;              // iteration index
        double bestOfv = 0.0;           // best-so-far after the iteration
        double currentOfv = 0.0;        // fitness of the current solution after the iteration
        int tabuSize = 0;               // tabu list size after the iteration (before reheat)
        bool aspiration = false;        // the selected move was tabu and admitted by aspiration
    };

    struct TGenStats
    {
        int generation = 0;             // generation index
        double minOfv = 0.0;            // best fitness in the population
        double maxOfv = 0.0;            // worst fitness in the population
        double meanOfv = 0.0;           // average fitness
    };

    //--------------------------------------------------------------------------
    // Struct: TRunResult
    // Description: output of one engine run
    //--------------------------------------------------------------------------
    template <typename TStep>
    struct TRunResult
    {
        TSol best;                      // best individual found
        std::vector<TStep> trace;       // progress trace, one entry per iteration/generation
    };

    //--------------------------------------------------------------------------
    // Engine parameters
    //--------------------------------------------------------------------------
    struct TTabuParams
    {
        int iterations = 2000;          // fixed iteration budget
        int neighbourhoodSize = 50;     // number of neighbours sampled per iteration
        int tabuLength = 20;            // capacity of the tabu list
        double aspiration = 1.0;        // margin a tabu move must beat the current fitness by
        int reheat = 10000;             // clear the tabu list every reheat iterations (0 = never)
        int debug = 0;                  // print improvements on screen
    };

    enum class EGACrossover { SINGLE_POINT = 1, UNIFORM };

    struct TGAParams
    {
        int populationSize = 400;       // population size
        int generations = 200;          // number of generations
        double crossoverProb = 0.9;     // crossover probability
        double mutationProb = 0.3;      // mutation probability
        int tournamentSize = 3;         // tournament size
        EGACrossover crossover = EGACrossover::SINGLE_POINT;
        int minLength = 8;              // deletion only above this length
        int maxLength = 16;             // insertion only below this length
        double wSubst = 0.35;           // weight of the substitution mutation
        double wInsert = 0.20;          // weight of the insertion mutation
        double wDelete = 0.20;          // weight of the deletion mutation
        double wSwap = 0.25;            // weight of the swap mutation
        int debug = 0;
    };

    enum class ECrossoverStrategy { UNIFORM = 1, GUIDED_EXACT, GUIDED_APPROX };
    enum class EElitism { KEEP_BEST = 1, NONE };

    struct TNGAParams
    {
        int populationSize = 400;
        int generations = 200;
        double crossoverProb = 0.9;
        double mutationProb = 0.25;     // per-operator, per-child mutation probability
        ECrossoverStrategy crossover = ECrossoverStrategy::GUIDED_EXACT;
        EElitism elitism = EElitism::KEEP_BEST;
        bool localSearch = true;        // enable hill-climbing refinement
        double localSearchGate = 0.20;  // first gate of the hill-climbing draw
        int shortLength = 5;            // sequences up to this length count as short
        double shortProb = 0.60;        // hill-climbing probability for short sequences
        double longProb = 0.20;         // hill-climbing probability otherwise
        int maxValidityRetries = 10000; // cap of the validity regeneration loop
        int debug = 0;
    };

    //--------------------------------------------------------------------------
    // Struct: TRunData
    // Description: driver configuration (which engines run and how)
    //--------------------------------------------------------------------------
    struct TRunData
    {
        std::vector<std::string> algorithms = {"GA", "NGA"};   // active engines
        unsigned int seed = 0;          // base seed, motif index is added per job
        int motif = -1;                 // single motif index (-1 = all motifs)
        bool bestMotif = false;         // best-of-catalog scoring mode
        int debug = 0;                  // verbose progress output

        TTabuParams tabu;
        TGAParams ga;
        TNGAParams nga;
    };

    //--------------------------------------------------------------------------
    // Struct: TJobResult
    // Description: outcome of one (motif, engine) job of the driver
    //--------------------------------------------------------------------------
    struct TJobResult
    {
        std::string algorithm;          // engine name (TABU, GA, NGA)
        int motif = 0;                  // motif index in the catalog
        unsigned int seed = 0;          // seed of the job generator
        TSol best;                      // best individual found
        int traceLength = 0;            // iterations or generations recorded
        double time = 0.0;              // wall time (s)
    };

} // namespace pepsolver::core
