#include <catch2/catch.hpp>
#include "pepsolver/mh/neighbour_ga.hpp"
#include "pepsolver/core/problem.hpp"

using namespace pepsolver::core;
using pepsolver::mh::NeighbourGA;
using pepsolver::mh::UnsatisfiablePredicateError;

namespace {

    PeptideProblem Motif(int index)
    {
        TScoringConfig sc;
        sc.motifIndex = index;
        return PeptideProblem(std::make_shared<MatrixScoring>(), sc);
    }

    TNGAParams SmallNGA()
    {
        TNGAParams p;
        p.populationSize = 50;
        p.generations = 30;
        return p;
    }

    // same peptide problem, but no sequence is ever acceptable
    class RejectAllProblem : public PeptideProblem {
        public:
            RejectAllProblem()
                : PeptideProblem(std::make_shared<MatrixScoring>(), TScoringConfig{}) {}

            bool isValid(const TSeq &) const override { return false; }
    };

}

TEST_CASE("NGA parameters", "[nga]") {
    PeptideProblem p = Motif(0);

    auto rejects = [&](auto edit) {
        TNGAParams params = SmallNGA();
        edit(params);
        REQUIRE_THROWS_AS(NeighbourGA(params, p), std::invalid_argument);
    };

    rejects([](TNGAParams &x) { x.populationSize = 0; });
    rejects([](TNGAParams &x) { x.generations = -1; });
    rejects([](TNGAParams &x) { x.crossoverProb = 2.0; });
    rejects([](TNGAParams &x) { x.mutationProb = -0.5; });
    rejects([](TNGAParams &x) { x.localSearchGate = 1.1; });
    rejects([](TNGAParams &x) { x.shortProb = -1.0; });
    rejects([](TNGAParams &x) { x.maxValidityRetries = 0; });
}

TEST_CASE("NGA scenario: length 9 motif, population 50, 30 generations", "[nga]") {
    PeptideProblem p = Motif(0);
    TNGAParams params = SmallNGA();
    NeighbourGA nga(params, p);

    auto out = nga.run(2024);

    REQUIRE(out.best.seq.size() == 9);
    for (Symbol x : out.best.seq) REQUIRE(x < 20);
    REQUIRE((int)out.trace.size() == 30);
    REQUIRE(out.best.ofv <= out.trace.front().minOfv);
    REQUIRE(out.best.ofv == Approx(p.evaluate(out.best.seq)));
}

TEST_CASE("NGA elitism", "[nga]") {
    PeptideProblem p = Motif(0);
    TNGAParams params = SmallNGA();

    SECTION("Keep best: the population minimum never increases") {
        params.elitism = EElitism::KEEP_BEST;
        auto out = NeighbourGA(params, p).run(8);
        for (size_t g = 1; g < out.trace.size(); g++)
            REQUIRE(out.trace[g].minOfv <= out.trace[g - 1].minOfv);
    }

    SECTION("No elitism still completes") {
        params.elitism = EElitism::NONE;
        auto out = NeighbourGA(params, p).run(8);
        REQUIRE(out.best.seq.size() == 9);
        REQUIRE((int)out.trace.size() == params.generations);
    }
}

TEST_CASE("NGA crossover strategies", "[nga]") {
    PeptideProblem p = Motif(3);     // PKKP
    TNGAParams params = SmallNGA();
    params.generations = 10;

    for (auto strategy : {ECrossoverStrategy::UNIFORM, ECrossoverStrategy::GUIDED_EXACT,
                          ECrossoverStrategy::GUIDED_APPROX}) {
        params.crossover = strategy;
        auto out = NeighbourGA(params, p).run(19);
        REQUIRE(out.best.seq.size() == 4);
        REQUIRE(out.best.ofv <= out.trace.front().minOfv);
    }
}

TEST_CASE("NGA final population is valid", "[nga]") {
    PeptideProblem p = Motif(0);
    TNGAParams params = SmallNGA();
    params.generations = 5;
    params.localSearchGate = 1.0;
    params.longProb = 1.0;

    auto out = NeighbourGA(params, p).run(12);
    REQUIRE(p.isValid(out.best.seq));
}

TEST_CASE("NGA keep-best output passes the validity predicate", "[nga]") {
    PeptideProblem p = Motif(1);     // RGD
    TNGAParams params = SmallNGA();
    REQUIRE(params.elitism == EElitism::KEEP_BEST);
    NeighbourGA nga(params, p);

    for (unsigned seed = 0; seed < 100; seed++) {
        auto out = nga.run(seed);
        INFO("seed " << seed);
        REQUIRE(p.isValid(out.best.seq));
    }
}

TEST_CASE("NGA determinism", "[nga]") {
    PeptideProblem p = Motif(0);
    NeighbourGA nga(SmallNGA(), p);

    auto a = nga.run(55);
    auto b = nga.run(55);
    REQUIRE(a.best.seq == b.best.seq);
    for (size_t g = 0; g < a.trace.size(); g++) {
        REQUIRE(a.trace[g].minOfv == b.trace[g].minOfv);
        REQUIRE(a.trace[g].maxOfv == b.trace[g].maxOfv);
    }
}

TEST_CASE("NGA validity regeneration", "[nga]") {
    SECTION("Valid draws are returned repaired") {
        PeptideProblem p = Motif(0);
        NeighbourGA nga(SmallNGA(), p);
        SearchContext ctx(4);
        for (int i = 0; i < 10; i++) {
            TSeq s = nga.regenerateValid(ctx);
            REQUIRE(s.size() == 9);
            REQUIRE(p.isValid(s));
        }
    }

    SECTION("Unsatisfiable predicate exhausts the retry cap") {
        RejectAllProblem p;
        TNGAParams params = SmallNGA();
        params.maxValidityRetries = 25;
        NeighbourGA nga(params, p);
        SearchContext ctx(4);

        try {
            nga.regenerateValid(ctx);
            FAIL("regeneration should not succeed");
        } catch (const UnsatisfiablePredicateError &e) {
            REQUIRE(e.retries() == 25);
            REQUIRE(std::string(e.what()).find("unsatisfiable") != std::string::npos);
        }

        REQUIRE_THROWS_AS(nga.run(1), UnsatisfiablePredicateError);
    }
}
