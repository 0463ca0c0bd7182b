#include <catch2/catch.hpp>
#include <filesystem>
#include "pepsolver/core/solver.hpp"
#include "pepsolver/utils/io.hpp"

using namespace pepsolver::core;
using pepsolver::PepSolver;

static TRunData QuickRun()
{
    TRunData rd;
    rd.algorithms = {"tabu", "ga", "nga"};
    rd.seed = 10;
    rd.motif = 0;
    rd.tabu.iterations = 60;
    rd.tabu.neighbourhoodSize = 10;
    rd.ga.populationSize = 20;
    rd.ga.generations = 8;
    rd.nga.populationSize = 20;
    rd.nga.generations = 8;
    return rd;
}

static TJobResult Result(const std::string &algorithm, int motif, double ofv)
{
    TJobResult r;
    r.algorithm = algorithm;
    r.motif = motif;
    r.best = TSol(MotifSymbols(motif), ofv);
    return r;
}

TEST_CASE("Solver configuration", "[solver]") {
    PepSolver solver;

    SECTION("Engine names are case-insensitive") {
        solver.configure(QuickRun());
        REQUIRE(solver.getRunData().algorithms == std::vector<std::string>{"TABU", "GA", "NGA"});
    }

    SECTION("Unknown engine") {
        TRunData rd = QuickRun();
        rd.algorithms = {"GA", "SA"};
        REQUIRE_THROWS_AS(solver.configure(rd), std::invalid_argument);
    }

    SECTION("No engine") {
        TRunData rd = QuickRun();
        rd.algorithms.clear();
        REQUIRE_THROWS_AS(solver.configure(rd), std::invalid_argument);
    }

    SECTION("Motif outside the catalog") {
        TRunData rd = QuickRun();
        rd.motif = 13;
        REQUIRE_THROWS_AS(solver.configure(rd), std::invalid_argument);
    }

    SECTION("Engine parameters are checked up front") {
        TRunData rd = QuickRun();
        rd.nga.crossoverProb = 3.0;
        REQUIRE_THROWS_AS(solver.configure(rd), std::invalid_argument);
    }

    SECTION("Solving before configuration") {
        REQUIRE_THROWS_AS(solver.solve(), std::logic_error);
    }
}

TEST_CASE("Solver jobs", "[solver]") {
    SECTION("One result per engine on a single motif") {
        PepSolver solver;
        solver.configure(QuickRun());
        solver.solve();

        const auto &res = solver.results();
        REQUIRE(res.size() == 3);
        for (const auto &r : res) {
            REQUIRE(r.motif == 0);
            REQUIRE(r.seed == 10);
            REQUIRE(r.best.seq.size() == 9);
            REQUIRE(r.time >= 0.0);
        }
        REQUIRE(res[0].algorithm == "TABU");
        REQUIRE(res[0].traceLength == 60);
        REQUIRE(res[2].algorithm == "NGA");
        REQUIRE(res[2].traceLength == 8);
    }

    SECTION("Every motif, seed offset by the motif index") {
        TRunData rd = QuickRun();
        rd.motif = -1;
        rd.algorithms = {"GA"};

        PepSolver solver;
        solver.configure(rd);
        REQUIRE(solver.selectedMotifs().size() == 13);
        solver.solve();

        const auto &res = solver.results();
        REQUIRE(res.size() == 13);
        for (int m = 0; m < 13; m++) {
            REQUIRE(res[m].motif == m);
            REQUIRE(res[m].seed == 10u + (unsigned)m);
            REQUIRE(res[m].best.seq.size() == MotifSymbols(m).size());
        }
    }

    SECTION("Parallel jobs are reproducible") {
        PepSolver a, b;
        a.configure(QuickRun());
        b.configure(QuickRun());
        a.solve();
        b.solve();
        for (size_t j = 0; j < a.results().size(); j++) {
            REQUIRE(a.results()[j].best.seq == b.results()[j].best.seq);
            REQUIRE(a.results()[j].best.ofv == b.results()[j].best.ofv);
        }
    }

    SECTION("Best of catalog scoring") {
        TRunData rd = QuickRun();
        rd.bestMotif = true;
        rd.algorithms = {"NGA"};

        PepSolver best;
        best.configure(rd);
        best.solve();
        REQUIRE(best.results().size() == 1);
        REQUIRE(best.results()[0].best.seq.size() == 9);
    }
}

TEST_CASE("Report helpers", "[solver]") {
    using pepsolver::utils::Winner;

    SECTION("Winner") {
        REQUIRE(Winner({}) == "-");
        REQUIRE(Winner({Result("GA", 0, -10.0), Result("NGA", 0, -12.0)}) == "NGA");
        REQUIRE(Winner({Result("GA", 0, -12.0), Result("NGA", 0, -12.0)}) == "Tie");
        REQUIRE(Winner({Result("TABU", 0, -3.0), Result("GA", 0, -3.0), Result("NGA", 0, -4.0)}) == "NGA");
    }

    SECTION("Results file gets a header once") {
        std::filesystem::path path = std::filesystem::temp_directory_path() / "pepsolver_results_test.tsv";
        std::filesystem::remove(path);

        std::vector<TJobResult> rows = {Result("GA", 0, -10.0), Result("NGA", 1, -8.0)};
        pepsolver::utils::WriteResults(path.string(), rows);
        pepsolver::utils::WriteResults(path.string(), rows);

        std::ifstream in(path);
        std::vector<std::string> lines;
        for (std::string line; std::getline(in, line);) lines.push_back(line);

        REQUIRE(lines.size() == 5);
        REQUIRE(lines[0] == "motif\tletters\talgorithm\tseed\tofv\tsequence\ttime");
        for (const auto &line : lines) REQUIRE(std::count(line.begin(), line.end(), '\t') == 6);
        REQUIRE(lines[1].find("GGAGGVGKS") != std::string::npos);
        REQUIRE(lines[2].find("\tNGA\t") != std::string::npos);
    }

    SECTION("Unwritable results file") {
        REQUIRE_THROWS_AS(pepsolver::utils::WriteResults("/nonexistent/pepsolver/out.tsv", {}), std::runtime_error);
    }
}
