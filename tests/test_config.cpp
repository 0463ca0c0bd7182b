#include <catch2/catch.hpp>
#include <filesystem>
#include "pepsolver/core/config.hpp"

using namespace pepsolver::core;

TEST_CASE("Parameter file sections", "[config]") {
    TRunData rd;

    SECTION("Empty document keeps the defaults") {
        ParseConfiguration("", rd);
        REQUIRE(rd.algorithms == std::vector<std::string>{"GA", "NGA"});
        REQUIRE(rd.ga.populationSize == 400);
        REQUIRE(rd.nga.mutationProb == Approx(0.25));
        REQUIRE(rd.tabu.reheat == 10000);
    }

    SECTION("Every section is read") {
        ParseConfiguration(R"(
run:
  algorithms: [TABU, NGA]
  seed: 17
  motif: 4
  bestMotif: true
  debug: 1
TABU:
  iterations: 500
  neighbourhoodSize: 30
  tabuLength: 12
  aspiration: 0.5
  reheat: 100
GA:
  populationSize: 120
  generations: 60
  crossoverProb: 0.8
  mutationProb: 0.1
  tournamentSize: 5
  crossover: uniform
  minLength: 6
  maxLength: 12
  weights: [0.4, 0.1, 0.1, 0.4]
NGA:
  populationSize: 80
  generations: 40
  crossover: guided-approx
  elitism: none
  localSearch: false
  maxValidityRetries: 50
)", rd);

        REQUIRE(rd.algorithms == std::vector<std::string>{"TABU", "NGA"});
        REQUIRE(rd.seed == 17);
        REQUIRE(rd.motif == 4);
        REQUIRE(rd.bestMotif);
        REQUIRE(rd.debug == 1);

        REQUIRE(rd.tabu.iterations == 500);
        REQUIRE(rd.tabu.neighbourhoodSize == 30);
        REQUIRE(rd.tabu.tabuLength == 12);
        REQUIRE(rd.tabu.aspiration == Approx(0.5));
        REQUIRE(rd.tabu.reheat == 100);

        REQUIRE(rd.ga.populationSize == 120);
        REQUIRE(rd.ga.generations == 60);
        REQUIRE(rd.ga.crossoverProb == Approx(0.8));
        REQUIRE(rd.ga.mutationProb == Approx(0.1));
        REQUIRE(rd.ga.tournamentSize == 5);
        REQUIRE(rd.ga.crossover == EGACrossover::UNIFORM);
        REQUIRE(rd.ga.minLength == 6);
        REQUIRE(rd.ga.maxLength == 12);
        REQUIRE(rd.ga.wSubst == Approx(0.4));
        REQUIRE(rd.ga.wSwap == Approx(0.4));

        REQUIRE(rd.nga.populationSize == 80);
        REQUIRE(rd.nga.generations == 40);
        REQUIRE(rd.nga.crossover == ECrossoverStrategy::GUIDED_APPROX);
        REQUIRE(rd.nga.elitism == EElitism::NONE);
        REQUIRE_FALSE(rd.nga.localSearch);
        REQUIRE(rd.nga.maxValidityRetries == 50);
        // untouched keys keep the defaults
        REQUIRE(rd.nga.crossoverProb == Approx(0.9));
    }

    SECTION("Unknown keys are rejected") {
        REQUIRE_THROWS_AS(ParseConfiguration("GA:\n  popSize: 10\n", rd), std::runtime_error);
        REQUIRE_THROWS_AS(ParseConfiguration("SA:\n  iterations: 10\n", rd), std::runtime_error);
    }

    SECTION("Malformed values") {
        REQUIRE_THROWS_AS(ParseConfiguration("GA:\n  populationSize: many\n", rd), std::runtime_error);
        REQUIRE_THROWS_AS(ParseConfiguration("GA:\n  weights: [1, 2]\n", rd), std::runtime_error);
        REQUIRE_THROWS_AS(ParseConfiguration("GA: 3\n", rd), std::runtime_error);
        REQUIRE_THROWS_AS(ParseConfiguration("- a\n- b\n", rd), std::runtime_error);
        REQUIRE_THROWS_AS(ParseConfiguration("GA: [unclosed\n", rd), std::runtime_error);
    }

    SECTION("Unknown enum names are reported as parameter errors") {
        REQUIRE_THROWS_AS(ParseConfiguration("NGA:\n  elitism: sometimes\n", rd), std::runtime_error);
        REQUIRE_THROWS_AS(ParseConfiguration("NGA:\n  crossover: two-point\n", rd), std::runtime_error);
        REQUIRE_THROWS_AS(ParseConfiguration("GA:\n  crossover: guided\n", rd), std::runtime_error);
        try {
            ParseConfiguration("NGA:\n  elitism: sometimes\n", rd);
            FAIL("an unknown elitism name should not parse");
        } catch (const std::invalid_argument &) {
            FAIL("parse errors must not leak std::invalid_argument");
        } catch (const std::runtime_error &e) {
            REQUIRE(std::string(e.what()).find("sometimes") != std::string::npos);
        }
    }
}

TEST_CASE("Parameter file on disk", "[config]") {
    TRunData rd;

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(LoadConfiguration("/nonexistent/pepsolver/param.yaml", rd), std::runtime_error);
    }

    SECTION("File content") {
        std::filesystem::path path = std::filesystem::temp_directory_path() / "pepsolver_param_test.yaml";
        {
            std::ofstream out(path);
            out << "TABU:\n  iterations: 42\n";
        }
        LoadConfiguration(path.string(), rd);
        REQUIRE(rd.tabu.iterations == 42);
        REQUIRE(rd.tabu.tabuLength == 20);
    }
}

TEST_CASE("Enum names", "[config]") {
    REQUIRE(ParseGACrossover("Single-Point") == EGACrossover::SINGLE_POINT);
    REQUIRE(ParseCrossoverStrategy("GUIDED") == ECrossoverStrategy::GUIDED_EXACT);
    REQUIRE(ParseCrossoverStrategy("uniform") == ECrossoverStrategy::UNIFORM);
    REQUIRE(ParseElitism("keep-best") == EElitism::KEEP_BEST);
    REQUIRE_THROWS_AS(ParseGACrossover("two-point"), std::invalid_argument);

    REQUIRE(std::string(ToString(ECrossoverStrategy::GUIDED_APPROX)) == "guided-approx");
    REQUIRE(ParseCrossoverStrategy(ToString(ECrossoverStrategy::GUIDED_EXACT)) == ECrossoverStrategy::GUIDED_EXACT);
    REQUIRE(ParseElitism(ToString(EElitism::NONE)) == EElitism::NONE);
}
