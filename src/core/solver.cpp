#include "pepsolver/core/solver.hpp"
#include "pepsolver/core/method.hpp"
#include "pepsolver/core/problem.hpp"
#include "pepsolver/core/config.hpp"
#include "pepsolver/utils/io.hpp"

// CLI11 and OpenMP
#include <CLI/CLI.hpp>
#include <omp.h>
#include <cctype>

// Engines
#include "pepsolver/mh/tabu.hpp"
#include "pepsolver/mh/ga.hpp"
#include "pepsolver/mh/neighbour_ga.hpp"

namespace pepsolver {

    static const char* DEFAULT_CONFIG = "config/param.yaml";

    static std::string Upper(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::toupper(c); });
        return s;
    }

    template <typename TStep>
    static core::TJobResult MakeJobResult(const core::TRunResult<TStep> &out)
    {
        core::TJobResult res;
        res.best = out.best;
        res.traceLength = (int)out.trace.size();
        return res;
    }

    PepSolver::PepSolver() {
        registerAlgorithms();
    }

    void PepSolver::registerAlgorithms() {
        algo_registry["TABU"] = [](const core::TRunData &rd, const core::IProblem &problem, unsigned int seed) {
            return MakeJobResult(mh::TabuSearch(rd.tabu, problem).run(seed));
        };
        algo_registry["GA"] = [](const core::TRunData &rd, const core::IProblem &problem, unsigned int seed) {
            return MakeJobResult(mh::GeneticAlgorithm(rd.ga, problem).run(seed));
        };
        algo_registry["NGA"] = [](const core::TRunData &rd, const core::IProblem &problem, unsigned int seed) {
            return MakeJobResult(mh::NeighbourGA(rd.nga, problem).run(seed));
        };
    }

    int PepSolver::init(int argc, char* argv[]) {
        CLI::App app{"pepsolver - peptide sequence design by metaheuristics"};

        // command line values, applied over the parameter file only when given
        core::TRunData cli;
        std::vector<std::string> algorithms;
        int generations = 0;
        int popSize = 0;
        bool listMotifs = false;
        bool bestMotif = false;
        bool debug = false;

        app.add_option("-c,--config", config.configPath, "YAML parameter file (default: config/param.yaml when present)")->check(CLI::ExistingFile);
        auto *optSeed = app.add_option("-s,--seed", cli.seed, "Base seed, the motif index is added per job");
        auto *optMotif = app.add_option("-m,--motif", cli.motif, "Run only this motif index");
        auto *optAlgos = app.add_option("-a,--algorithms", algorithms, "Engines to run (TABU, GA, NGA)");
        auto *optGen = app.add_option("-g,--generations", generations, "Iterations / generations of every engine");
        auto *optPop = app.add_option("-p,--pop-size", popSize, "Population size of both GAs");
        auto *optCx = app.add_option("--crossover-prob", cli.ga.crossoverProb, "Crossover probability of both GAs");
        auto *optMut = app.add_option("--mutation-prob", cli.ga.mutationProb, "Mutation probability of both GAs");
        auto *optTour = app.add_option("--tournament-size", cli.ga.tournamentSize, "Tournament size of the baseline GA");
        app.add_flag("--best-motif", bestMotif, "Score against the best matching motif of the catalog");
        app.add_option("--adjacency", config.adjacencyPath, "Adjacency table file (20x20)")->check(CLI::ExistingFile);
        app.add_flag("--list-motifs", listMotifs, "Print the motif catalog and exit");
        app.add_option("-o,--output", config.outputPath, "Append one tab-separated result row per job to this file");
        app.add_flag("-d,--debug", debug, "Verbose progress output");

        CLI11_PARSE(app, argc, argv);

        if (listMotifs) {
            utils::WriteMotifCatalog();
            return 0;
        }

        try {
            core::TRunData &rd = config.runData;

            if (config.configPath.empty() && std::ifstream(DEFAULT_CONFIG).good())
                config.configPath = DEFAULT_CONFIG;
            if (!config.configPath.empty())
                core::LoadConfiguration(config.configPath, rd);

            if (optSeed->count())  rd.seed = cli.seed;
            if (optMotif->count()) rd.motif = cli.motif;
            if (optAlgos->count()) rd.algorithms = algorithms;
            if (optGen->count()) {
                rd.tabu.iterations = generations;
                rd.ga.generations = generations;
                rd.nga.generations = generations;
            }
            if (optPop->count()) {
                rd.ga.populationSize = popSize;
                rd.nga.populationSize = popSize;
            }
            if (optCx->count()) {
                rd.ga.crossoverProb = cli.ga.crossoverProb;
                rd.nga.crossoverProb = cli.ga.crossoverProb;
            }
            if (optMut->count()) {
                rd.ga.mutationProb = cli.ga.mutationProb;
                rd.nga.mutationProb = cli.ga.mutationProb;
            }
            if (optTour->count()) rd.ga.tournamentSize = cli.ga.tournamentSize;
            if (bestMotif) rd.bestMotif = true;
            if (debug) rd.debug = 1;

            std::shared_ptr<const core::IScoringProvider> scoring;
            if (!config.adjacencyPath.empty())
                scoring = std::make_shared<core::MatrixScoring>(core::LoadAdjacencyTable(config.adjacencyPath));

            configure(rd, scoring);
            return READY;
        } catch (const std::exception &e) {
            std::cerr << "Initialization Error: " << e.what() << std::endl;
            return 1;
        }
    }

    void PepSolver::configure(const core::TRunData &runData,
                              std::shared_ptr<const core::IScoringProvider> scoring) {
        config.runData = runData;

        core::TRunData &rd = config.runData;
        for (auto &name : rd.algorithms) name = Upper(name);
        if (rd.debug) {
            rd.tabu.debug = rd.ga.debug = rd.nga.debug = rd.debug;
        }

        scoring_ = scoring ? std::move(scoring) : std::make_shared<core::MatrixScoring>();
        validateConfiguration();
    }

    // Guard clauses, every engine validates its own parameters at construction
    void PepSolver::validateConfiguration() const {
        const core::TRunData &rd = config.runData;

        if (rd.algorithms.empty())
            throw std::invalid_argument("no algorithm selected (TABU, GA, NGA)");

        for (const auto &name : rd.algorithms) {
            if (!algo_registry.count(name))
                throw std::invalid_argument("unknown algorithm '" + name + "' (TABU, GA, NGA)");
        }

        if (rd.motif < -1 || rd.motif >= core::MotifCount())
            throw std::invalid_argument("motif index " + std::to_string(rd.motif) + " outside the catalog [0, "
                                        + std::to_string(core::MotifCount() - 1) + "]");

        std::unique_ptr<core::IProblem> probe = makeProblem(selectedMotifs().front());
        for (const auto &name : rd.algorithms) {
            if (name == "TABU") {
                mh::TabuSearch engine(rd.tabu, *probe);
            } else if (name == "GA") {
                mh::GeneticAlgorithm engine(rd.ga, *probe);
            } else if (name == "NGA") {
                mh::NeighbourGA engine(rd.nga, *probe);
            }
        }
    }

    std::vector<int> PepSolver::selectedMotifs() const {
        if (config.runData.motif >= 0) return {config.runData.motif};

        std::vector<int> motifs(core::MotifCount());
        std::iota(motifs.begin(), motifs.end(), 0);
        return motifs;
    }

    std::unique_ptr<core::IProblem> PepSolver::makeProblem(int motif) const {
        core::TScoringConfig sc;
        sc.mode = config.runData.bestMotif ? core::EScoringMode::BEST_OF_CATALOG : core::EScoringMode::SINGLE_MOTIF;
        sc.motifIndex = motif;
        return std::make_unique<core::PeptideProblem>(scoring_, sc);
    }

    void PepSolver::solve() {
        if (!scoring_) throw std::logic_error("solver used before init() or configure()");

        const core::TRunData &rd = config.runData;

        // one job per (motif, engine), each with its own problem and generator
        std::vector<std::pair<int, std::string>> jobs;
        for (int m : selectedMotifs())
            for (const auto &name : rd.algorithms)
                jobs.emplace_back(m, name);

        results_.assign(jobs.size(), core::TJobResult());
        std::vector<std::string> errors(jobs.size());

        #pragma omp parallel for schedule(dynamic)
        for (int j = 0; j < (int)jobs.size(); j++)
        {
            const int motif = jobs[j].first;
            const std::string &name = jobs[j].second;
            const unsigned int seed = rd.seed + (unsigned int)motif;

            try {
                if (rd.debug) {
                    #pragma omp critical
                    std::cout << "\n[T" << omp_get_thread_num() << "] Start: " << name
                              << " on motif " << motif << " (seed " << seed << ")";
                }

                std::unique_ptr<core::IProblem> problem = makeProblem(motif);

                double start_time = core::get_time_in_seconds();
                core::TJobResult res = algo_registry.at(name)(rd, *problem, seed);
                res.time = core::get_time_in_seconds() - start_time;

                res.algorithm = name;
                res.motif = motif;
                res.seed = seed;
                results_[j] = std::move(res);
            } catch (const std::exception &e) {
                errors[j] = e.what();
            }
        }

        for (size_t j = 0; j < jobs.size(); j++) {
            if (!errors[j].empty())
                throw std::runtime_error(jobs[j].second + " on motif " + std::to_string(jobs[j].first) + ": " + errors[j]);
        }
    }

    void PepSolver::run() {
        const core::TRunData &rd = config.runData;

        printf("\nEngines: ");
        for (const auto &name : rd.algorithms) printf("%s ", name.c_str());
        printf("\nMotifs: %d | Seed: %u | Scoring: %s\n", (int)selectedMotifs().size(), rd.seed,
               rd.bestMotif ? "best of catalog" : "single motif");

        solve();

        for (int m : selectedMotifs()) {
            std::vector<core::TJobResult> motifResults;
            for (const auto &r : results_)
                if (r.motif == m) motifResults.push_back(r);
            utils::WriteMotifReport(m, motifResults);
        }

        utils::WriteSummary(results_, rd.algorithms);

        if (!config.outputPath.empty())
            utils::WriteResults(config.outputPath, results_);
    }

} // namespace pepsolver
