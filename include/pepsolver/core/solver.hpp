/**
 * pepsolver - Solver Interface
 * Runs the selected engines over the selected motifs and reports the results
 */

#pragma once

#include "pepsolver/core/data.hpp"
#include "pepsolver/core/iproblem.hpp"
#include "pepsolver/core/scoring.hpp"

namespace pepsolver {

    /**
    * @brief Driver class: command line, parameter file, parallel jobs, report
    */
    class PepSolver {
    public:
        // init() result meaning "go on with run()"
        static constexpr int READY = -1;

        using AlgorithmFunc = std::function<core::TJobResult(const core::TRunData&, const core::IProblem&, unsigned int)>;

        // -------------------------------------------------------------------------
        // CONSTRUCTOR
        // -------------------------------------------------------------------------
        PepSolver();

        // -------------------------------------------------------------------------
        // PUBLIC INTERFACE
        // -------------------------------------------------------------------------

        // Reads CLI, parameter file and adjacency table. Returns READY or a process exit code.
        int init(int argc, char* argv[]);

        // Programmatic setup, bypassing the command line
        void configure(const core::TRunData &runData,
                       std::shared_ptr<const core::IScoringProvider> scoring = nullptr);

        // Runs every (motif, engine) job; results kept in results()
        void solve();

        // solve() plus the screen report and the optional tab-separated results file
        void run();

        // -------------------------------------------------------------------------
        // ACCESSORS
        // -------------------------------------------------------------------------
        const std::vector<core::TJobResult>& results() const { return results_; }
        const core::TRunData& getRunData() const { return config.runData; }
        std::vector<int> selectedMotifs() const;

    private:
        struct TConfig {
            std::string configPath;
            std::string adjacencyPath;
            std::string outputPath;
            core::TRunData runData;
        };

        void registerAlgorithms();
        void validateConfiguration() const;
        std::unique_ptr<core::IProblem> makeProblem(int motif) const;

        TConfig config;
        std::shared_ptr<const core::IScoringProvider> scoring_;
        std::map<std::string, AlgorithmFunc> algo_registry;
        std::vector<core::TJobResult> results_;
    };

} // namespace pepsolver
