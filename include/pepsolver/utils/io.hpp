#pragma once

#include "pepsolver/core/data.hpp"

namespace pepsolver::utils {

    /**
     * Prints the reference motif catalog (index, length, letters).
     */
    void WriteMotifCatalog();

    /**
     * Name of the engine with the lowest fitness among the results,
     * "Tie" when that fitness is shared, "-" when there is no result.
     */
    std::string Winner(const std::vector<core::TJobResult> &results);

    /**
     * Outputs the results of one motif to the screen: best sequence,
     * fitness and time of each engine, then the winner.
     */
    void WriteMotifReport(int motif, const std::vector<core::TJobResult> &results);

    /**
     * Outputs the summary table (one row per motif) and the overall statistics:
     * wins per engine, ties, average time and best result per engine.
     */
    void WriteSummary(const std::vector<core::TJobResult> &results,
                      const std::vector<std::string> &algorithms);

    /**
     * Appends one tab separated row per job to the file, header first when the
     * file is empty. Throws std::runtime_error when the file cannot be opened.
     */
    void WriteResults(const std::string &path, const std::vector<core::TJobResult> &results);

} // namespace pepsolver::utils
