#include "pepsolver/core/solver.hpp"
#include <iostream>

int main(int argc, char *argv[]) {
    // 1. Create the solver
    pepsolver::PepSolver solver;

    // 2. Read the command line, parameter file and adjacency table
    int status = solver.init(argc, argv);

    // --help, --list-motifs or a startup error
    if (status != pepsolver::PepSolver::READY) return status;

    // 3. Run the jobs and write the report
    try {
        solver.run();
    } catch (const std::exception &e) {
        std::cerr << "\nRun Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
