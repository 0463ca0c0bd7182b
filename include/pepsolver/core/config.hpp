#pragma once

#include "pepsolver/core/data.hpp"

namespace pepsolver::core {

    // -----------------------------------------------------------------------------
    // IO / Config
    // -----------------------------------------------------------------------------

    /**
     * Method: LoadConfiguration
     * Description: read a YAML parameter file into runData. Sections: run, TABU,
     * GA, NGA. Missing keys keep their current value, unknown keys are rejected.
     * Throws std::runtime_error (file, syntax or value errors).
     */
    void LoadConfiguration(const std::string &paramFile, TRunData &runData);

    // same as LoadConfiguration, from YAML text
    void ParseConfiguration(const std::string &yamlText, TRunData &runData);

    // name <-> enum helpers, names are case-insensitive; throw std::invalid_argument
    EGACrossover ParseGACrossover(const std::string &name);
    ECrossoverStrategy ParseCrossoverStrategy(const std::string &name);
    EElitism ParseElitism(const std::string &name);

    const char* ToString(EGACrossover c);
    const char* ToString(ECrossoverStrategy c);
    const char* ToString(EElitism e);

} // namespace pepsolver::core
