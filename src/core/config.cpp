#include "pepsolver/core/config.hpp"

#include <cctype>
#include <yaml-cpp/yaml.h>

namespace pepsolver::core {

    static std::string Lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        return s;
    }

    // -----------------------------------------------------------------------------
    // Enum names
    // -----------------------------------------------------------------------------

    EGACrossover ParseGACrossover(const std::string &name)
    {
        std::string n = Lower(name);
        if (n == "single-point" || n == "singlepoint") return EGACrossover::SINGLE_POINT;
        if (n == "uniform") return EGACrossover::UNIFORM;
        throw std::invalid_argument("unknown GA crossover '" + name + "' (single-point, uniform)");
    }

    ECrossoverStrategy ParseCrossoverStrategy(const std::string &name)
    {
        std::string n = Lower(name);
        if (n == "uniform") return ECrossoverStrategy::UNIFORM;
        if (n == "guided" || n == "guided-exact") return ECrossoverStrategy::GUIDED_EXACT;
        if (n == "guided-approx") return ECrossoverStrategy::GUIDED_APPROX;
        throw std::invalid_argument("unknown NGA crossover '" + name + "' (uniform, guided, guided-approx)");
    }

    EElitism ParseElitism(const std::string &name)
    {
        std::string n = Lower(name);
        if (n == "keep-best") return EElitism::KEEP_BEST;
        if (n == "none") return EElitism::NONE;
        throw std::invalid_argument("unknown elitism '" + name + "' (keep-best, none)");
    }

    const char* ToString(EGACrossover c)
    {
        return c == EGACrossover::UNIFORM ? "uniform" : "single-point";
    }

    const char* ToString(ECrossoverStrategy c)
    {
        switch (c) {
            case ECrossoverStrategy::UNIFORM: return "uniform";
            case ECrossoverStrategy::GUIDED_APPROX: return "guided-approx";
            default: return "guided";
        }
    }

    const char* ToString(EElitism e)
    {
        return e == EElitism::NONE ? "none" : "keep-best";
    }

    // -----------------------------------------------------------------------------
    // YAML helpers
    // -----------------------------------------------------------------------------

    // Guard clause: every key of the section must be known
    static void CheckKeys(const YAML::Node &node, const std::string &section,
                          std::initializer_list<const char*> allowed)
    {
        if (!node.IsMap()) {
            throw std::runtime_error("section '" + section + "' must be a map");
        }
        for (const auto &kv : node) {
            std::string key = kv.first.as<std::string>();
            bool known = std::any_of(allowed.begin(), allowed.end(),
                                     [&](const char* a) { return key == a; });
            if (!known) {
                throw std::runtime_error("unknown key '" + key + "' in section '" + section + "'");
            }
        }
    }

    template <typename T>
    static void Read(const YAML::Node &node, const char* key, T &out)
    {
        if (node[key]) out = node[key].as<T>();
    }

    static void ReadRun(const YAML::Node &node, TRunData &runData)
    {
        CheckKeys(node, "run", {"algorithms", "seed", "motif", "bestMotif", "debug"});
        Read(node, "algorithms", runData.algorithms);
        Read(node, "seed", runData.seed);
        Read(node, "motif", runData.motif);
        Read(node, "bestMotif", runData.bestMotif);
        Read(node, "debug", runData.debug);
    }

    static void ReadTabu(const YAML::Node &node, TTabuParams &p)
    {
        CheckKeys(node, "TABU", {"iterations", "neighbourhoodSize", "tabuLength", "aspiration", "reheat", "debug"});
        Read(node, "iterations", p.iterations);
        Read(node, "neighbourhoodSize", p.neighbourhoodSize);
        Read(node, "tabuLength", p.tabuLength);
        Read(node, "aspiration", p.aspiration);
        Read(node, "reheat", p.reheat);
        Read(node, "debug", p.debug);
    }

    static void ReadGA(const YAML::Node &node, TGAParams &p)
    {
        CheckKeys(node, "GA", {"populationSize", "generations", "crossoverProb", "mutationProb",
                               "tournamentSize", "crossover", "minLength", "maxLength", "weights", "debug"});
        Read(node, "populationSize", p.populationSize);
        Read(node, "generations", p.generations);
        Read(node, "crossoverProb", p.crossoverProb);
        Read(node, "mutationProb", p.mutationProb);
        Read(node, "tournamentSize", p.tournamentSize);
        Read(node, "minLength", p.minLength);
        Read(node, "maxLength", p.maxLength);
        Read(node, "debug", p.debug);

        if (node["crossover"]) p.crossover = ParseGACrossover(node["crossover"].as<std::string>());

        // weights: [substitution, insertion, deletion, swap]
        if (node["weights"]) {
            auto w = node["weights"].as<std::vector<double>>();
            if (w.size() != 4) {
                throw std::runtime_error("GA weights must list 4 values (substitution, insertion, deletion, swap)");
            }
            p.wSubst = w[0];
            p.wInsert = w[1];
            p.wDelete = w[2];
            p.wSwap = w[3];
        }
    }

    static void ReadNGA(const YAML::Node &node, TNGAParams &p)
    {
        CheckKeys(node, "NGA", {"populationSize", "generations", "crossoverProb", "mutationProb", "crossover",
                                "elitism", "localSearch", "localSearchGate", "shortLength", "shortProb",
                                "longProb", "maxValidityRetries", "debug"});
        Read(node, "populationSize", p.populationSize);
        Read(node, "generations", p.generations);
        Read(node, "crossoverProb", p.crossoverProb);
        Read(node, "mutationProb", p.mutationProb);
        Read(node, "localSearch", p.localSearch);
        Read(node, "localSearchGate", p.localSearchGate);
        Read(node, "shortLength", p.shortLength);
        Read(node, "shortProb", p.shortProb);
        Read(node, "longProb", p.longProb);
        Read(node, "maxValidityRetries", p.maxValidityRetries);
        Read(node, "debug", p.debug);

        if (node["crossover"]) p.crossover = ParseCrossoverStrategy(node["crossover"].as<std::string>());
        if (node["elitism"]) p.elitism = ParseElitism(node["elitism"].as<std::string>());
    }

    static void LoadYamlLogic(const YAML::Node &config, TRunData &runData)
    {
        if (config.IsNull()) return; // empty file: keep defaults

        if (!config.IsMap()) {
            throw std::runtime_error("parameter file must be a map of sections");
        }

        CheckKeys(config, "<root>", {"run", "TABU", "GA", "NGA"});

        if (config["run"])  ReadRun(config["run"], runData);
        if (config["TABU"]) ReadTabu(config["TABU"], runData.tabu);
        if (config["GA"])   ReadGA(config["GA"], runData.ga);
        if (config["NGA"])  ReadNGA(config["NGA"], runData.nga);
    }

    // -----------------------------------------------------------------------------
    // Entry points
    // -----------------------------------------------------------------------------

    void LoadConfiguration(const std::string &paramFile, TRunData &runData)
    {
        try {
            LoadYamlLogic(YAML::LoadFile(paramFile), runData);
        } catch (const YAML::BadFile &) {
            throw std::runtime_error("cannot open parameter file " + paramFile);
        } catch (const YAML::ParserException &e) {
            throw std::runtime_error("syntax error in " + paramFile + ": " + e.what());
        } catch (const YAML::Exception &e) {
            throw std::runtime_error("bad value in " + paramFile + ": " + e.what());
        } catch (const std::exception &e) {
            throw std::runtime_error(paramFile + ": " + e.what());
        }
    }

    void ParseConfiguration(const std::string &yamlText, TRunData &runData)
    {
        try {
            LoadYamlLogic(YAML::Load(yamlText), runData);
        } catch (const YAML::ParserException &e) {
            throw std::runtime_error(std::string("syntax error in parameters: ") + e.what());
        } catch (const YAML::Exception &e) {
            throw std::runtime_error(std::string("bad value in parameters: ") + e.what());
        } catch (const std::invalid_argument &e) {
            throw std::runtime_error(std::string("bad value in parameters: ") + e.what());
        }
    }

} // namespace pepsolver::core
