#include "pepsolver/mh/tabu.hpp"

#include "pepsolver/core/method.hpp"

namespace pepsolver::mh {

    using namespace pepsolver::core;

    // -------------------------------------------------------------------------
    // TabuList
    // -------------------------------------------------------------------------
    TabuList::TabuList(int capacity) : capacity_(capacity)
    {
        if (capacity < 0) {
            throw std::invalid_argument("TabuList: capacity must be >= 0, got " + std::to_string(capacity));
        }
    }

    bool TabuList::contains(const TMove &mv) const
    {
        return std::find(moves_.begin(), moves_.end(), mv) != moves_.end();
    }

    void TabuList::push(const TMove &mv)
    {
        if (capacity_ == 0) return;
        if ((int)moves_.size() == capacity_) moves_.pop_front();
        moves_.push_back(mv);
    }

    // -------------------------------------------------------------------------
    // TabuSearch
    // -------------------------------------------------------------------------
    TabuSearch::TabuSearch(const TTabuParams &params, const IProblem &problem)
        : params_(params), problem_(problem)
    {
        if (params_.iterations <= 0)
            throw std::invalid_argument("TABU: iterations must be > 0");
        if (params_.neighbourhoodSize <= 0)
            throw std::invalid_argument("TABU: neighbourhood size must be > 0");
        if (params_.tabuLength < 0)
            throw std::invalid_argument("TABU: tabu length must be >= 0");
        if (!std::isfinite(params_.aspiration) || params_.aspiration < 0)
            throw std::invalid_argument("TABU: aspiration margin must be finite and >= 0");
        if (params_.reheat < 0)
            throw std::invalid_argument("TABU: reheat interval must be >= 0");
    }

    TRunResult<TTabuStep> TabuSearch::run(unsigned int seed) const
    {
        SearchContext ctx(seed);
        TRunResult<TTabuStep> result;
        result.trace.reserve(params_.iterations);

        TSol current;                           // current solution
        TSol &best = result.best;               // best solution of the run
        TabuList tabu(params_.tabuLength);      // last moves, avoid revisiting them

        CreateInitialSolutions(current, problem_, ctx);
        best = current;

        for (int it = 0; it < params_.iterations; it++)
        {
            // generate neighbourhood
            std::vector<TNeighbour> neigh = problem_.neighbourhood(ctx, current.seq, params_.neighbourhoodSize);

            // choose the best admissible candidate
            int chosen = -1;                    // index of the selected candidate
            double chosenOfv = INFINITY;        // its fitness
            bool chosenTabu = false;            // selected through aspiration

            for (int k = 0; k < (int)neigh.size(); k++)
            {
                double f = problem_.evaluate(neigh[k].first);
                bool tabuHit = tabu.contains(neigh[k].second);

                // aspiration: a tabu move is admitted only if clearly better than current
                if (tabuHit && !(f + params_.aspiration < current.ofv)) continue;

                if (f < chosenOfv) {
                    chosen = k;
                    chosenOfv = f;
                    chosenTabu = tabuHit;
                }
            }

            if (chosen >= 0) {
                const TMove &mv = neigh[chosen].second;
                problem_.applyMove(current.seq, mv);
                current.ofv = chosenOfv;
                tabu.push(mv);
            }

            // update global best
            if (current.ofv < best.ofv) {
                best = current;
                if (params_.debug) {
                    printf("\n[TABU] it %d best %.4f", it, best.ofv);
                }
            }

            TTabuStep step;
            step.iteration = it;
            step.bestOfv = best.ofv;
            step.currentOfv = current.ofv;
            step.tabuSize = tabu.size();
            step.aspiration = chosen >= 0 && chosenTabu;
            result.trace.push_back(step);

            // reheat
            if (params_.reheat > 0 && it != 0 && it % params_.reheat == 0) {
                tabu.clear();
            }
        }

        return result;
    }

} // namespace pepsolver::mh
