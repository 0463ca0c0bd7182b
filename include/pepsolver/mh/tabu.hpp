#pragma once

#include "pepsolver/core/data.hpp"
#include "pepsolver/core/iproblem.hpp"
#include "pepsolver/core/context.hpp"

namespace pepsolver::mh {

    /**
     * Class: TabuList
     * Description: bounded FIFO of recently applied moves. Pushing into a full
     * list evicts the oldest move; a zero capacity list stays empty.
     */
    class TabuList {
        public:
            explicit TabuList(int capacity);

            bool contains(const core::TMove &mv) const;
            void push(const core::TMove &mv);
            void clear() { moves_.clear(); }

            int size() const { return (int)moves_.size(); }
            int capacity() const { return capacity_; }

        private:
            std::deque<core::TMove> moves_;
            int capacity_;
    };

    /**
     * Class: TabuSearch
     * Description: trajectory search with a bounded tabu list, an aspiration
     * criterion and a periodic reheat that empties the list.
     * Parameters are validated at construction (std::invalid_argument).
     */
    class TabuSearch {
        public:
            TabuSearch(const core::TTabuParams &params, const core::IProblem &problem);

            // one full run of params.iterations iterations; deterministic for a seed
            core::TRunResult<core::TTabuStep> run(unsigned int seed) const;


        private:
            const core::TTabuParams params_;
            const core::IProblem &problem_;
    };

} // namespace pepsolver::mh
