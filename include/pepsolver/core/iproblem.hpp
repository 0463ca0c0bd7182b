#pragma once
#include "pepsolver/core/data.hpp"
#include "pepsolver/core/context.hpp"

namespace pepsolver::core {

    // Abstract problem interface shared by every search engine
    class IProblem {
        public:
            virtual ~IProblem() = default;

            // uniform legal starting point (satisfies the fixed-length invariant)
            virtual TSeq randomIndividual(SearchContext &ctx) const = 0;

            // fitness, pure and deterministic (lower is better)
            virtual double evaluate(const TSeq &s) const = 0;

            // sample up to size single-move neighbours of s
            virtual std::vector<TNeighbour> neighbourhood(SearchContext &ctx, const TSeq &s, int size) const = 0;

            // apply a move in place; throws if the move does not fit s
            virtual void applyMove(TSeq &s, const TMove &mv) const = 0;

            // idempotent shape normalization
            virtual void repair(TSeq &s, SearchContext &ctx) const {
                (void)s;
                (void)ctx;
            }

            // domain-validity predicate
            virtual bool isValid(const TSeq &s) const {
                (void)s;
                return true;
            }

            // local contribution of placing sym right after left
            virtual double localScore(Symbol left, Symbol sym) const {
                (void)left;
                (void)sym;
                return 0.0;
            }

            virtual int getDimension() const = 0;

            virtual int alphabetSize() const { return ALPHABET_SIZE; }

            virtual bool fixedLength() const { return true; }
        };

}
