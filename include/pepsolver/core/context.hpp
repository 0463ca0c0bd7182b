/**
 * pepsolver - Search Context
 * Per-run random state owned by one engine instance
 */

#pragma once

#include <random>
#include "pepsolver/core/data.hpp"

namespace pepsolver {
    namespace core {

    /**
    * @brief Random state of a single engine run
    *
    * Every engine builds its own context from the run seed, so two engines
    * (or two runs) never share a generator. Not thread-safe by itself: one
    * context belongs to one thread.
    */
    class SearchContext {
      public:
          explicit SearchContext(unsigned int seed) : rng_(seed) {}

          SearchContext(const SearchContext&) = delete;
          SearchContext& operator=(const SearchContext&) = delete;

          // -------------------------------------------------------------------------
          // RANDOM DRAWS
          // -------------------------------------------------------------------------

          // uniform real in [min, max)
          double randomico(double min, double max) {
              return std::uniform_real_distribution<double>(min, max)(rng_);
          }

          // uniform integer in [min, max] (inclusive)
          int irandomico(int min, int max) {
              int v = (int)randomico(0, max - min + 1) + min;
              return std::min(v, max);
          }

          // fair coin
          bool coin() { return randomico(0, 1) < 0.5; }

          // uniform symbol of the alphabet
          Symbol symbol(int alphabetSize) { return (Symbol)irandomico(0, alphabetSize - 1); }


      private:
          std::mt19937 rng_;
      };

      } // namespace core
} // namespace pepsolver
