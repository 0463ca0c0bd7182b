#include "pepsolver/core/method.hpp"

#if defined(_WIN32) || defined(_WIN64)
    #define NOMINMAX
    #include <windows.h>
#else
    #include <ctime>
#endif

namespace pepsolver::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------

    bool sortByFitness(const TSol &lhs, const TSol &rhs) {
        return lhs.ofv < rhs.ofv;
    }

    double get_time_in_seconds() {
        #if defined(_WIN32) || defined(_WIN64)
            LARGE_INTEGER frequency;
            LARGE_INTEGER timeCur;
            QueryPerformanceFrequency(&frequency);
            QueryPerformanceCounter(&timeCur);
            return static_cast<double>(timeCur.QuadPart) / frequency.QuadPart;
        #else
            struct timespec timeCur;
            clock_gettime(CLOCK_MONOTONIC, &timeCur);
            return timeCur.tv_sec + timeCur.tv_nsec / 1e9;
        #endif
    }

    int BestIndex(const std::vector<TSol> &Pop)
    {
        if (Pop.empty()) {
            throw std::invalid_argument("BestIndex: empty population");
        }

        int best = 0;
        for (int i = 1; i < (int)Pop.size(); i++) {
            if (Pop[i].ofv < Pop[best].ofv) best = i;
        }
        return best;
    }

    TGenStats PopulationStats(int generation, const std::vector<TSol> &Pop)
    {
        TGenStats st;
        st.generation = generation;
        if (Pop.empty()) return st;

        st.minOfv = INFINITY;
        st.maxOfv = -INFINITY;
        double sum = 0.0;
        for (const auto &ind : Pop) {
            st.minOfv = std::min(st.minOfv, ind.ofv);
            st.maxOfv = std::max(st.maxOfv, ind.ofv);
            sum += ind.ofv;
        }
        st.meanOfv = sum / (double)Pop.size();
        return st;
    }

    // -----------------------------------------------------------------------------
    // Solution & Population Management
    // -----------------------------------------------------------------------------

    void CreateInitialSolutions(TSol &s, const IProblem &problem, SearchContext &ctx)
    {
        s.seq = problem.randomIndividual(ctx);
        s.ofv = problem.evaluate(s.seq);
    }

    std::vector<TSol> CreatePopulation(const IProblem &problem, int sizePop, SearchContext &ctx)
    {
        std::vector<TSol> Pop(sizePop);
        for (int i = 0; i < sizePop; i++) {
            CreateInitialSolutions(Pop[i], problem, ctx);
        }
        return Pop;
    }

    // -----------------------------------------------------------------------------
    // Selection
    // -----------------------------------------------------------------------------

    int TournamentSelection(const std::vector<TSol> &Pop, int k, SearchContext &ctx)
    {
        const int n = (int)Pop.size();
        int best = ctx.irandomico(0, n - 1);
        for (int j = 1; j < k; j++) {
            int idx = ctx.irandomico(0, n - 1);
            if (Pop[idx].ofv < Pop[best].ofv) best = idx;
        }
        return best;
    }

    // -----------------------------------------------------------------------------
    // Crossover Operators
    // -----------------------------------------------------------------------------

    TSeq SinglePointCrossover(const TSeq &a, const TSeq &b, SearchContext &ctx)
    {
        const int common = (int)std::min(a.size(), b.size());
        if (common < 2) return a;

        int point = ctx.irandomico(1, common - 1);
        TSeq child(a.begin(), a.begin() + point);
        child.insert(child.end(), b.begin() + point, b.end());
        return child;
    }

    TSeq UniformCrossover(const TSeq &a, const TSeq &b, SearchContext &ctx)
    {
        TSeq child = a;
        const size_t common = std::min(a.size(), b.size());
        for (size_t i = 0; i < common; i++) {
            if (ctx.coin()) child[i] = b[i];
        }
        return child;
    }

    std::pair<TSeq, TSeq> UniformCrossoverPair(const TSeq &a, const TSeq &b, SearchContext &ctx)
    {
        TSeq childA = a;
        TSeq childB = b;
        const size_t common = std::min(a.size(), b.size());
        for (size_t i = 0; i < common; i++) {
            if (ctx.coin()) {
                childA[i] = b[i];
                childB[i] = a[i];
            }
        }
        return {childA, childB};
    }

    // randomise the first locus to keep diversity
    static void DiversifyFirstLocus(TSeq &child, const TSeq &b, SearchContext &ctx)
    {
        if (child.empty() || b.empty()) return;
        if (ctx.coin()) child[0] = b[0];
    }

    TSeq GuidedCrossover(const TSeq &a, const TSeq &b, const IProblem &problem, SearchContext &ctx)
    {
        TSeq child = a;
        const size_t common = std::min(a.size(), b.size());

        for (size_t i = 0; i < common; i++)
        {
            if (a[i] == b[i]) continue; // no choice to make

            // try allele from B
            child[i] = b[i];
            double fitB = problem.evaluate(child);

            // keep A's allele
            child[i] = a[i];
            double fitA = problem.evaluate(child);

            // choose the better allele (lower energy)
            if (fitB < fitA) child[i] = b[i];
        }

        DiversifyFirstLocus(child, b, ctx);
        return child;
    }

    TSeq GuidedCrossoverApprox(const TSeq &a, const TSeq &b, const IProblem &problem, SearchContext &ctx)
    {
        TSeq child = a;
        const size_t common = std::min(a.size(), b.size());

        for (size_t i = 1; i < common; i++)
        {
            if (a[i] == b[i]) continue;

            double scoreA = problem.localScore(child[i - 1], a[i]);
            double scoreB = problem.localScore(child[i - 1], b[i]);
            if (scoreB < scoreA) child[i] = b[i];
        }

        DiversifyFirstLocus(child, b, ctx);
        return child;
    }

    // -----------------------------------------------------------------------------
    // Mutation Operators
    // -----------------------------------------------------------------------------

    void SubstitutionMutation(TSeq &s, int alphabetSize, bool distinct, SearchContext &ctx)
    {
        if (s.empty()) return;

        int pos = ctx.irandomico(0, (int)s.size() - 1);
        Symbol newS = ctx.symbol(alphabetSize);
        while (distinct && alphabetSize > 1 && newS == s[pos]) {
            newS = ctx.symbol(alphabetSize);
        }
        s[pos] = newS;
    }

    void InsertionMutation(TSeq &s, int alphabetSize, SearchContext &ctx)
    {
        int pos = ctx.irandomico(0, (int)s.size());
        Symbol sym = ctx.symbol(alphabetSize);
        s.insert(s.begin() + pos, sym);
    }

    void DeletionMutation(TSeq &s, SearchContext &ctx)
    {
        if (s.empty()) return;

        int pos = ctx.irandomico(0, (int)s.size() - 1);
        s.erase(s.begin() + pos);
    }

    void SwapMutation(TSeq &s, SearchContext &ctx)
    {
        const int n = (int)s.size();
        if (n < 2) return;

        int p1 = ctx.irandomico(0, n - 1);
        int p2 = ctx.irandomico(0, n - 1);
        while (p2 == p1) p2 = ctx.irandomico(0, n - 1);
        std::swap(s[p1], s[p2]);
    }

    void InversionMutation(TSeq &s, SearchContext &ctx)
    {
        const int n = (int)s.size();
        if (n < 3) return;

        int i = ctx.irandomico(0, n - 2);
        int j = ctx.irandomico(i + 1, n - 1);
        std::reverse(s.begin() + i, s.begin() + j + 1);
    }

    // -----------------------------------------------------------------------------
    // Local Search
    // -----------------------------------------------------------------------------

    void HillClimb(TSol &s, const IProblem &problem)
    {
        double bestScore = problem.evaluate(s.seq);

        for (size_t pos = 0; pos < s.seq.size(); pos++)
        {
            const Symbol orig = s.seq[pos];
            double bestLocal = bestScore;
            Symbol bestSym = orig;

            // test the alternative symbols
            for (int sym = 0; sym < problem.alphabetSize(); sym++)
            {
                if (sym == orig) continue;
                s.seq[pos] = (Symbol)sym;

                // keep search inside the valid space
                if (!problem.isValid(s.seq)) continue;

                double score = problem.evaluate(s.seq);
                if (score < bestLocal) {
                    bestLocal = score;
                    bestSym = (Symbol)sym;
                }
            }

            // commit the best substitution found for this position
            s.seq[pos] = bestSym;
            bestScore = bestLocal;
        }

        s.ofv = bestScore;
    }

} // namespace pepsolver::core
