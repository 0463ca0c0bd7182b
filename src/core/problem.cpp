#include "pepsolver/core/data.hpp"
#include "pepsolver/core/problem.hpp"

//-------------------------- IMPLEMENTATION --------------------------
namespace pepsolver::core {

    // Kyte-Doolittle hydropathy, AA_LETTERS order
    static const double HYDROPATHY[ALPHABET_SIZE] = {
        1.8, 2.5, -3.5, -3.5, 2.8, -0.4, -3.2, 4.5, -3.9, 3.8,
        1.9, -3.5, -1.6, -3.5, -4.5, -0.8, -0.7, 4.2, -0.9, -1.3
    };

    static const double MIN_HYDROPATHY = -1.5;
    static const double MAX_HYDROPATHY = 3.0;
    static const Symbol CYS = 1;    // 'C'
    static const Symbol PRO = 12;   // 'P'
    static const int MAX_RUN = 3;   // longest allowed homopolymer run

    PeptideProblem::PeptideProblem(std::shared_ptr<const IScoringProvider> scoring,
                                   TScoringConfig config,
                                   TPeptideOptions options)
        : scoring_(std::move(scoring)),
          config_(config),
          options_(options),
          targetLength_(0)
    {
        if (!scoring_) {
            throw std::invalid_argument("PeptideProblem: scoring provider is null");
        }
        if (config_.motifIndex < 0 || config_.motifIndex >= MotifCount()) {
            throw std::invalid_argument("PeptideProblem: motif index " + std::to_string(config_.motifIndex)
                                        + " outside catalog [0, " + std::to_string(MotifCount() - 1) + "]");
        }
        if (options_.length == ELengthPolicy::VARIABLE
            && (options_.minLength < 1 || options_.minLength > options_.maxLength)) {
            throw std::invalid_argument("PeptideProblem: length bounds must satisfy 1 <= minLength <= maxLength");
        }

        targetLength_ = (int)MotifSymbols(config_.motifIndex).size();
        if (options_.length == ELengthPolicy::VARIABLE) {
            targetLength_ = std::clamp(targetLength_, options_.minLength, options_.maxLength);
        }
    }

    TSeq PeptideProblem::randomIndividual(SearchContext &ctx) const
    {
        TSeq s(targetLength_);
        for (auto &x : s) x = ctx.symbol(alphabetSize());
        return s;
    }

    double PeptideProblem::motifEnergy(const TSeq &s, const TSeq &motif) const
    {
        double e = 0.0;
        for (size_t i = 0; i < s.size(); i++) {
            e -= scoring_->substitutionScore(s[i], motif[i % motif.size()]);
        }
        return e;
    }

    double PeptideProblem::motifEnergy(const TSeq &s) const
    {
        if (config_.mode == EScoringMode::SINGLE_MOTIF) {
            return motifEnergy(s, MotifSymbols(config_.motifIndex));
        }

        double best = INFINITY;
        for (int m = 0; m < MotifCount(); m++) {
            best = std::min(best, motifEnergy(s, MotifSymbols(m)));
        }
        return best;
    }

    double PeptideProblem::adjacencyEnergy(const TSeq &s) const
    {
        double e = 0.0;
        for (size_t i = 1; i < s.size(); i++) {
            e += scoring_->adjacencyScore(s[i - 1], s[i]);
        }
        return e;
    }

    double PeptideProblem::evaluate(const TSeq &s) const
    {
        return motifEnergy(s) + adjacencyEnergy(s);
    }

    std::vector<TNeighbour> PeptideProblem::neighbourhood(SearchContext &ctx, const TSeq &s, int size) const
    {
        std::vector<TNeighbour> out;
        out.reserve(size);

        const int len = (int)s.size();
        if (len == 0) return out;

        // operator mix: fixed 70/30 subst/swap, variable 60/20/10/10 subst/swap/insert/delete
        const bool variable = !fixedLength();
        const double pSubst = variable ? 0.6 : 0.7;
        const double pSwap = variable ? 0.8 : 1.0;
        const double pInsert = 0.9;

        for (int k = 0; k < size; k++)
        {
            TSeq neigh = s;
            double r = ctx.randomico(0, 1);

            if (r < pSubst) {
                // ---------- SUBST ----------
                int pos = ctx.irandomico(0, len - 1);
                Symbol oldS = neigh[pos];
                Symbol newS = ctx.symbol(alphabetSize());
                while (newS == oldS) newS = ctx.symbol(alphabetSize());
                neigh[pos] = newS;
                out.emplace_back(std::move(neigh), TMove::Subst(pos, oldS, newS));
            }
            else if (r < pSwap) {
                // ---------- SWAP ----------
                if (len < 2) continue;
                int p1 = ctx.irandomico(0, len - 1);
                int p2 = ctx.irandomico(0, len - 1);
                while (p2 == p1) p2 = ctx.irandomico(0, len - 1);
                std::swap(neigh[p1], neigh[p2]);
                out.emplace_back(std::move(neigh), TMove::Swap(p1, p2));
            }
            else if (r < pInsert) {
                // ---------- INSERT ----------
                if (len >= options_.maxLength) continue;
                int pos = ctx.irandomico(0, len);
                Symbol sym = ctx.symbol(alphabetSize());
                neigh.insert(neigh.begin() + pos, sym);
                out.emplace_back(std::move(neigh), TMove::Insert(pos, sym));
            }
            else {
                // ---------- DELETE ----------
                if (len <= options_.minLength) continue;
                int pos = ctx.irandomico(0, len - 1);
                Symbol sym = neigh[pos];
                neigh.erase(neigh.begin() + pos);
                out.emplace_back(std::move(neigh), TMove::Delete(pos, sym));
            }
        }
        return out;
    }

    void PeptideProblem::applyMove(TSeq &s, const TMove &mv) const
    {
        const int len = (int)s.size();
        auto inRange = [len](int p) { return p >= 0 && p < len; };

        switch (mv.type)
        {
            case EMoveType::SUBST:
                if (!inRange(mv.p1) || s[mv.p1] != mv.oldSym || mv.newSym >= alphabetSize()) {
                    throw std::out_of_range("applyMove: substitution at " + std::to_string(mv.p1)
                                            + " does not match a sequence of length " + std::to_string(len));
                }
                s[mv.p1] = mv.newSym;
                break;

            case EMoveType::SWAP:
                if (!inRange(mv.p1) || !inRange(mv.p2)) {
                    throw std::out_of_range("applyMove: swap (" + std::to_string(mv.p1) + ", " + std::to_string(mv.p2)
                                            + ") outside a sequence of length " + std::to_string(len));
                }
                std::swap(s[mv.p1], s[mv.p2]);
                break;

            case EMoveType::INSERT:
                if (fixedLength()) throw std::logic_error("applyMove: insertion not supported with fixed length");
                if (mv.p1 < 0 || mv.p1 > len || len >= options_.maxLength || mv.newSym >= alphabetSize()) {
                    throw std::out_of_range("applyMove: insertion at " + std::to_string(mv.p1)
                                            + " does not fit a sequence of length " + std::to_string(len));
                }
                s.insert(s.begin() + mv.p1, mv.newSym);
                break;

            case EMoveType::DELETE:
                if (fixedLength()) throw std::logic_error("applyMove: deletion not supported with fixed length");
                if (!inRange(mv.p1) || s[mv.p1] != mv.oldSym || len <= options_.minLength) {
                    throw std::out_of_range("applyMove: deletion at " + std::to_string(mv.p1)
                                            + " does not match a sequence of length " + std::to_string(len));
                }
                s.erase(s.begin() + mv.p1);
                break;
        }
    }

    void PeptideProblem::repair(TSeq &s, SearchContext &ctx) const
    {
        int lo = targetLength_;
        int hi = targetLength_;
        if (!fixedLength()) {
            lo = options_.minLength;
            hi = options_.maxLength;
        }

        // too short: extend with random residues
        while ((int)s.size() < lo) s.push_back(ctx.symbol(alphabetSize()));

        // too long: truncate
        if ((int)s.size() > hi) s.resize(hi);
    }

    bool PeptideProblem::isValid(const TSeq &s) const
    {
        return IsBiologicallyValid(s);
    }

    double PeptideProblem::localScore(Symbol left, Symbol sym) const
    {
        return scoring_->adjacencyScore(left, sym);
    }

    //-------------------------- DOMAIN VALIDITY --------------------------

    double MeanHydropathy(const TSeq &s)
    {
        if (s.empty()) return 0.0;

        double sum = 0.0;
        for (Symbol x : s) sum += HYDROPATHY[x];
        return sum / (double)s.size();
    }

    bool IsBiologicallyValid(const TSeq &s)
    {
        if (s.empty()) return false;

        for (Symbol x : s) {
            if (x >= ALPHABET_SIZE) return false;
        }

        // --- average hydropathy ---
        double avg = MeanHydropathy(s);
        if (avg < MIN_HYDROPATHY || avg > MAX_HYDROPATHY) return false;

        // --- forbidden adjacent pairs ---
        for (size_t i = 1; i < s.size(); i++) {
            if ((s[i - 1] == CYS && s[i] == CYS) || (s[i - 1] == PRO && s[i] == PRO)) return false;
        }

        // --- long homopolymers ---
        int run = 1;
        for (size_t i = 1; i < s.size(); i++) {
            if (s[i] == s[i - 1]) {
                if (++run > MAX_RUN) return false;
            } else {
                run = 1;
            }
        }

        return true;
    }

}
