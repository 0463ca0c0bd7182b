#include "pepsolver/utils/io.hpp"
#include "pepsolver/core/scoring.hpp"

namespace pepsolver::utils {

    using core::TJobResult;

    void WriteMotifCatalog()
    {
        printf("\nReference motifs:\n");
        for (int i = 0; i < core::MotifCount(); i++)
            printf("%3d  [%2d]  %s\n", i, (int)core::MotifLetters(i).size(), core::MotifLetters(i).c_str());
    }

    std::string Winner(const std::vector<TJobResult> &results)
    {
        if (results.empty()) return "-";

        int best = 0;
        int shared = 1;
        for (int i = 1; i < (int)results.size(); i++)
        {
            if (results[i].best.ofv < results[best].best.ofv) {
                best = i;
                shared = 1;
            }
            else if (results[i].best.ofv == results[best].best.ofv) {
                shared++;
            }
        }
        return (shared > 1) ? "Tie" : results[best].algorithm;
    }

    void WriteMotifReport(int motif, const std::vector<TJobResult> &results)
    {
        printf("\n==================================================");
        printf("\nMotif %d: %s (length %d)", motif, core::MotifLetters(motif).c_str(),
               (int)core::MotifLetters(motif).size());
        printf("\n==================================================");

        for (const auto &r : results)
        {
            printf("\n%-5s | seq: %-24s | ofv: %10.4lf | time: %.3fs",
                   r.algorithm.c_str(), core::Decode(r.best.seq).c_str(), r.best.ofv, r.time);
        }

        if (results.size() > 1)
            printf("\nWinner: %s", Winner(results).c_str());
        printf("\n");
    }

    void WriteSummary(const std::vector<TJobResult> &results, const std::vector<std::string> &algorithms)
    {
        // motifs in order of appearance
        std::vector<int> motifs;
        for (const auto &r : results)
            if (std::find(motifs.begin(), motifs.end(), r.motif) == motifs.end())
                motifs.push_back(r.motif);

        std::map<std::string, int> wins;
        int ties = 0;

        printf("\n\n==== SUMMARY ====\n");
        printf("%-4s %-24s", "ID", "Motif");
        for (const auto &name : algorithms) printf(" %12s", name.c_str());
        printf("  %s\n", "Better");

        for (int m : motifs)
        {
            std::vector<TJobResult> row;
            for (const auto &r : results)
                if (r.motif == m) row.push_back(r);

            printf("%-4d %-24s", m, core::MotifLetters(m).c_str());
            for (const auto &name : algorithms)
            {
                auto it = std::find_if(row.begin(), row.end(), [&](const TJobResult &r) { return r.algorithm == name; });
                if (it != row.end()) printf(" %12.4lf", it->best.ofv);
                else printf(" %12s", "-");
            }

            std::string winner = Winner(row);
            printf("  %s\n", winner.c_str());

            if (row.size() > 1) {
                if (winner == "Tie") ties++;
                else wins[winner]++;
            }
        }

        // ---- overall statistics ----
        printf("\n==== OVERALL ====");
        for (const auto &name : algorithms)
        {
            int count = 0;
            double totalTime = 0.0;
            const TJobResult *best = nullptr;

            for (const auto &r : results)
            {
                if (r.algorithm != name) continue;
                count++;
                totalTime += r.time;
                if (best == nullptr || r.best.ofv < best->best.ofv) best = &r;
            }
            if (count == 0) continue;

            printf("\n%-5s wins: %3d | avg time: %.3fs | best: %.4lf (motif %d, %s)",
                   name.c_str(), wins[name], totalTime / count, best->best.ofv, best->motif,
                   core::Decode(best->best.seq).c_str());
        }
        printf("\nTies: %d\n", ties);
    }

    void WriteResults(const std::string &path, const std::vector<TJobResult> &results)
    {
        FILE *File = fopen(path.c_str(), "a");
        if (!File)
            throw std::runtime_error("cannot open results file " + path);

        // header on a fresh file
        fseek(File, 0, SEEK_END);
        if (ftell(File) == 0)
            fprintf(File, "motif\tletters\talgorithm\tseed\tofv\tsequence\ttime\n");

        for (const auto &r : results)
        {
            fprintf(File, "%d\t%s\t%s\t%u\t%lf\t%s\t%.3f\n",
                    r.motif, core::MotifLetters(r.motif).c_str(), r.algorithm.c_str(), r.seed,
                    r.best.ofv, core::Decode(r.best.seq).c_str(), r.time);
        }

        fclose(File);
    }

} // namespace pepsolver::utils
