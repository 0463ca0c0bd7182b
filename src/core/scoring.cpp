#include "pepsolver/core/scoring.hpp"
#include <cstring>

namespace pepsolver::core {

    // -----------------------------------------------------------------------------
    // Static tables
    // -----------------------------------------------------------------------------

    // BLOSUM62 in its usual row order
    static const char BLOSUM_ORDER[] = "ARNDCQEGHILKMFPSTWYV";

    static const int BLOSUM62[20][20] = {
        //A   R   N   D   C   Q   E   G   H   I   L   K   M   F   P   S   T   W   Y   V
        { 4, -1, -2, -2,  0, -1, -1,  0, -2, -1, -1, -1, -1, -2, -1,  1,  0, -3, -2,  0}, // A
        {-1,  5,  0, -2, -3,  1,  0, -2,  0, -3, -2,  2, -1, -3, -2, -1, -1, -3, -2, -3}, // R
        {-2,  0,  6,  1, -3,  0,  0,  0,  1, -3, -3,  0, -2, -3, -2,  1,  0, -4, -2, -3}, // N
        {-2, -2,  1,  6, -3,  0,  2, -1, -1, -3, -4, -1, -3, -3, -1,  0, -1, -4, -3, -3}, // D
        { 0, -3, -3, -3,  9, -3, -4, -3, -3, -1, -1, -3, -1, -2, -3, -1, -1, -2, -2, -1}, // C
        {-1,  1,  0,  0, -3,  5,  2, -2,  0, -3, -2,  1,  0, -3, -1,  0, -1, -2, -1, -2}, // Q
        {-1,  0,  0,  2, -4,  2,  5, -2,  0, -3, -3,  1, -2, -3, -1,  0, -1, -3, -2, -2}, // E
        { 0, -2,  0, -1, -3, -2, -2,  6, -2, -4, -4, -2, -3, -3, -2,  0, -2, -2, -3, -3}, // G
        {-2,  0,  1, -1, -3,  0,  0, -2,  8, -3, -3, -1, -2, -1, -2, -1, -2, -2,  2, -3}, // H
        {-1, -3, -3, -3, -1, -3, -3, -4, -3,  4,  2, -3,  1,  0, -3, -2, -1, -3, -1,  3}, // I
        {-1, -2, -3, -4, -1, -2, -3, -4, -3,  2,  4, -2,  2,  0, -3, -2, -1, -2, -1,  1}, // L
        {-1,  2,  0, -1, -3,  1,  1, -2, -1, -3, -2,  5, -1, -3, -1,  0, -1, -3, -2, -2}, // K
        {-1, -1, -2, -3, -1,  0, -2, -3, -2,  1,  2, -1,  5,  0, -2, -1, -1, -1, -1,  1}, // M
        {-2, -3, -3, -3, -2, -3, -3, -3, -1,  0,  0, -3,  0,  6, -4, -2, -2,  1,  3, -1}, // F
        {-1, -2, -2, -1, -3, -1, -1, -2, -2, -3, -3, -1, -2, -4,  7, -1, -1, -4, -3, -2}, // P
        { 1, -1,  1,  0, -1,  0,  0,  0, -1, -2, -2,  0, -1, -2, -1,  4,  1, -3, -2, -2}, // S
        { 0, -1,  0, -1, -1, -1, -1, -2, -2, -1, -1, -1, -1, -2, -1,  1,  5, -2, -2,  0}, // T
        {-3, -3, -4, -4, -2, -2, -3, -2, -2, -3, -2, -3, -1,  1, -4, -3, -2, 11,  2, -3}, // W
        {-2, -2, -2, -3, -2, -1, -2, -3,  2, -1, -1, -2, -1,  3, -3, -2, -2,  2,  7, -1}, // Y
        { 0, -3, -3, -3, -1, -2, -2, -3, -3,  3,  1, -2,  1, -1, -2, -2,  0, -3, -1,  4}  // V
    };

    static const std::vector<std::string> MOTIFS = {
        "GGAGGVGKS",
        "RGD",                      // cell adhesion
        "KDEL",                     // ER retention signal
        "PKKP",                     // modified SH3 domain binding
        "YPAF",                     // modified sorting signal
        "DPDGGDGMDDSD",             // modified calcium binding
        "CIGCINGSMRKSDWKNHKPWH",    // modified zinc finger
        "LPEKAYNLALGRCELMYSHKNL",   // modified leucine zipper
        "HTH",                      // helix-turn-helix
        "YGRKKRRQRRR",              // HIV-1 Tat transduction domain
        "RQIKIWFQNRRMKWKK",         // Antennapedia homeodomain
        "AGYLLGKLGAALKG",           // antimicrobial peptide
        "KWRWKRWKK"                 // cell-penetrating peptide
    };

    // -----------------------------------------------------------------------------
    // Alphabet
    // -----------------------------------------------------------------------------

    Symbol SymbolOf(char letter)
    {
        const char* p = std::strchr(AA_LETTERS, letter);
        if (letter == '\0' || p == nullptr) {
            throw std::invalid_argument(std::string("undefined amino acid '") + letter + "'");
        }
        return (Symbol)(p - AA_LETTERS);
    }

    char LetterOf(Symbol s)
    {
        if (s >= ALPHABET_SIZE) return '?';
        return AA_LETTERS[s];
    }

    TSeq Encode(const std::string &letters)
    {
        TSeq s;
        s.reserve(letters.size());
        for (char c : letters) s.push_back(SymbolOf(c));
        return s;
    }

    std::string Decode(const TSeq &s)
    {
        std::string out;
        out.reserve(s.size());
        for (Symbol x : s) out.push_back(LetterOf(x));
        return out;
    }

    // -----------------------------------------------------------------------------
    // Motif catalog
    // -----------------------------------------------------------------------------

    int MotifCount()
    {
        return (int)MOTIFS.size();
    }

    const std::string& MotifLetters(int index)
    {
        if (index < 0 || index >= MotifCount()) {
            throw std::out_of_range("motif index " + std::to_string(index) + " outside catalog of "
                                    + std::to_string(MotifCount()));
        }
        return MOTIFS[index];
    }

    const TSeq& MotifSymbols(int index)
    {
        static const std::vector<TSeq> encoded = [] {
            std::vector<TSeq> v;
            for (const auto &m : MOTIFS) v.push_back(Encode(m));
            return v;
        }();

        MotifLetters(index); // range check
        return encoded[index];
    }

    // -----------------------------------------------------------------------------
    // MatrixScoring
    // -----------------------------------------------------------------------------

    static TMatrix BuildSubstitution()
    {
        TMatrix m(ALPHABET_SIZE, std::vector<double>(ALPHABET_SIZE, 0.0));
        for (int a = 0; a < ALPHABET_SIZE; a++) {
            int ia = (int)(std::strchr(BLOSUM_ORDER, AA_LETTERS[a]) - BLOSUM_ORDER);
            for (int b = 0; b < ALPHABET_SIZE; b++) {
                int ib = (int)(std::strchr(BLOSUM_ORDER, AA_LETTERS[b]) - BLOSUM_ORDER);
                m[a][b] = BLOSUM62[ia][ib];
            }
        }
        return m;
    }

    MatrixScoring::MatrixScoring()
        : sub_(BuildSubstitution()),
          adj_(ALPHABET_SIZE, std::vector<double>(ALPHABET_SIZE, 0.0))
    {}

    MatrixScoring::MatrixScoring(TMatrix adjacency)
        : sub_(BuildSubstitution()),
          adj_(std::move(adjacency))
    {
        bool square = (int)adj_.size() == ALPHABET_SIZE;
        for (const auto &row : adj_) square = square && (int)row.size() == ALPHABET_SIZE;
        if (!square) {
            throw std::invalid_argument("adjacency table must be 20x20");
        }
    }

    double MatrixScoring::substitutionScore(Symbol a, Symbol b) const
    {
        return sub_[a][b];
    }

    double MatrixScoring::adjacencyScore(Symbol a, Symbol b) const
    {
        return adj_[a][b];
    }

    TMatrix LoadAdjacencyTable(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("adjacency table " + path + " not found");
        }

        TMatrix m;
        std::string line;
        int lineNo = 0;
        while (std::getline(file, line)) {
            lineNo++;
            if (line.empty() || line[0] == '#') continue;

            std::istringstream iss(line);
            std::vector<double> row;
            std::string token;
            while (iss >> token) {
                try {
                    size_t pos = 0;
                    double v = std::stod(token, &pos);
                    if (pos != token.size()) throw std::invalid_argument(token);
                    row.push_back(v);
                } catch (const std::logic_error&) {
                    throw std::runtime_error(path + ":" + std::to_string(lineNo) + ": bad value '" + token + "'");
                }
            }

            if (row.empty()) continue; // blank line with spaces only
            if ((int)row.size() != ALPHABET_SIZE) {
                throw std::runtime_error(path + ":" + std::to_string(lineNo) + ": expected 20 values, got "
                                         + std::to_string(row.size()));
            }
            m.push_back(std::move(row));
        }

        if ((int)m.size() != ALPHABET_SIZE) {
            throw std::runtime_error(path + ": expected 20 rows, got " + std::to_string(m.size()));
        }
        return m;
    }

} // namespace pepsolver::core
