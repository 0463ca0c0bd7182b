#pragma once

#include "pepsolver/core/data.hpp"

namespace pepsolver::core {

    //--------------------------------------------------------------------------
    // Alphabet
    //--------------------------------------------------------------------------
    // one-letter amino acid codes, symbol i is AA_LETTERS[i]
    inline constexpr char AA_LETTERS[] = "ACDEFGHIKLMNPQRSTVWY";

    Symbol SymbolOf(char letter);               // throws std::invalid_argument for unknown letters
    char LetterOf(Symbol s);
    TSeq Encode(const std::string &letters);
    std::string Decode(const TSeq &s);

    //--------------------------------------------------------------------------
    // Reference motif catalog
    //--------------------------------------------------------------------------
    int MotifCount();
    const std::string& MotifLetters(int index);    // throws std::out_of_range
    const TSeq& MotifSymbols(int index);           // throws std::out_of_range

    //--------------------------------------------------------------------------
    // Class: IScoringProvider
    // Description: pairwise lookups the energy function is built from
    //--------------------------------------------------------------------------
    class IScoringProvider {
        public:
            virtual ~IScoringProvider() = default;

            virtual double substitutionScore(Symbol a, Symbol b) const = 0;
            virtual double adjacencyScore(Symbol a, Symbol b) const = 0;
            virtual int alphabetSize() const { return ALPHABET_SIZE; }
    };

    using TMatrix = std::vector<std::vector<double>>;

    //--------------------------------------------------------------------------
    // Class: MatrixScoring
    // Description: BLOSUM62 substitution scores plus a pairwise adjacency table
    //--------------------------------------------------------------------------
    class MatrixScoring : public IScoringProvider {
        public:
            MatrixScoring();                                // zero adjacency table
            explicit MatrixScoring(TMatrix adjacency);      // throws std::invalid_argument if not 20x20

            double substitutionScore(Symbol a, Symbol b) const override;
            double adjacencyScore(Symbol a, Symbol b) const override;

        private:
            TMatrix sub_;
            TMatrix adj_;
    };

    /**
     * Method: LoadAdjacencyTable
     * Description: read a 20x20 whitespace separated table, '#' lines are comments.
     * Throws std::runtime_error with file and line on any malformed input.
     */
    TMatrix LoadAdjacencyTable(const std::string &path);

    //--------------------------------------------------------------------------
    // Scoring configuration, captured once by the problem
    //--------------------------------------------------------------------------
    enum class EScoringMode { SINGLE_MOTIF = 1, BEST_OF_CATALOG };

    struct TScoringConfig
    {
        EScoringMode mode = EScoringMode::SINGLE_MOTIF;
        int motifIndex = 0;             // scored motif; also fixes the target length
    };

} // namespace pepsolver::core
