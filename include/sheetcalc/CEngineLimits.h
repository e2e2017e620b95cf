#ifndef SHEETCALC_CENGINELIMITS_H
#define SHEETCALC_CENGINELIMITS_H

#include <cstddef>

/**
 * Resource ceilings of the evaluator. The defaults are chosen constants, tests and hosts may
 * tighten or loosen them per spreadsheet.
 */
struct CEngineLimits {
    static constexpr size_t DEFAULT_MAX_RANGE_CELLS = 10'000;
    static constexpr int DEFAULT_MAX_DEPTH = 100;
    static constexpr size_t DEFAULT_MAX_EVALUATIONS = 100'000;

    /**
     * Largest number of cells a single range reference may expand to.
     */
    size_t m_MaxRangeCells = DEFAULT_MAX_RANGE_CELLS;

    /**
     * Nesting depth of formula evaluations at which #DEPTH! is returned.
     */
    int m_MaxDepth = DEFAULT_MAX_DEPTH;

    /**
     * Cell visits allowed in one top-level evaluation before #LIMIT! is returned.
     */
    size_t m_MaxEvaluations = DEFAULT_MAX_EVALUATIONS;
};

#endif /* SHEETCALC_CENGINELIMITS_H */
