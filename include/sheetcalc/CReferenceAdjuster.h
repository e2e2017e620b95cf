#ifndef SHEETCALC_CREFERENCEADJUSTER_H
#define SHEETCALC_CREFERENCEADJUSTER_H

#include <string>

/**
 * Rewrites the relative references of a formula moved by copy or fill.
 */
class CReferenceAdjuster {
public:
    /**
     * Shift relative references of the formula. '$'-anchored parts stay, shifted
     * parts are clamped to the first row and column, everything else (spacing,
     * strings, function names) is kept as written.
     *
     * @param formula cell contents
     * @param rowOffset rows to move by
     * @param columnOffset columns to move by
     * @return adjusted formula, the input itself for literals and unparsable formulas
     */
    static std::string adjust(const std::string &formula, int rowOffset, int columnOffset);

private:
    static std::string shiftReference(const std::string &reference, int rowOffset, int columnOffset);
};

#endif /* SHEETCALC_CREFERENCEADJUSTER_H */
