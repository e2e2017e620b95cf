#ifndef SHEETCALC_CRANGERESOLVER_H
#define SHEETCALC_CRANGERESOLVER_H

#include "sheetcalc/CPos.h"
#include "sheetcalc/CValue.h"

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

/**
 * Expands range references into cell positions under a size ceiling.
 */
class CRangeResolver {
public:
    /**
     * Number of cells the range spans, corners in any order.
     * @param from first corner
     * @param to opposite corner
     * @return rows * columns computed without overflow
     */
    static std::uint64_t cellCount(const CPos &from, const CPos &to);

    /**
     * Expand the range into its positions.
     *
     * The size is checked before anything is allocated, a range above the ceiling
     * fails immediately with #RANGE!.
     *
     * @param from first corner
     * @param to opposite corner
     * @param ceiling largest permitted number of cells
     * @return positions in row-major order, or the #RANGE! error
     */
    static std::variant<std::vector<CPos>, CError> expand(const CPos &from, const CPos &to, size_t ceiling);
};

#endif /* SHEETCALC_CRANGERESOLVER_H */
