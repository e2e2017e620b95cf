#ifndef SHEETCALC_CGRIDCONTEXT_H
#define SHEETCALC_CGRIDCONTEXT_H

#include "sheetcalc/CPos.h"
#include "sheetcalc/CValue.h"

#include <set>
#include <string>

/**
 * Cells whose evaluation is in flight on the current path. Threaded explicitly through
 * every recursive call; re-entering a member is a cycle.
 */
using CVisitedSet = std::set<CPos>;

/**
 * Grid the evaluator resolves references against.
 */
class CGridContext {
public:
    virtual ~CGridContext() = default;

    /**
     * Evaluate the cell at the position.
     * @param row zero-based row
     * @param column zero-based column
     * @param visited cells in flight, the implementation adds the cell for the duration of the call
     * @return value of the cell or an error value (#CYCLE! when the cell is already in flight)
     */
    virtual CValue evaluateCell(int row, int column, CVisitedSet &visited) = 0;

    /**
     * Get the raw contents of the cell.
     * @param row zero-based row
     * @param column zero-based column
     * @return raw text, empty for empty or missing cells
     */
    virtual std::string getCellRaw(int row, int column) const = 0;
};

#endif /* SHEETCALC_CGRIDCONTEXT_H */
