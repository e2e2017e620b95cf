#ifndef SHEETCALC_CCELL_H
#define SHEETCALC_CCELL_H

#include "sheetcalc/COperation.h"
#include "sheetcalc/CValue.h"

#include <string>

/**
 * Class representing contents of a single cell.
 *
 * A formula is parsed once when the contents are set; the tree is shared between
 * copies of the cell.
 */
class CCell {
public:
    CCell() = default;

    /**
     * @param raw raw contents, a leading '=' makes it a formula
     */
    explicit CCell(std::string raw);

    const std::string &raw() const { return m_Raw; }

    bool isFormula() const;

    /**
     * @return true if the formula could not be parsed
     */
    bool hasParseError() const { return m_ParseError; }

    /**
     * @return parsed formula, nullptr for literals, empty formulas and parse errors
     */
    const COperationPtr &expression() const { return m_Expression; }

    /**
     * @return value of a literal cell, meaningless for formulas
     */
    const CValue &literal() const { return m_Literal; }

private:
    std::string m_Raw;
    COperationPtr m_Expression;
    bool m_ParseError = false;
    CValue m_Literal;
};

#endif /* SHEETCALC_CCELL_H */
