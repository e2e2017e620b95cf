#include "sheetcalc/CCell.h"

#include "sheetcalc/CMyExpressionBuilder.h"

#include <stdexcept>
#include <utility>

CCell::CCell(std::string raw) : m_Raw(std::move(raw)) {
    if (!isFormula()) {
        m_Literal = literalValue(m_Raw);
        return;
    }

    // "=" alone is an empty formula
    if (m_Raw.find_first_not_of(" \t\r\n", 1) == std::string::npos)
        return;

    try {
        m_Expression = buildExpression(m_Raw);
    } catch (const std::invalid_argument &) {
        m_ParseError = true;
    }
}

bool CCell::isFormula() const {
    return !m_Raw.empty() && m_Raw.front() == '=';
}
