#ifndef SHEETCALC_CFORMULAPARSER_H
#define SHEETCALC_CFORMULAPARSER_H

#include "sheetcalc/CExprBuilder.h"
#include "sheetcalc/CTokenizer.h"

#include <string>
#include <string_view>
#include <vector>

/**
 * Recursive descent parser for formula bodies.
 *
 * Precedence, lowest first: comparison (= <> < <= > >=), concatenation (&),
 * additive (+ -), multiplicative (* /), unary (+ -), power (^), range (:).
 * Binary operators are left associative.
 */
class CFormulaParser {
public:
    /**
     * @param formula formula text, a leading '=' is skipped
     * @param builder receiver of the postfix event stream
     */
    CFormulaParser(std::string_view formula, CExprBuilder &builder);

    /**
     * Parse the whole formula.
     * @throws CParseError on malformed input
     */
    void parse();

private:
    void parseComparison();

    void parseConcatenation();

    void parseAdditive();

    void parseMultiplicative();

    void parseUnary();

    void parsePower();

    void parsePowerOperand();

    void parsePrimary();

    void parseIdentifier();

    void parseFunctionCall(const std::string &name);

    const CToken &current() const;

    void advance();

    bool isOperator(std::string_view op) const;

    void expect(ETokenType type, const char *what);

    std::vector<CToken> m_Tokens;
    size_t m_Index = 0;
    size_t m_Nesting = 0;
    CExprBuilder &m_Builder;
};

/**
 * Parse the expression and feed the builder.
 * @param expr formula text, with or without the leading '='
 * @param builder receiver of the postfix event stream
 * @throws CParseError on malformed input
 */
void parseExpression(const std::string &expr, CExprBuilder &builder);

#endif /* SHEETCALC_CFORMULAPARSER_H */
