#ifndef SHEETCALC_CMYEXPRESSIONBUILDER_H
#define SHEETCALC_CMYEXPRESSIONBUILDER_H

#include "sheetcalc/CExprBuilder.h"
#include "sheetcalc/COperation.h"

#include <deque>
#include <memory>
#include <string>

/**
 * Builder assembling the expression tree from the parser's postfix events.
 */
class CMyExpressionBuilder : public CExprBuilder {
public:
    /**
     * Add operation to the stack.
     */
    void opAdd() override;

    /**
     * Subtract operation from the stack.
     */
    void opSub() override;

    /**
     * Multiply operation from the stack.
     */
    void opMul() override;

    /**
     * Divide operation from the stack.
     */
    void opDiv() override;

    /**
     * Power operation from the stack.
     */
    void opPow() override;

    /**
     * Negation operation from the stack.
     */
    void opNeg() override;

    /**
     * Concatenation operation from the stack.
     */
    void opConcat() override;

    /**
     * Equal operation from the stack.
     */
    void opEq() override;

    /**
     * Not equal operation from the stack.
     */
    void opNe() override;

    /**
     * Less than operation from the stack.
     */
    void opLt() override;

    /**
     * Less equal operation from the stack.
     */
    void opLe() override;

    /**
     * Greater than operation from the stack.
     */
    void opGt() override;

    /**
     * Greater equal operation from the stack.
     */
    void opGe() override;

    /**
     * Add number to the stack.
     * @param val - number
     */
    void valNumber(double val) override;

    /**
     * Add string to the stack.
     * @param val - string
     */
    void valString(std::string val) override;

    /**
     * Add boolean to the stack.
     * @param val - boolean
     */
    void valBool(bool val) override;

    void valEmpty() override;

    /**
     * Add reference on cell to the stack.
     * @param val - reference on cell
     */
    void valReference(std::string val) override;

    /**
     * Add range of cells to the stack.
     * @param val - range of cells
     */
    void valRange(std::string val) override;

    /**
     * Add function call to the stack.
     * @param fnName - function name
     * @param paramCount - count of parameters
     */
    void funcCall(std::string fnName, int paramCount) override;

    /**
     * Get the finished expression.
     * @return - root of the expression tree
     * @throws CParseError if the events did not form exactly one expression
     */
    COperationPtr getResult() const;

private:
    /**
     * Replace the two topmost operands with the operation applied to them.
     */
    template<typename TOperation>
    void binary();

    COperationPtr pop();

    /**
     * Stack of operations.
     */
    std::deque<COperationPtr> m_Stack;
};

/**
 * Parse the formula into an expression tree.
 * @param formula formula text, with or without the leading '='
 * @return root of the expression tree
 * @throws CParseError on malformed input
 */
COperationPtr buildExpression(const std::string &formula);

#endif /* SHEETCALC_CMYEXPRESSIONBUILDER_H */
