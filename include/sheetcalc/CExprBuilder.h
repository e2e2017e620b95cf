#ifndef SHEETCALC_CEXPRBUILDER_H
#define SHEETCALC_CEXPRBUILDER_H

#include <string>

/**
 * Receiver of parser events. The parser reports operands and operators in postfix order,
 * so an implementation can assemble the expression with a simple stack.
 */
class CExprBuilder {
public:
    virtual ~CExprBuilder() = default;

    virtual void opAdd() = 0;

    virtual void opSub() = 0;

    virtual void opMul() = 0;

    virtual void opDiv() = 0;

    virtual void opPow() = 0;

    virtual void opNeg() = 0;

    virtual void opConcat() = 0;

    virtual void opEq() = 0;

    virtual void opNe() = 0;

    virtual void opLt() = 0;

    virtual void opLe() = 0;

    virtual void opGt() = 0;

    virtual void opGe() = 0;

    virtual void valNumber(double val) = 0;

    virtual void valString(std::string val) = 0;

    virtual void valBool(bool val) = 0;

    /**
     * Placeholder for an omitted function argument, e.g. the middle one in F(1,,2).
     */
    virtual void valEmpty() = 0;

    virtual void valReference(std::string val) = 0;

    /**
     * @param val range text "A1:B2"
     */
    virtual void valRange(std::string val) = 0;

    /**
     * @param fnName function name as written
     * @param paramCount number of arguments already reported
     */
    virtual void funcCall(std::string fnName, int paramCount) = 0;
};

#endif /* SHEETCALC_CEXPRBUILDER_H */
