#include "sheetcalc/CMyExpressionBuilder.h"

#include "sheetcalc/CFormulaParser.h"
#include "sheetcalc/CFuncCall.h"
#include "sheetcalc/CLiterals.h"
#include "sheetcalc/COperators.h"
#include "sheetcalc/CReference.h"

#include <utility>
#include <vector>

template<typename TOperation>
void CMyExpressionBuilder::binary() {
    COperationPtr right = pop();
    COperationPtr left = pop();
    m_Stack.push_back(std::make_shared<TOperation>(std::move(left), std::move(right)));
}

COperationPtr CMyExpressionBuilder::pop() {
    if (m_Stack.empty())
        throw CParseError("Missing operand", 0);
    COperationPtr top = std::move(m_Stack.back());
    m_Stack.pop_back();
    return top;
}

void CMyExpressionBuilder::opAdd() {
    binary<CAddition>();
}

void CMyExpressionBuilder::opSub() {
    binary<CSubtraction>();
}

void CMyExpressionBuilder::opMul() {
    binary<CMultiplication>();
}

void CMyExpressionBuilder::opDiv() {
    binary<CDivision>();
}

void CMyExpressionBuilder::opPow() {
    binary<CPower>();
}

void CMyExpressionBuilder::opNeg() {
    m_Stack.push_back(std::make_shared<CNegation>(pop()));
}

void CMyExpressionBuilder::opConcat() {
    binary<CConcatenation>();
}

void CMyExpressionBuilder::opEq() {
    binary<CEqual>();
}

void CMyExpressionBuilder::opNe() {
    binary<CNotEqual>();
}

void CMyExpressionBuilder::opLt() {
    binary<CLessThan>();
}

void CMyExpressionBuilder::opLe() {
    binary<CLessEqual>();
}

void CMyExpressionBuilder::opGt() {
    binary<CGreaterThan>();
}

void CMyExpressionBuilder::opGe() {
    binary<CGreaterEqual>();
}

void CMyExpressionBuilder::valNumber(double val) {
    m_Stack.push_back(std::make_shared<CNumber>(val));
}

void CMyExpressionBuilder::valString(std::string val) {
    m_Stack.push_back(std::make_shared<CString>(std::move(val)));
}

void CMyExpressionBuilder::valBool(bool val) {
    m_Stack.push_back(std::make_shared<CBoolean>(val));
}

void CMyExpressionBuilder::valEmpty() {
    m_Stack.push_back(std::make_shared<CEmpty>());
}

void CMyExpressionBuilder::valReference(std::string val) {
    m_Stack.push_back(std::make_shared<CReference>(CPos(val)));
}

void CMyExpressionBuilder::valRange(std::string val) {
    size_t colon = val.find(':');
    if (colon == std::string::npos)
        throw CParseError("Invalid range: " + val, 0);
    CPos from(std::string_view(val).substr(0, colon));
    CPos to(std::string_view(val).substr(colon + 1));
    m_Stack.push_back(std::make_shared<CValRange>(from, to));
}

void CMyExpressionBuilder::funcCall(std::string fnName, int paramCount) {
    if (paramCount < 0 || static_cast<size_t>(paramCount) > m_Stack.size())
        throw CParseError("Missing arguments of " + fnName, 0);

    std::vector<COperationPtr> args(paramCount);
    for (int i = paramCount - 1; i >= 0; --i)
        args[i] = pop();
    m_Stack.push_back(std::make_shared<CFuncCall>(std::move(fnName), std::move(args)));
}

COperationPtr CMyExpressionBuilder::getResult() const {
    if (m_Stack.size() != 1)
        throw CParseError("Incomplete expression", 0);
    return m_Stack.back();
}

COperationPtr buildExpression(const std::string &formula) {
    CMyExpressionBuilder builder;
    parseExpression(formula, builder);
    return builder.getResult();
}
