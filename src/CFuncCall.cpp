#include "sheetcalc/CFuncCall.h"

#include "sheetcalc/CEvaluator.h"

#include <ostream>
#include <utility>

CFuncCall::CFuncCall(std::string name, std::vector<COperationPtr> args)
        : m_Name(std::move(name)), m_Args(std::move(args)) {}

CValue CFuncCall::evaluate(CEvaluator &evaluator, CVisitedSet &visited) const {
    return evaluator.callFunction(m_Name, m_Args, visited);
}

void CFuncCall::print(std::ostream &os) const {
    os << m_Name << '(';
    for (size_t i = 0; i < m_Args.size(); ++i) {
        if (i)
            os << ',';
        m_Args[i]->print(os);
    }
    os << ')';
}

EOperationType CFuncCall::getTypeId() const {
    return EOperationType::FunctionCall;
}
