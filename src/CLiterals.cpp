#include "sheetcalc/CLiterals.h"

#include <ostream>
#include <sstream>
#include <utility>

CArgument COperation::evaluateArgument(CEvaluator &evaluator, CVisitedSet &visited) const {
    return evaluate(evaluator, visited);
}

std::string COperation::toString() const {
    std::ostringstream oss;
    print(oss);
    return oss.str();
}

CNumber::CNumber(double value) : m_Value(value) {}

CValue CNumber::evaluate(CEvaluator &, CVisitedSet &) const {
    return m_Value;
}

void CNumber::print(std::ostream &os) const {
    os << formatNumber(m_Value);
}

EOperationType CNumber::getTypeId() const {
    return EOperationType::Number;
}

CString::CString(std::string value) : m_Value(std::move(value)) {}

CValue CString::evaluate(CEvaluator &, CVisitedSet &) const {
    return m_Value;
}

void CString::print(std::ostream &os) const {
    os << '"';
    for (char ch: m_Value) {
        if (ch == '"')
            os << ch;
        os << ch;
    }
    os << '"';
}

EOperationType CString::getTypeId() const {
    return EOperationType::String;
}

CBoolean::CBoolean(bool value) : m_Value(value) {}

CValue CBoolean::evaluate(CEvaluator &, CVisitedSet &) const {
    return m_Value;
}

void CBoolean::print(std::ostream &os) const {
    os << (m_Value ? "TRUE" : "FALSE");
}

EOperationType CBoolean::getTypeId() const {
    return EOperationType::Boolean;
}

CValue CEmpty::evaluate(CEvaluator &, CVisitedSet &) const {
    return std::monostate{};
}

void CEmpty::print(std::ostream &) const {}

EOperationType CEmpty::getTypeId() const {
    return EOperationType::Empty;
}
