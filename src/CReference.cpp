#include "sheetcalc/CReference.h"

#include "sheetcalc/CEvaluator.h"

#include <ostream>

CReference::CReference(const CPos &pos) : m_Pos(pos) {}

CValue CReference::evaluate(CEvaluator &evaluator, CVisitedSet &visited) const {
    return evaluator.resolveCell(m_Pos, visited);
}

void CReference::print(std::ostream &os) const {
    os << m_Pos.toString();
}

EOperationType CReference::getTypeId() const {
    return EOperationType::Reference;
}

CValRange::CValRange(const CPos &from, const CPos &to) : m_From(from), m_To(to) {}

CValue CValRange::evaluate(CEvaluator &, CVisitedSet &) const {
    return CError(ECellError::Type);
}

CArgument CValRange::evaluateArgument(CEvaluator &evaluator, CVisitedSet &visited) const {
    return evaluator.resolveRange(m_From, m_To, visited);
}

void CValRange::print(std::ostream &os) const {
    os << m_From.toString() << ':' << m_To.toString();
}

EOperationType CValRange::getTypeId() const {
    return EOperationType::Range;
}
