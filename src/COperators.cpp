#include "sheetcalc/COperators.h"

#include <cmath>
#include <ostream>
#include <utility>

namespace {
    CValue numberResult(double value) {
        if (!std::isfinite(value))
            return CError(ECellError::Type);
        return value;
    }

    /**
     * Convert both operands for a numeric operator.
     * @return false if one of them is not numeric
     */
    bool numericOperands(const CValue &lhs, const CValue &rhs, double &left, double &right) {
        std::optional<double> l = toNumber(lhs);
        std::optional<double> r = toNumber(rhs);
        if (!l || !r)
            return false;
        left = *l;
        right = *r;
        return true;
    }

    /**
     * Three-way comparison for the comparison operators. Empty compares as 0 against numbers
     * and as "" against text, other type mixes cannot be compared.
     * @return negative, zero or positive, nullopt if the operands have incompatible types
     */
    std::optional<int> compareValues(const CValue &lhs, const CValue &rhs) {
        auto sign = [](auto a, auto b) { return a < b ? -1 : (b < a ? 1 : 0); };

        bool lEmpty = std::holds_alternative<std::monostate>(lhs);
        bool rEmpty = std::holds_alternative<std::monostate>(rhs);
        if (lEmpty && rEmpty)
            return 0;

        if (std::holds_alternative<double>(lhs) || std::holds_alternative<double>(rhs)) {
            if ((std::holds_alternative<double>(lhs) || lEmpty) && (std::holds_alternative<double>(rhs) || rEmpty))
                return sign(lEmpty ? 0.0 : std::get<double>(lhs), rEmpty ? 0.0 : std::get<double>(rhs));
            return std::nullopt;
        }

        if (std::holds_alternative<std::string>(lhs) || std::holds_alternative<std::string>(rhs)) {
            if ((std::holds_alternative<std::string>(lhs) || lEmpty) &&
                (std::holds_alternative<std::string>(rhs) || rEmpty)) {
                const std::string empty;
                const std::string &l = lEmpty ? empty : std::get<std::string>(lhs);
                const std::string &r = rEmpty ? empty : std::get<std::string>(rhs);
                return sign(l, r);
            }
            return std::nullopt;
        }

        if (std::holds_alternative<bool>(lhs) && std::holds_alternative<bool>(rhs))
            return sign(std::get<bool>(lhs), std::get<bool>(rhs));

        return std::nullopt;
    }
}

CBinaryOperation::CBinaryOperation(COperationPtr left, COperationPtr right)
        : m_Left(std::move(left)), m_Right(std::move(right)) {}

CValue CBinaryOperation::evaluate(CEvaluator &evaluator, CVisitedSet &visited) const {
    CValue left_side = m_Left->evaluate(evaluator, visited);
    if (isError(left_side))
        return left_side;

    CValue right_side = m_Right->evaluate(evaluator, visited);
    if (isError(right_side))
        return right_side;

    return apply(left_side, right_side);
}

void CBinaryOperation::print(std::ostream &os) const {
    os << '(';
    m_Left->print(os);
    os << symbol();
    m_Right->print(os);
    os << ')';
}

CValue CAddition::apply(const CValue &lhs, const CValue &rhs) const {
    double l, r;
    if (!numericOperands(lhs, rhs, l, r))
        return CError(ECellError::Type);
    return numberResult(l + r);
}

const char *CAddition::symbol() const {
    return "+";
}

EOperationType CAddition::getTypeId() const {
    return EOperationType::Addition;
}

CValue CSubtraction::apply(const CValue &lhs, const CValue &rhs) const {
    double l, r;
    if (!numericOperands(lhs, rhs, l, r))
        return CError(ECellError::Type);
    return numberResult(l - r);
}

const char *CSubtraction::symbol() const {
    return "-";
}

EOperationType CSubtraction::getTypeId() const {
    return EOperationType::Subtraction;
}

CValue CMultiplication::apply(const CValue &lhs, const CValue &rhs) const {
    double l, r;
    if (!numericOperands(lhs, rhs, l, r))
        return CError(ECellError::Type);
    return numberResult(l * r);
}

const char *CMultiplication::symbol() const {
    return "*";
}

EOperationType CMultiplication::getTypeId() const {
    return EOperationType::Multiplication;
}

CValue CDivision::apply(const CValue &lhs, const CValue &rhs) const {
    double l, r;
    if (!numericOperands(lhs, rhs, l, r))
        return CError(ECellError::Type);
    if (r == 0)
        return CError(ECellError::DivisionByZero);
    return numberResult(l / r);
}

const char *CDivision::symbol() const {
    return "/";
}

EOperationType CDivision::getTypeId() const {
    return EOperationType::Division;
}

CValue CPower::apply(const CValue &lhs, const CValue &rhs) const {
    double l, r;
    if (!numericOperands(lhs, rhs, l, r))
        return CError(ECellError::Type);
    if (l == 0 && r < 0)
        return CError(ECellError::DivisionByZero);
    return numberResult(std::pow(l, r));
}

const char *CPower::symbol() const {
    return "^";
}

EOperationType CPower::getTypeId() const {
    return EOperationType::Power;
}

CValue CConcatenation::apply(const CValue &lhs, const CValue &rhs) const {
    return toText(lhs) + toText(rhs);
}

const char *CConcatenation::symbol() const {
    return "&";
}

EOperationType CConcatenation::getTypeId() const {
    return EOperationType::Concatenation;
}

CValue CEqual::apply(const CValue &lhs, const CValue &rhs) const {
    std::optional<int> cmp = compareValues(lhs, rhs);
    if (!cmp)
        return CError(ECellError::Type);
    return *cmp == 0;
}

const char *CEqual::symbol() const {
    return "=";
}

EOperationType CEqual::getTypeId() const {
    return EOperationType::Equal;
}

CValue CNotEqual::apply(const CValue &lhs, const CValue &rhs) const {
    std::optional<int> cmp = compareValues(lhs, rhs);
    if (!cmp)
        return CError(ECellError::Type);
    return *cmp != 0;
}

const char *CNotEqual::symbol() const {
    return "<>";
}

EOperationType CNotEqual::getTypeId() const {
    return EOperationType::NotEqual;
}

CValue CLessThan::apply(const CValue &lhs, const CValue &rhs) const {
    std::optional<int> cmp = compareValues(lhs, rhs);
    if (!cmp)
        return CError(ECellError::Type);
    return *cmp < 0;
}

const char *CLessThan::symbol() const {
    return "<";
}

EOperationType CLessThan::getTypeId() const {
    return EOperationType::LessThan;
}

CValue CLessEqual::apply(const CValue &lhs, const CValue &rhs) const {
    std::optional<int> cmp = compareValues(lhs, rhs);
    if (!cmp)
        return CError(ECellError::Type);
    return *cmp <= 0;
}

const char *CLessEqual::symbol() const {
    return "<=";
}

EOperationType CLessEqual::getTypeId() const {
    return EOperationType::LessEqual;
}

CValue CGreaterThan::apply(const CValue &lhs, const CValue &rhs) const {
    std::optional<int> cmp = compareValues(lhs, rhs);
    if (!cmp)
        return CError(ECellError::Type);
    return *cmp > 0;
}

const char *CGreaterThan::symbol() const {
    return ">";
}

EOperationType CGreaterThan::getTypeId() const {
    return EOperationType::GreaterThan;
}

CValue CGreaterEqual::apply(const CValue &lhs, const CValue &rhs) const {
    std::optional<int> cmp = compareValues(lhs, rhs);
    if (!cmp)
        return CError(ECellError::Type);
    return *cmp >= 0;
}

const char *CGreaterEqual::symbol() const {
    return ">=";
}

EOperationType CGreaterEqual::getTypeId() const {
    return EOperationType::GreaterEqual;
}

CNegation::CNegation(COperationPtr operand) : m_Operand(std::move(operand)) {}

CValue CNegation::evaluate(CEvaluator &evaluator, CVisitedSet &visited) const {
    CValue value = m_Operand->evaluate(evaluator, visited);
    if (isError(value))
        return value;

    std::optional<double> number = toNumber(value);
    if (!number)
        return CError(ECellError::Type);
    return -*number;
}

void CNegation::print(std::ostream &os) const {
    os << "(-";
    m_Operand->print(os);
    os << ')';
}

EOperationType CNegation::getTypeId() const {
    return EOperationType::Negation;
}
