#ifndef SHEETCALC_COPERATORS_H
#define SHEETCALC_COPERATORS_H

#include "sheetcalc/COperation.h"

/**
 * class representing an operation with two operands
 *
 * Operands are evaluated left to right, an error operand is returned unchanged
 * before the operator is applied.
 */
class CBinaryOperation : public COperation {
public:
    CBinaryOperation(COperationPtr left, COperationPtr right);

    CValue evaluate(CEvaluator &evaluator, CVisitedSet &visited) const override;

    void print(std::ostream &os) const override;

    const COperation &left() const { return *m_Left; }

    const COperation &right() const { return *m_Right; }

protected:
    /**
     * apply the operator to two non-error operands
     * @param lhs left operand
     * @param rhs right operand
     * @return result of the operation
     */
    virtual CValue apply(const CValue &lhs, const CValue &rhs) const = 0;

    /**
     * @return operator symbol as written in a formula
     */
    virtual const char *symbol() const = 0;

private:
    COperationPtr m_Left;
    COperationPtr m_Right;
};

/**
 * class representing addition operation
 */
class CAddition : public CBinaryOperation {
public:
    using CBinaryOperation::CBinaryOperation;

    EOperationType getTypeId() const override;

protected:
    CValue apply(const CValue &lhs, const CValue &rhs) const override;

    const char *symbol() const override;
};

/**
 * class representing subtraction operation
 */
class CSubtraction : public CBinaryOperation {
public:
    using CBinaryOperation::CBinaryOperation;

    EOperationType getTypeId() const override;

protected:
    CValue apply(const CValue &lhs, const CValue &rhs) const override;

    const char *symbol() const override;
};

/**
 * class representing multiplication operation
 */
class CMultiplication : public CBinaryOperation {
public:
    using CBinaryOperation::CBinaryOperation;

    EOperationType getTypeId() const override;

protected:
    CValue apply(const CValue &lhs, const CValue &rhs) const override;

    const char *symbol() const override;
};

/**
 * class representing division operation
 */
class CDivision : public CBinaryOperation {
public:
    using CBinaryOperation::CBinaryOperation;

    EOperationType getTypeId() const override;

protected:
    CValue apply(const CValue &lhs, const CValue &rhs) const override;

    const char *symbol() const override;
};

/**
 * class representing power operation
 */
class CPower : public CBinaryOperation {
public:
    using CBinaryOperation::CBinaryOperation;

    EOperationType getTypeId() const override;

protected:
    CValue apply(const CValue &lhs, const CValue &rhs) const override;

    const char *symbol() const override;
};

/**
 * class representing string concatenation (&)
 */
class CConcatenation : public CBinaryOperation {
public:
    using CBinaryOperation::CBinaryOperation;

    EOperationType getTypeId() const override;

protected:
    CValue apply(const CValue &lhs, const CValue &rhs) const override;

    const char *symbol() const override;
};

/**
 * class representing equal operation
 */
class CEqual : public CBinaryOperation {
public:
    using CBinaryOperation::CBinaryOperation;

    EOperationType getTypeId() const override;

protected:
    CValue apply(const CValue &lhs, const CValue &rhs) const override;

    const char *symbol() const override;
};

/**
 * class representing not equal operation
 */
class CNotEqual : public CBinaryOperation {
public:
    using CBinaryOperation::CBinaryOperation;

    EOperationType getTypeId() const override;

protected:
    CValue apply(const CValue &lhs, const CValue &rhs) const override;

    const char *symbol() const override;
};

/**
 * class representing less than operation
 */
class CLessThan : public CBinaryOperation {
public:
    using CBinaryOperation::CBinaryOperation;

    EOperationType getTypeId() const override;

protected:
    CValue apply(const CValue &lhs, const CValue &rhs) const override;

    const char *symbol() const override;
};

/**
 * class representing less equal operation
 */
class CLessEqual : public CBinaryOperation {
public:
    using CBinaryOperation::CBinaryOperation;

    EOperationType getTypeId() const override;

protected:
    CValue apply(const CValue &lhs, const CValue &rhs) const override;

    const char *symbol() const override;
};

/**
 * class representing greater than operation
 */
class CGreaterThan : public CBinaryOperation {
public:
    using CBinaryOperation::CBinaryOperation;

    EOperationType getTypeId() const override;

protected:
    CValue apply(const CValue &lhs, const CValue &rhs) const override;

    const char *symbol() const override;
};

/**
 * class representing greater equal operation
 */
class CGreaterEqual : public CBinaryOperation {
public:
    using CBinaryOperation::CBinaryOperation;

    EOperationType getTypeId() const override;

protected:
    CValue apply(const CValue &lhs, const CValue &rhs) const override;

    const char *symbol() const override;
};

/**
 * class representing negation operation
 */
class CNegation : public COperation {
public:
    explicit CNegation(COperationPtr operand);

    CValue evaluate(CEvaluator &evaluator, CVisitedSet &visited) const override;

    void print(std::ostream &os) const override;

    EOperationType getTypeId() const override;

private:
    COperationPtr m_Operand;
};

#endif /* SHEETCALC_COPERATORS_H */
