#ifndef SHEETCALC_CLITERALS_H
#define SHEETCALC_CLITERALS_H

#include "sheetcalc/COperation.h"

#include <string>

/**
 * class representing a number
 */
class CNumber : public COperation {
public:
    explicit CNumber(double value);

    CValue evaluate(CEvaluator &evaluator, CVisitedSet &visited) const override;

    void print(std::ostream &os) const override;

    EOperationType getTypeId() const override;

private:
    double m_Value;
};

/**
 * class representing a string
 */
class CString : public COperation {
public:
    explicit CString(std::string value);

    CValue evaluate(CEvaluator &evaluator, CVisitedSet &visited) const override;

    void print(std::ostream &os) const override;

    EOperationType getTypeId() const override;

private:
    std::string m_Value;
};

/**
 * class representing TRUE or FALSE
 */
class CBoolean : public COperation {
public:
    explicit CBoolean(bool value);

    CValue evaluate(CEvaluator &evaluator, CVisitedSet &visited) const override;

    void print(std::ostream &os) const override;

    EOperationType getTypeId() const override;

private:
    bool m_Value;
};

/**
 * class representing an omitted function argument
 */
class CEmpty : public COperation {
public:
    CValue evaluate(CEvaluator &evaluator, CVisitedSet &visited) const override;

    void print(std::ostream &os) const override;

    EOperationType getTypeId() const override;
};

#endif /* SHEETCALC_CLITERALS_H */
