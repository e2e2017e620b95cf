#ifndef SHEETCALC_CREFERENCE_H
#define SHEETCALC_CREFERENCE_H

#include "sheetcalc/COperation.h"
#include "sheetcalc/CPos.h"

/**
 * class representing reference to a cell
 */
class CReference : public COperation {
public:
    explicit CReference(const CPos &pos);

    CValue evaluate(CEvaluator &evaluator, CVisitedSet &visited) const override;

    void print(std::ostream &os) const override;

    EOperationType getTypeId() const override;

    const CPos &position() const { return m_Pos; }

private:
    CPos m_Pos;
};

/**
 * class representing a rectangular range of cells
 *
 * A range has a value only as a function argument, in scalar context it is a type error.
 */
class CValRange : public COperation {
public:
    /**
     * @param from first corner
     * @param to opposite corner, corners need not be ordered
     */
    CValRange(const CPos &from, const CPos &to);

    CValue evaluate(CEvaluator &evaluator, CVisitedSet &visited) const override;

    CArgument evaluateArgument(CEvaluator &evaluator, CVisitedSet &visited) const override;

    void print(std::ostream &os) const override;

    EOperationType getTypeId() const override;

    const CPos &from() const { return m_From; }

    const CPos &to() const { return m_To; }

private:
    CPos m_From;
    CPos m_To;
};

#endif /* SHEETCALC_CREFERENCE_H */
