#ifndef SHEETCALC_CFUNCCALL_H
#define SHEETCALC_CFUNCCALL_H

#include "sheetcalc/COperation.h"

#include <string>
#include <vector>

/**
 * class representing a call of a registered function
 */
class CFuncCall : public COperation {
public:
    /**
     * @param name function name as written in the formula
     * @param args argument expressions in call order
     */
    CFuncCall(std::string name, std::vector<COperationPtr> args);

    CValue evaluate(CEvaluator &evaluator, CVisitedSet &visited) const override;

    void print(std::ostream &os) const override;

    EOperationType getTypeId() const override;

    const std::string &name() const { return m_Name; }

    const std::vector<COperationPtr> &arguments() const { return m_Args; }

private:
    std::string m_Name;
    std::vector<COperationPtr> m_Args;
};

#endif /* SHEETCALC_CFUNCCALL_H */
