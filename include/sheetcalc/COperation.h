#ifndef SHEETCALC_COPERATION_H
#define SHEETCALC_COPERATION_H

#include "sheetcalc/CGridContext.h"
#include "sheetcalc/CValue.h"

#include <iosfwd>
#include <memory>
#include <string>

class CEvaluator; // forward declaration

/**
 * Tag of an expression node.
 */
enum class EOperationType {
    Number,
    String,
    Boolean,
    Empty,
    Reference,
    Range,
    Addition,
    Subtraction,
    Multiplication,
    Division,
    Power,
    Concatenation,
    Equal,
    NotEqual,
    LessThan,
    LessEqual,
    GreaterThan,
    GreaterEqual,
    Negation,
    FunctionCall
};

/**
 * abstract class representing a node of a parsed formula
 */
class COperation {
public:
    virtual ~COperation() = default;

    /**
     * evaluate the operation in scalar context
     * @param evaluator evaluator owning the guard counters
     * @param visited cells in flight on the current path
     * @return result of the operation
     */
    virtual CValue evaluate(CEvaluator &evaluator, CVisitedSet &visited) const = 0;

    /**
     * evaluate the operation as a function argument, ranges yield their cells here
     * @param evaluator evaluator owning the guard counters
     * @param visited cells in flight on the current path
     * @return scalar or range value
     */
    virtual CArgument evaluateArgument(CEvaluator &evaluator, CVisitedSet &visited) const;

    /**
     * write the operation in fully parenthesized formula syntax
     * @param os output stream
     */
    virtual void print(std::ostream &os) const = 0;

    /**
     * get the type id of the operation
     * @return type id
     */
    virtual EOperationType getTypeId() const = 0;

    /**
     * @return result of print() as a string
     */
    std::string toString() const;
};

using COperationPtr = std::shared_ptr<COperation>;

#endif /* SHEETCALC_COPERATION_H */
