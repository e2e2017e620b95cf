#ifndef SHEETCALC_CEVALUATOR_H
#define SHEETCALC_CEVALUATOR_H

#include "sheetcalc/CDispatchChannel.h"
#include "sheetcalc/CEngineLimits.h"
#include "sheetcalc/CFunctionRegistry.h"
#include "sheetcalc/CGridContext.h"
#include "sheetcalc/COperation.h"
#include "sheetcalc/CValue.h"

#include <memory>
#include <string>
#include <vector>

/**
 * Mutable state of one top-level evaluation. Both counters return to zero exactly
 * when the outermost evaluation finishes.
 */
struct CEvaluationContext {
    int m_Depth = 0;
    size_t m_Evaluations = 0;
};

/**
 * Recursive evaluator of expression trees against a grid.
 *
 * Every nested formula evaluation passes the depth guard, every cell visit counts
 * against the evaluation ceiling, the visited set catches cycles. All failures are
 * returned as error values.
 */
class CEvaluator {
public:
    /**
     * @param grid grid the references are resolved against
     * @param limits resource ceilings
     * @param registry functions callable from formulas
     */
    explicit CEvaluator(CGridContext &grid, const CEngineLimits &limits = {},
                        const CFunctionRegistry &registry = CFunctionRegistry::instance());

    /**
     * Evaluate formula text. Text without the leading '=' is a literal.
     * @param formula formula or literal text
     * @param visited cells in flight
     * @return value, #PARSE! if the formula is malformed
     */
    CValue evaluate(const std::string &formula, CVisitedSet &visited);

    /**
     * Evaluate an already parsed expression. This is the depth-guarded entry used for
     * every nested formula.
     * @param expression expression tree
     * @param visited cells in flight
     * @return value or error value
     */
    CValue evaluate(const COperation &expression, CVisitedSet &visited);

    /**
     * Get the value of a referenced cell.
     * @param pos cell position
     * @param visited cells in flight
     * @return value, #LIMIT! past the evaluation ceiling
     */
    CValue resolveCell(const CPos &pos, CVisitedSet &visited);

    /**
     * Get the values of a range, row-major.
     *
     * Stops at the first guard error. Other errors are kept in the list for the function to propagate.
     *
     * @param from first corner
     * @param to opposite corner
     * @param visited cells in flight
     * @return values of the cells, or #RANGE! / a guard error
     */
    CArgument resolveRange(const CPos &from, const CPos &to, CVisitedSet &visited);

    /**
     * Evaluate the arguments and call a registered function.
     * @param name function name in any letter case
     * @param args argument expressions
     * @param visited cells in flight
     * @return result, #NAME? for an unknown function, #VALUE! for a wrong argument count
     */
    CValue callFunction(const std::string &name, const std::vector<COperationPtr> &args, CVisitedSet &visited);

    /**
     * Forward a request to the cross-module channel.
     * @param key operation key
     * @param input request payload
     * @return handler result, #CIPHER? when no channel is attached or the key is unknown
     */
    CValue dispatch(const std::string &key, const std::string &input) const;

    /**
     * @param channel channel used by dispatch(), nullptr detaches it
     */
    void setDispatchChannel(std::shared_ptr<const CDispatchChannel> channel);

    const CEngineLimits &limits() const { return m_Limits; }

    void setLimits(const CEngineLimits &limits) { m_Limits = limits; }

    const CEvaluationContext &context() const { return m_Context; }

    const CFunctionRegistry &registry() const { return m_Registry; }

private:
    /**
     * Keeps the depth counter balanced and resets the context when the outermost
     * evaluation returns.
     */
    class CDepthScope {
    public:
        explicit CDepthScope(CEvaluationContext &context);

        ~CDepthScope();

        CDepthScope(const CDepthScope &) = delete;

        CDepthScope &operator=(const CDepthScope &) = delete;

    private:
        CEvaluationContext &m_Context;
    };

    CGridContext &m_Grid;
    CEngineLimits m_Limits;
    const CFunctionRegistry &m_Registry;
    std::shared_ptr<const CDispatchChannel> m_Channel;
    CEvaluationContext m_Context;
};

#endif /* SHEETCALC_CEVALUATOR_H */
