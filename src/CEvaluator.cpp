#include "sheetcalc/CEvaluator.h"

#include "sheetcalc/CMyExpressionBuilder.h"
#include "sheetcalc/CRangeResolver.h"

#include <stdexcept>
#include <utility>

CEvaluator::CDepthScope::CDepthScope(CEvaluationContext &context) : m_Context(context) {
    ++m_Context.m_Depth;
}

CEvaluator::CDepthScope::~CDepthScope() {
    if (--m_Context.m_Depth == 0)
        m_Context = CEvaluationContext();
}

CEvaluator::CEvaluator(CGridContext &grid, const CEngineLimits &limits, const CFunctionRegistry &registry)
        : m_Grid(grid), m_Limits(limits), m_Registry(registry) {}

CValue CEvaluator::evaluate(const std::string &formula, CVisitedSet &visited) {
    if (formula.empty() || formula.front() != '=')
        return literalValue(formula);

    // "=" followed by nothing but whitespace is an empty cell
    if (formula.find_first_not_of(" \t\r\n", 1) == std::string::npos)
        return std::monostate{};

    COperationPtr expression;
    try {
        expression = buildExpression(formula);
    } catch (const std::invalid_argument &) {
        return CError(ECellError::Parse);
    }
    return evaluate(*expression, visited);
}

CValue CEvaluator::evaluate(const COperation &expression, CVisitedSet &visited) {
    if (m_Context.m_Depth >= m_Limits.m_MaxDepth)
        return CError(ECellError::Depth);

    CDepthScope scope(m_Context);
    return expression.evaluate(*this, visited);
}

CValue CEvaluator::resolveCell(const CPos &pos, CVisitedSet &visited) {
    if (++m_Context.m_Evaluations > m_Limits.m_MaxEvaluations)
        return CError(ECellError::EvaluationLimit);
    return m_Grid.evaluateCell(pos.m_Row, pos.m_Column, visited);
}

CArgument CEvaluator::resolveRange(const CPos &from, const CPos &to, CVisitedSet &visited) {
    auto positions = CRangeResolver::expand(from, to, m_Limits.m_MaxRangeCells);
    if (auto error = std::get_if<CError>(&positions))
        return CValue(*error);

    CRangeValue values;
    values.reserve(std::get<std::vector<CPos>>(positions).size());
    for (const CPos &pos: std::get<std::vector<CPos>>(positions)) {
        CValue value = resolveCell(pos, visited);
        if (isGuardError(value))
            return value;
        values.push_back(std::move(value));
    }
    return values;
}

CValue CEvaluator::callFunction(const std::string &name, const std::vector<COperationPtr> &args,
                                CVisitedSet &visited) {
    const CFunction *function = m_Registry.find(name);
    const CFunctionInfo *info = m_Registry.getMetadata(name);
    if (!function || !info)
        return CError(ECellError::UnknownFunction);

    if (args.size() < info->minArguments() || args.size() > info->maxArguments())
        return CError(ECellError::Type);

    std::vector<CArgument> values;
    values.reserve(args.size());
    for (const auto &arg: args) {
        CArgument value = arg->evaluateArgument(*this, visited);
        if (auto scalar = std::get_if<CValue>(&value); scalar && isGuardError(*scalar))
            return *scalar;
        values.push_back(std::move(value));
    }

    return normalizeValue((*function)(*this, values));
}

CValue CEvaluator::dispatch(const std::string &key, const std::string &input) const {
    if (!m_Channel)
        return CError(ECellError::UnknownOperation);
    return m_Channel->request(key, input);
}

void CEvaluator::setDispatchChannel(std::shared_ptr<const CDispatchChannel> channel) {
    m_Channel = std::move(channel);
}
