#undef NDEBUG

#include "sheetcalc/CEvaluator.h"
#include "sheetcalc/CMyExpressionBuilder.h"
#include "TestSupport.h"

#include <cassert>
#include <cstdlib>
#include <map>
#include <stdexcept>
#include <string>

/**
 * Minimal grid keeping raw texts in a map, formulas are parsed on every visit.
 */
class CMapGrid : public CGridContext {
public:
    CMapGrid(int rows, int columns) : m_Rows(rows), m_Columns(columns) {}

    void set(const std::string &pos, const std::string &raw) {
        m_Cells[CPos(pos)] = raw;
    }

    void bind(CEvaluator &evaluator) {
        m_Evaluator = &evaluator;
    }

    CValue evaluateCell(int row, int column, CVisitedSet &visited) override {
        ++m_Visits;
        if (row < 0 || column < 0 || row >= m_Rows || column >= m_Columns)
            return CError(ECellError::Reference);

        CPos pos(row, column);
        if (visited.count(pos))
            return CError(ECellError::Cycle);

        auto it = m_Cells.find(pos);
        if (it == m_Cells.end())
            return std::monostate{};
        if (it->second.empty() || it->second.front() != '=')
            return literalValue(it->second);

        COperationPtr expression;
        try {
            expression = buildExpression(it->second);
        } catch (const std::invalid_argument &) {
            return CError(ECellError::Parse);
        }
        visited.insert(pos);
        CValue value = m_Evaluator->evaluate(*expression, visited);
        visited.erase(pos);
        return value;
    }

    std::string getCellRaw(int row, int column) const override {
        auto it = m_Cells.find(CPos(row, column));
        return it == m_Cells.end() ? std::string() : it->second;
    }

    size_t m_Visits = 0;

private:
    int m_Rows;
    int m_Columns;
    std::map<CPos, std::string> m_Cells;
    CEvaluator *m_Evaluator = nullptr;
};

static CValue run(CEvaluator &evaluator, const std::string &formula) {
    CVisitedSet visited;
    CValue value = evaluator.evaluate(formula, visited);
    assert(visited.empty());
    assert(evaluator.context().m_Depth == 0);
    assert(evaluator.context().m_Evaluations == 0);
    return value;
}

int main() {
    CMapGrid grid(100, 100);
    CEvaluator evaluator(grid);
    grid.bind(evaluator);

    // literals and empty formulas
    assert(valueMatch(run(evaluator, ""), CValue()));
    assert(valueMatch(run(evaluator, "42"), CValue(42.0)));
    assert(valueMatch(run(evaluator, "hello"), CValue("hello"s)));
    assert(valueMatch(run(evaluator, "="), CValue()));
    assert(valueMatch(run(evaluator, "=   "), CValue()));
    assert(isErrorKind(run(evaluator, "=1+"), ECellError::Parse));
    assert(isErrorKind(run(evaluator, "=A0"), ECellError::Parse));
    assert(valueMatch(run(evaluator, "=\"\""), CValue(""s)));

    // references and ranges
    grid.set("A1", "1");
    grid.set("B1", "2");
    grid.set("C1", "3");
    assert(valueMatch(run(evaluator, "=SUM(A1:C1)"), CValue(6.0)));
    assert(valueMatch(run(evaluator, "=sum(c1:a1)"), CValue(6.0)));
    assert(valueMatch(run(evaluator, "=A1+B1*C1"), CValue(7.0)));
    assert(valueMatch(run(evaluator, "=$A$1+B$1"), CValue(3.0)));
    assert(isErrorKind(run(evaluator, "=A1:C1"), ECellError::Type));
    assert(isErrorKind(run(evaluator, "=A1:C1+1"), ECellError::Type));
    assert(isErrorKind(run(evaluator, "=CW1"), ECellError::Reference));
    assert(isErrorKind(run(evaluator, "=A101"), ECellError::Reference));
    assert(valueMatch(run(evaluator, "=Z50"), CValue()));

    // coercions and operators
    grid.set("A2", "'7");
    grid.set("B2", "TRUE");
    grid.set("C2", "=\"3\"");
    assert(valueMatch(run(evaluator, "=C2+1"), CValue(4.0)));
    assert(valueMatch(run(evaluator, "=B2+1"), CValue(2.0)));
    assert(valueMatch(run(evaluator, "=Z50+1"), CValue(1.0)));
    assert(isErrorKind(run(evaluator, "=A2+1"), ECellError::Type));
    assert(isErrorKind(run(evaluator, "=\"abc\"*2"), ECellError::Type));
    assert(isErrorKind(run(evaluator, "=-\"abc\""), ECellError::Type));
    assert(isErrorKind(run(evaluator, "=1/0"), ECellError::DivisionByZero));
    assert(isErrorKind(run(evaluator, "=1/Z50"), ECellError::DivisionByZero));
    assert(isErrorKind(run(evaluator, "=0^-1"), ECellError::DivisionByZero));
    assert(isErrorKind(run(evaluator, "=(-8)^0.5"), ECellError::Type));
    assert(isErrorKind(run(evaluator, "=10^400"), ECellError::Type));
    assert(valueMatch(run(evaluator, "=2^-1"), CValue(0.5)));
    assert(valueMatch(run(evaluator, "=-2^2"), CValue(-4.0)));
    assert(valueMatch(run(evaluator, "=1&TRUE"), CValue("1TRUE"s)));
    assert(valueMatch(run(evaluator, "=0.5&\"x\"&Z50"), CValue("0.5x"s)));
    assert(valueMatch(run(evaluator, "=\"a\"<\"b\""), CValue(true)));
    assert(valueMatch(run(evaluator, "=\"a\"=\"A\""), CValue(false)));
    assert(valueMatch(run(evaluator, "=Z50=0"), CValue(true)));
    assert(valueMatch(run(evaluator, "=Z50=\"\""), CValue(true)));
    assert(valueMatch(run(evaluator, "=TRUE>FALSE"), CValue(true)));
    assert(valueMatch(run(evaluator, "=2>=2"), CValue(true)));
    assert(valueMatch(run(evaluator, "=1<>1"), CValue(false)));
    assert(isErrorKind(run(evaluator, "=\"a\"=1"), ECellError::Type));
    assert(isErrorKind(run(evaluator, "=TRUE=1"), ECellError::Type));

    // the left operand's error wins
    assert(isErrorKind(run(evaluator, "=(1/0)+FOO()"), ECellError::DivisionByZero));
    assert(isErrorKind(run(evaluator, "=FOO()+(1/0)"), ECellError::UnknownFunction));
    assert(isErrorKind(run(evaluator, "=(1/0)&\"x\""), ECellError::DivisionByZero));
    grid.set("D1", "#N/A");
    assert(isErrorKind(run(evaluator, "=D1+1"), ECellError::Generic));
    assert(valueMatch(run(evaluator, "=D1&1"), CValue(CError(ECellError::Generic, "#N/A"))));

    // function lookup and arity
    assert(isErrorKind(run(evaluator, "=NOSUCH(1)"), ECellError::UnknownFunction));
    assert(valueMatch(run(evaluator, "=Abs(-2)"), CValue(2.0)));
    assert(isErrorKind(run(evaluator, "=ABS()"), ECellError::Type));
    assert(isErrorKind(run(evaluator, "=ABS(1,2)"), ECellError::Type));
    assert(isErrorKind(run(evaluator, "=IF(1)"), ECellError::Type));

    // errors inside a range reach the function
    grid.set("A3", "5");
    grid.set("A4", "=1/0");
    assert(isErrorKind(run(evaluator, "=SUM(A3:A4)"), ECellError::DivisionByZero));
    assert(valueMatch(run(evaluator, "=ISERROR(A3:A4)"), CValue(true)));

    // cycles
    grid.set("E1", "=F1");
    grid.set("F1", "=E1");
    grid.set("G1", "=G1+1");
    grid.set("H1", "=IFERROR(I1,0)");
    grid.set("I1", "=H1");
    grid.set("J1", "=SUM(J1:J2)");
    assert(isErrorKind(run(evaluator, "=E1"), ECellError::Cycle));
    assert(isErrorKind(run(evaluator, "=F1*2"), ECellError::Cycle));
    assert(isErrorKind(run(evaluator, "=G1"), ECellError::Cycle));
    assert(isErrorKind(run(evaluator, "=H1"), ECellError::Cycle));
    assert(isErrorKind(run(evaluator, "=ISERROR(E1)"), ECellError::Cycle));
    assert(isErrorKind(run(evaluator, "=J1"), ECellError::Cycle));
    assert(valueMatch(run(evaluator, "=IFERROR(1/0,7)"), CValue(7.0)));

    // diamond: the same cell twice on different paths is not a cycle
    grid.set("K1", "=L1+L1");
    grid.set("L1", "=A1*10");
    assert(valueMatch(run(evaluator, "=K1+L1"), CValue(30.0)));

    // depth guard
    {
        CMapGrid chain(100, 100);
        CEngineLimits limits;
        limits.m_MaxDepth = 10;
        CEvaluator shallow(chain, limits);
        chain.bind(shallow);

        for (int row = 1; row < 50; ++row)
            chain.set("A" + std::to_string(row), "=A" + std::to_string(row + 1) + "+1");
        chain.set("A50", "1");
        chain.set("B5", "1");
        for (int row = 1; row < 5; ++row)
            chain.set("B" + std::to_string(row), "=B" + std::to_string(row + 1) + "+1");

        assert(valueMatch(run(shallow, "=B1"), CValue(5.0)));
        assert(isErrorKind(run(shallow, "=A1"), ECellError::Depth));
        assert(isErrorKind(run(shallow, "=IFERROR(A1,0)"), ECellError::Depth));
        assert(valueMatch(run(shallow, "=A45"), CValue(6.0)));
        assert(shallow.context().m_Depth == 0);
    }

    // range ceiling, checked before any cell is visited
    {
        CMapGrid big(1000, 1000);
        CEvaluator wide(big);
        big.bind(wide);
        big.set("A1", "1");
        big.set("CV100", "2");

        assert(isErrorKind(run(wide, "=SUM(A1:CV101)"), ECellError::RangeTooLarge));
        assert(isErrorKind(run(wide, "=SUM(A1:ALL1000)"), ECellError::RangeTooLarge));
        assert(big.m_Visits == 0);
        assert(valueMatch(run(wide, "=IFERROR(SUM(A1:CV101),-1)"), CValue(-1.0)));
        assert(valueMatch(run(wide, "=SUM(A1:CV100)"), CValue(3.0)));
        assert(big.m_Visits == 10000);
        assert(valueMatch(run(wide, "=COUNT(CV100:A1)"), CValue(2.0)));
    }

    // evaluation ceiling, the counter restarts with every top-level evaluation
    {
        CMapGrid small(100, 100);
        CEngineLimits limits;
        limits.m_MaxEvaluations = 5;
        CEvaluator counted(small, limits);
        small.bind(counted);
        for (int row = 1; row <= 10; ++row)
            small.set("A" + std::to_string(row), "1");

        assert(isErrorKind(run(counted, "=SUM(A1:A10)"), ECellError::EvaluationLimit));
        assert(valueMatch(run(counted, "=SUM(A1:A5)"), CValue(5.0)));
        assert(valueMatch(run(counted, "=SUM(A1:A5)"), CValue(5.0)));
        assert(isErrorKind(run(counted, "=A1+A2+A3+A4+A5+A6"), ECellError::EvaluationLimit));
        assert(isErrorKind(run(counted, "=IFERROR(SUM(A1:A10),0)"), ECellError::EvaluationLimit));

        small.m_Visits = 0;
        run(counted, "=SUM(A1:A10)");
        assert(small.m_Visits == 5);

        CEngineLimits loose = counted.limits();
        loose.m_MaxEvaluations = 100;
        counted.setLimits(loose);
        assert(valueMatch(run(counted, "=SUM(A1:A10)"), CValue(10.0)));
    }

    return EXIT_SUCCESS;
}
