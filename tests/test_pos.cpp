#undef NDEBUG

#include "sheetcalc/CPos.h"
#include "sheetcalc/CValue.h"
#include "TestSupport.h"

#include <cassert>
#include <cstdlib>
#include <set>
#include <stdexcept>

template<typename TFunction>
bool throwsInvalidArgument(TFunction function) {
    try {
        function();
    } catch (const std::invalid_argument &) {
        return true;
    }
    return false;
}

int main() {
    // column codec
    assert(CPos::convertColumn("A") == 0);
    assert(CPos::convertColumn("Z") == 25);
    assert(CPos::convertColumn("AA") == 26);
    assert(CPos::convertColumn("az") == 51);
    assert(CPos::convertColumn("ZZ") == 701);
    assert(CPos::convertColumn("AAA") == 702);
    assert(CPos::columnName(0) == "A");
    assert(CPos::columnName(25) == "Z");
    assert(CPos::columnName(26) == "AA");
    assert(CPos::columnName(701) == "ZZ");
    assert(CPos::columnName(702) == "AAA");
    for (int column = 0; column < 20000; ++column)
        assert(CPos::convertColumn(CPos::columnName(column)) == column);
    assert(throwsInvalidArgument([] { CPos::columnName(-1); }));
    assert(throwsInvalidArgument([] { CPos::convertColumn(""); }));
    assert(throwsInvalidArgument([] { CPos::convertColumn("A1"); }));
    assert(throwsInvalidArgument([] { CPos::convertColumn("ZZZZZZZZZZZZ"); }));

    // addresses, rows are 1-based in text
    CPos a1("A1");
    assert(a1.m_Row == 0 && a1.m_Column == 0 && !a1.m_AbsRow && !a1.m_AbsColumn);
    CPos cv100("CV100");
    assert(cv100.m_Row == 99 && cv100.m_Column == 99);
    CPos anchored("$B$7");
    assert(anchored.m_Row == 6 && anchored.m_Column == 1 && anchored.m_AbsRow && anchored.m_AbsColumn);
    CPos mixed("c$3");
    assert(mixed.m_Row == 2 && mixed.m_Column == 2 && mixed.m_AbsRow && !mixed.m_AbsColumn);
    assert(anchored.toString() == "$B$7");
    assert(mixed.toString() == "C$3");
    assert(CPos(0, 26).toString() == "AA1");

    assert(throwsInvalidArgument([] { CPos("A0"); }));
    assert(throwsInvalidArgument([] { CPos("1A"); }));
    assert(throwsInvalidArgument([] { CPos("A"); }));
    assert(throwsInvalidArgument([] { CPos("A1B"); }));
    assert(throwsInvalidArgument([] { CPos(""); }));
    assert(throwsInvalidArgument([] { CPos("A99999999999"); }));

    assert(CPos::looksLikeAddress("A1"));
    assert(CPos::looksLikeAddress("$zz$10"));
    assert(!CPos::looksLikeAddress("SUM"));
    assert(!CPos::looksLikeAddress("A1B"));
    assert(!CPos::looksLikeAddress("1"));

    // ordering ignores anchors
    assert(CPos("$A$1") == CPos("A1"));
    assert(CPos("B1") < CPos("A2"));
    assert(CPos("A1") < CPos("B1"));
    std::set<CPos> positions{CPos("B2"), CPos("$B$2"), CPos("A1")};
    assert(positions.size() == 2);

    // sentinels
    assert(CError(ECellError::Depth).m_Text == "#DEPTH!");
    assert(CError(ECellError::UnknownOperation).m_Text == "#CIPHER?");
    assert(errorFromSentinel("#REF!") == ECellError::Reference);
    assert(!errorFromSentinel("#NOPE"));
    assert(CError(ECellError::Cycle).isGuard());
    assert(CError(ECellError::EvaluationLimit).isGuard());
    assert(!CError(ECellError::DivisionByZero).isGuard());

    // literals
    assert(valueMatch(literalValue(""), CValue()));
    assert(valueMatch(literalValue("3e1"), CValue(30.0)));
    assert(valueMatch(literalValue("-2.5"), CValue(-2.5)));
    assert(valueMatch(literalValue("true"), CValue(true)));
    assert(valueMatch(literalValue("False"), CValue(false)));
    assert(valueMatch(literalValue("inf"), CValue("inf"s)));
    assert(valueMatch(literalValue("12 apples"), CValue("12 apples"s)));
    assert(isErrorKind(literalValue("#REF!"), ECellError::Reference));
    assert(isErrorKind(literalValue("#whatever"), ECellError::Generic));
    assert(std::get<CError>(literalValue("#whatever")).m_Text == "#whatever");

    assert(formatNumber(3) == "3");
    assert(formatNumber(-0.5) == "-0.5");
    assert(formatNumber(1.0 / 3) == "0.333333333333333");
    assert(toText(CValue(true)) == "TRUE");

    return EXIT_SUCCESS;
}
