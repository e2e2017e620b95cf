#undef NDEBUG

#include "sheetcalc/CRangeResolver.h"

#include <cassert>
#include <climits>
#include <cstdlib>
#include <variant>
#include <vector>

int main() {
    auto result = CRangeResolver::expand(CPos("A1"), CPos("B2"), 100);
    assert(std::holds_alternative<std::vector<CPos>>(result));
    std::vector<CPos> positions = std::get<std::vector<CPos>>(result);
    assert(positions.size() == 4);
    assert(positions[0] == CPos("A1"));
    assert(positions[1] == CPos("B1"));
    assert(positions[2] == CPos("A2"));
    assert(positions[3] == CPos("B2"));

    // corners in any order give the same rectangle
    result = CRangeResolver::expand(CPos("B2"), CPos("A1"), 100);
    assert(std::get<std::vector<CPos>>(result) == positions);
    result = CRangeResolver::expand(CPos("A2"), CPos("B1"), 100);
    assert(std::get<std::vector<CPos>>(result) == positions);

    result = CRangeResolver::expand(CPos("$C$3"), CPos("C3"), 1);
    assert(std::get<std::vector<CPos>>(result).size() == 1);

    // ceiling is inclusive
    assert(CRangeResolver::cellCount(CPos("A1"), CPos("CV100")) == 10000);
    result = CRangeResolver::expand(CPos("A1"), CPos("CV100"), 10000);
    assert(std::get<std::vector<CPos>>(result).size() == 10000);
    assert(std::get<std::vector<CPos>>(result).back() == CPos("CV100"));
    result = CRangeResolver::expand(CPos("A1"), CPos("CV101"), 10000);
    assert(std::holds_alternative<CError>(result));
    assert(std::get<CError>(result).m_Kind == ECellError::RangeTooLarge);
    assert(std::get<CError>(result).m_Text == "#RANGE!");

    // huge ranges are rejected by their size, nothing is allocated
    CPos far(INT_MAX - 1, INT_MAX - 1);
    assert(CRangeResolver::cellCount(CPos(0, 0), far) == 4611686014132420609ULL);
    result = CRangeResolver::expand(CPos(0, 0), far, 10000);
    assert(std::holds_alternative<CError>(result));
    result = CRangeResolver::expand(CPos("A1"), CPos("XFD1048576"), 10000);
    assert(std::holds_alternative<CError>(result));

    return EXIT_SUCCESS;
}
