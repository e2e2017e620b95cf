#include "sheetcalc/CRangeResolver.h"

#include <algorithm>
#include <cstdlib>

std::uint64_t CRangeResolver::cellCount(const CPos &from, const CPos &to) {
    std::int64_t rows = std::abs(static_cast<std::int64_t>(to.m_Row) - from.m_Row) + 1;
    std::int64_t columns = std::abs(static_cast<std::int64_t>(to.m_Column) - from.m_Column) + 1;
    return static_cast<std::uint64_t>(rows) * static_cast<std::uint64_t>(columns);
}

std::variant<std::vector<CPos>, CError> CRangeResolver::expand(const CPos &from, const CPos &to, size_t ceiling) {
    if (cellCount(from, to) > ceiling)
        return CError(ECellError::RangeTooLarge);

    int top = std::min(from.m_Row, to.m_Row);
    int bottom = std::max(from.m_Row, to.m_Row);
    int left = std::min(from.m_Column, to.m_Column);
    int right = std::max(from.m_Column, to.m_Column);

    std::vector<CPos> positions;
    positions.reserve(static_cast<size_t>(bottom - top + 1) * static_cast<size_t>(right - left + 1));
    for (int row = top; row <= bottom; ++row)
        for (int column = left; column <= right; ++column)
            positions.emplace_back(row, column);
    return positions;
}
