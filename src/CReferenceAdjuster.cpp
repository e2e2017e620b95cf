#include "sheetcalc/CReferenceAdjuster.h"

#include "sheetcalc/CPos.h"
#include "sheetcalc/CTokenizer.h"

#include <algorithm>
#include <climits>
#include <stdexcept>
#include <vector>

std::string CReferenceAdjuster::adjust(const std::string &formula, int rowOffset, int columnOffset) {
    if (formula.empty() || formula.front() != '=')
        return formula;

    std::string_view body = std::string_view(formula).substr(1);
    std::vector<CToken> tokens;
    try {
        tokens = CTokenizer(body).tokenize();
    } catch (const CParseError &) {
        return formula;
    }

    std::string result = "=";
    size_t copied = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const CToken &token = tokens[i];
        if (token.m_Type == ETokenType::End)
            break;

        // whitespace between tokens
        result.append(body.substr(copied, token.m_Offset - copied));
        std::string_view source = body.substr(token.m_Offset, token.m_Length);

        bool functionName = i + 1 < tokens.size() && tokens[i + 1].m_Type == ETokenType::LeftParen;
        if (token.m_Type == ETokenType::Identifier && !functionName && CPos::looksLikeAddress(token.m_Text))
            result += shiftReference(token.m_Text, rowOffset, columnOffset);
        else
            result.append(source);
        copied = token.m_Offset + token.m_Length;
    }
    result.append(body.substr(std::min(copied, body.size())));
    return result;
}

std::string CReferenceAdjuster::shiftReference(const std::string &reference, int rowOffset, int columnOffset) {
    CPos pos;
    try {
        pos = CPos(reference);
    } catch (const std::invalid_argument &) {
        return reference;
    }

    if (!pos.m_AbsRow)
        pos.m_Row = static_cast<int>(std::clamp<long long>(static_cast<long long>(pos.m_Row) + rowOffset, 0, INT_MAX - 1));
    if (!pos.m_AbsColumn)
        pos.m_Column = static_cast<int>(std::clamp<long long>(static_cast<long long>(pos.m_Column) + columnOffset, 0,
                                                              INT_MAX - 1));
    return pos.toString();
}
