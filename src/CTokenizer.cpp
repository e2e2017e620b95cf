#include "sheetcalc/CTokenizer.h"

#include <cctype>

namespace {
    bool isDigit(char ch) {
        return std::isdigit(static_cast<unsigned char>(ch)) != 0;
    }

    bool isIdentifierStart(char ch) {
        return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_' || ch == '$';
    }

    bool isIdentifierChar(char ch) {
        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '$';
    }
}

CParseError::CParseError(const std::string &message, size_t offset)
        : std::invalid_argument(message), m_Offset(offset) {}

size_t CParseError::offset() const {
    return m_Offset;
}

CTokenizer::CTokenizer(std::string_view input) : m_Input(input) {}

std::vector<CToken> CTokenizer::tokenize() {
    std::vector<CToken> tokens;
    while (m_Pos < m_Input.size()) {
        char ch = m_Input[m_Pos];
        if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
            ++m_Pos;
            continue;
        }
        if (isDigit(ch) || (ch == '.' && m_Pos + 1 < m_Input.size() && isDigit(m_Input[m_Pos + 1])))
            tokens.push_back(readNumber());
        else if (ch == '"')
            tokens.push_back(readString());
        else if (isIdentifierStart(ch))
            tokens.push_back(readIdentifier());
        else if (ch == '(')
            tokens.push_back({ETokenType::LeftParen, "(", m_Pos++, 1});
        else if (ch == ')')
            tokens.push_back({ETokenType::RightParen, ")", m_Pos++, 1});
        else if (ch == ',')
            tokens.push_back({ETokenType::Comma, ",", m_Pos++, 1});
        else
            tokens.push_back(readOperator());
    }
    tokens.push_back({ETokenType::End, "", m_Input.size(), 0});
    return tokens;
}

CToken CTokenizer::readNumber() {
    size_t start = m_Pos;
    while (m_Pos < m_Input.size() && isDigit(m_Input[m_Pos])) ++m_Pos;
    if (m_Pos < m_Input.size() && m_Input[m_Pos] == '.') {
        ++m_Pos;
        while (m_Pos < m_Input.size() && isDigit(m_Input[m_Pos])) ++m_Pos;
    }
    // exponent only when digits follow, otherwise "2E" is left for the parser to reject
    if (m_Pos < m_Input.size() && (m_Input[m_Pos] == 'e' || m_Input[m_Pos] == 'E')) {
        size_t mark = m_Pos + 1;
        if (mark < m_Input.size() && (m_Input[mark] == '+' || m_Input[mark] == '-')) ++mark;
        if (mark < m_Input.size() && isDigit(m_Input[mark])) {
            m_Pos = mark;
            while (m_Pos < m_Input.size() && isDigit(m_Input[m_Pos])) ++m_Pos;
        }
    }
    return {ETokenType::Number, std::string(m_Input.substr(start, m_Pos - start)), start, m_Pos - start};
}

CToken CTokenizer::readString() {
    size_t start = m_Pos++;
    std::string text;
    while (true) {
        if (m_Pos >= m_Input.size())
            throw CParseError("Unterminated string literal", start);
        char ch = m_Input[m_Pos++];
        if (ch == '"') {
            if (m_Pos < m_Input.size() && m_Input[m_Pos] == '"') {
                text += '"';
                ++m_Pos;
                continue;
            }
            break;
        }
        text += ch;
    }
    return {ETokenType::String, text, start, m_Pos - start};
}

CToken CTokenizer::readIdentifier() {
    size_t start = m_Pos;
    while (m_Pos < m_Input.size() && isIdentifierChar(m_Input[m_Pos])) ++m_Pos;
    return {ETokenType::Identifier, std::string(m_Input.substr(start, m_Pos - start)), start, m_Pos - start};
}

CToken CTokenizer::readOperator() {
    size_t start = m_Pos;
    char ch = m_Input[m_Pos];
    char next = m_Pos + 1 < m_Input.size() ? m_Input[m_Pos + 1] : '\0';

    if ((ch == '<' && (next == '=' || next == '>')) || (ch == '>' && next == '=')) {
        m_Pos += 2;
        return {ETokenType::Operator, std::string(m_Input.substr(start, 2)), start, 2};
    }

    switch (ch) {
        case '+':
        case '-':
        case '*':
        case '/':
        case '^':
        case '&':
        case '=':
        case '<':
        case '>':
        case ':':
            ++m_Pos;
            return {ETokenType::Operator, std::string(1, ch), start, 1};
        default:
            throw CParseError(std::string("Unexpected character: ") + ch, start);
    }
}
