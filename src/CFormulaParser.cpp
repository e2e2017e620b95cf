#include "sheetcalc/CFormulaParser.h"

#include "sheetcalc/CPos.h"

#include <algorithm>
#include <cctype>

namespace {
    constexpr size_t MAX_NESTING = 256;

    /**
     * Keeps the parser's recursion bounded for inputs like "((((...))))" or "-----1".
     */
    class CNestingGuard {
    public:
        CNestingGuard(size_t &nesting, size_t offset) : m_Nesting(nesting) {
            if (++m_Nesting > MAX_NESTING) {
                --m_Nesting;
                throw CParseError("Formula nested too deeply", offset);
            }
        }

        ~CNestingGuard() { --m_Nesting; }

        CNestingGuard(const CNestingGuard &) = delete;

        CNestingGuard &operator=(const CNestingGuard &) = delete;

    private:
        size_t &m_Nesting;
    };

    std::string_view body(std::string_view formula) {
        if (!formula.empty() && formula.front() == '=')
            formula.remove_prefix(1);
        return formula;
    }

    bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
        return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
            return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
        });
    }
}

CFormulaParser::CFormulaParser(std::string_view formula, CExprBuilder &builder)
        : m_Tokens(CTokenizer(body(formula)).tokenize()), m_Builder(builder) {}

void CFormulaParser::parse() {
    if (current().m_Type == ETokenType::End)
        throw CParseError("Empty formula", 0);
    parseComparison();
    if (current().m_Type != ETokenType::End)
        throw CParseError("Unexpected token: " + current().m_Text, current().m_Offset);
}

void CFormulaParser::parseComparison() {
    CNestingGuard guard(m_Nesting, current().m_Offset);
    parseConcatenation();
    while (current().m_Type == ETokenType::Operator) {
        std::string op = current().m_Text;
        if (op != "=" && op != "<>" && op != "<" && op != "<=" && op != ">" && op != ">=")
            break;
        advance();
        parseConcatenation();
        if (op == "=") m_Builder.opEq();
        else if (op == "<>") m_Builder.opNe();
        else if (op == "<") m_Builder.opLt();
        else if (op == "<=") m_Builder.opLe();
        else if (op == ">") m_Builder.opGt();
        else m_Builder.opGe();
    }
}

void CFormulaParser::parseConcatenation() {
    parseAdditive();
    while (isOperator("&")) {
        advance();
        parseAdditive();
        m_Builder.opConcat();
    }
}

void CFormulaParser::parseAdditive() {
    parseMultiplicative();
    while (isOperator("+") || isOperator("-")) {
        bool add = isOperator("+");
        advance();
        parseMultiplicative();
        if (add) m_Builder.opAdd();
        else m_Builder.opSub();
    }
}

void CFormulaParser::parseMultiplicative() {
    parseUnary();
    while (isOperator("*") || isOperator("/")) {
        bool mul = isOperator("*");
        advance();
        parseUnary();
        if (mul) m_Builder.opMul();
        else m_Builder.opDiv();
    }
}

void CFormulaParser::parseUnary() {
    CNestingGuard guard(m_Nesting, current().m_Offset);
    if (isOperator("-")) {
        advance();
        parseUnary();
        m_Builder.opNeg();
        return;
    }
    if (isOperator("+")) {
        advance();
        parseUnary();
        return;
    }
    parsePower();
}

void CFormulaParser::parsePower() {
    parsePrimary();
    while (isOperator("^")) {
        advance();
        parsePowerOperand();
        m_Builder.opPow();
    }
}

void CFormulaParser::parsePowerOperand() {
    CNestingGuard guard(m_Nesting, current().m_Offset);
    // 2^-1 is accepted, the sign binds to the exponent only
    if (isOperator("-")) {
        advance();
        parsePowerOperand();
        m_Builder.opNeg();
        return;
    }
    if (isOperator("+")) {
        advance();
        parsePowerOperand();
        return;
    }
    parsePrimary();
}

void CFormulaParser::parsePrimary() {
    const CToken &token = current();
    switch (token.m_Type) {
        case ETokenType::Number: {
            double value;
            try {
                value = std::stod(token.m_Text);
            } catch (const std::out_of_range &) {
                throw CParseError("Number out of range: " + token.m_Text, token.m_Offset);
            }
            advance();
            m_Builder.valNumber(value);
            return;
        }
        case ETokenType::String: {
            std::string text = token.m_Text;
            advance();
            m_Builder.valString(std::move(text));
            return;
        }
        case ETokenType::Identifier:
            parseIdentifier();
            return;
        case ETokenType::LeftParen:
            advance();
            parseComparison();
            expect(ETokenType::RightParen, "')'");
            return;
        case ETokenType::End:
            throw CParseError("Unexpected end of formula", token.m_Offset);
        default:
            throw CParseError("Unexpected token: " + token.m_Text, token.m_Offset);
    }
}

void CFormulaParser::parseIdentifier() {
    const CToken &token = current();
    std::string name = token.m_Text;
    size_t offset = token.m_Offset;
    advance();

    if (current().m_Type == ETokenType::LeftParen) {
        parseFunctionCall(name);
        return;
    }

    if (equalsIgnoreCase(name, "TRUE") || equalsIgnoreCase(name, "FALSE")) {
        m_Builder.valBool(equalsIgnoreCase(name, "TRUE"));
        return;
    }

    if (!CPos::looksLikeAddress(name))
        throw CParseError("Unknown identifier: " + name, offset);

    if (isOperator(":")) {
        advance();
        if (current().m_Type != ETokenType::Identifier || !CPos::looksLikeAddress(current().m_Text))
            throw CParseError("Expected cell reference after ':'", current().m_Offset);
        std::string range = name + ":" + current().m_Text;
        advance();
        m_Builder.valRange(std::move(range));
        return;
    }

    m_Builder.valReference(std::move(name));
}

void CFormulaParser::parseFunctionCall(const std::string &name) {
    expect(ETokenType::LeftParen, "'('");
    int paramCount = 0;

    if (current().m_Type != ETokenType::RightParen) {
        while (true) {
            if (current().m_Type == ETokenType::Comma || current().m_Type == ETokenType::RightParen)
                m_Builder.valEmpty();
            else
                parseComparison();
            ++paramCount;

            if (current().m_Type != ETokenType::Comma)
                break;
            advance();
        }
    }

    expect(ETokenType::RightParen, "')'");
    m_Builder.funcCall(name, paramCount);
}

const CToken &CFormulaParser::current() const {
    return m_Tokens[m_Index];
}

void CFormulaParser::advance() {
    if (m_Index + 1 < m_Tokens.size())
        ++m_Index;
}

bool CFormulaParser::isOperator(std::string_view op) const {
    return current().m_Type == ETokenType::Operator && current().m_Text == op;
}

void CFormulaParser::expect(ETokenType type, const char *what) {
    if (current().m_Type != type)
        throw CParseError(std::string("Expected ") + what, current().m_Offset);
    advance();
}

void parseExpression(const std::string &expr, CExprBuilder &builder) {
    CFormulaParser parser(expr, builder);
    parser.parse();
}
