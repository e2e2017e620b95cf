#ifndef SHEETCALC_CTOKENIZER_H
#define SHEETCALC_CTOKENIZER_H

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * Exception thrown by the tokenizer and parser on malformed formulas.
 * The evaluator converts it to the #PARSE! error value.
 */
class CParseError : public std::invalid_argument {
public:
    CParseError(const std::string &message, size_t offset);

    /**
     * Offset of the offending character in the formula body
     * @return zero-based offset
     */
    size_t offset() const;

private:
    size_t m_Offset;
};

enum class ETokenType {
    Number,
    String,
    Identifier,
    Operator,
    LeftParen,
    RightParen,
    Comma,
    End
};

/**
 * Single lexical token of a formula.
 */
struct CToken {
    ETokenType m_Type;

    /**
     * Token text. For strings the quotes are removed and doubled quotes collapsed.
     */
    std::string m_Text;

    /**
     * Offset and length of the token in the source, used to rebuild the source verbatim.
     */
    size_t m_Offset;
    size_t m_Length;
};

/**
 * Splits formula text (without the leading '=') into tokens.
 */
class CTokenizer {
public:
    explicit CTokenizer(std::string_view input);

    /**
     * Tokenize the whole input. The last token is always ETokenType::End.
     * @return tokens
     * @throws CParseError on an unexpected character or an unterminated string
     */
    std::vector<CToken> tokenize();

private:
    CToken readNumber();

    CToken readString();

    CToken readIdentifier();

    CToken readOperator();

    std::string_view m_Input;
    size_t m_Pos = 0;
};

#endif /* SHEETCALC_CTOKENIZER_H */
