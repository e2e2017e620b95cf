#ifndef SHEETCALC_CVALUE_H
#define SHEETCALC_CVALUE_H

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * Kinds of failures an evaluation can produce. Each kind has its own sentinel text.
 */
enum class ECellError {
    Parse,            // #PARSE!
    Reference,        // #REF!
    RangeTooLarge,    // #RANGE!
    Cycle,            // #CYCLE!
    Depth,            // #DEPTH!
    EvaluationLimit,  // #LIMIT!
    UnknownFunction,  // #NAME?
    UnknownOperation, // #CIPHER?
    Type,             // #VALUE!
    DivisionByZero,   // #DIV/0!
    Generic           // #ERROR!
};

/**
 * Error value stored in place of a result.
 */
struct CError {
    ECellError m_Kind = ECellError::Generic;

    /**
     * Sentinel text shown to the user, starts with '#'.
     */
    std::string m_Text;

    CError() = default;

    explicit CError(ECellError kind);

    CError(ECellError kind, std::string text);

    /**
     * Guard errors are raised by the evaluator's resource checks, not by a computation.
     * @return true for cycle, depth and evaluation limit errors
     */
    bool isGuard() const;

    bool operator==(const CError &rhs) const = default;
};

using CValue = std::variant<std::monostate, double, std::string, bool, CError>;

/**
 * Values of a resolved range, row-major.
 */
using CRangeValue = std::vector<CValue>;

/**
 * Pre-evaluated function argument: a scalar or the cells of a range.
 */
using CArgument = std::variant<CValue, CRangeValue>;

/**
 * Get the sentinel text of an error kind
 * @param kind error kind
 * @return sentinel, e.g. "#REF!"
 */
const char *errorSentinel(ECellError kind);

/**
 * Map a sentinel text back to its kind
 * @param text text starting with '#'
 * @return kind if the text is one of the known sentinels
 */
std::optional<ECellError> errorFromSentinel(std::string_view text);

bool isError(const CValue &value);

bool isGuardError(const CValue &value);

/**
 * Turn a leading-'#' string into an error value, other values are returned unchanged.
 * @param value value coming from outside the engine
 * @return normalized value
 */
CValue normalizeValue(CValue value);

/**
 * Parse the whole text as a number.
 * @param text text to parse
 * @return number if the complete text is numeric
 */
std::optional<double> parseNumber(std::string_view text);

/**
 * Numeric view of a value used by arithmetic: numbers, booleans (1/0), empty (0)
 * and numeric text.
 * @param value value to convert
 * @return number or nullopt if the value is not numeric
 */
std::optional<double> toNumber(const CValue &value);

/**
 * Truthiness of a value used by IF and friends.
 * @param value value to test
 * @return false for empty, zero, FALSE and empty text
 */
bool toBool(const CValue &value);

/**
 * Format a number without trailing zeros (3 -> "3", 0.5 -> "0.5").
 */
std::string formatNumber(double value);

/**
 * Text form of a value, errors yield their sentinel.
 */
std::string toText(const CValue &value);

/**
 * Interpret raw cell content that is not a formula.
 * @param raw raw cell text
 * @return empty, number, boolean, error (leading '#') or text
 */
CValue literalValue(const std::string &raw);

/**
 * ASCII uppercase copy, used for case-insensitive names and keys.
 */
std::string toUpper(std::string_view text);

#endif /* SHEETCALC_CVALUE_H */
