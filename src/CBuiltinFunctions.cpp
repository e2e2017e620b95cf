#include "sheetcalc/CEvaluator.h"
#include "sheetcalc/CFunctionRegistry.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numbers>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {
    using CArgs = std::vector<CArgument>;
    using CNumberResult = std::variant<double, CError>;
    using CTextResult = std::variant<std::string, CError>;

    const char *const DEFAULT_CIPHER = "ENGLISH (TQ)";

    CValue numberResult(double value) {
        if (!std::isfinite(value))
            return CError(ECellError::Type);
        return value;
    }

    bool isOmitted(const CArgs &args, size_t index) {
        if (index >= args.size())
            return true;
        const CValue *value = std::get_if<CValue>(&args[index]);
        return value && std::holds_alternative<std::monostate>(*value);
    }

    /**
     * Scalar view of an argument, a range where a single value is expected is a type error.
     */
    CValue scalar(const CArgument &arg) {
        if (const CValue *value = std::get_if<CValue>(&arg))
            return *value;
        return CError(ECellError::Type);
    }

    CNumberResult asNumber(const CArgument &arg) {
        CValue value = scalar(arg);
        if (auto error = std::get_if<CError>(&value))
            return *error;
        std::optional<double> number = toNumber(value);
        if (!number)
            return CError(ECellError::Type);
        return *number;
    }

    CTextResult asText(const CArgument &arg) {
        CValue value = scalar(arg);
        if (auto error = std::get_if<CError>(&value))
            return *error;
        return toText(value);
    }

    /**
     * Whole-number view used for counts and positions, truncated toward zero.
     */
    std::variant<long long, CError> asInteger(const CArgument &arg) {
        CNumberResult number = asNumber(arg);
        if (auto error = std::get_if<CError>(&number))
            return *error;
        double value = std::trunc(std::get<double>(number));
        if (std::abs(value) > 1e15)
            return CError(ECellError::Type);
        return static_cast<long long>(value);
    }

    /**
     * Every argument value in call order, ranges expanded.
     */
    std::vector<CValue> flatten(const CArgs &args) {
        std::vector<CValue> values;
        for (const auto &arg: args) {
            if (const CValue *value = std::get_if<CValue>(&arg)) {
                values.push_back(*value);
            } else {
                const auto &range = std::get<CRangeValue>(arg);
                values.insert(values.end(), range.begin(), range.end());
            }
        }
        return values;
    }

    /**
     * Numbers of an aggregate call. Empty cells and non-numeric text are skipped,
     * the first error is returned in place of the list.
     */
    std::variant<std::vector<double>, CError> collectNumbers(const CArgs &args) {
        std::vector<double> numbers;
        for (const CValue &value: flatten(args)) {
            if (auto error = std::get_if<CError>(&value))
                return *error;
            if (std::holds_alternative<std::monostate>(value))
                continue;
            if (std::optional<double> number = toNumber(value))
                numbers.push_back(*number);
        }
        return numbers;
    }

    std::string lower(std::string text) {
        for (char &ch: text)
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        return text;
    }

    CArgumentInfo arg(std::string name, std::string description, std::string typeHint, bool optional = false) {
        return CArgumentInfo{std::move(name), std::move(description), std::move(typeHint), optional};
    }

    CFunctionInfo info(std::string name, std::string description, std::string syntax, std::string category,
                       std::vector<CArgumentInfo> arguments, bool variadic = false) {
        return CFunctionInfo{std::move(name), std::move(description), std::move(syntax), std::move(category),
                             std::move(arguments), variadic};
    }

    void add(CFunctionRegistry &registry, CFunctionInfo functionInfo, CFunction function) {
        registry.registerFunction(std::move(functionInfo), std::move(function));
    }

    template<typename TFunction>
    void addAggregate(CFunctionRegistry &registry, CFunctionInfo functionInfo, TFunction reduce) {
        add(registry, std::move(functionInfo), [reduce](CEvaluator &, const CArgs &args) -> CValue {
            auto numbers = collectNumbers(args);
            if (auto error = std::get_if<CError>(&numbers))
                return *error;
            return reduce(std::get<std::vector<double>>(numbers));
        });
    }

    template<typename TFunction>
    void addUnaryMath(CFunctionRegistry &registry, const std::string &name, const std::string &description,
                      const std::string &category, TFunction function) {
        std::string argName = category == "Trig" ? "angle" : "number";
        add(registry, info(name, description, name + "(" + argName + ")", category,
                           {arg(argName, "Value", "number")}),
            [function](CEvaluator &, const CArgs &args) -> CValue {
                CNumberResult number = asNumber(args[0]);
                if (auto error = std::get_if<CError>(&number))
                    return *error;
                return numberResult(function(std::get<double>(number)));
            });
    }

    void registerMath(CFunctionRegistry &registry) {
        addAggregate(registry, info("SUM", "Adds arguments.", "SUM(number1, ...)", "Math",
                                    {arg("number1", "Value", "number")}, true),
                     [](const std::vector<double> &numbers) -> CValue {
                         double total = 0;
                         for (double number: numbers)
                             total += number;
                         return numberResult(total);
                     });

        addAggregate(registry, info("AVERAGE", "Average of arguments.", "AVERAGE(number1, ...)", "Math",
                                    {arg("number1", "Value", "number")}, true),
                     [](const std::vector<double> &numbers) -> CValue {
                         if (numbers.empty())
                             return 0.0;
                         double total = 0;
                         for (double number: numbers)
                             total += number;
                         return numberResult(total / static_cast<double>(numbers.size()));
                     });

        addAggregate(registry, info("COUNT", "Count numbers.", "COUNT(value1, ...)", "Math",
                                    {arg("value1", "Value", "any")}, true),
                     [](const std::vector<double> &numbers) -> CValue {
                         return static_cast<double>(numbers.size());
                     });

        addAggregate(registry, info("MIN", "Minimum value.", "MIN(number1, ...)", "Math",
                                    {arg("number1", "Value", "number")}, true),
                     [](const std::vector<double> &numbers) -> CValue {
                         if (numbers.empty())
                             return 0.0;
                         return *std::min_element(numbers.begin(), numbers.end());
                     });

        addAggregate(registry, info("MAX", "Maximum value.", "MAX(number1, ...)", "Math",
                                    {arg("number1", "Value", "number")}, true),
                     [](const std::vector<double> &numbers) -> CValue {
                         if (numbers.empty())
                             return 0.0;
                         return *std::max_element(numbers.begin(), numbers.end());
                     });

        addUnaryMath(registry, "ABS", "Absolute value.", "Math", [](double x) { return std::fabs(x); });
        addUnaryMath(registry, "FLOOR", "Rounds down.", "Math", [](double x) { return std::floor(x); });
        addUnaryMath(registry, "CEILING", "Rounds up.", "Math", [](double x) { return std::ceil(x); });
        addUnaryMath(registry, "INT", "Integer part.", "Math", [](double x) { return std::trunc(x); });
        addUnaryMath(registry, "SQRT", "Square root.", "Math", [](double x) { return std::sqrt(x); });
        addUnaryMath(registry, "LN", "Natural logarithm.", "Math", [](double x) { return std::log(x); });
        addUnaryMath(registry, "LOG10", "Logarithm base 10.", "Math", [](double x) { return std::log10(x); });

        add(registry, info("ROUND", "Rounds number.", "ROUND(number, [digits])", "Math",
                           {arg("number", "Value", "number"), arg("digits", "Decimals (default 0)", "number", true)}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CNumberResult number = asNumber(args[0]);
                if (auto error = std::get_if<CError>(&number))
                    return *error;
                long long digits = 0;
                if (!isOmitted(args, 1)) {
                    auto value = asInteger(args[1]);
                    if (auto error = std::get_if<CError>(&value))
                        return *error;
                    digits = std::get<long long>(value);
                }
                if (digits > 15 || digits < -15)
                    return CError(ECellError::Type);
                double scale = std::pow(10.0, static_cast<double>(digits));
                // std::round rounds halves away from zero
                return numberResult(std::round(std::get<double>(number) * scale) / scale);
            });

        add(registry, info("POWER", "Power.", "POWER(base, exponent)", "Math",
                           {arg("base", "Base", "number"), arg("exponent", "Exponent", "number")}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CNumberResult base = asNumber(args[0]);
                if (auto error = std::get_if<CError>(&base))
                    return *error;
                CNumberResult exponent = asNumber(args[1]);
                if (auto error = std::get_if<CError>(&exponent))
                    return *error;
                if (std::get<double>(base) == 0 && std::get<double>(exponent) < 0)
                    return CError(ECellError::DivisionByZero);
                return numberResult(std::pow(std::get<double>(base), std::get<double>(exponent)));
            });

        add(registry, info("MOD", "Modulo, the result has the sign of the divisor.", "MOD(number, divisor)", "Math",
                           {arg("number", "Number", "number"), arg("divisor", "Divisor", "number")}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CNumberResult number = asNumber(args[0]);
                if (auto error = std::get_if<CError>(&number))
                    return *error;
                CNumberResult divisor = asNumber(args[1]);
                if (auto error = std::get_if<CError>(&divisor))
                    return *error;
                double d = std::get<double>(divisor);
                if (d == 0)
                    return CError(ECellError::DivisionByZero);
                double r = std::fmod(std::get<double>(number), d);
                if (r != 0 && (r < 0) != (d < 0))
                    r += d;
                return numberResult(r);
            });

        add(registry, info("PI", "Pi constant.", "PI()", "Math", {}),
            [](CEvaluator &, const CArgs &) -> CValue {
                return std::numbers::pi;
            });
    }

    void registerTrig(CFunctionRegistry &registry) {
        addUnaryMath(registry, "SIN", "Sine (radians).", "Trig", [](double x) { return std::sin(x); });
        addUnaryMath(registry, "COS", "Cosine (radians).", "Trig", [](double x) { return std::cos(x); });
        addUnaryMath(registry, "TAN", "Tangent (radians).", "Trig", [](double x) { return std::tan(x); });
        addUnaryMath(registry, "ASIN", "Arc sine.", "Trig", [](double x) { return std::asin(x); });
        addUnaryMath(registry, "ACOS", "Arc cosine.", "Trig", [](double x) { return std::acos(x); });
        addUnaryMath(registry, "ATAN", "Arc tangent.", "Trig", [](double x) { return std::atan(x); });
    }

    void registerLogic(CFunctionRegistry &registry) {
        add(registry, info("IF", "Conditional logic.", "IF(condition, value_if_true, [value_if_false])", "Logic",
                           {arg("condition", "Expression", "any"), arg("value_if_true", "Result if true", "any"),
                            arg("value_if_false", "Result if false", "any", true)}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CValue condition = scalar(args[0]);
                if (isError(condition))
                    return condition;
                if (toBool(condition))
                    return scalar(args[1]);
                if (args.size() < 3)
                    return false;
                return scalar(args[2]);
            });

        add(registry, info("IFERROR", "Value, or the fallback when the value is an error.",
                           "IFERROR(value, value_if_error)", "Logic",
                           {arg("value", "Expression", "any"), arg("value_if_error", "Fallback", "any")}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CValue value = scalar(args[0]);
                if (isError(value))
                    return scalar(args[1]);
                return value;
            });

        add(registry, info("ISERROR", "TRUE if the value (or any cell of the range) is an error.", "ISERROR(value)",
                           "Logic", {arg("value", "Expression", "any")}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                if (const CValue *value = std::get_if<CValue>(&args[0]))
                    return isError(*value);
                const auto &range = std::get<CRangeValue>(args[0]);
                return std::any_of(range.begin(), range.end(), [](const CValue &value) { return isError(value); });
            });
    }

    void registerText(CFunctionRegistry &registry) {
        add(registry, info("CONCAT", "Join strings.", "CONCAT(text1, ...)", "Text",
                           {arg("text1", "Text", "str")}, true),
            [](CEvaluator &, const CArgs &args) -> CValue {
                std::string result;
                for (const CValue &value: flatten(args)) {
                    if (isError(value))
                        return value;
                    result += toText(value);
                }
                return result;
            });

        add(registry, info("LEN", "Length of text.", "LEN(text)", "Text", {arg("text", "Text", "str")}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CTextResult text = asText(args[0]);
                if (auto error = std::get_if<CError>(&text))
                    return *error;
                return static_cast<double>(std::get<std::string>(text).size());
            });

        add(registry, info("UPPER", "Uppercase.", "UPPER(text)", "Text", {arg("text", "Text", "str")}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CTextResult text = asText(args[0]);
                if (auto error = std::get_if<CError>(&text))
                    return *error;
                return toUpper(std::get<std::string>(text));
            });

        add(registry, info("LOWER", "Lowercase.", "LOWER(text)", "Text", {arg("text", "Text", "str")}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CTextResult text = asText(args[0]);
                if (auto error = std::get_if<CError>(&text))
                    return *error;
                return lower(std::get<std::string>(std::move(text)));
            });

        add(registry, info("PROPER", "Title case.", "PROPER(text)", "Text", {arg("text", "Text", "str")}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CTextResult text = asText(args[0]);
                if (auto error = std::get_if<CError>(&text))
                    return *error;
                std::string result = std::get<std::string>(std::move(text));
                bool wordStart = true;
                for (char &ch: result) {
                    auto c = static_cast<unsigned char>(ch);
                    if (std::isalpha(c)) {
                        ch = static_cast<char>(wordStart ? std::toupper(c) : std::tolower(c));
                        wordStart = false;
                    } else {
                        wordStart = true;
                    }
                }
                return result;
            });

        add(registry, info("LEFT", "Left characters.", "LEFT(text, [num_chars])", "Text",
                           {arg("text", "Text", "str"), arg("num_chars", "Count (default 1)", "number", true)}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CTextResult text = asText(args[0]);
                if (auto error = std::get_if<CError>(&text))
                    return *error;
                long long count = 1;
                if (!isOmitted(args, 1)) {
                    auto value = asInteger(args[1]);
                    if (auto error = std::get_if<CError>(&value))
                        return *error;
                    count = std::get<long long>(value);
                }
                if (count < 0)
                    return CError(ECellError::Type);
                const std::string &s = std::get<std::string>(text);
                return s.substr(0, static_cast<size_t>(std::min<long long>(count, static_cast<long long>(s.size()))));
            });

        add(registry, info("RIGHT", "Right characters.", "RIGHT(text, [num_chars])", "Text",
                           {arg("text", "Text", "str"), arg("num_chars", "Count (default 1)", "number", true)}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CTextResult text = asText(args[0]);
                if (auto error = std::get_if<CError>(&text))
                    return *error;
                long long count = 1;
                if (!isOmitted(args, 1)) {
                    auto value = asInteger(args[1]);
                    if (auto error = std::get_if<CError>(&value))
                        return *error;
                    count = std::get<long long>(value);
                }
                if (count < 0)
                    return CError(ECellError::Type);
                const std::string &s = std::get<std::string>(text);
                size_t n = static_cast<size_t>(std::min<long long>(count, static_cast<long long>(s.size())));
                return s.substr(s.size() - n);
            });

        add(registry, info("MID", "Middle characters.", "MID(text, start_num, num_chars)", "Text",
                           {arg("text", "Text", "str"), arg("start_num", "Start (1-based)", "number"),
                            arg("num_chars", "Count", "number")}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CTextResult text = asText(args[0]);
                if (auto error = std::get_if<CError>(&text))
                    return *error;
                auto start = asInteger(args[1]);
                if (auto error = std::get_if<CError>(&start))
                    return *error;
                auto count = asInteger(args[2]);
                if (auto error = std::get_if<CError>(&count))
                    return *error;
                if (std::get<long long>(start) < 1 || std::get<long long>(count) < 0)
                    return CError(ECellError::Type);
                const std::string &s = std::get<std::string>(text);
                auto first = static_cast<size_t>(std::get<long long>(start) - 1);
                if (first >= s.size())
                    return std::string();
                return s.substr(first, static_cast<size_t>(std::get<long long>(count)));
            });

        add(registry, info("TRIM", "Remove surrounding spaces and collapse inner runs.", "TRIM(text)", "Text",
                           {arg("text", "Text", "str")}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CTextResult text = asText(args[0]);
                if (auto error = std::get_if<CError>(&text))
                    return *error;
                std::string result;
                bool pendingSpace = false;
                for (char ch: std::get<std::string>(text)) {
                    if (std::isspace(static_cast<unsigned char>(ch))) {
                        pendingSpace = !result.empty();
                        continue;
                    }
                    if (pendingSpace)
                        result += ' ';
                    pendingSpace = false;
                    result += ch;
                }
                return result;
            });

        add(registry, info("REPLACE", "Replace part of text.", "REPLACE(old_text, start_num, num_chars, new_text)",
                           "Text",
                           {arg("old_text", "Text", "str"), arg("start_num", "Start (1-based)", "number"),
                            arg("num_chars", "Count", "number"), arg("new_text", "New text", "str")}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CTextResult text = asText(args[0]);
                if (auto error = std::get_if<CError>(&text))
                    return *error;
                auto start = asInteger(args[1]);
                if (auto error = std::get_if<CError>(&start))
                    return *error;
                auto count = asInteger(args[2]);
                if (auto error = std::get_if<CError>(&count))
                    return *error;
                CTextResult replacement = asText(args[3]);
                if (auto error = std::get_if<CError>(&replacement))
                    return *error;
                if (std::get<long long>(start) < 1 || std::get<long long>(count) < 0)
                    return CError(ECellError::Type);

                const std::string &s = std::get<std::string>(text);
                size_t first = std::min(static_cast<size_t>(std::get<long long>(start) - 1), s.size());
                size_t last = std::min(first + static_cast<size_t>(std::get<long long>(count)), s.size());
                return s.substr(0, first) + std::get<std::string>(replacement) + s.substr(last);
            });

        add(registry, info("SUBSTITUTE", "Substitute text.", "SUBSTITUTE(text, old_text, new_text, [instance_num])",
                           "Text",
                           {arg("text", "Text", "str"), arg("old_text", "Old", "str"), arg("new_text", "New", "str"),
                            arg("instance_num", "Instance", "number", true)}),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CTextResult text = asText(args[0]);
                if (auto error = std::get_if<CError>(&text))
                    return *error;
                CTextResult from = asText(args[1]);
                if (auto error = std::get_if<CError>(&from))
                    return *error;
                CTextResult to = asText(args[2]);
                if (auto error = std::get_if<CError>(&to))
                    return *error;
                long long instance = 0;
                if (!isOmitted(args, 3)) {
                    auto value = asInteger(args[3]);
                    if (auto error = std::get_if<CError>(&value))
                        return *error;
                    instance = std::get<long long>(value);
                    if (instance < 1)
                        return CError(ECellError::Type);
                }

                const std::string &s = std::get<std::string>(text);
                const std::string &oldText = std::get<std::string>(from);
                const std::string &newText = std::get<std::string>(to);
                if (oldText.empty())
                    return s;

                std::string result;
                size_t pos = 0;
                long long occurrence = 0;
                while (true) {
                    size_t found = s.find(oldText, pos);
                    if (found == std::string::npos)
                        break;
                    ++occurrence;
                    result.append(s, pos, found - pos);
                    result += (instance == 0 || occurrence == instance) ? newText : oldText;
                    pos = found + oldText.size();
                }
                result.append(s, pos, std::string::npos);
                return result;
            });

        add(registry, info("TEXTJOIN", "Join with delimiter.", "TEXTJOIN(delimiter, ignore_empty, text1, ...)", "Text",
                           {arg("delimiter", "Delimiter", "str"), arg("ignore_empty", "Ignore empty", "bool"),
                            arg("text1", "Text", "str")}, true),
            [](CEvaluator &, const CArgs &args) -> CValue {
                CTextResult delimiter = asText(args[0]);
                if (auto error = std::get_if<CError>(&delimiter))
                    return *error;

                // an omitted flag means ignore empty values
                bool skipEmpty = true;
                if (!isOmitted(args, 1)) {
                    CValue flag = scalar(args[1]);
                    if (isError(flag))
                        return flag;
                    skipEmpty = toBool(flag);
                }

                std::string result;
                bool first = true;
                for (const CValue &value: flatten(CArgs(args.begin() + 2, args.end()))) {
                    if (isError(value))
                        return value;
                    std::string part = toText(value);
                    if (skipEmpty && part.empty())
                        continue;
                    if (!first)
                        result += std::get<std::string>(delimiter);
                    result += part;
                    first = false;
                }
                return result;
            });
    }

    void registerBridge(CFunctionRegistry &registry) {
        add(registry, info("GEMATRIA", "Calculates the value of the text in a cipher.", "GEMATRIA(text, [cipher])",
                           "Esoteric",
                           {arg("text", "Text or cell", "str"), arg("cipher", "Cipher name", "cipher", true)}),
            [](CEvaluator &evaluator, const CArgs &args) -> CValue {
                CTextResult text = asText(args[0]);
                if (auto error = std::get_if<CError>(&text))
                    return *error;
                if (std::get<std::string>(text).empty())
                    return 0.0;

                std::string key = DEFAULT_CIPHER;
                if (!isOmitted(args, 1)) {
                    CTextResult cipher = asText(args[1]);
                    if (auto error = std::get_if<CError>(&cipher))
                        return *error;
                    key = toUpper(std::get<std::string>(cipher));
                }
                return evaluator.dispatch(key, std::get<std::string>(text));
            });
    }
}

void registerBuiltinFunctions(CFunctionRegistry &registry) {
    registerMath(registry);
    registerTrig(registry);
    registerLogic(registry);
    registerText(registry);
    registerBridge(registry);
}
