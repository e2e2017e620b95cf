#include "sheetcalc/CValue.h"

#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {
    struct CSentinel {
        ECellError m_Kind;
        const char *m_Text;
    };

    constexpr std::array<CSentinel, 11> SENTINELS = {{
        {ECellError::Parse, "#PARSE!"},
        {ECellError::Reference, "#REF!"},
        {ECellError::RangeTooLarge, "#RANGE!"},
        {ECellError::Cycle, "#CYCLE!"},
        {ECellError::Depth, "#DEPTH!"},
        {ECellError::EvaluationLimit, "#LIMIT!"},
        {ECellError::UnknownFunction, "#NAME?"},
        {ECellError::UnknownOperation, "#CIPHER?"},
        {ECellError::Type, "#VALUE!"},
        {ECellError::DivisionByZero, "#DIV/0!"},
        {ECellError::Generic, "#ERROR!"},
    }};
}

CError::CError(ECellError kind) : m_Kind(kind), m_Text(errorSentinel(kind)) {}

CError::CError(ECellError kind, std::string text) : m_Kind(kind), m_Text(std::move(text)) {}

bool CError::isGuard() const {
    return m_Kind == ECellError::Cycle || m_Kind == ECellError::Depth || m_Kind == ECellError::EvaluationLimit;
}

const char *errorSentinel(ECellError kind) {
    for (const auto &sentinel: SENTINELS)
        if (sentinel.m_Kind == kind)
            return sentinel.m_Text;
    return "#ERROR!";
}

std::optional<ECellError> errorFromSentinel(std::string_view text) {
    for (const auto &sentinel: SENTINELS)
        if (text == sentinel.m_Text)
            return sentinel.m_Kind;
    return std::nullopt;
}

bool isError(const CValue &value) {
    return std::holds_alternative<CError>(value);
}

bool isGuardError(const CValue &value) {
    return isError(value) && std::get<CError>(value).isGuard();
}

CValue normalizeValue(CValue value) {
    if (auto text = std::get_if<std::string>(&value); text && !text->empty() && text->front() == '#') {
        auto kind = errorFromSentinel(*text);
        return CError(kind.value_or(ECellError::Generic), *text);
    }
    return value;
}

std::optional<double> parseNumber(std::string_view text) {
    if (text.empty() || text.find_first_not_of("0123456789+-.eE") != std::string_view::npos)
        return std::nullopt;
    try {
        size_t idx;
        std::string str(text);
        double value = std::stod(str, &idx);
        if (idx == str.length())
            return value;
    } catch (const std::invalid_argument &) {
        return std::nullopt;
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<double> toNumber(const CValue &value) {
    if (std::holds_alternative<double>(value))
        return std::get<double>(value);
    if (std::holds_alternative<bool>(value))
        return std::get<bool>(value) ? 1.0 : 0.0;
    if (std::holds_alternative<std::monostate>(value))
        return 0.0;
    if (std::holds_alternative<std::string>(value))
        return parseNumber(std::get<std::string>(value));
    return std::nullopt;
}

bool toBool(const CValue &value) {
    if (std::holds_alternative<bool>(value))
        return std::get<bool>(value);
    if (std::holds_alternative<double>(value))
        return std::get<double>(value) != 0;
    if (std::holds_alternative<std::string>(value))
        return !std::get<std::string>(value).empty();
    return false;
}

std::string formatNumber(double value) {
    if (std::isfinite(value) && value == std::trunc(value) && std::fabs(value) < 1e15)
        return std::to_string(static_cast<long long>(value));
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

std::string toText(const CValue &value) {
    if (std::holds_alternative<double>(value))
        return formatNumber(std::get<double>(value));
    if (std::holds_alternative<std::string>(value))
        return std::get<std::string>(value);
    if (std::holds_alternative<bool>(value))
        return std::get<bool>(value) ? "TRUE" : "FALSE";
    if (std::holds_alternative<CError>(value))
        return std::get<CError>(value).m_Text;
    return "";
}

CValue literalValue(const std::string &raw) {
    if (raw.empty())
        return std::monostate{};
    if (auto number = parseNumber(raw))
        return *number;
    std::string upperRaw = toUpper(raw);
    if (upperRaw == "TRUE")
        return true;
    if (upperRaw == "FALSE")
        return false;
    return normalizeValue(raw);
}

std::string toUpper(std::string_view text) {
    std::string out(text);
    for (char &ch: out)
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return out;
}
