#include "sheetcalc/CPos.h"

#include <cctype>
#include <climits>
#include <stdexcept>
#include <tuple>

CPos::CPos(std::string_view str) {
    size_t i = 0;
    size_t len = str.size();

    // Check for absolute column reference
    if (i < len && str[i] == '$') {
        m_AbsColumn = true;
        ++i;
    }

    // Extract column part
    size_t columnStart = i;
    while (i < len && std::isalpha(static_cast<unsigned char>(str[i]))) {
        ++i;
    }
    if (i == columnStart) {
        throw std::invalid_argument("Invalid CPos string: missing column part");
    }
    m_Column = convertColumn(str.substr(columnStart, i - columnStart));

    // Check for absolute row reference
    if (i < len && str[i] == '$') {
        m_AbsRow = true;
        ++i;
    }

    // Extract row part
    size_t rowStart = i;
    while (i < len && std::isdigit(static_cast<unsigned char>(str[i]))) {
        ++i;
    }
    if (i == rowStart) {
        throw std::invalid_argument("Invalid CPos string: missing row part");
    }
    int row;
    try {
        row = std::stoi(std::string(str.substr(rowStart, i - rowStart)));
    } catch (const std::exception &) {
        throw std::invalid_argument("Invalid row number");
    }

    if (row < 1) {
        throw std::invalid_argument("Invalid row number: must be positive");
    }
    m_Row = row - 1;

    // Ensure no trailing invalid characters
    if (i != len) {
        throw std::invalid_argument("Invalid CPos string: trailing characters");
    }
}

int CPos::convertColumn(std::string_view columnStr) {
    if (columnStr.empty()) {
        throw std::invalid_argument("Invalid column part: empty");
    }
    int column = 0;
    for (char ch: columnStr) {
        if (!std::isalpha(static_cast<unsigned char>(ch))) {
            throw std::invalid_argument("Invalid column part: must be alphabetic");
        }
        if (column > (INT_MAX - 26) / 26) {
            throw std::invalid_argument("Invalid column part: too many letters");
        }
        column = column * 26 + (std::toupper(static_cast<unsigned char>(ch)) - 'A' + 1);
    }
    return column - 1;
}

std::string CPos::columnName(int column) {
    if (column < 0) {
        throw std::invalid_argument("Invalid column index: must not be negative");
    }
    std::string name;
    long long value = static_cast<long long>(column) + 1;
    while (value > 0) {
        name.insert(name.begin(), static_cast<char>('A' + (value - 1) % 26));
        value = (value - 1) / 26;
    }
    return name;
}

bool CPos::looksLikeAddress(std::string_view str) {
    size_t i = 0;
    if (i < str.size() && str[i] == '$') ++i;
    size_t letters = i;
    while (i < str.size() && std::isalpha(static_cast<unsigned char>(str[i]))) ++i;
    if (i == letters) return false;
    if (i < str.size() && str[i] == '$') ++i;
    size_t digits = i;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) ++i;
    return i != digits && i == str.size();
}

std::string CPos::toString() const {
    std::string out;
    if (m_AbsColumn) out += '$';
    out += columnName(m_Column);
    if (m_AbsRow) out += '$';
    out += std::to_string(m_Row + 1);
    return out;
}

std::strong_ordering CPos::operator<=>(const CPos &rhs) const {
    return std::tie(m_Row, m_Column) <=> std::tie(rhs.m_Row, rhs.m_Column);
}

bool CPos::operator==(const CPos &rhs) const {
    return m_Row == rhs.m_Row && m_Column == rhs.m_Column;
}
