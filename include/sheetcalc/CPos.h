#ifndef SHEETCALC_CPOS_H
#define SHEETCALC_CPOS_H

#include <compare>
#include <string>
#include <string_view>

/**
 * Class representing position in a spreadsheet.
 * Row and column are zero-based, the textual form uses 1-based rows ("A1" is 0,0).
 */
class CPos {
public:
    int m_Row = 0;
    bool m_AbsRow = false;
    int m_Column = 0;
    bool m_AbsColumn = false;

    /**
     * Constructor from string
     * @param str string representation of the position, e.g. "B7" or "$AA$10"
     * @throws std::invalid_argument if the string is not a valid address
     */
    explicit CPos(std::string_view str);

    CPos() = default;

    /**
     * Constructor from row and column
     * @param row zero-based row
     * @param column zero-based column
     */
    CPos(int row, int column) : m_Row(row), m_Column(column) {}

    /**
     * Compare two positions (row-major, anchors are ignored)
     * @param rhs right-hand side
     * @return result of the comparison
     */
    std::strong_ordering operator<=>(const CPos &rhs) const;

    bool operator==(const CPos &rhs) const;

    /**
     * Convert the position back to its textual form, keeping '$' anchors
     * @return address string
     */
    std::string toString() const;

    /**
     * Convert column string to integer
     * @param columnStr column string (letters only, any case)
     * @return zero-based column number
     */
    static int convertColumn(std::string_view columnStr);

    /**
     * Convert zero-based column index to its letters (0 -> "A", 26 -> "AA")
     * @param column zero-based column number
     * @return column letters
     */
    static std::string columnName(int column);

    /**
     * Check whether the text has the shape of an address ($?letters$?digits)
     * @param str text to check
     * @return true if it looks like an address
     */
    static bool looksLikeAddress(std::string_view str);
};

#endif /* SHEETCALC_CPOS_H */
