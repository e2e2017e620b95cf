#ifndef SHEETCALC_CCELLSTYLE_H
#define SHEETCALC_CCELLSTYLE_H

#include <string>

enum class EAlignment {
    General,
    Left,
    Center,
    Right
};

/**
 * Presentation attributes of a cell. Kept in an address store of the spreadsheet,
 * independent of the cell contents.
 */
struct CCellStyle {
    /**
     * Colors as "#rrggbb", empty means the default.
     */
    std::string m_Background;
    std::string m_Foreground;
    EAlignment m_Alignment = EAlignment::General;
    bool m_Bold = false;
    bool m_Italic = false;
    bool m_BorderTop = false;
    bool m_BorderBottom = false;
    bool m_BorderLeft = false;
    bool m_BorderRight = false;

    bool operator==(const CCellStyle &rhs) const = default;
};

#endif /* SHEETCALC_CCELLSTYLE_H */
