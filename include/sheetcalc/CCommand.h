#ifndef SHEETCALC_CCOMMAND_H
#define SHEETCALC_CCOMMAND_H

#include "sheetcalc/CAddressStore.h"
#include "sheetcalc/CCellStyle.h"
#include "sheetcalc/CPos.h"
#include "sheetcalc/CSpreadsheet.h"

#include <map>
#include <optional>
#include <string>

/**
 * Reversible edit of a spreadsheet. redo() followed by undo() leaves the grid and every
 * address store exactly as before.
 */
class CCommand {
public:
    virtual ~CCommand() = default;

    virtual void redo() = 0;

    virtual void undo() = 0;

    /**
     * @return short description for an undo menu
     */
    const std::string &text() const { return m_Text; }

protected:
    CCommand(CSpreadsheet &sheet, std::string text);

    CSpreadsheet &m_Sheet;
    std::string m_Text;
};

/**
 * Insert count empty rows or columns before position.
 */
class CInsertCommand : public CCommand {
public:
    /**
     * @throws std::invalid_argument for a negative position, a non-positive count or a
     *         position past the end of the grid
     */
    CInsertCommand(CSpreadsheet &sheet, EAxis axis, int position, int count);

    void redo() override;

    void undo() override;

private:
    EAxis m_Axis;
    int m_Position;
    int m_Count;
};

/**
 * Remove count rows or columns starting at position.
 */
class CRemoveCommand : public CCommand {
public:
    /**
     * @throws std::invalid_argument for a negative position, a non-positive count or a
     *         band reaching past the end of the grid
     */
    CRemoveCommand(CSpreadsheet &sheet, EAxis axis, int position, int count);

    void redo() override;

    void undo() override;

private:
    EAxis m_Axis;
    int m_Position;
    int m_Count;

    /**
     * Entries of the removed band, filled by redo().
     */
    CBandSnapshot m_Removed;
};

class CInsertRowsCommand : public CInsertCommand {
public:
    CInsertRowsCommand(CSpreadsheet &sheet, int position, int count)
            : CInsertCommand(sheet, EAxis::Row, position, count) {}
};

class CRemoveRowsCommand : public CRemoveCommand {
public:
    CRemoveRowsCommand(CSpreadsheet &sheet, int position, int count)
            : CRemoveCommand(sheet, EAxis::Row, position, count) {}
};

class CInsertColumnsCommand : public CInsertCommand {
public:
    CInsertColumnsCommand(CSpreadsheet &sheet, int position, int count)
            : CInsertCommand(sheet, EAxis::Column, position, count) {}
};

class CRemoveColumnsCommand : public CRemoveCommand {
public:
    CRemoveColumnsCommand(CSpreadsheet &sheet, int position, int count)
            : CRemoveCommand(sheet, EAxis::Column, position, count) {}
};

/**
 * Change the contents of one cell.
 */
class CSetCellCommand : public CCommand {
public:
    /**
     * @throws std::invalid_argument if the position is outside the grid
     */
    CSetCellCommand(CSpreadsheet &sheet, CPos pos, std::string contents);

    void redo() override;

    void undo() override;

private:
    CPos m_Pos;
    std::string m_Contents;
    std::string m_Previous;
};

/**
 * Set or clear the style of one cell.
 */
class CSetStyleCommand : public CCommand {
public:
    /**
     * @param style new style, nullopt removes the style
     * @throws std::invalid_argument if the position is outside the grid
     */
    CSetStyleCommand(CSpreadsheet &sheet, CPos pos, std::optional<CCellStyle> style);

    void redo() override;

    void undo() override;

private:
    void apply(const std::optional<CCellStyle> &style);

    CPos m_Pos;
    std::optional<CCellStyle> m_Style;
    std::optional<CCellStyle> m_Previous;
};

/**
 * Copy a rectangle with reference adjustment, see CSpreadsheet::copyRect.
 */
class CCopyRectCommand : public CCommand {
public:
    /**
     * @throws std::invalid_argument if a rectangle does not fit into the grid
     */
    CCopyRectCommand(CSpreadsheet &sheet, CPos dst, CPos src, int w = 1, int h = 1);

    void redo() override;

    void undo() override;

private:
    CPos m_Dst;
    CPos m_Src;
    int m_Width;
    int m_Height;

    /**
     * Destination contents and styles before the copy.
     */
    std::map<CPos, std::string> m_PreviousCells;
    std::map<CPos, CCellStyle> m_PreviousStyles;
};

#endif /* SHEETCALC_CCOMMAND_H */
