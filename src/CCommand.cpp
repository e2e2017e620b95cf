#include "sheetcalc/CCommand.h"

#include <climits>
#include <stdexcept>
#include <utility>

namespace {
    int axisLength(const CSpreadsheet &sheet, EAxis axis) {
        return axis == EAxis::Row ? sheet.rowCount() : sheet.columnCount();
    }

    /**
     * Grow or shrink the grid along the axis.
     */
    void resizeAxis(CSpreadsheet &sheet, EAxis axis, int delta) {
        if (axis == EAxis::Row)
            sheet.resize(sheet.rowCount() + delta, sheet.columnCount());
        else
            sheet.resize(sheet.rowCount(), sheet.columnCount() + delta);
    }

    std::string describe(const char *verb, EAxis axis, int count) {
        return std::string(verb) + " " + std::to_string(count) + (axis == EAxis::Row ? " Rows" : " Columns");
    }
}

CCommand::CCommand(CSpreadsheet &sheet, std::string text) : m_Sheet(sheet), m_Text(std::move(text)) {}

CInsertCommand::CInsertCommand(CSpreadsheet &sheet, EAxis axis, int position, int count)
        : CCommand(sheet, describe("Insert", axis, count)), m_Axis(axis), m_Position(position), m_Count(count) {
    if (position < 0 || count <= 0)
        throw std::invalid_argument("Insert needs a non-negative position and a positive count");
    if (position > axisLength(sheet, axis))
        throw std::invalid_argument("Insert position is past the end of the grid");
    if (axisLength(sheet, axis) > INT_MAX - count)
        throw std::invalid_argument("Insert makes the grid too large");
}

void CInsertCommand::redo() {
    m_Sheet.shiftStores(m_Axis, m_Position, m_Count);
    resizeAxis(m_Sheet, m_Axis, m_Count);
}

void CInsertCommand::undo() {
    // anything left in the inserted band belongs to commands already undone
    m_Sheet.extractBand(m_Axis, m_Position, m_Count);
    m_Sheet.shiftStores(m_Axis, m_Position + m_Count, -m_Count);
    resizeAxis(m_Sheet, m_Axis, -m_Count);
}

CRemoveCommand::CRemoveCommand(CSpreadsheet &sheet, EAxis axis, int position, int count)
        : CCommand(sheet, describe("Remove", axis, count)), m_Axis(axis), m_Position(position), m_Count(count) {
    if (position < 0 || count <= 0)
        throw std::invalid_argument("Remove needs a non-negative position and a positive count");
    if (static_cast<long long>(position) + count > axisLength(sheet, axis))
        throw std::invalid_argument("Removed band reaches past the end of the grid");
}

void CRemoveCommand::redo() {
    m_Removed = m_Sheet.extractBand(m_Axis, m_Position, m_Count);
    m_Sheet.shiftStores(m_Axis, m_Position + m_Count, -m_Count);
    resizeAxis(m_Sheet, m_Axis, -m_Count);
}

void CRemoveCommand::undo() {
    resizeAxis(m_Sheet, m_Axis, m_Count);
    m_Sheet.shiftStores(m_Axis, m_Position, m_Count);
    m_Sheet.restoreBand(m_Removed);
    m_Removed.clear();
}

CSetCellCommand::CSetCellCommand(CSpreadsheet &sheet, CPos pos, std::string contents)
        : CCommand(sheet, "Edit Cell " + pos.toString()), m_Pos(pos.m_Row, pos.m_Column),
          m_Contents(std::move(contents)) {
    if (!sheet.contains(m_Pos))
        throw std::invalid_argument("Cell is outside the grid");
}

void CSetCellCommand::redo() {
    m_Previous = m_Sheet.getCell(m_Pos);
    m_Sheet.setCell(m_Pos, m_Contents);
}

void CSetCellCommand::undo() {
    m_Sheet.setCell(m_Pos, m_Previous);
}

CSetStyleCommand::CSetStyleCommand(CSpreadsheet &sheet, CPos pos, std::optional<CCellStyle> style)
        : CCommand(sheet, "Format Cell " + pos.toString()), m_Pos(pos.m_Row, pos.m_Column), m_Style(std::move(style)) {
    if (!sheet.contains(m_Pos))
        throw std::invalid_argument("Cell is outside the grid");
}

void CSetStyleCommand::redo() {
    const CCellStyle *current = m_Sheet.findStyle(m_Pos);
    m_Previous = current ? std::optional<CCellStyle>(*current) : std::nullopt;
    apply(m_Style);
}

void CSetStyleCommand::undo() {
    apply(m_Previous);
}

void CSetStyleCommand::apply(const std::optional<CCellStyle> &style) {
    if (style)
        m_Sheet.setStyle(m_Pos, *style);
    else
        m_Sheet.clearStyle(m_Pos);
}

CCopyRectCommand::CCopyRectCommand(CSpreadsheet &sheet, CPos dst, CPos src, int w, int h)
        : CCommand(sheet, "Copy " + src.toString() + " to " + dst.toString()), m_Dst(dst.m_Row, dst.m_Column),
          m_Src(src.m_Row, src.m_Column), m_Width(w), m_Height(h) {
    auto fits = [&sheet, w, h](const CPos &corner) {
        return sheet.contains(corner) && static_cast<long long>(corner.m_Row) + h <= sheet.rowCount()
               && static_cast<long long>(corner.m_Column) + w <= sheet.columnCount();
    };
    if (w <= 0 || h <= 0 || !fits(m_Src) || !fits(m_Dst))
        throw std::invalid_argument("Copied rectangle does not fit into the grid");
}

void CCopyRectCommand::redo() {
    m_PreviousCells.clear();
    m_PreviousStyles.clear();
    for (int y = 0; y < m_Height; y++) {
        for (int x = 0; x < m_Width; x++) {
            CPos pos(m_Dst.m_Row + y, m_Dst.m_Column + x);
            std::string raw = m_Sheet.getCell(pos);
            if (!raw.empty())
                m_PreviousCells.emplace(pos, std::move(raw));
            if (const CCellStyle *style = m_Sheet.findStyle(pos))
                m_PreviousStyles.emplace(pos, *style);
        }
    }
    m_Sheet.copyRect(m_Dst, m_Src, m_Width, m_Height);
}

void CCopyRectCommand::undo() {
    for (int y = 0; y < m_Height; y++) {
        for (int x = 0; x < m_Width; x++) {
            CPos pos(m_Dst.m_Row + y, m_Dst.m_Column + x);

            auto cell = m_PreviousCells.find(pos);
            m_Sheet.setCell(pos, cell != m_PreviousCells.end() ? cell->second : std::string());

            auto style = m_PreviousStyles.find(pos);
            if (style != m_PreviousStyles.end())
                m_Sheet.setStyle(pos, style->second);
            else
                m_Sheet.clearStyle(pos);
        }
    }
}
