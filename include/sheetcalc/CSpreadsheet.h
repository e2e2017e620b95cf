#ifndef SHEETCALC_CSPREADSHEET_H
#define SHEETCALC_CSPREADSHEET_H

#include "sheetcalc/CAddressStore.h"
#include "sheetcalc/CCell.h"
#include "sheetcalc/CCellStyle.h"
#include "sheetcalc/CDispatchChannel.h"
#include "sheetcalc/CEngineLimits.h"
#include "sheetcalc/CEvaluator.h"
#include "sheetcalc/CGridContext.h"
#include "sheetcalc/CPos.h"
#include "sheetcalc/CValue.h"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

constexpr unsigned SHEETCALC_CYCLIC_DEPS = 0x01;
constexpr unsigned SHEETCALC_FUNCTIONS = 0x02;
constexpr unsigned SHEETCALC_STRUCTURAL_EDITS = 0x04;
constexpr unsigned SHEETCALC_SPEED = 0x08;
constexpr unsigned SHEETCALC_PARSER = 0x10;
constexpr unsigned SHEETCALC_DISPATCH = 0x20;

/**
 * Entries removed from every address store by a structural edit, in store order.
 */
using CBandSnapshot = std::vector<std::pair<CAddressStore *, std::unique_ptr<CAddressSlice>>>;

/**
 * Class representing a spreadsheet.
 *
 * The grid is bounded by its row and column count; cells and styles are sparse.
 * Rows and columns are zero-based.
 */
class CSpreadsheet : public CGridContext {
public:
    static constexpr int DEFAULT_ROWS = 100;
    static constexpr int DEFAULT_COLUMNS = 26;

    static unsigned capabilities() {
        return SHEETCALC_CYCLIC_DEPS | SHEETCALC_FUNCTIONS | SHEETCALC_STRUCTURAL_EDITS | SHEETCALC_SPEED
               | SHEETCALC_PARSER | SHEETCALC_DISPATCH;
    }

    /**
     * @param rows number of rows
     * @param columns number of columns
     * @param limits resource ceilings of the evaluator
     * @throws std::invalid_argument for negative dimensions
     */
    explicit CSpreadsheet(int rows = DEFAULT_ROWS, int columns = DEFAULT_COLUMNS, const CEngineLimits &limits = {});

    /**
     * Copies cells, styles, limits and the dispatch channel. Attached stores belong to
     * their owner and are not copied.
     */
    CSpreadsheet(const CSpreadsheet &other);

    CSpreadsheet &operator=(const CSpreadsheet &other);

    /**
     * Set the contents of the cell.
     * @param pos - position of the cell
     * @param contents - contents of the cell, empty contents clear it
     * @return - false if the position is outside the grid
     */
    bool setCell(CPos pos, std::string contents);

    /**
     * @param pos - position of the cell
     * @return - false if the position is outside the grid
     */
    bool clearCell(CPos pos);

    /**
     * Get the raw contents of the cell.
     * @param pos - position of the cell
     * @return - contents as set, empty for empty cells
     */
    std::string getCell(CPos pos) const;

    /**
     * Get the value of the cell.
     * @param pos - position of the cell
     * @return - value of the cell, #REF! outside the grid
     */
    CValue getValue(CPos pos);

    /**
     * Evaluate a formula that is not stored in any cell.
     * @param formula - formula text or literal
     * @return - value
     */
    CValue evaluate(const std::string &formula);

    bool setStyle(CPos pos, const CCellStyle &style);

    /**
     * @param pos - position of the cell
     * @return - style of the cell, default style if none is set
     */
    CCellStyle getStyle(CPos pos) const;

    /**
     * @param pos - position of the cell
     * @return - style of the cell, nullptr if none is set
     */
    const CCellStyle *findStyle(CPos pos) const;

    bool clearStyle(CPos pos);

    /**
     * Copy a rectangle of cells from one position to another. Relative references in copied
     * formulas move with the cells, styles are copied too. Overlapping rectangles are allowed.
     * @param dst - destination position
     * @param src - source position
     * @param w  - width
     * @param h  - height
     * @return - false if a rectangle does not fit into the grid
     */
    bool copyRect(CPos dst, CPos src, int w = 1, int h = 1);

    int rowCount() const { return m_Rows; }

    int columnCount() const { return m_Columns; }

    /**
     * @return true if the position lies inside the grid
     */
    bool contains(const CPos &pos) const;

    /**
     * Register an additional address-keyed store to be re-keyed by structural edits.
     * The store must outlive its registration.
     */
    void attachStore(CAddressStore &store);

    void detachStore(CAddressStore &store);

    void setDispatchChannel(std::shared_ptr<const CDispatchChannel> channel);

    const CEngineLimits &limits() const { return m_Limits; }

    void setLimits(const CEngineLimits &limits);

    const CAddressMap<CCell> &cells() const { return m_Cells; }

    const CAddressMap<CCellStyle> &styles() const { return m_Styles; }

    /**
     * Shift every store entry at index >= from on the axis by delta. Building block of the
     * structural edit commands.
     */
    void shiftStores(EAxis axis, int from, int delta);

    /**
     * Remove the band [first, first + count) on the axis from every store.
     * @return - removed entries, for restoreBand()
     */
    CBandSnapshot extractBand(EAxis axis, int first, int count);

    /**
     * Put entries returned by extractBand() back. Entries of stores detached in the
     * meantime are dropped.
     */
    void restoreBand(const CBandSnapshot &snapshot);

    /**
     * Change the grid dimensions. Store entries are not touched.
     * @throws std::invalid_argument for negative dimensions
     */
    void resize(int rows, int columns);

    CValue evaluateCell(int row, int column, CVisitedSet &visited) override;

    std::string getCellRaw(int row, int column) const override;

private:
    /**
     * Every store re-keyed by structural edits: cells, styles, then attached stores.
     */
    std::vector<CAddressStore *> stores();

    void invalidateCache();

    int m_Rows;
    int m_Columns;
    CEngineLimits m_Limits;
    CAddressMap<CCell> m_Cells;
    CAddressMap<CCellStyle> m_Styles;
    std::vector<CAddressStore *> m_AttachedStores;
    std::shared_ptr<const CDispatchChannel> m_Channel;
    /** Channel generation the cached values were computed against. */
    unsigned long long m_ChannelGeneration = 0;

    /**
     * Values of formula cells computed since the last mutation. Errors are not kept.
     */
    std::map<CPos, CValue> m_Cache;
    CEvaluator m_Evaluator;
};

#endif /* SHEETCALC_CSPREADSHEET_H */
