#include "sheetcalc/CSpreadsheet.h"

#include "sheetcalc/CReferenceAdjuster.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

CSpreadsheet::CSpreadsheet(int rows, int columns, const CEngineLimits &limits)
        : m_Rows(rows), m_Columns(columns), m_Limits(limits), m_Evaluator(*this, m_Limits) {
    if (rows < 0 || columns < 0)
        throw std::invalid_argument("Spreadsheet dimensions must not be negative");
}

CSpreadsheet::CSpreadsheet(const CSpreadsheet &other)
        : m_Rows(other.m_Rows), m_Columns(other.m_Columns), m_Limits(other.m_Limits), m_Cells(other.m_Cells),
          m_Styles(other.m_Styles), m_Channel(other.m_Channel), m_Evaluator(*this, m_Limits) {
    m_Evaluator.setDispatchChannel(m_Channel);
}

CSpreadsheet &CSpreadsheet::operator=(const CSpreadsheet &other) {
    if (this == &other)
        return *this;
    m_Rows = other.m_Rows;
    m_Columns = other.m_Columns;
    m_Cells = other.m_Cells;
    m_Styles = other.m_Styles;
    m_Channel = other.m_Channel;
    // the evaluator stays bound to this grid
    setLimits(other.m_Limits);
    m_Evaluator.setDispatchChannel(m_Channel);
    invalidateCache();
    return *this;
}

bool CSpreadsheet::setCell(CPos pos, std::string contents) {
    if (!contains(pos))
        return false;

    CPos key(pos.m_Row, pos.m_Column);
    if (contents.empty()) {
        m_Cells.erase(key);
    } else {
        CCell cell(std::move(contents));
        if (cell.hasParseError())
            std::cerr << "Invalid formula in " << key.toString() << ": " << cell.raw() << std::endl;
        m_Cells.set(key, std::move(cell));
    }
    invalidateCache();
    return true;
}

bool CSpreadsheet::clearCell(CPos pos) {
    return setCell(pos, std::string());
}

std::string CSpreadsheet::getCell(CPos pos) const {
    return getCellRaw(pos.m_Row, pos.m_Column);
}

CValue CSpreadsheet::getValue(CPos pos) {
    CVisitedSet visited;
    return evaluateCell(pos.m_Row, pos.m_Column, visited);
}

CValue CSpreadsheet::evaluate(const std::string &formula) {
    CVisitedSet visited;
    return m_Evaluator.evaluate(formula, visited);
}

bool CSpreadsheet::setStyle(CPos pos, const CCellStyle &style) {
    if (!contains(pos))
        return false;
    m_Styles.set(CPos(pos.m_Row, pos.m_Column), style);
    return true;
}

CCellStyle CSpreadsheet::getStyle(CPos pos) const {
    const CCellStyle *style = findStyle(pos);
    return style ? *style : CCellStyle();
}

const CCellStyle *CSpreadsheet::findStyle(CPos pos) const {
    return m_Styles.find(pos);
}

bool CSpreadsheet::clearStyle(CPos pos) {
    if (!contains(pos))
        return false;
    m_Styles.erase(pos);
    return true;
}

bool CSpreadsheet::copyRect(CPos dst, CPos src, int w, int h) {
    auto fits = [this, w, h](const CPos &corner) {
        return contains(corner) && static_cast<long long>(corner.m_Row) + h <= m_Rows
               && static_cast<long long>(corner.m_Column) + w <= m_Columns;
    };
    if (w <= 0 || h <= 0 || !fits(src) || !fits(dst))
        return false;

    // Calculate offset between source and destination
    int rowOffset = dst.m_Row - src.m_Row;
    int columnOffset = dst.m_Column - src.m_Column;

    // read the whole source first, the rectangles may overlap
    std::map<CPos, std::string> newCells;
    std::map<CPos, CCellStyle> newStyles;
    std::vector<CPos> clearedStyles;
    for (int x = 0; x < w; x++) {
        for (int y = 0; y < h; y++) {
            CPos srcPos(src.m_Row + y, src.m_Column + x);
            CPos dstPos(dst.m_Row + y, dst.m_Column + x);

            const CCell *cell = m_Cells.find(srcPos);
            newCells[dstPos] = cell ? CReferenceAdjuster::adjust(cell->raw(), rowOffset, columnOffset)
                                    : std::string();

            if (const CCellStyle *style = m_Styles.find(srcPos))
                newStyles[dstPos] = *style;
            else
                clearedStyles.push_back(dstPos);
        }
    }

    for (auto &[pos, contents]: newCells) {
        if (contents.empty())
            m_Cells.erase(pos);
        else
            m_Cells.set(pos, CCell(std::move(contents)));
    }
    for (const CPos &pos: clearedStyles)
        m_Styles.erase(pos);
    for (auto &[pos, style]: newStyles)
        m_Styles.set(pos, std::move(style));

    invalidateCache();
    return true;
}

bool CSpreadsheet::contains(const CPos &pos) const {
    return pos.m_Row >= 0 && pos.m_Row < m_Rows && pos.m_Column >= 0 && pos.m_Column < m_Columns;
}

void CSpreadsheet::attachStore(CAddressStore &store) {
    if (std::find(m_AttachedStores.begin(), m_AttachedStores.end(), &store) == m_AttachedStores.end())
        m_AttachedStores.push_back(&store);
}

void CSpreadsheet::detachStore(CAddressStore &store) {
    m_AttachedStores.erase(std::remove(m_AttachedStores.begin(), m_AttachedStores.end(), &store),
                           m_AttachedStores.end());
}

void CSpreadsheet::setDispatchChannel(std::shared_ptr<const CDispatchChannel> channel) {
    m_Channel = std::move(channel);
    m_Evaluator.setDispatchChannel(m_Channel);
    invalidateCache();
}

void CSpreadsheet::setLimits(const CEngineLimits &limits) {
    m_Limits = limits;
    m_Evaluator.setLimits(limits);
    invalidateCache();
}

void CSpreadsheet::shiftStores(EAxis axis, int from, int delta) {
    for (CAddressStore *store: stores())
        store->shift(axis, from, delta);
    invalidateCache();
}

CBandSnapshot CSpreadsheet::extractBand(EAxis axis, int first, int count) {
    CBandSnapshot snapshot;
    for (CAddressStore *store: stores())
        snapshot.emplace_back(store, store->extract(axis, first, count));
    invalidateCache();
    return snapshot;
}

void CSpreadsheet::restoreBand(const CBandSnapshot &snapshot) {
    std::vector<CAddressStore *> current = stores();
    for (const auto &[store, slice]: snapshot)
        if (std::find(current.begin(), current.end(), store) != current.end())
            store->restore(*slice);
    invalidateCache();
}

void CSpreadsheet::resize(int rows, int columns) {
    if (rows < 0 || columns < 0)
        throw std::invalid_argument("Spreadsheet dimensions must not be negative");
    m_Rows = rows;
    m_Columns = columns;
    invalidateCache();
}

CValue CSpreadsheet::evaluateCell(int row, int column, CVisitedSet &visited) {
    CPos pos(row, column);
    if (!contains(pos))
        return CError(ECellError::Reference);
    if (visited.count(pos))
        return CError(ECellError::Cycle);

    // nested reads always recompute, the guards must see the whole dependency chain
    bool topLevel = m_Evaluator.context().m_Depth == 0;
    if (topLevel) {
        // handlers registered or removed since the values were cached
        if (m_Channel && m_Channel->generation() != m_ChannelGeneration) {
            invalidateCache();
            m_ChannelGeneration = m_Channel->generation();
        }
        auto cached = m_Cache.find(pos);
        if (cached != m_Cache.end())
            return cached->second;
    }

    const CCell *cell = m_Cells.find(pos);
    if (!cell)
        return std::monostate{};
    if (!cell->isFormula())
        return cell->literal();
    if (cell->hasParseError())
        return CError(ECellError::Parse);

    COperationPtr expression = cell->expression();
    if (!expression)
        return std::monostate{};

    visited.insert(pos);
    CValue result = m_Evaluator.evaluate(*expression, visited);
    visited.erase(pos);

    if (topLevel && !isError(result))
        m_Cache[pos] = result;
    return result;
}

std::string CSpreadsheet::getCellRaw(int row, int column) const {
    const CCell *cell = m_Cells.find(CPos(row, column));
    return cell ? cell->raw() : std::string();
}

std::vector<CAddressStore *> CSpreadsheet::stores() {
    std::vector<CAddressStore *> result{&m_Cells, &m_Styles};
    result.insert(result.end(), m_AttachedStores.begin(), m_AttachedStores.end());
    return result;
}

void CSpreadsheet::invalidateCache() {
    m_Cache.clear();
}
