#ifndef SHEETCALC_CADDRESSSTORE_H
#define SHEETCALC_CADDRESSSTORE_H

#include "sheetcalc/CPos.h"

#include <map>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

/**
 * Grid axis a structural edit works on.
 */
enum class EAxis {
    Row,
    Column
};

/**
 * Entries cut out of a store, kept by a command for undo.
 */
class CAddressSlice {
public:
    virtual ~CAddressSlice() = default;

    virtual size_t size() const = 0;
};

/**
 * Any metadata keyed by cell address. Structural edits re-key every registered store,
 * so styles, notes or cell contents stay attached to the cell they describe.
 */
class CAddressStore {
public:
    virtual ~CAddressStore() = default;

    /**
     * @return every key currently in the store, row-major
     */
    virtual std::vector<CPos> keys() const = 0;

    /**
     * Move every entry whose index on the axis is >= from by delta.
     * @param axis row or column
     * @param from first index that moves
     * @param delta signed distance
     */
    virtual void shift(EAxis axis, int from, int delta) = 0;

    /**
     * Remove and return the entries whose index on the axis lies in [first, first + count).
     * @param axis row or column
     * @param first first index of the band
     * @param count band width
     * @return removed entries
     */
    virtual std::unique_ptr<CAddressSlice> extract(EAxis axis, int first, int count) = 0;

    /**
     * Put previously extracted entries back at their original keys.
     * @param slice result of extract() on this store
     */
    virtual void restore(const CAddressSlice &slice) = 0;
};

/**
 * Address store kept in an ordered map.
 * @tparam T value stored for each address
 */
template<typename T>
class CAddressMap : public CAddressStore {
public:
    class CSlice : public CAddressSlice {
    public:
        explicit CSlice(std::map<CPos, T> entries) : m_Entries(std::move(entries)) {}

        size_t size() const override { return m_Entries.size(); }

        const std::map<CPos, T> &entries() const { return m_Entries; }

    private:
        std::map<CPos, T> m_Entries;
    };

    std::vector<CPos> keys() const override {
        std::vector<CPos> result;
        result.reserve(m_Data.size());
        for (const auto &[pos, value]: m_Data)
            result.push_back(pos);
        return result;
    }

    void shift(EAxis axis, int from, int delta) override {
        if (delta == 0)
            return;
        for (const auto &[pos, value]: m_Data) {
            int index = axis == EAxis::Row ? pos.m_Row : pos.m_Column;
            if (index >= from && index + delta < 0)
                throw std::invalid_argument("Shift moves an entry before the first row or column");
        }

        // rebuild, shifting in place could collide with entries not yet moved
        std::map<CPos, T> shifted;
        for (auto &[pos, value]: m_Data) {
            CPos target = pos;
            int &index = axis == EAxis::Row ? target.m_Row : target.m_Column;
            if (index >= from)
                index += delta;
            shifted.insert_or_assign(target, std::move(value));
        }
        m_Data = std::move(shifted);
    }

    std::unique_ptr<CAddressSlice> extract(EAxis axis, int first, int count) override {
        std::map<CPos, T> removed;
        for (auto it = m_Data.begin(); it != m_Data.end();) {
            int index = axis == EAxis::Row ? it->first.m_Row : it->first.m_Column;
            if (index >= first && index < first + count) {
                removed.emplace(it->first, std::move(it->second));
                it = m_Data.erase(it);
            } else {
                ++it;
            }
        }
        return std::make_unique<CSlice>(std::move(removed));
    }

    void restore(const CAddressSlice &slice) override {
        const auto &entries = dynamic_cast<const CSlice &>(slice).entries();
        for (const auto &[pos, value]: entries)
            m_Data.insert_or_assign(pos, value);
    }

    T *find(const CPos &pos) {
        auto it = m_Data.find(pos);
        return it == m_Data.end() ? nullptr : &it->second;
    }

    const T *find(const CPos &pos) const {
        auto it = m_Data.find(pos);
        return it == m_Data.end() ? nullptr : &it->second;
    }

    void set(const CPos &pos, T value) {
        m_Data.insert_or_assign(pos, std::move(value));
    }

    bool erase(const CPos &pos) {
        return m_Data.erase(pos) != 0;
    }

    void clear() { m_Data.clear(); }

    size_t size() const { return m_Data.size(); }

    bool empty() const { return m_Data.empty(); }

    const std::map<CPos, T> &data() const { return m_Data; }

private:
    std::map<CPos, T> m_Data;
};

#endif /* SHEETCALC_CADDRESSSTORE_H */
