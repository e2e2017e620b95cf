#undef NDEBUG

#include "sheetcalc/CCommand.h"
#include "sheetcalc/CUndoStack.h"
#include "TestSupport.h"

#include <cassert>
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Everything a structural edit may touch, for before/after comparisons.
 */
struct CSnapshot {
    int m_Rows;
    int m_Columns;
    std::map<CPos, std::string> m_Cells;
    std::map<CPos, CCellStyle> m_Styles;
    std::map<CPos, std::string> m_Notes;

    bool operator==(const CSnapshot &rhs) const {
        return m_Rows == rhs.m_Rows && m_Columns == rhs.m_Columns && m_Cells == rhs.m_Cells
               && m_Styles == rhs.m_Styles && m_Notes == rhs.m_Notes;
    }
};

static CSnapshot snapshot(const CSpreadsheet &sheet, const CAddressMap<std::string> &notes) {
    CSnapshot result{sheet.rowCount(), sheet.columnCount(), {}, sheet.styles().data(), notes.data()};
    for (const auto &[pos, cell]: sheet.cells().data())
        result.m_Cells[pos] = cell.raw();
    return result;
}

static CCellStyle boldStyle(const std::string &background) {
    CCellStyle style;
    style.m_Bold = true;
    style.m_Background = background;
    return style;
}

template<typename TFunction>
bool throwsInvalidArgument(TFunction function) {
    try {
        function();
    } catch (const std::invalid_argument &) {
        return true;
    }
    return false;
}

static void fill(CSpreadsheet &sheet, CAddressMap<std::string> &notes) {
    sheet.setCell(CPos("A1"), "10");
    sheet.setCell(CPos("B2"), "=A1*2");
    sheet.setCell(CPos("C3"), "text");
    sheet.setCell(CPos("D4"), "=SUM(A1:C3)");
    sheet.setCell(CPos("E10"), "5");
    sheet.setStyle(CPos("A1"), boldStyle("#ff0000"));
    sheet.setStyle(CPos("B2"), boldStyle("#00ff00"));
    sheet.setStyle(CPos("E10"), boldStyle("#0000ff"));
    notes.set(CPos("B2"), "check this");
    notes.set(CPos("C3"), "label");
    notes.set(CPos("E10"), "last");
}

int main() {
    // inserted rows push the style of (1, 1) down to (3, 1)
    {
        CSpreadsheet sheet(10, 10);
        sheet.setStyle(CPos(1, 1), boldStyle("#123456"));
        CInsertRowsCommand insert(sheet, 1, 2);
        assert(insert.text() == "Insert 2 Rows");
        insert.redo();
        assert(sheet.rowCount() == 12);
        assert(sheet.findStyle(CPos(1, 1)) == nullptr);
        assert(sheet.findStyle(CPos(3, 1)) && sheet.findStyle(CPos(3, 1))->m_Background == "#123456");
        insert.undo();
        assert(sheet.rowCount() == 10);
        assert(sheet.findStyle(CPos(3, 1)) == nullptr);
        assert(sheet.getStyle(CPos(1, 1)) == boldStyle("#123456"));
    }

    // contents, styles and attached stores travel together
    {
        CSpreadsheet sheet(20, 10);
        CAddressMap<std::string> notes;
        sheet.attachStore(notes);
        fill(sheet, notes);

        CRemoveColumnsCommand remove(sheet, 1, 2);
        assert(remove.text() == "Remove 2 Columns");
        remove.redo();
        assert(sheet.columnCount() == 8);
        assert(sheet.getCell(CPos("A1")) == "10");
        assert(sheet.getCell(CPos("B4")) == "=SUM(A1:C3)");
        assert(sheet.getCell(CPos("C10")) == "5");
        assert(sheet.getCell(CPos("B2")).empty());
        assert(sheet.getStyle(CPos("C10")) == boldStyle("#0000ff"));
        assert(sheet.findStyle(CPos("B2")) == nullptr);
        assert(notes.size() == 1 && *notes.find(CPos("C10")) == "last");
        remove.undo();
        assert(*notes.find(CPos("B2")) == "check this");
        assert(sheet.getCell(CPos("B2")) == "=A1*2");
        assert(sheet.getStyle(CPos("B2")) == boldStyle("#00ff00"));

        CInsertColumnsCommand insert(sheet, 0, 3);
        assert(insert.text() == "Insert 3 Columns");
        insert.redo();
        assert(sheet.columnCount() == 13);
        assert(sheet.getCell(CPos("D1")) == "10");
        assert(*notes.find(CPos("F3")) == "label");
        insert.undo();
        assert(sheet.getCell(CPos("A1")) == "10");
        sheet.detachStore(notes);
    }

    // redo followed by undo is the identity, alone and composed
    {
        CSpreadsheet sheet(20, 10);
        CAddressMap<std::string> notes;
        sheet.attachStore(notes);
        fill(sheet, notes);
        const CSnapshot before = snapshot(sheet, notes);
        const CValue sumBefore = sheet.getValue(CPos("D4"));
        assert(valueMatch(sumBefore, CValue(30.0)));

        std::vector<std::function<std::unique_ptr<CCommand>()>> factories{
                [&] { return std::make_unique<CInsertRowsCommand>(sheet, 0, 1); },
                [&] { return std::make_unique<CInsertRowsCommand>(sheet, 3, 4); },
                [&] { return std::make_unique<CInsertRowsCommand>(sheet, 20, 2); },
                [&] { return std::make_unique<CRemoveRowsCommand>(sheet, 0, 1); },
                [&] { return std::make_unique<CRemoveRowsCommand>(sheet, 1, 3); },
                [&] { return std::make_unique<CRemoveRowsCommand>(sheet, 9, 11); },
                [&] { return std::make_unique<CInsertColumnsCommand>(sheet, 2, 1); },
                [&] { return std::make_unique<CInsertColumnsCommand>(sheet, 10, 5); },
                [&] { return std::make_unique<CRemoveColumnsCommand>(sheet, 0, 4); },
                [&] { return std::make_unique<CRemoveColumnsCommand>(sheet, 4, 6); },
                [&] { return std::make_unique<CSetCellCommand>(sheet, CPos("A1"), "=B2"); },
                [&] { return std::make_unique<CSetCellCommand>(sheet, CPos("F6"), "new"); },
                [&] { return std::make_unique<CSetCellCommand>(sheet, CPos("C3"), ""); },
                [&] { return std::make_unique<CSetStyleCommand>(sheet, CPos("A1"), boldStyle("#abcdef")); },
                [&] { return std::make_unique<CSetStyleCommand>(sheet, CPos("B2"), std::nullopt); },
                [&] { return std::make_unique<CSetStyleCommand>(sheet, CPos("J20"), CCellStyle()); },
                [&] { return std::make_unique<CCopyRectCommand>(sheet, CPos("B1"), CPos("A1"), 3, 4); },
                [&] { return std::make_unique<CCopyRectCommand>(sheet, CPos("E8"), CPos("D4"), 2, 3); },
        };

        for (const auto &factory: factories) {
            std::unique_ptr<CCommand> command = factory();
            command->redo();
            command->undo();
            assert(snapshot(sheet, notes) == before);
            command->redo();
            command->undo();
            assert(snapshot(sheet, notes) == before);
            assert(valueMatch(sheet.getValue(CPos("D4")), sumBefore));
        }

        // composed: apply everything in order, undo in reverse
        std::vector<std::unique_ptr<CCommand>> applied;
        std::vector<CSnapshot> history;
        for (const auto &factory: factories) {
            history.push_back(snapshot(sheet, notes));
            try {
                applied.push_back(factory());
            } catch (const std::invalid_argument &) {
                history.pop_back();
                continue;
            }
            applied.back()->redo();
        }
        while (!applied.empty()) {
            applied.back()->undo();
            applied.pop_back();
            assert(snapshot(sheet, notes) == history.back());
            history.pop_back();
        }
        assert(snapshot(sheet, notes) == before);
        assert(valueMatch(sheet.getValue(CPos("D4")), sumBefore));
        assert(valueMatch(sheet.getValue(CPos("B2")), CValue(20.0)));
    }

    // formulas keep their text, references are not rewritten
    {
        CSpreadsheet sheet(10, 10);
        sheet.setCell(CPos("A1"), "1");
        sheet.setCell(CPos("A2"), "=A1+1");
        assert(valueMatch(sheet.getValue(CPos("A2")), CValue(2.0)));
        CInsertRowsCommand insert(sheet, 0, 1);
        insert.redo();
        assert(sheet.getCell(CPos("A3")) == "=A1+1");
        assert(valueMatch(sheet.getValue(CPos("A3")), CValue(1.0)));
        insert.undo();
        assert(valueMatch(sheet.getValue(CPos("A2")), CValue(2.0)));
    }

    // invalid arguments
    {
        CSpreadsheet sheet(10, 5);
        assert(throwsInvalidArgument([&] { CInsertRowsCommand(sheet, -1, 1); }));
        assert(throwsInvalidArgument([&] { CInsertRowsCommand(sheet, 0, 0); }));
        assert(throwsInvalidArgument([&] { CInsertRowsCommand(sheet, 11, 1); }));
        assert(throwsInvalidArgument([&] { CInsertColumnsCommand(sheet, 6, 1); }));
        assert(throwsInvalidArgument([&] { CRemoveRowsCommand(sheet, 0, -2); }));
        assert(throwsInvalidArgument([&] { CRemoveRowsCommand(sheet, 5, 6); }));
        assert(throwsInvalidArgument([&] { CRemoveColumnsCommand(sheet, 5, 1); }));
        assert(throwsInvalidArgument([&] { CSetCellCommand(sheet, CPos("F1"), "x"); }));
        assert(throwsInvalidArgument([&] { CSetStyleCommand(sheet, CPos("A11"), std::nullopt); }));
        assert(throwsInvalidArgument([&] { CCopyRectCommand(sheet, CPos("D1"), CPos("A1"), 3, 1); }));
        assert(throwsInvalidArgument([&] { CCopyRectCommand(sheet, CPos("A1"), CPos("A1"), 0, 1); }));

        CRemoveRowsCommand whole(sheet, 0, 10);
        whole.redo();
        assert(sheet.rowCount() == 0);
        whole.undo();
        assert(sheet.rowCount() == 10);

        CAddressMap<int> store;
        store.set(CPos(2, 2), 7);
        assert(throwsInvalidArgument([&] { store.shift(EAxis::Row, 1, -3); }));
        assert(*store.find(CPos(2, 2)) == 7);
    }

    // undo history
    {
        CSpreadsheet sheet(10, 10);
        CUndoStack stack;
        assert(!stack.canUndo() && !stack.canRedo());
        assert(!stack.undo() && !stack.redo());
        assert(stack.undoText().empty() && stack.redoText().empty());
        assert(throwsInvalidArgument([&] { stack.push(nullptr); }));

        stack.push(std::make_unique<CSetCellCommand>(sheet, CPos("B3"), "=1+1"));
        assert(valueMatch(sheet.getValue(CPos("B3")), CValue(2.0)));
        assert(stack.undoText() == "Edit Cell B3");
        stack.push(std::make_unique<CInsertRowsCommand>(sheet, 0, 2));
        assert(valueMatch(sheet.getValue(CPos("B5")), CValue(2.0)));
        stack.push(std::make_unique<CSetStyleCommand>(sheet, CPos("B5"), boldStyle("#000000")));
        assert(stack.count() == 3 && stack.index() == 3);
        assert(stack.undoText() == "Format Cell B5");

        assert(stack.undo());
        assert(sheet.findStyle(CPos("B5")) == nullptr);
        assert(stack.undo());
        assert(stack.redoText() == "Insert 2 Rows");
        assert(sheet.rowCount() == 10);
        assert(sheet.getCell(CPos("B3")) == "=1+1");
        assert(stack.redo());
        assert(sheet.getCell(CPos("B5")) == "=1+1");
        assert(stack.undo());
        assert(stack.canRedo() && stack.index() == 1);

        // a new command drops the redo tail
        stack.push(std::make_unique<CRemoveColumnsCommand>(sheet, 0, 1));
        assert(!stack.canRedo());
        assert(stack.count() == 2);
        assert(sheet.getCell(CPos("A3")) == "=1+1");
        assert(stack.undo() && stack.undo());
        assert(!stack.canUndo());
        assert(sheet.getCell(CPos("B3")).empty());
        assert(sheet.columnCount() == 10);

        stack.clear();
        assert(stack.count() == 0 && stack.index() == 0);
    }

    return EXIT_SUCCESS;
}
