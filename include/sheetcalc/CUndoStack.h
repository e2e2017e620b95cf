#ifndef SHEETCALC_CUNDOSTACK_H
#define SHEETCALC_CUNDOSTACK_H

#include "sheetcalc/CCommand.h"

#include <memory>
#include <string>
#include <vector>

/**
 * Linear undo history. Pushing a command executes it and discards everything that
 * could still be redone.
 */
class CUndoStack {
public:
    /**
     * Execute the command and record it.
     * @param command command to run, must not be nullptr
     */
    void push(std::unique_ptr<CCommand> command);

    /**
     * Undo the last executed command.
     * @return false if there is nothing to undo
     */
    bool undo();

    /**
     * Execute the last undone command again.
     * @return false if there is nothing to redo
     */
    bool redo();

    bool canUndo() const;

    bool canRedo() const;

    /**
     * @return text of the command undo() would revert, empty if none
     */
    std::string undoText() const;

    /**
     * @return text of the command redo() would execute, empty if none
     */
    std::string redoText() const;

    size_t count() const { return m_Commands.size(); }

    /**
     * @return number of commands currently applied
     */
    size_t index() const { return m_Index; }

    void clear();

private:
    std::vector<std::unique_ptr<CCommand>> m_Commands;
    size_t m_Index = 0;
};

#endif /* SHEETCALC_CUNDOSTACK_H */
