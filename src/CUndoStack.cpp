#include "sheetcalc/CUndoStack.h"

#include <stdexcept>
#include <utility>

void CUndoStack::push(std::unique_ptr<CCommand> command) {
    if (!command)
        throw std::invalid_argument("Cannot push an empty command");

    command->redo();
    m_Commands.resize(m_Index);
    m_Commands.push_back(std::move(command));
    m_Index = m_Commands.size();
}

bool CUndoStack::undo() {
    if (!canUndo())
        return false;
    m_Commands[--m_Index]->undo();
    return true;
}

bool CUndoStack::redo() {
    if (!canRedo())
        return false;
    m_Commands[m_Index++]->redo();
    return true;
}

bool CUndoStack::canUndo() const {
    return m_Index > 0;
}

bool CUndoStack::canRedo() const {
    return m_Index < m_Commands.size();
}

std::string CUndoStack::undoText() const {
    return canUndo() ? m_Commands[m_Index - 1]->text() : std::string();
}

std::string CUndoStack::redoText() const {
    return canRedo() ? m_Commands[m_Index]->text() : std::string();
}

void CUndoStack::clear() {
    m_Commands.clear();
    m_Index = 0;
}
