#include "sheetcalc/CDispatchChannel.h"

#include <exception>
#include <iostream>
#include <utility>

bool CDispatchChannel::registerHandler(std::string_view key, CDispatchHandler handler) {
    if (!handler)
        return false;
    if (!m_Handlers.emplace(toUpper(key), std::move(handler)).second)
        return false;
    ++m_Generation;
    return true;
}

bool CDispatchChannel::unregisterHandler(std::string_view key) {
    if (m_Handlers.erase(toUpper(key)) == 0)
        return false;
    ++m_Generation;
    return true;
}

bool CDispatchChannel::hasHandler(std::string_view key) const {
    return m_Handlers.count(toUpper(key)) != 0;
}

std::vector<std::string> CDispatchChannel::listOperations() const {
    std::vector<std::string> keys;
    keys.reserve(m_Handlers.size());
    for (const auto &[key, handler]: m_Handlers)
        keys.push_back(key);
    return keys;
}

CValue CDispatchChannel::request(std::string_view key, const std::string &input) const {
    std::string normalized = toUpper(key);
    auto it = m_Handlers.find(normalized);
    if (it == m_Handlers.end())
        return CError(ECellError::UnknownOperation);

    try {
        return normalizeValue(it->second(input, normalized));
    } catch (const std::exception &e) {
        std::cerr << "Dispatch handler '" << normalized << "' failed: " << e.what() << std::endl;
        return CError(ECellError::Generic);
    } catch (...) {
        std::cerr << "Dispatch handler '" << normalized << "' failed: unknown exception" << std::endl;
        return CError(ECellError::Generic);
    }
}
