#include "sheetcalc/CFunctionRegistry.h"

#include <cstdint>
#include <utility>

size_t CFunctionInfo::minArguments() const {
    size_t count = 0;
    for (const auto &argument: m_Arguments)
        if (!argument.m_Optional)
            ++count;
    return count;
}

size_t CFunctionInfo::maxArguments() const {
    return m_Variadic ? SIZE_MAX : m_Arguments.size();
}

CFunctionRegistry &CFunctionRegistry::instance() {
    static CFunctionRegistry registry;
    return registry;
}

CFunctionRegistry::CFunctionRegistry(bool withBuiltins) {
    if (withBuiltins)
        registerBuiltinFunctions(*this);
}

bool CFunctionRegistry::registerFunction(CFunctionInfo info, CFunction function) {
    if (info.m_Name.empty() || !function)
        return false;

    std::string key = toUpper(info.m_Name);
    if (m_Functions.count(key))
        return false;

    info.m_Name = key;
    m_Functions.emplace(std::move(key), CEntry{std::move(info), std::move(function)});
    return true;
}

const CFunction *CFunctionRegistry::find(std::string_view name) const {
    auto it = m_Functions.find(toUpper(name));
    if (it == m_Functions.end())
        return nullptr;
    return &it->second.m_Function;
}

const CFunctionInfo *CFunctionRegistry::getMetadata(std::string_view name) const {
    auto it = m_Functions.find(toUpper(name));
    if (it == m_Functions.end())
        return nullptr;
    return &it->second.m_Info;
}

std::vector<CFunctionInfo> CFunctionRegistry::getAllMetadata() const {
    // std::map keeps the names sorted
    std::vector<CFunctionInfo> result;
    result.reserve(m_Functions.size());
    for (const auto &[name, entry]: m_Functions)
        result.push_back(entry.m_Info);
    return result;
}

bool CFunctionRegistry::contains(std::string_view name) const {
    return m_Functions.count(toUpper(name)) != 0;
}
