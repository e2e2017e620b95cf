#ifndef SHEETCALC_CFUNCTIONREGISTRY_H
#define SHEETCALC_CFUNCTIONREGISTRY_H

#include "sheetcalc/CValue.h"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

class CEvaluator; // forward declaration

/**
 * Description of a single function parameter, shown by a formula wizard.
 */
struct CArgumentInfo {
    std::string m_Name;
    std::string m_Description;

    /**
     * Kind of value expected: "number", "str", "bool", "any" or "cipher" (an operation key
     * of the dispatch channel).
     */
    std::string m_TypeHint;
    bool m_Optional = false;
};

/**
 * Metadata of a registered function.
 */
struct CFunctionInfo {
    std::string m_Name;
    std::string m_Description;
    std::string m_Syntax;
    std::string m_Category;
    std::vector<CArgumentInfo> m_Arguments;

    /**
     * The last argument may repeat any number of times (SUM(a, b, ...)).
     */
    bool m_Variadic = false;

    /**
     * @return number of required arguments
     */
    size_t minArguments() const;

    /**
     * @return largest accepted argument count, SIZE_MAX for variadic functions
     */
    size_t maxArguments() const;
};

/**
 * Implementation of a function. Receives the live evaluator (for dispatch) and the
 * pre-evaluated arguments, ranges already resolved to their values.
 */
using CFunction = std::function<CValue(CEvaluator &, const std::vector<CArgument> &)>;

/**
 * Case-insensitive table of functions callable from formulas.
 *
 * Append-only: a name can be registered once and is never removed.
 */
class CFunctionRegistry {
public:
    /**
     * Process-wide registry, populated with the built-ins on first use.
     * @return shared instance
     */
    static CFunctionRegistry &instance();

    /**
     * @param withBuiltins register the built-in functions
     */
    explicit CFunctionRegistry(bool withBuiltins = true);

    /**
     * Register a function under the metadata name (stored uppercase).
     * @param info metadata, m_Name must not be empty
     * @param function implementation
     * @return false if the name is already registered or invalid
     */
    bool registerFunction(CFunctionInfo info, CFunction function);

    /**
     * Find a function by name in any letter case.
     * @param name function name
     * @return pointer to the implementation, nullptr if not registered
     */
    const CFunction *find(std::string_view name) const;

    /**
     * @param name function name in any letter case
     * @return pointer to the metadata, nullptr if not registered
     */
    const CFunctionInfo *getMetadata(std::string_view name) const;

    /**
     * @return metadata of every function, sorted by name
     */
    std::vector<CFunctionInfo> getAllMetadata() const;

    bool contains(std::string_view name) const;

    size_t size() const { return m_Functions.size(); }

private:
    struct CEntry {
        CFunctionInfo m_Info;
        CFunction m_Function;
    };

    std::map<std::string, CEntry> m_Functions;
};

/**
 * Register the math, trigonometric, logical, text and bridge functions.
 * @param registry registry to fill
 */
void registerBuiltinFunctions(CFunctionRegistry &registry);

#endif /* SHEETCALC_CFUNCTIONREGISTRY_H */
