#ifndef SHEETCALC_CDISPATCHCHANNEL_H
#define SHEETCALC_CDISPATCHCHANNEL_H

#include "sheetcalc/CValue.h"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

/**
 * Handler answering requests of one operation key.
 * @param input request payload
 * @param key operation key the handler was registered under
 */
using CDispatchHandler = std::function<CValue(const std::string &input, const std::string &key)>;

/**
 * Channel to a separately built subsystem. Formulas reach it through a string key,
 * so the engine has no compile-time dependency on whoever answers.
 *
 * Requests are synchronous: request() returns once the handler has produced its value.
 * Failures never escape as exceptions, they come back as error values.
 */
class CDispatchChannel {
public:
    /**
     * Register the handler of an operation key. Keys are case-insensitive.
     * @param key operation key
     * @param handler handler, must be callable
     * @return false if the key already has a handler
     */
    bool registerHandler(std::string_view key, CDispatchHandler handler);

    /**
     * @param key operation key
     * @return true if a handler was removed
     */
    bool unregisterHandler(std::string_view key);

    bool hasHandler(std::string_view key) const;

    /**
     * @return counter that changes whenever a handler is registered or removed
     */
    unsigned long long generation() const { return m_Generation; }

    /**
     * @return registered keys, sorted
     */
    std::vector<std::string> listOperations() const;

    /**
     * Send a request and wait for its result.
     * @param key operation key
     * @param input request payload
     * @return handler result (leading-'#' strings become errors), #CIPHER? for an unknown key,
     *         #ERROR! if the handler failed
     */
    CValue request(std::string_view key, const std::string &input) const;

private:
    std::map<std::string, CDispatchHandler> m_Handlers;
    unsigned long long m_Generation = 0;
};

#endif /* SHEETCALC_CDISPATCHCHANNEL_H */
