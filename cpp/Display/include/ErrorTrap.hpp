#pragma once
#include "DisplayContext.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace XBridge {

enum class SyncPolicy {
    NoSync, // the request already waited for its reply
    Sync    // round trip first, errors only show up once the server answered
};

/**
 * @brief Scoped error trap: construction clears the error cell, finish()
 * reports the first protocol error raised inside the span.
 *
 * Spans nest. An inner span sets aside the error its enclosing span has
 * already seen and hands the earliest of the two back when it ends, so the
 * outer span still reports the first error raised anywhere inside it.
 */
class ErrorTrapSpan {
public:
    explicit ErrorTrapSpan(DisplayContext& context, SyncPolicy policy = SyncPolicy::Sync);
    ~ErrorTrapSpan();

    ErrorTrapSpan(const ErrorTrapSpan&) = delete;
    ErrorTrapSpan& operator=(const ErrorTrapSpan&) = delete;

    std::optional<XErrorInfo> finish();

private:
    std::optional<XErrorInfo> end();

    DisplayContext& m_context;
    SyncPolicy m_policy;
    bool m_nested = false;
    std::optional<XErrorInfo> m_outerError;
    bool m_finished = false;
};

class XError : public std::runtime_error {
public:
    XError(const XErrorInfo& info, const std::string& text);

    const XErrorInfo& info() const noexcept { return m_info; }

private:
    XErrorInfo m_info;
};

/**
 * @brief Runs fn inside an error trap span
 * @return the first protocol error raised by fn, if any
 */
template <typename Fn>
std::optional<XErrorInfo> trapErrors(DisplayContext& context, Fn&& fn, SyncPolicy policy = SyncPolicy::Sync) {
    ErrorTrapSpan span(context, policy);
    std::forward<Fn>(fn)();
    return span.finish();
}

// For outer boundaries that report errors as exceptions (Python bindings)
void throwIfError(DisplayContext& context, const std::optional<XErrorInfo>& error);

} // namespace XBridge
