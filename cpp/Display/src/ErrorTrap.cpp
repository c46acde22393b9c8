#include "ErrorTrap.hpp"
#include <iostream>

namespace XBridge {

ErrorTrapSpan::ErrorTrapSpan(DisplayContext& context, SyncPolicy policy)
    : m_context(context), m_policy(policy) {
    m_nested = m_context.enterTrap() > 0;
    auto pending = m_context.errors().consume();
    if (m_nested) {
        // Belongs to the enclosing span, handed back in end()
        m_outerError = pending;
    } else if (pending) {
        std::cerr << "Discarding unobserved X11 error: " << describe(*pending) << std::endl;
    }
}

ErrorTrapSpan::~ErrorTrapSpan() {
    if (m_finished) {
        return;
    }
    // Left early (exception in the trapped call): don't round trip,
    // just report what was already seen.
    auto error = end();
    if (error && !m_nested) {
        std::cerr << "Unhandled X11 error in abandoned trap: " << describe(*error) << std::endl;
    }
}

std::optional<XErrorInfo> ErrorTrapSpan::finish() {
    if (m_finished) {
        return std::nullopt;
    }
    if (m_policy == SyncPolicy::Sync && m_context.isUsable()) {
        m_context.connection().sync(false);
    }
    return end();
}

std::optional<XErrorInfo> ErrorTrapSpan::end() {
    m_finished = true;
    auto error = m_context.errors().consume();
    if (m_nested) {
        if (m_outerError) {
            m_context.errors().restore(*m_outerError);
        } else if (error) {
            m_context.errors().restore(*error);
        }
    }
    m_context.leaveTrap();
    return error;
}

XError::XError(const XErrorInfo& info, const std::string& text)
    : std::runtime_error(text + " (" + describe(info) + ")"), m_info(info) {}

void throwIfError(DisplayContext& context, const std::optional<XErrorInfo>& error) {
    if (error) {
        throw XError(*error, context.errorText(error->errorCode));
    }
}

} // namespace XBridge
