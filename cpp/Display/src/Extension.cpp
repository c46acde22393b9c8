#include "Extension.hpp"
#include "Errors.hpp"
#include <iostream>
#include <utility>

namespace XBridge {

Extension::Extension(DisplayContext& context, std::string name)
    : m_context(context), m_name(std::move(name)) {}

bool Extension::hasSupport() {
    if (m_supported) {
        return *m_supported;
    }
    m_context.checkUsable("Extension::hasSupport");
    auto codes = m_context.connection().queryExtension(m_name);
    m_supported = codes.has_value();
    if (codes) {
        m_codes = *codes;
        std::cout << m_name << " extension available (event base " << m_codes.eventBase << ")" << std::endl;
    } else {
        std::cout << m_name << " extension not available" << std::endl;
    }
    return *m_supported;
}

void Extension::ensureSupport() {
    if (!hasSupport()) {
        throw ExtensionUnavailable(m_name);
    }
}

} // namespace XBridge
