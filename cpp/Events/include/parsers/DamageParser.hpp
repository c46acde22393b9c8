#pragma once
#include "EventRegistry.hpp"
#include "Extension.hpp"

namespace XBridge {

std::optional<ParsedEvent> parseDamageNotify(ParseContext& context, const XEvent& event);

/**
 * @brief Registers DamageNotify at the extension's event base
 * @throws ExtensionUnavailable
 */
void registerDamageEvents(EventRegistry& registry, Extension& damage);

} // namespace XBridge
