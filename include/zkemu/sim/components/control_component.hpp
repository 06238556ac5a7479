#pragma once

#include "zkemu/sim/dispatcher.hpp"

namespace zkemu::sim::components {

/**
 * Control Component
 *
 * Enable/disable, restart and power off, the door relay, LCD, voice
 * prompts and event registration.
 */
class ControlComponent : public Component {
public:
    ControlComponent();

    void registerHandlers(Dispatcher& dispatcher) override;

private:
    Replies handleShutdown(RequestContext& context, const char* what);
};

} // namespace zkemu::sim::components
