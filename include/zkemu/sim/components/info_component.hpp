#pragma once

#include "zkemu/sim/dispatcher.hpp"

namespace zkemu::sim::components {

/**
 * Device information: firmware version, clock, options, capacity
 * counters and PIN width.
 */
class InfoComponent : public Component {
public:
    InfoComponent();

    void registerHandlers(Dispatcher& dispatcher) override;

private:
    Replies handleGetTime(RequestContext& context);
    Replies handleSetTime(RequestContext& context, const protocol::SetTimeRequest& request);
    Replies handleReadOption(RequestContext& context, const protocol::OptionsReadRequest& request);
    Replies handleWriteOption(RequestContext& context, const protocol::OptionsWriteRequest& request);
};

} // namespace zkemu::sim::components
