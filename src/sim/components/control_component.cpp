#include "zkemu/sim/components/control_component.hpp"
#include "zkemu/utils/logger.hpp"

namespace zkemu::sim::components {

using namespace protocol;

ControlComponent::ControlComponent()
    : Component("Control")
{
}

void ControlComponent::registerHandlers(Dispatcher& dispatcher) {
    dispatcher.on<EnableDeviceRequest>([](RequestContext& context, const EnableDeviceRequest&) {
        context.store.setEnabled(true);
        return ok();
    });
    dispatcher.on<DisableDeviceRequest>([](RequestContext& context, const DisableDeviceRequest&) {
        context.store.setEnabled(false);
        return ok();
    });
    dispatcher.on<RefreshDataRequest>([](RequestContext&, const RefreshDataRequest&) {
        return ok();
    });

    dispatcher.on<RestartRequest>(
        [this](RequestContext& context, const RestartRequest&) { return handleShutdown(context, "restart"); });
    dispatcher.on<PowerOffRequest>(
        [this](RequestContext& context, const PowerOffRequest&) { return handleShutdown(context, "power off"); });

    dispatcher.on<UnlockRequest>([](RequestContext& context, const UnlockRequest& request) {
        LOG_INFO("[Control] Door unlocked for {:.1f} s", request.tenthsOfSecond / 10.0);
        context.store.unlockDoor(request.tenthsOfSecond);
        return ok();
    });

    // ACK_OK while the lock is closed
    dispatcher.on<DoorStateRequest>([](RequestContext& context, const DoorStateRequest&) {
        return context.store.doorLocked() ? ok() : error();
    });

    dispatcher.on<WriteLcdRequest>([](RequestContext& context, const WriteLcdRequest& request) {
        LOG_INFO("[Control] LCD line {}: {}", request.line, request.text);
        context.store.writeLcd(request.line, request.text);
        return ok();
    });
    dispatcher.on<ClearLcdRequest>([](RequestContext& context, const ClearLcdRequest&) {
        context.store.clearLcd();
        return ok();
    });

    dispatcher.on<TestVoiceRequest>([](RequestContext&, const TestVoiceRequest& request) {
        LOG_INFO("[Control] Voice prompt {}", request.index);
        return ok();
    });

    dispatcher.on<RegEventRequest>([](RequestContext& context, const RegEventRequest& request) {
        LOG_DEBUG("[Control] Session 0x{:04X} events 0x{:X}", context.session.id, request.flags);
        context.session.registeredEvents = request.flags;
        return ok();
    });

    dispatcher.on<StartVerifyRequest>([](RequestContext& context, const StartVerifyRequest&) {
        context.session.verifying = true;
        return ok();
    });
    dispatcher.on<CancelCaptureRequest>([](RequestContext& context, const CancelCaptureRequest&) {
        context.session.verifying = false;
        return ok();
    });
}

Replies ControlComponent::handleShutdown(RequestContext& context, const char* what) {
    LOG_INFO("[Control] {} requested by {}, dropping session 0x{:04X}",
             what, context.session.peer, context.session.id);
    context.session.closeAfterReply = true;
    return ok();
}

} // namespace zkemu::sim::components
