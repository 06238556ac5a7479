#include "zkemu/sim/components/info_component.hpp"
#include "zkemu/utils/buffer.hpp"
#include "zkemu/utils/logger.hpp"

namespace zkemu::sim::components {

InfoComponent::InfoComponent()
    : Component("Info")
{
}

void InfoComponent::registerHandlers(Dispatcher& dispatcher) {
    dispatcher.on<protocol::GetVersionRequest>([](RequestContext& context, const protocol::GetVersionRequest&) {
        utils::BufferWriter writer;
        writer.writeCString(context.store.config().firmware_version);
        return ok(writer.take());
    });

    dispatcher.on<protocol::GetTimeRequest>(
        [this](RequestContext& context, const protocol::GetTimeRequest&) { return handleGetTime(context); });
    dispatcher.on<protocol::SetTimeRequest>(
        [this](RequestContext& context, const protocol::SetTimeRequest& request) {
            return handleSetTime(context, request);
        });
    dispatcher.on<protocol::OptionsReadRequest>(
        [this](RequestContext& context, const protocol::OptionsReadRequest& request) {
            return handleReadOption(context, request);
        });
    dispatcher.on<protocol::OptionsWriteRequest>(
        [this](RequestContext& context, const protocol::OptionsWriteRequest& request) {
            return handleWriteOption(context, request);
        });

    dispatcher.on<protocol::GetFreeSizesRequest>([](RequestContext& context, const protocol::GetFreeSizesRequest&) {
        return ok(context.store.freeSizes());
    });

    dispatcher.on<protocol::GetPinWidthRequest>([](RequestContext&, const protocol::GetPinWidthRequest&) {
        return ok(Bytes{DeviceStore::kPinWidth});
    });
}

Replies InfoComponent::handleGetTime(RequestContext& context) {
    utils::BufferWriter writer;
    writer.writeU32(protocol::encodeTime(context.store.time()));
    return ok(writer.take());
}

Replies InfoComponent::handleSetTime(RequestContext& context, const protocol::SetTimeRequest& request) {
    auto time = protocol::decodeTime(request.packedTime);
    if (!time.isValid()) {
        LOG_WARN("[Info] Rejecting clock value {}", request.packedTime);
        return error();
    }

    context.store.setTime(time);
    LOG_INFO("[Info] Clock set to {}", time.toString());
    return ok();
}

Replies InfoComponent::handleReadOption(RequestContext& context, const protocol::OptionsReadRequest& request) {
    auto value = context.store.option(request.name);
    if (!value) {
        LOG_DEBUG("[Info] Unknown option '{}'", request.name);
        return ok();
    }

    utils::BufferWriter writer;
    writer.writeCString(request.name + "=" + *value);
    return ok(writer.take());
}

Replies InfoComponent::handleWriteOption(RequestContext& context, const protocol::OptionsWriteRequest& request) {
    LOG_INFO("[Info] Option {} = {}", request.name, request.value);
    context.store.setOption(request.name, request.value);
    return ok();
}

} // namespace zkemu::sim::components
