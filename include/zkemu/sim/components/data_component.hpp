#pragma once

#include "zkemu/sim/dispatcher.hpp"

namespace zkemu::sim::components {

/**
 * Data Component
 *
 * User, template and attendance tables plus the buffered transfer
 * commands that move them.
 *
 * Pull: PREPARE_BUFFER stages a data set, READ_BUFFER serves slices of
 * it, FREE_DATA releases it. Push: PREPARE_DATA opens an upload, DATA
 * appends to it and SAVE_USERTEMPS applies it.
 */
class DataComponent : public Component {
public:
    static constexpr uint32_t kMaxUploadSize = 16 * 1024 * 1024;

    DataComponent();

    void registerHandlers(Dispatcher& dispatcher) override;

private:
    static Bytes dataSetFor(const DeviceStore& store, uint16_t command, uint32_t table);

    Replies handleUserWrite(RequestContext& context, const protocol::UserWriteRequest& request);
    Replies handleGetUserTemp(RequestContext& context, const protocol::GetUserTempRequest& request);
    Replies handlePrepareBuffer(RequestContext& context, const protocol::PrepareBufferRequest& request);
    Replies handleReadBuffer(RequestContext& context, const protocol::ReadBufferRequest& request);
    Replies handlePrepareData(RequestContext& context, const protocol::PrepareDataRequest& request);
    Replies handleData(RequestContext& context, const protocol::DataRequest& request);
    Replies handleSaveUserTemps(RequestContext& context);
};

} // namespace zkemu::sim::components
