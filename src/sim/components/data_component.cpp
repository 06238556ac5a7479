#include "zkemu/sim/components/data_component.hpp"
#include "zkemu/utils/buffer.hpp"
#include "zkemu/utils/logger.hpp"

#include <algorithm>

namespace zkemu::sim::components {

using namespace protocol;

DataComponent::DataComponent()
    : Component("Data")
{
}

void DataComponent::registerHandlers(Dispatcher& dispatcher) {
    // Tables
    dispatcher.on<UserTempReadRequest>([](RequestContext& context, const UserTempReadRequest&) {
        return dataFor(context, context.store.userTable());
    });
    dispatcher.on<AttLogReadRequest>([](RequestContext& context, const AttLogReadRequest&) {
        return dataFor(context, context.store.attendanceTable());
    });
    dispatcher.on<DbReadRequest>([](RequestContext& context, const DbReadRequest& request) {
        Bytes table = dataSetFor(context.store, code(CommandId::DbRrq), static_cast<uint32_t>(request.table));
        return dataFor(context, table);
    });

    dispatcher.on<UserWriteRequest>(
        [this](RequestContext& context, const UserWriteRequest& request) {
            return handleUserWrite(context, request);
        });
    dispatcher.on<DeleteUserRequest>([](RequestContext& context, const DeleteUserRequest& request) {
        if (!context.store.removeUser(request.uid)) {
            LOG_DEBUG("[Data] DELETE_USER for unknown uid {}", request.uid);
        }
        return ok();
    });
    dispatcher.on<DeleteUserTempRequest>([](RequestContext& context, const DeleteUserTempRequest& request) {
        return context.store.removeTemplate(request.uid, request.fingerIndex) ? ok() : error();
    });
    dispatcher.on<GetUserTempRequest>(
        [this](RequestContext& context, const GetUserTempRequest& request) {
            return handleGetUserTemp(context, request);
        });

    dispatcher.on<ClearDataRequest>([](RequestContext& context, const ClearDataRequest&) {
        LOG_INFO("[Data] Clearing all data");
        context.store.clearAll();
        return ok();
    });
    dispatcher.on<ClearAttLogRequest>([](RequestContext& context, const ClearAttLogRequest&) {
        LOG_INFO("[Data] Clearing attendance log");
        context.store.clearAttendance();
        return ok();
    });

    // Buffered transfer
    dispatcher.on<PrepareBufferRequest>(
        [this](RequestContext& context, const PrepareBufferRequest& request) {
            return handlePrepareBuffer(context, request);
        });
    dispatcher.on<ReadBufferRequest>(
        [this](RequestContext& context, const ReadBufferRequest& request) {
            return handleReadBuffer(context, request);
        });
    dispatcher.on<FreeDataRequest>([](RequestContext& context, const FreeDataRequest&) {
        context.session.releaseBuffers();
        return ok();
    });
    dispatcher.on<PrepareDataRequest>(
        [this](RequestContext& context, const PrepareDataRequest& request) {
            return handlePrepareData(context, request);
        });
    dispatcher.on<DataRequest>(
        [this](RequestContext& context, const DataRequest& request) { return handleData(context, request); });
    dispatcher.on<SaveUserTempsRequest>(
        [this](RequestContext& context, const SaveUserTempsRequest&) { return handleSaveUserTemps(context); });
}

Bytes DataComponent::dataSetFor(const DeviceStore& store, uint16_t command, uint32_t table) {
    if (command == code(CommandId::AttLogRrq)) {
        return store.attendanceTable();
    }

    switch (static_cast<TableId>(table)) {
        case TableId::User:      return store.userTable();
        case TableId::FingerTmp: return store.templateTable();
        case TableId::AttLog:    return store.attendanceTable();
    }

    LOG_WARN("[Data] Unknown table {} for {}", table, commandName(command));
    return wrapDataSet({});
}

// =============================================================================
// Users and templates
// =============================================================================

Replies DataComponent::handleUserWrite(RequestContext& context, const UserWriteRequest& request) {
    UserRecord user = request.user;
    if (user.userId.empty()) {
        user.userId = std::to_string(user.uid);
    }

    if (!context.store.putUser(user)) {
        LOG_WARN("[Data] User table full, uid {} rejected", user.uid);
        return error();
    }

    LOG_INFO("[Data] Stored user uid={} id='{}' name='{}'", user.uid, user.userId, user.name);
    return ok();
}

Replies DataComponent::handleGetUserTemp(RequestContext& context, const GetUserTempRequest& request) {
    auto record = context.store.findTemplate(request.uid, request.fingerIndex);
    if (!record) {
        return error();
    }

    Bytes payload = record->data;
    payload.insert(payload.end(), 6, 0);
    return dataFor(context, payload);
}

// =============================================================================
// Pull: PREPARE_BUFFER / READ_BUFFER
// =============================================================================

Replies DataComponent::handlePrepareBuffer(RequestContext& context, const PrepareBufferRequest& request) {
    Bytes dataSet = dataSetFor(context.store, request.command, request.table);
    uint32_t limit = context.store.config().inline_data_limit;

    if (dataSet.size() <= limit) {
        LOG_DEBUG("[Data] {} table {}: {} bytes inline", commandName(request.command), request.table, dataSet.size());
        return data(std::move(dataSet));
    }

    DeviceSession& session = context.session;
    session.readBuffer = std::move(dataSet);
    session.readBufferStaged = true;
    LOG_DEBUG("[Data] {} table {}: staged {} bytes", commandName(request.command), request.table,
              session.readBuffer.size());

    utils::BufferWriter writer;
    writer.writeU8(0);
    writer.writeU32(static_cast<uint32_t>(session.readBuffer.size()));
    return ok(writer.take());
}

Replies DataComponent::handleReadBuffer(RequestContext& context, const ReadBufferRequest& request) {
    DeviceSession& session = context.session;
    if (!session.readBufferStaged) {
        LOG_WARN("[Data] READ_BUFFER without a staged buffer");
        return error();
    }

    uint64_t end = static_cast<uint64_t>(request.offset) + request.size;
    if (request.size == 0 || end > session.readBuffer.size()) {
        LOG_WARN("[Data] READ_BUFFER {}+{} outside {} staged bytes",
                 request.offset, request.size, session.readBuffer.size());
        return error();
    }

    Bytes slice(session.readBuffer.begin() + request.offset, session.readBuffer.begin() + end);
    if (session.transport == TransportKind::Udp) {
        return data(std::move(slice));
    }
    return dataOrStream(slice, 0);
}

// =============================================================================
// Push: PREPARE_DATA / DATA / SAVE_USERTEMPS
// =============================================================================

Replies DataComponent::handlePrepareData(RequestContext& context, const PrepareDataRequest& request) {
    if (request.size > kMaxUploadSize) {
        LOG_WARN("[Data] Upload of {} bytes refused", request.size);
        return error();
    }

    DeviceSession& session = context.session;
    session.upload.clear();
    session.upload.reserve(request.size);
    session.uploadExpected = request.size;
    session.uploadActive = true;
    return ok();
}

Replies DataComponent::handleData(RequestContext& context, const DataRequest& request) {
    DeviceSession& session = context.session;
    if (!session.uploadActive) {
        LOG_WARN("[Data] DATA without PREPARE_DATA");
        return error();
    }
    if (session.upload.size() + request.chunk.size() > session.uploadExpected) {
        LOG_WARN("[Data] Upload overflow: {} + {} > {}",
                 session.upload.size(), request.chunk.size(), session.uploadExpected);
        return error();
    }

    session.upload.insert(session.upload.end(), request.chunk.begin(), request.chunk.end());
    return ok();
}

Replies DataComponent::handleSaveUserTemps(RequestContext& context) {
    DeviceSession& session = context.session;
    if (!session.uploadActive || session.upload.size() != session.uploadExpected) {
        LOG_WARN("[Data] SAVE_USERTEMPS with {} of {} bytes uploaded",
                 session.upload.size(), session.uploadExpected);
        return error();
    }

    auto entries = decodeTemplateUpload(session.upload);
    session.releaseBuffers();
    if (!entries) {
        LOG_WARN("[Data] Bad template upload: {}", entries.error().message);
        return error();
    }

    size_t fingers = 0;
    for (const auto& entry : entries.value()) {
        if (!context.store.putUser(entry.user)) {
            return error();
        }
        for (auto record : entry.templates) {
            record.uid = entry.user.uid;
            if (!context.store.putTemplate(record)) {
                return error();
            }
            fingers++;
        }
    }

    LOG_INFO("[Data] Saved {} users, {} templates", entries.value().size(), fingers);
    return ok();
}

} // namespace zkemu::sim::components
