#include "zkemu/core/result.hpp"

namespace zkemu {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Checksum:        return "ChecksumError";
        case ErrorCode::MalformedFrame:  return "MalformedFrameError";
        case ErrorCode::MalformedRecord: return "MalformedRecordError";
        case ErrorCode::Timeout:         return "TimeoutError";
        case ErrorCode::Authentication:  return "AuthenticationError";
        case ErrorCode::ConnectionLost:  return "ConnectionLostError";
        case ErrorCode::Transfer:        return "TransferError";
        case ErrorCode::NotConnected:    return "NotConnectedError";
        case ErrorCode::DeviceError:     return "DeviceError";
        case ErrorCode::Io:              return "IOError";
    }
    return "UnknownError";
}

} // namespace zkemu
