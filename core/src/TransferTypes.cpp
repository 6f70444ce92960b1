// Protocol tables and error helpers.
#include "openxfer/TransferTypes.hpp"
#include <cerrno>
#include <cstring>

namespace openxfer {

const char* protocolName(Protocol p) {
    switch (p) {
        case Protocol::Local: return "local";
        case Protocol::Smb:   return "smb";
        case Protocol::Sftp:  return "sftp";
        case Protocol::Ftp:   return "ftp";
        case Protocol::Cloud: return "cloud";
    }
    return "unknown";
}

ProtocolLimits protocolLimits(Protocol p) {
    switch (p) {
        case Protocol::Local: return {24, 24};
        case Protocol::Smb:   return {2, 1};
        case Protocol::Sftp:  return {3, 1};
        case Protocol::Ftp:   return {2, 1};
        case Protocol::Cloud: return {8, 3};
    }
    return {1, 1};
}

const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::FileNotFound:           return "FileNotFound";
        case ErrorKind::FileExists:             return "FileExists";
        case ErrorKind::PermissionDenied:       return "PermissionDenied";
        case ErrorKind::InvalidOperation:       return "InvalidOperation";
        case ErrorKind::NetworkError:           return "NetworkError";
        case ErrorKind::AuthenticationRequired: return "AuthenticationRequired";
        case ErrorKind::Cancelled:              return "Cancelled";
        case ErrorKind::InvalidInput:           return "InvalidInput";
        case ErrorKind::StorageFull:            return "StorageFull";
        case ErrorKind::Unknown:                return "Unknown";
    }
    return "Unknown";
}

ClientError ClientError::fromErrno(int e, const std::string& what) {
    ClientError err;
    std::string msg = what + ": " + std::strerror(e);
    switch (e) {
        case ENOENT:
        case ENOTDIR:
            err.set(ErrorKind::FileNotFound, msg);
            break;
        case EEXIST:
        case ENOTEMPTY:
            err.set(ErrorKind::FileExists, msg);
            break;
        case EACCES:
        case EPERM:
        case EROFS:
            err.set(ErrorKind::PermissionDenied, msg);
            break;
        case ENOSPC:
        case EDQUOT:
            err.set(ErrorKind::StorageFull, msg);
            break;
        case ETIMEDOUT:
            err.set(ErrorKind::NetworkError, msg, true);
            break;
        case ECONNREFUSED:
        case ECONNRESET:
        case EHOSTUNREACH:
        case ENETUNREACH:
        case EPIPE:
        case EIO:
            err.set(ErrorKind::NetworkError, msg);
            break;
        case ECANCELED:
            err.set(ErrorKind::Cancelled, msg);
            break;
        case EINVAL:
            err.set(ErrorKind::InvalidInput, msg);
            break;
        default:
            err.set(ErrorKind::Unknown, msg);
            break;
    }
    return err;
}

} // namespace openxfer
