#ifndef XORNET_NETWORK_ERROR_HPP
#define XORNET_NETWORK_ERROR_HPP

namespace xornet {
namespace network {

enum class NetworkError {
    SUCCESS = 0,
    CONNECTION_FAILED,
    INVALID_PEER,
    TIMEOUT,
    NOT_FOUND,
    REJECTED,
    UNKNOWN_ERROR
};

inline const char* to_string(NetworkError error) {
    switch (error) {
        case NetworkError::SUCCESS: return "Success";
        case NetworkError::CONNECTION_FAILED: return "Connection failed";
        case NetworkError::INVALID_PEER: return "Invalid peer";
        case NetworkError::TIMEOUT: return "Timeout";
        case NetworkError::NOT_FOUND: return "Not found";
        case NetworkError::REJECTED: return "Rejected";
        case NetworkError::UNKNOWN_ERROR: return "Unknown error";
        default: return "Undefined error";
    }
}

} // namespace network
} // namespace xornet

#endif // XORNET_NETWORK_ERROR_HPP
