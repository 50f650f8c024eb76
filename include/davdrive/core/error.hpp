#pragma once

#include <stdexcept>
#include <string>

namespace davdrive {

// Failure reported by a remote store or its transport.
// Carries the HTTP status (0 when the request never produced one) and
// whether the failure happened at the network level.
class RemoteError : public std::runtime_error {
public:
    explicit RemoteError(const std::string& message, int status = 0, bool network_error = false)
        : std::runtime_error(message)
        , status_(status)
        , network_error_(network_error) {}

    int status() const { return status_; }
    bool is_network_error() const { return network_error_; }
    bool is_not_found() const { return status_ == 404; }

private:
    int status_;
    bool network_error_;
};

} // namespace davdrive
