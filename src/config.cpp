#include "config.hpp"
#include "errors.hpp"

namespace config {

void Options::validate() const {
    if (connect_host.empty()) {
        throw errors::InputError("connect_host must not be empty");
    }
    if (connect_attempts < 1 || bind_attempts < 1) {
        throw errors::InputError("retry attempts must be at least 1");
    }
    if (poll_interval.count() <= 0) {
        throw errors::InputError("poll_interval must be positive");
    }
    if (retry_backoff.count() < 0 || sweep_interval.count() < 0) {
        throw errors::InputError("durations must not be negative");
    }
    if (peer_wait_timeout.count() <= 0 || connect_timeout.count() <= 0 ||
        accept_timeout.count() <= 0 || metadata_timeout.count() <= 0 ||
        read_timeout.count() <= 0 || write_timeout.count() <= 0) {
        throw errors::InputError("timeouts must be positive");
    }
    if (session_ttl.count() <= 0) {
        throw errors::InputError("session_ttl must be positive");
    }
}

} // namespace config
