#pragma once
#include <atomic>
#include <mutex>
#include <vector>

namespace EventRelay {

class DuplexStream;

/**
 * @brief Cancellation shared by every stream of one streaming pass.
 *
 * Streams attach while they are live; cancel() aborts all of them and any
 * stream attaching afterwards is refused.
 */
class CancelToken {
public:
    void cancel();

    // false if the token was already cancelled; the caller then cancels the stream itself
    bool attach(DuplexStream* stream);
    void detach(DuplexStream* stream);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::vector<DuplexStream*> streams_;
};

} // namespace EventRelay
