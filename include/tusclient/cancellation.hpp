#pragma once

#include <chrono>
#include <memory>

namespace tusclient {

/// Shareable cancellation flag. Copies refer to the same state; a token made
/// with child() is cancelled when it or any of its ancestors is.
class CancellationToken {
public:
    CancellationToken();

    void cancel() const;
    bool is_cancelled() const;

    /// Throws UploadCancelled if the token has fired.
    void throw_if_cancelled() const;

    /// Sleep for up to `duration`. Returns true if cancelled before or during
    /// the wait.
    bool wait_for(std::chrono::milliseconds duration) const;

    CancellationToken child() const;

private:
    struct State;
    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

}  // namespace tusclient
