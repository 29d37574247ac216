/**
 * @file CancellationToken.hpp
 * @brief Shared cancellation flag for export requests.
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "domain/ExportErrors.hpp"

namespace healthexport::application {

/**
 * @class CancellationToken
 * @brief Copyable handle to a cancellation flag shared by all of its copies.
 *
 * A token created with linked() observes its parent as well as its own flag,
 * so an assembler can cancel its own fetches without touching the caller's token.
 */
class CancellationToken {
public:
    CancellationToken() : m_state(std::make_shared<State>()) {}

    void cancel() { m_state->cancelled = true; }

    bool isCancelled() const {
        for (auto state = m_state; state; state = state->parent) {
            if (state->cancelled.load()) return true;
        }
        return false;
    }

    /** @throws domain::ExportCancelledError if this token or any parent was cancelled. */
    void throwIfCancelled(const std::string& operation) const {
        if (isCancelled()) {
            throw domain::ExportCancelledError(operation);
        }
    }

    /** @brief Returns a child token cancelled whenever this one is. */
    CancellationToken linked() const {
        CancellationToken child;
        child.m_state->parent = m_state;
        return child;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<State> parent;
    };

    std::shared_ptr<State> m_state;
};

} // namespace healthexport::application
