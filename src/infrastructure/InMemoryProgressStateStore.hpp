/**
 * @file InMemoryProgressStateStore.hpp
 * @brief Process-local ProgressStateStore.
 */

#pragma once

#include "domain/ProgressStateStore.hpp"

namespace scribeline::infrastructure {

class InMemoryProgressStateStore : public domain::ProgressStateStore {
public:
    std::optional<domain::PersistedJobState> get() const override { return m_state; }

    void set(const domain::PersistedJobState& state) override {
        m_state = state;
        ++m_writes;
    }

    void clear() override {
        m_state.reset();
        ++m_clears;
    }

    int writes() const { return m_writes; }
    int clears() const { return m_clears; }

private:
    std::optional<domain::PersistedJobState> m_state;
    int m_writes = 0;
    int m_clears = 0;
};

} // namespace scribeline::infrastructure
