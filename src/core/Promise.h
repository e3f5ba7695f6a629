#pragma once

#include <utility>
#include <variant>

#include "Result.h"

// Lifecycle of one asynchronous value, guarded by a correlation key.
//
//   Empty ──defer(k)──▶ Pending(k) ──update(k, r)──▶ Resolved(k, r)
//                          ▲                               │
//                          └───────────defer(k')───────────┘
//
// update() is accepted only while Pending with an equal key; a result for a
// superseded request is dropped without side effects. There is no blocking
// read; observers branch on state().
//
// K must be copyable and equality-comparable. Keys are never ordered.
template<typename T, typename K>
class Promise {
public:
    enum class State { Empty, Pending, Resolved };

    Promise() = default;

    State state() const
    {
        switch (m_state.index()) {
        case 1:  return State::Pending;
        case 2:  return State::Resolved;
        default: return State::Empty;
        }
    }

    bool isEmpty() const    { return std::holds_alternative<EmptyState>(m_state); }
    bool isPending() const  { return std::holds_alternative<PendingState>(m_state); }
    bool isResolved() const { return std::holds_alternative<ResolvedState>(m_state); }
    bool isFulfilled() const { return isResolved() && resolved().result.isOk(); }
    bool isRejected() const  { return isResolved() && resolved().result.isErr(); }

    // True when Pending with exactly this key.
    bool isPendingFor(const K& key) const
    {
        const auto* p = std::get_if<PendingState>(&m_state);
        return p && p->key == key;
    }

    // Precondition: isPending().
    const K& pendingKey() const { return std::get<PendingState>(m_state).key; }
    // Precondition: isResolved().
    const K& resolvedKey() const { return resolved().key; }
    const Result<T>& result() const { return resolved().result; }

    // Precondition: isFulfilled().
    const T& value() const { return resolved().result.value(); }
    // Precondition: isRejected().
    const AppError& error() const { return resolved().result.error(); }

    // Mutable access to a fulfilled value, nullptr in every other state.
    T* valueMut()
    {
        auto* r = std::get_if<ResolvedState>(&m_state);
        if (!r || r->result.isErr())
            return nullptr;
        return &r->result.value();
    }

    void defer(K key)
    {
        m_state = PendingState{std::move(key)};
    }

    // Returns true if the result was accepted.
    bool update(const K& key, Result<T> result)
    {
        if (!isPendingFor(key))
            return false;
        m_state = ResolvedState{key, std::move(result)};
        return true;
    }

    // Unconditional transitions for locally synthesised state.
    void resolve(K key, T value)
    {
        m_state = ResolvedState{std::move(key), Result<T>(std::move(value))};
    }

    void reject(K key, AppError error)
    {
        m_state = ResolvedState{std::move(key), Result<T>(std::move(error))};
    }

    void clear() { m_state = EmptyState{}; }

private:
    struct EmptyState {};
    struct PendingState {
        K key;
    };
    struct ResolvedState {
        K key;
        Result<T> result;
    };

    const ResolvedState& resolved() const { return std::get<ResolvedState>(m_state); }

    std::variant<EmptyState, PendingState, ResolvedState> m_state;
};
