#pragma once

/**
@file
@brief Defines `util::Observable`, a value wrapper that notifies observers when the value changes.
*/

#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

namespace util {

/// @brief Stores a value of type `T` and lets other objects observe and react to changes.
///
/// Observer functions run when they are registered with `ObserveAndNotify` and every time the value is assigned.
/// Observers run on the thread that assigns the value.
///
/// @tparam T the type of the value
template <typename T>
class Observable {
public:
    /// @brief The observer function type.
    ///
    /// The value is passed by value if it fits in a pointer, otherwise it is passed by const reference.
    using Observer = std::conditional_t<sizeof(T) <= sizeof(uintptr_t), void(T), void(const T &)>;

    Observable(const T &value)
        : m_value(value) {}

    Observable(T &&value)
        : m_value(std::move(value)) {}

    Observable() = default;
    Observable(const Observable &) = delete;
    Observable(Observable &&) = default;

    Observable &operator=(const Observable &) = delete;
    Observable &operator=(Observable &&) = default;

    /// @brief Assigns the value to this observable and notifies all observers of the change.
    /// @param[in] value the new value
    /// @return a reference to this observable
    Observable &operator=(T value) {
        m_value = std::move(value);
        Notify();
        return *this;
    }

    const T *operator->() const {
        return &m_value;
    }

    const T &operator*() const {
        return m_value;
    }

    /// @brief Adds an observer to this observable.
    /// @param[in] observer the observer to add
    void Observe(std::function<Observer> &&observer) {
        m_fnObservers.emplace_back(std::move(observer));
    }

    /// @brief Adds an observer to this observable and immediately invokes it with the current value.
    /// @param[in] observer the observer to add
    void ObserveAndNotify(std::function<Observer> &&observer) {
        observer(m_value);
        m_fnObservers.emplace_back(std::move(observer));
    }

    /// @brief Keeps the given variable in sync with this observable's value.
    ///
    /// Also copies the current value into the variable.
    ///
    /// @param[in] valueRef a reference to the variable to keep in sync
    void Observe(T &valueRef) {
        m_valObservers.emplace_back(&valueRef);
        valueRef = m_value;
    }

    /// @brief Notifies all observers of the current value.
    void Notify() {
        for (auto &observer : m_fnObservers) {
            observer(m_value);
        }
        for (auto *observer : m_valObservers) {
            *observer = m_value;
        }
    }

    /// @brief Gets the current value.
    T Get() const {
        return m_value;
    }

    operator T() const {
        return m_value;
    }

private:
    T m_value{};

    std::vector<std::function<Observer>> m_fnObservers;
    std::vector<T *> m_valObservers;
};

} // namespace util
