#pragma once

/**
@file
@brief Structured C-style callbacks.

`OptionalCallback` wraps a C-style function pointer plus a context (user data) `void` pointer. The context pointer is
passed as the last argument to the function. A callback bound to `nullptr` is a no-op that returns a
default-constructed value.

Usage example:

```cpp
void OnEdge(bool level, void *ctx) {
    // ctx has the user data pointer
}

util::OptionalCallback<void(bool)> cbEdge{OnEdge};

struct Listener {
    void OnEdge(bool level) {}
};

Listener listener{};
util::OptionalCallback<void(bool)> cbMember = util::MakeClassMemberOptionalCallback<&Listener::OnEdge>(&listener);
```
*/

#include "inline.hpp"

#include <type_traits>
#include <utility>

namespace util {

namespace detail {

    /// @brief A type-dependent always false value to use in static assertions.
    template <typename T>
    inline constexpr bool alwaysFalse = false;

    /// @brief The callback implementation.
    /// @tparam TReturn the return type of the callback function
    /// @tparam ...TArgs the argument types of the callback function
    template <typename TReturn, typename... TArgs>
    class FuncClass {
    public:
        /// @brief The function pointer type, constructed from the class's template types.
        using FnType = TReturn (*)(TArgs... args, void *context);

        FuncClass() = default;

        FuncClass(void *context, FnType fn)
            : m_context(context)
            , m_fn(fn) {}

        /// @brief Invokes the callback function with the specified arguments.
        /// @param ...args the arguments to pass to the callback function
        /// @return the return value of the callback function, or a default-constructed value if unbound
        FLATTEN FORCE_INLINE TReturn operator()(TArgs... args) const {
            if (m_fn == nullptr) [[unlikely]] {
                if constexpr (std::is_void_v<TReturn>) {
                    return;
                } else {
                    return {};
                }
            }
            return m_fn(std::forward<TArgs>(args)..., m_context);
        }

    private:
        void *m_context = nullptr;
        FnType m_fn = nullptr;
    };

    template <typename TFunc>
    struct FuncHelper {
        static_assert(alwaysFalse<TFunc>, "Callback requires a function argument");
    };

    template <typename TReturn, typename... TArgs>
    struct FuncHelper<TReturn(TArgs...)> {
        using type = FuncClass<TReturn, TArgs...>;
    };

} // namespace detail

/// @brief A C-style callback containing a function pointer and a context/user data pointer.
///
/// May be left unbound or bound to `nullptr` to disable it.
///
/// @tparam TFunc the function type of the form `ReturnType(Args...)`
template <typename TFunc>
class OptionalCallback : public detail::FuncHelper<TFunc>::type {
    using Base = typename detail::FuncHelper<TFunc>::type;
    using FnType = typename Base::FnType;

public:
    OptionalCallback() = default;

    OptionalCallback(FnType fn)
        : Base(nullptr, fn) {}

    OptionalCallback(void *context, FnType fn)
        : Base(context, fn) {}
};

namespace detail {

    template <typename>
    struct MFPCallbackMaker;

    template <typename Return, typename Object, typename... Args>
    struct MFPCallbackMaker<Return (Object::*)(Args...)> {
        using class_type = Object;

        template <Return (Object::*mfp)(Args...)>
        static auto GetCallback(Object *context) {
            return OptionalCallback<Return(Args...)>{context, [](Args... args, void *context) {
                                                         auto &obj = *static_cast<Object *>(context);
                                                         return (obj.*mfp)(std::forward<Args>(args)...);
                                                     }};
        }
    };

} // namespace detail

/// @brief Creates an optional callback to a member function pointer invoked on the given instance of the class.
/// @tparam mfp the member function pointer
/// @param context the object instance to bind to
/// @return an `OptionalCallback` bound to the object instance and member function pointer
template <auto mfp>
    requires std::is_member_function_pointer_v<decltype(mfp)>
auto MakeClassMemberOptionalCallback(typename detail::MFPCallbackMaker<decltype(mfp)>::class_type *context) {
    return detail::MFPCallbackMaker<decltype(mfp)>::template GetCallback<mfp>(context);
}

} // namespace util
