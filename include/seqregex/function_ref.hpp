#pragma once

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace seqregex {
template <typename Signature> class FunctionRef;

// Non-owning reference to a callable. The callable must outlive every call,
// which holds for lambdas passed down the engine's recursion.
template <typename Return, typename... Args> class FunctionRef<Return(Args...)> {
  void *m_callable;
  Return (*m_trampoline)(void *, Args...);

public:
  template <typename Callable>
    requires(not std::is_same_v<std::remove_cvref_t<Callable>, FunctionRef> &&
             std::is_invocable_r_v<Return, Callable &, Args...>)
  constexpr FunctionRef(Callable &&callable)
      : m_callable{const_cast<void *>(
            static_cast<void const *>(std::addressof(callable)))},
        m_trampoline{[](void *callable, Args... args) -> Return {
          return std::invoke(
              *static_cast<std::remove_reference_t<Callable> *>(callable),
              std::forward<Args>(args)...);
        }} {}

  constexpr auto operator()(Args... args) const -> Return {
    return m_trampoline(m_callable, std::forward<Args>(args)...);
  }
};
} // namespace seqregex
