#pragma once
#include <concepts>
#include <cstdint>
#include <type_traits>
#include <variant>

namespace cmdpipe::model {

// Delivery class of a command. Derived from the variant tag alone.
enum class DeliveryClass : uint8_t {
    Droppable,   // only the latest value of a burst matters
    Guaranteed,  // exactly once, in submission order
};

struct droppable_tag {};
struct guaranteed_tag {};

template<class T>
concept Droppable =
    requires { typename T::delivery; } &&
    std::same_as<typename T::delivery, droppable_tag>;

template<class T>
concept Guaranteed =
    requires { typename T::delivery; } &&
    std::same_as<typename T::delivery, guaranteed_tag>;

// Every command alternative must pick exactly one delivery class.
template<class T>
concept Classified = (Droppable<T> != Guaranteed<T>);

template<class Variant>
struct all_classified;

template<class... Ts>
struct all_classified<std::variant<Ts...>>
    : std::bool_constant<(Classified<Ts> && ...)> {};

template<class T>
inline constexpr DeliveryClass delivery_class_of =
    Droppable<T> ? DeliveryClass::Droppable : DeliveryClass::Guaranteed;

// Result of one iteration of a long-lived stage loop.
enum class StepResult : uint8_t {
    Continue,
    Stop,
};

template<class T>
concept Steppable =
    requires(T& t)
{
    { t.step() } noexcept -> std::same_as<StepResult>;
};

} // namespace cmdpipe::model
