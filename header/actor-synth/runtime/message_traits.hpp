#pragma once

#include <type_traits>
#include <utility>
#include <variant>

#include <actor-synth/runtime/reply_slot.hpp>

namespace actor_synth {

    template<class T>
    struct is_reply_slot : std::false_type {};

    template<class T>
    struct is_reply_slot<reply_slot<T>> : std::true_type {};

    template<class T>
    inline constexpr bool is_reply_slot_v = is_reply_slot<T>::value;

    template<class V, class Message>
    struct is_alternative : std::false_type {};

    template<class V, class... Ts>
    struct is_alternative<V, std::variant<Ts...>> : std::disjunction<std::is_same<V, Ts>...> {};

    template<class V, class Message>
    inline constexpr bool is_alternative_v = is_alternative<V, Message>::value;

    /// @brief A variant struct whose `resp` member is a reply_slot
    template<class V>
    concept message_variant = requires(V& v) {
        v.resp;
    } && is_reply_slot_v<std::remove_cvref_t<decltype(std::declval<V&>().resp)>>;

    template<message_variant V>
    using response_type_t = typename std::remove_cvref_t<decltype(std::declval<V&>().resp)>::value_type;

    /// @brief Processor with a handler taking the whole message by reference
    template<class Processor, class Message>
    concept message_processor = requires(Processor& p, Message& m) {
        p.process(m);
    };

} // namespace actor_synth
