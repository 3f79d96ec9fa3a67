#ifndef TEMPLATE_UTILS_HPP
#define TEMPLATE_UTILS_HPP

#include <cstddef>
#include <tuple>
#include <type_traits>

namespace pf {

    // is_any_same lets you know in compilation time if any of the variadic
    // template parameters equals first parameter
    template <typename T, typename...>
        struct is_any_same : std::false_type
    {};

    template <typename T, typename V, typename... Types>
        struct is_any_same<T, V, Types...>
        : std::integral_constant<bool, std::is_same<T, V>{} || is_any_same<T, Types...>{}>
        {};


    // compile time list of tuple indices
    template <std::size_t... Indices>
        struct index_list
    {};

    template <std::size_t N, std::size_t... Indices>
        struct make_index_list : make_index_list<N-1, N-1, Indices...>
    {};

    template <std::size_t... Indices>
        struct make_index_list<0, Indices...> {
            typedef index_list<Indices...> type;
        };


    // Calls unit.setup with every element of stored arguments, the tuple
    // stays untouched so it can be used again for the next worker
    template <typename Unit, typename Tuple, std::size_t... Indices>
        void call_setup(Unit& unit, const Tuple& args, index_list<Indices...>) {
            unit.setup(std::get<Indices>(args)...);
        }

    template <typename Unit, typename... Args>
        void call_setup(Unit& unit, const std::tuple<Args...>& args) {
            call_setup(unit, args, typename make_index_list<sizeof...(Args)>::type());
        }

}

#endif
