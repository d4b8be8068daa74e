#ifndef LOGDEDUP_TYPE_TRAITS_HPP
#define LOGDEDUP_TYPE_TRAITS_HPP

#include <type_traits>

namespace logdedup {

/// Dependent false value for static assertions in discarded
/// `if constexpr` branches.
template<typename T>
struct always_false : std::false_type {};

} // namespace logdedup

#endif // LOGDEDUP_TYPE_TRAITS_HPP
