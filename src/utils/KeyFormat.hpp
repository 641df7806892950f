#ifndef KEYFORMAT_HPP
#define KEYFORMAT_HPP

#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace KeyFormat {

template <typename T, typename = void>
struct is_streamable : std::false_type {};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

// Renders a cache key for log lines; keys without operator<< print as "<key>".
template <typename T>
std::string toString(const T& key) {
    if constexpr (is_streamable<T>::value) {
        std::ostringstream oss;
        oss << key;
        return oss.str();
    } else {
        return "<key>";
    }
}

} // namespace KeyFormat

#endif // KEYFORMAT_HPP
