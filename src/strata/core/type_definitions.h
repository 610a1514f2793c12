#ifndef STRATA_CORE_TYPE_DEFINITIONS_H
#define STRATA_CORE_TYPE_DEFINITIONS_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/core/noncopyable.hpp>

namespace strata {

using boost::noncopyable;

using std::string;

using std::optional;
typedef std::nullopt_t none_t;
inline constexpr std::nullopt_t none(std::nullopt);

// some(x) creates an optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cvref_t<T>>(std::forward<T>(x));
}

typedef int64_t integer;

typedef std::vector<std::uint8_t> byte_vector;

} // namespace strata

#endif
