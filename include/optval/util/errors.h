#ifndef OPTVAL_UTIL_ERRORS
#define OPTVAL_UTIL_ERRORS

#include <optval/optval_export.h>

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace optval {

    /**
     * Raised by the dynamic optional operations when no optional box can be built for a runtime type,
     * either because the input carries no type at all or because no factory is registered for it.
     */
    struct OPTVAL_EXPORT TypeConstructionError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Overload (I) - takes error msg and appends source location info
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // A format string that also records the call site, so overload (II) can append it
    template<typename... Ts>
    struct format_with_location {
        template<typename S>
            requires std::convertible_to<const S &, std::string_view>
        consteval format_with_location(const S &str, std::source_location loc = std::source_location::current())
            : fmt_str(str), loc(loc) {}

        fmt::format_string<Ts...> fmt_str;
        std::source_location loc;
    };

    // Overload (II) - direct formatting of error msg from args, appends source location info
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(format_with_location<std::type_identity_t<Ts>...> fmt_str, Ts&&... xs) {
        const auto &loc = fmt_str.loc;
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", fmt::format(fmt_str.fmt_str, std::forward<Ts>(xs)...),
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

} // namespace optval

#endif // OPTVAL_UTIL_ERRORS
