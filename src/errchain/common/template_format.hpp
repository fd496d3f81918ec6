/**
 * @file template_format.hpp
 * @brief printf-style template substitution used by template chain nodes.
 */
#pragma once
#include "errchain/common/common.hpp"
#include <fmt/format.h>
#include <fmt/printf.h>

namespace errchain
{

namespace detail
{

/**
 * @brief Stringify a single template argument with its default `{}` formatting.
 */
template <typename Arg>
std::string stringify_arg(const Arg& arg)
{
    return fmt::format("{}", arg);
}

/**
 * @brief Build the text used when a template cannot be filled by its arguments.
 * @return @p format followed by the arguments in brackets, e.g. `"v=%d [x, y]"`.
 */
std::string degraded_template(const std::string& format, const std::vector<std::string>& args);

} // namespace detail

/**
 * @brief Concatenate the stringified arguments, without separators.
 * @details Used in place of substitution when the text to fill is not a template.
 */
template <typename... Args>
std::string concat_args(const Args&... args)
{
    std::string out;
    ((out += detail::stringify_arg(args)), ...);
    return out;
}

/**
 * @brief Fill a printf-style template (`%s`, `%d`, `%5.2f`, ...) with arguments.
 *
 * @details
 * Never throws on a malformed template or an argument mismatch: the
 * `fmt::format_error` raised by the formatter is turned into the degraded
 * rendering of `detail::degraded_template()`. Surplus arguments are ignored.
 */
template <typename... Args>
std::string format_template(const std::string& format, const Args&... args)
{
    try
    {
        return fmt::sprintf(format, args...);
    }
    catch (const fmt::format_error&)
    {
        return detail::degraded_template(format, {detail::stringify_arg(args)...});
    }
}

} // namespace errchain
