/**
 * @file error_chain.inline.hpp
 * @brief Implementations for type-parameterized member methods in the ErrorChain class.
 */
#pragma once
#include "errchain/chain/error_chain.hpp"
#include "errchain/common/error_data.inline.hpp"
#include "errchain/common/template_format.hpp"

namespace errchain
{

namespace detail
{

template <typename T>
ErrorData to_payload(T&& data)
{
    if constexpr (std::is_same_v<std::decay_t<T>, ErrorData>)
    {
        return std::forward<T>(data);
    }
    else
    {
        return ErrorData::of(std::forward<T>(data));
    }
}

} // namespace detail

template <typename... Args>
std::string ErrorChain::fill(const Args&... args) const
{
    if (!is_template())
    {
        return concat_args(args...);
    }
    return format_template(text(), args...);
}

template <typename T>
ErrorChain ErrorChain::wrap_data_template(std::string format, T&& data) const
{
    return derive(std::move(format), true, Error{}, detail::to_payload(std::forward<T>(data)));
}

template <typename... Args>
ErrorChain ErrorChain::with_args(const Args&... args) const
{
    return derive(fill(args...), false, Error{}, template_payload());
}

template <typename... Args>
ErrorChain ErrorChain::wrap_cause_with_args(Error cause, const Args&... args) const
{
    return derive(fill(args...), false, std::move(cause), template_payload());
}

template <typename T>
ErrorChain ErrorChain::wrap_data(std::string message, T&& data) const
{
    return derive(std::move(message), false, Error{}, detail::to_payload(std::forward<T>(data)));
}

template <typename T, typename... Args>
ErrorChain ErrorChain::wrap_data_with_args(T&& data, const Args&... args) const
{
    return derive(fill(args...), false, Error{}, detail::to_payload(std::forward<T>(data)));
}

} // namespace errchain
