/**
 * @file wrap.hpp
 * @brief Lightweight wrappers for errors that do not need a full chain node.
 */
#pragma once
#include "errchain/common/common.hpp"
#include "errchain/chain/error_chain.hpp"

namespace errchain
{

/**
 * @brief Native error that prefixes a message with another error and unwraps to it.
 *
 * @details
 * Produced by `wrap_message()` and `wrap_with_cause()`. `Error::is()` looks
 * through a `WrappedError` to the error it wraps; a cause folded into the
 * text by `wrap_with_cause()` is display-only and carries no identity.
 */
class WrappedError : public std::runtime_error
{
public:
    WrappedError(Error wrapped, const std::string& message)
        : std::runtime_error(message)
        , m_wrapped(std::move(wrapped))
    {
    }

    /**
     * @brief The error this one was built around.
     */
    const Error& unwrap() const noexcept
    {
        return m_wrapped;
    }

private:
    Error m_wrapped;
};

/**
 * @brief Wrap @p err with a message.
 * @return Empty if @p err is empty; @p err itself if @p message is empty;
 *         otherwise a WrappedError reading `"<err>: <message>"`.
 */
[[nodiscard]] Error wrap_message(Error err, std::string_view message);

/**
 * @brief Wrap @p err with a message and a cause.
 * @return Empty if @p err is empty; `wrap_message(err, message)` if @p cause is
 *         empty; otherwise a WrappedError reading `"<err>: <cause>"`, or
 *         `"<err>: <message>: <cause>"` when @p message is not empty.
 *         The result always unwraps to @p err.
 */
[[nodiscard]] Error wrap_with_cause(Error err, const Error& cause, std::string_view message);

} // namespace errchain
