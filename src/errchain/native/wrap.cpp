/**
 * @file wrap.cpp
 */
#include "errchain/native/wrap.hpp"

namespace errchain
{

Error wrap_message(Error err, std::string_view message)
{
    if (!err)
    {
        return Error{};
    }
    if (message.empty())
    {
        return err;
    }
    std::string text = fmt::format("{}: {}", err.message(), message);
    return std::make_shared<WrappedError>(std::move(err), text);
}

Error wrap_with_cause(Error err, const Error& cause, std::string_view message)
{
    if (!err)
    {
        return Error{};
    }
    if (!cause)
    {
        return wrap_message(std::move(err), message);
    }
    std::string text;
    if (message.empty())
    {
        text = fmt::format("{}: {}", err.message(), cause.message());
    }
    else
    {
        text = fmt::format("{}: {}: {}", err.message(), message, cause.message());
    }
    return std::make_shared<WrappedError>(std::move(err), text);
}

} // namespace errchain
