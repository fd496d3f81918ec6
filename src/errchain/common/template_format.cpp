/**
 * @file template_format.cpp
 */
#include "errchain/common/template_format.hpp"
#include <fmt/ranges.h>

namespace errchain
{

namespace detail
{

std::string degraded_template(const std::string& format, const std::vector<std::string>& args)
{
    if (args.empty())
    {
        return format;
    }
    return fmt::format("{} [{}]", format, fmt::join(args, ", "));
}

} // namespace detail

} // namespace errchain
