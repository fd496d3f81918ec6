/**
 * @file error_chain.cpp
 */
#include "errchain/chain/error_chain.hpp"
#include "errchain/chain/chain_exceptions.hpp"
#include "errchain/native/wrap.hpp"

namespace errchain
{

namespace detail
{

/**
 * @brief Storage for one chain node.
 *
 * @details
 * Everything except `extras` is fixed at construction. `wrapped` is null for
 * a root node; no cycle can form because a node can only be derived from one
 * that already exists. `wrapped` is only released by the destructor.
 */
struct ChainNode
{
    ChainNode(std::string text_, bool is_template_, std::shared_ptr<ChainNode> wrapped_,
              Error cause_, ErrorData data_)
        : text(std::move(text_))
        , is_template(is_template_)
        , wrapped(std::move(wrapped_))
        , cause(std::move(cause_))
        , data(std::move(data_))
    {
    }

    ChainNode(const ChainNode&) = delete;
    ChainNode& operator=(const ChainNode&) = delete;

    // Ancestors owned only by this node are released one at a time, so that
    // dropping a long chain does not recurse once per ancestor.
    ~ChainNode()
    {
        std::shared_ptr<ChainNode> next = std::move(wrapped);
        while (next && next.use_count() == 1)
        {
            next = std::move(next->wrapped);
        }
    }

    const std::string text;
    const bool is_template;
    std::shared_ptr<ChainNode> wrapped;
    const Error cause;
    const ErrorData data;
    std::vector<Error> extras;
};

namespace
{

/**
 * @brief Text a node contributes as an ancestor: its own text plus its cause, if any.
 */
std::string ancestor_entry(const ChainNode& node)
{
    if (!node.cause)
    {
        return node.text;
    }
    return node.text + " < " + node.cause.message();
}

} // namespace

} // namespace detail

ErrorChain::ErrorChain(std::shared_ptr<detail::ChainNode> node) noexcept
    : m_node(std::move(node))
{
}

ErrorChain ErrorChain::make(std::string message)
{
    return ErrorChain{
        std::make_shared<detail::ChainNode>(std::move(message), false, nullptr, Error{}, ErrorData{})};
}

ErrorChain ErrorChain::make_template(std::string format)
{
    return ErrorChain{
        std::make_shared<detail::ChainNode>(std::move(format), true, nullptr, Error{}, ErrorData{})};
}

ErrorChain ErrorChain::derive(std::string text, bool is_template, Error cause, ErrorData data) const
{
    return ErrorChain{std::make_shared<detail::ChainNode>(
        std::move(text), is_template, m_node, std::move(cause), std::move(data))};
}

ErrorChain ErrorChain::wrap(std::string message) const
{
    return derive(std::move(message), false, Error{}, ErrorData{});
}

ErrorChain ErrorChain::wrap_template(std::string format) const
{
    return derive(std::move(format), true, Error{}, ErrorData{});
}

ErrorChain ErrorChain::wrap_cause(std::string message, Error cause) const
{
    return derive(std::move(message), false, std::move(cause), ErrorData{});
}

ErrorData ErrorChain::template_payload() const noexcept
{
    return m_node->is_template ? m_node->data : ErrorData{};
}

ErrorChain& ErrorChain::extra(Error err)
{
    if (err && err != Error{*this})
    {
        m_node->extras.push_back(std::move(err));
    }
    return *this;
}

const std::string& ErrorChain::text() const noexcept
{
    return m_node->text;
}

bool ErrorChain::is_template() const noexcept
{
    return m_node->is_template;
}

const Error& ErrorChain::cause() const noexcept
{
    return m_node->cause;
}

ErrorData ErrorChain::data() const noexcept
{
    return m_node->data;
}

ErrorData ErrorChain::any_data() const noexcept
{
    for (const detail::ChainNode* node = m_node.get(); node; node = node->wrapped.get())
    {
        if (node->data.has_value())
        {
            return node->data;
        }
    }
    return ErrorData{};
}

const std::vector<Error>& ErrorChain::extras() const noexcept
{
    return m_node->extras;
}

std::optional<ErrorChain> ErrorChain::unwrap() const
{
    if (!m_node->wrapped)
    {
        return std::nullopt;
    }
    return ErrorChain{m_node->wrapped};
}

std::string ErrorChain::render() const
{
    const detail::ChainNode& self = *m_node;

    std::string message = self.is_template ? std::string{} : self.text;
    if (self.cause)
    {
        message += " < " + self.cause.message();
    }

    // Nearest ancestor first.
    std::vector<std::string> stack;
    for (const detail::ChainNode* node = self.wrapped.get(); node; node = node->wrapped.get())
    {
        if (node->is_template || node->text.empty())
        {
            continue;
        }
        stack.push_back(detail::ancestor_entry(*node));
    }

    std::string result;
    if (stack.empty())
    {
        result = std::move(message);
    }
    else if (stack.size() == 1)
    {
        result = message.empty() ? stack.front() : stack.front() + ": " + message;
    }
    else
    {
        result = stack.back() + ":";
        for (std::size_t i = stack.size() - 1; i-- > 0;)
        {
            result += " " + stack[i];
            if (i > 0)
            {
                result += ";";
            }
        }
        if (!message.empty())
        {
            result += " > " + message;
        }
    }

    for (const Error& extra : self.extras)
    {
        result += " + " + extra.message();
    }
    return result;
}

bool ErrorChain::is(const Error& target) const
{
    const ErrorChain* target_chain = target.chain();
    for (const detail::ChainNode* node = m_node.get(); node; node = node->wrapped.get())
    {
        if (target_chain && target_chain->m_node.get() == node)
        {
            return true;
        }
        if (node->cause && node->cause.is(target))
        {
            return true;
        }
    }
    return false;
}

void ErrorChain::raise() const
{
    throw ErrorChainException{*this};
}

std::string Error::message() const
{
    if (const ErrorChain* c = chain())
    {
        return c->render();
    }
    if (const NativeError* n = native())
    {
        return (*n)->what();
    }
    return std::string{};
}

bool Error::is(const Error& target) const
{
    if (!has_value())
    {
        return !target.has_value();
    }
    if (const ErrorChain* c = chain())
    {
        return c->is(target);
    }

    const NativeError& self = *native();
    if (const NativeError* t = target.native(); t && *t == self)
    {
        return true;
    }
    if (const auto* wrapped = dynamic_cast<const WrappedError*>(self.get()))
    {
        return wrapped->unwrap().is(target);
    }
    if (const auto* thrown = dynamic_cast<const ErrorChainException*>(self.get()))
    {
        return thrown->chain().is(target);
    }
    return false;
}

bool operator==(const Error& lhs, const Error& rhs) noexcept
{
    if (const ErrorChain* c = lhs.chain())
    {
        const ErrorChain* other = rhs.chain();
        return other && *c == *other;
    }
    if (const NativeError* n = lhs.native())
    {
        const NativeError* other = rhs.native();
        return other && *n == *other;
    }
    return !rhs.has_value();
}

std::ostream& operator<<(std::ostream& os, const ErrorChain& chain)
{
    return os << chain.render();
}

std::ostream& operator<<(std::ostream& os, const Error& err)
{
    return os << err.message();
}

} // namespace errchain
