/**
 * @file error_chain.hpp
 * @brief Definition of ErrorChain and of the Error value accepted as cause or extra.
 * @see error_chain.inline.hpp for implementations of type-parameterized methods.
 */
#pragma once
#include "errchain/common/common.hpp"
#include "errchain/common/error_data.hpp"
#include <fmt/format.h>

namespace errchain
{

namespace detail
{
struct ChainNode;
} // namespace detail

class Error;

/**
 * @brief Any error that is not an ErrorChain.
 * @details Held by shared pointer so that identity survives copies of the handle.
 */
using NativeError = std::shared_ptr<const std::exception>;

/**
 * @brief Handle to one node of an error derivation lineage.
 *
 * @details
 * An `ErrorChain` is created from a root message with `make()` or a root
 * format template with `make_template()`, then refined by derivation calls
 * (`wrap()`, `wrap_cause()`, `wrap_data()`, `with_args()`, ...). Each
 * derivation allocates one new node that shares ownership of the node it was
 * derived from, so a node always knows its whole ancestry.
 *
 * Besides the parent ("wrapped") edge a node may carry:
 * - a cause: an independent `Error` explaining why this node exists;
 * - a payload (`ErrorData`) visible through `data()` and `any_data()`;
 * - extras: sibling errors appended with `extra()` for joint reporting.
 *
 * @par Rendering
 * `render()` produces a single line. The root-most printable ancestor is
 * followed by `':'`, intermediate ancestors are joined with `';'`, and the
 * node's own text is set off with `'>'`. Causes follow their node after
 * `'<'` and extras are appended after `'+'`:
 * @code
 *   pkg: subsystem; operation > detail < cause: detail + extra
 * @endcode
 * Template nodes and ancestors with empty text are left out of the line.
 *
 * @par Identity
 * `is()` compares node references, never text. A node "is" every ancestor
 * in its wrapped chain and everything its causes (and its ancestors' causes)
 * are. Extras carry no identity.
 *
 * @par Value semantics
 * - Copying a handle copies a reference; both handles name the same node.
 * - `operator==` compares node identity.
 *
 * @par Thread safety
 * - Nodes are immutable except for the extras list.
 * - `extra()` is only to be called by the single owner building the error,
 *   before the node is shared.
 * - All const methods are safe for concurrent reads once appends have stopped.
 */
class ErrorChain
{
public:
    /**
     * @brief Create a root node with literal text.
     */
    [[nodiscard]] static ErrorChain make(std::string message);

    /**
     * @brief Create a root template node.
     * @details The node is never printed; its text is a printf-style template
     *          filled by `with_args()` and the other `*_with_args()` calls.
     */
    [[nodiscard]] static ErrorChain make_template(std::string format);

    /**
     * @brief Derive a node with literal text.
     */
    [[nodiscard]] ErrorChain wrap(std::string message) const;

    /**
     * @brief Derive a template node, used to build multi-stage format chains.
     */
    [[nodiscard]] ErrorChain wrap_template(std::string format) const;

    /**
     * @brief Derive a template node that also carries a payload.
     */
    template <typename T>
    [[nodiscard]] ErrorChain wrap_data_template(std::string format, T&& data) const;

    /**
     * @brief Derive a literal node whose text is this node's template filled with @p args.
     * @details On a non-template node the stringified args are concatenated instead.
     *          A payload carried by the template moves onto the filled node.
     *          Never throws on a template/argument mismatch.
     */
    template <typename... Args>
    [[nodiscard]] ErrorChain with_args(const Args&... args) const;

    /**
     * @brief Derive a node that records @p cause as the reason it exists.
     */
    [[nodiscard]] ErrorChain wrap_cause(std::string message, Error cause) const;

    /**
     * @brief `with_args()` combined with `wrap_cause()`.
     */
    template <typename... Args>
    [[nodiscard]] ErrorChain wrap_cause_with_args(Error cause, const Args&... args) const;

    /**
     * @brief Derive a node carrying a payload.
     * @details Passing an `ErrorData` stores it as is rather than nesting it.
     */
    template <typename T>
    [[nodiscard]] ErrorChain wrap_data(std::string message, T&& data) const;

    /**
     * @brief `with_args()` combined with `wrap_data()`.
     */
    template <typename T, typename... Args>
    [[nodiscard]] ErrorChain wrap_data_with_args(T&& data, const Args&... args) const;

    /**
     * @brief Append @p err to this node's extras. Empty errors and this node itself are ignored.
     * @return This same handle, for chaining further appends.
     * @note Mutates the shared node; see the thread safety notes above.
     * @warning Appending an error whose rendering reaches back to this node
     *          (for example an error caused by it) makes `render()` recurse
     *          without end.
     */
    ErrorChain& extra(Error err);

    [[nodiscard]] const std::string& text() const noexcept;

    [[nodiscard]] bool is_template() const noexcept;

    /**
     * @brief The cause attached to this node, or an empty Error.
     */
    [[nodiscard]] const Error& cause() const noexcept;

    /**
     * @brief The payload attached to this node only; empty if none.
     */
    [[nodiscard]] ErrorData data() const noexcept;

    /**
     * @brief The first payload found walking from this node towards the root.
     */
    [[nodiscard]] ErrorData any_data() const noexcept;

    /**
     * @brief Extras in insertion order.
     */
    [[nodiscard]] const std::vector<Error>& extras() const noexcept;

    /**
     * @brief The node this one was derived from; empty for a root node.
     */
    [[nodiscard]] std::optional<ErrorChain> unwrap() const;

    /**
     * @brief Render the node, its printable ancestors, causes and extras on one line.
     */
    [[nodiscard]] std::string render() const;

    /**
     * @brief Check whether this node is, derives from, or was caused by @p target.
     */
    [[nodiscard]] bool is(const Error& target) const;

    /**
     * @brief Throw this chain as an ErrorChainException.
     */
    [[noreturn]] void raise() const;

    friend bool operator==(const ErrorChain& lhs, const ErrorChain& rhs) noexcept
    {
        return lhs.m_node == rhs.m_node;
    }

    friend bool operator!=(const ErrorChain& lhs, const ErrorChain& rhs) noexcept
    {
        return !(lhs == rhs);
    }

private:
    explicit ErrorChain(std::shared_ptr<detail::ChainNode> node) noexcept;

    ErrorChain derive(std::string text, bool is_template, Error cause, ErrorData data) const;

    template <typename... Args>
    std::string fill(const Args&... args) const;

    /**
     * @brief Payload a template node hands on to the node that fills it.
     */
    ErrorData template_payload() const noexcept;

private:
    std::shared_ptr<detail::ChainNode> m_node;
};

/**
 * @brief Any error value: empty, an ErrorChain, or a native error.
 *
 * @details
 * `Error` is the closed set of things a chain can point at as a cause or an
 * extra, and what the native wrappers in `errchain/native/wrap.hpp` accept and
 * return. Traversal is a structural match on the held alternative. Native
 * errors end a traversal unless they are one of the library's own carriers
 * (`WrappedError`, `ErrorChainException`).
 *
 * A null native pointer converts to the empty Error.
 */
class Error
{
public:
    Error() noexcept = default;

    Error(ErrorChain chain) noexcept
        : m_value(std::move(chain))
    {
    }

    template <typename E, typename = std::enable_if_t<std::is_base_of_v<std::exception, E>>>
    Error(std::shared_ptr<E> native) noexcept
    {
        if (native)
        {
            m_value = NativeError{std::move(native)};
        }
    }

    [[nodiscard]] bool has_value() const noexcept
    {
        return !std::holds_alternative<std::monostate>(m_value);
    }

    explicit operator bool() const noexcept
    {
        return has_value();
    }

    /**
     * @brief The held chain, or nullptr if this is not a chain.
     */
    [[nodiscard]] const ErrorChain* chain() const noexcept
    {
        return std::get_if<ErrorChain>(&m_value);
    }

    /**
     * @brief The held native error, or nullptr if this is not a native error.
     */
    [[nodiscard]] const NativeError* native() const noexcept
    {
        return std::get_if<NativeError>(&m_value);
    }

    /**
     * @brief Display form: chain rendering, native `what()`, or "" when empty.
     */
    [[nodiscard]] std::string message() const;

    /**
     * @brief Check whether this error is, wraps, or was caused by @p target.
     * @details An empty error only matches an empty target.
     */
    [[nodiscard]] bool is(const Error& target) const;

    /**
     * @brief Identity comparison: same chain node or same native object.
     */
    friend bool operator==(const Error& lhs, const Error& rhs) noexcept;

    friend bool operator!=(const Error& lhs, const Error& rhs) noexcept
    {
        return !(lhs == rhs);
    }

private:
    std::variant<std::monostate, ErrorChain, NativeError> m_value;
};

std::ostream& operator<<(std::ostream& os, const ErrorChain& chain);

std::ostream& operator<<(std::ostream& os, const Error& err);

} // namespace errchain

namespace fmt
{

template <>
struct formatter<errchain::ErrorChain> : formatter<string_view>
{
    template <typename FormatContext>
    auto format(const errchain::ErrorChain& chain, FormatContext& ctx) const -> decltype(ctx.out())
    {
        const std::string rendered = chain.render();
        return formatter<string_view>::format(rendered, ctx);
    }
};

template <>
struct formatter<errchain::Error> : formatter<string_view>
{
    template <typename FormatContext>
    auto format(const errchain::Error& err, FormatContext& ctx) const -> decltype(ctx.out())
    {
        const std::string rendered = err.message();
        return formatter<string_view>::format(rendered, ctx);
    }
};

} // namespace fmt
