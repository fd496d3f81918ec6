/**
 * @file chain_exceptions.hpp
 */
#pragma once
#include "errchain/common/common.hpp"
#include "errchain/chain/error_chain.hpp"

namespace errchain
{

/**
 * @brief Exception carrying an ErrorChain through C++ exception handling.
 *
 * @details
 * Thrown by `ErrorChain::raise()`. The message is the chain's rendering at
 * the time of construction. `chain()` hands the node back, so a handler can
 * test the caught error against sentinels with `is()`:
 * @code
 *   catch (const ErrorChainException& e)
 *   {
 *       if (e.chain().is(ErrNotFound)) { ... }
 *   }
 * @endcode
 * Held as a native `Error`, the exception is transparent to `Error::is()`:
 * it matches whatever its chain matches.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads once the chain is no longer
 *   being appended to.
 */
class ErrorChainException : public std::exception
{
public:
    explicit ErrorChainException(ErrorChain chain)
        : m_chain(std::move(chain))
        , m_message(m_chain.render())
    {
    }

    const ErrorChain& chain() const noexcept
    {
        return m_chain;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    ErrorChain m_chain;
    std::string m_message;
};

} // namespace errchain
