/**
 * @file error_data.hpp
 * @brief Definition of ErrorData, the type-erased payload carried by a chain node.
 * @see error_data.inline.hpp for implementations of type-parameterized methods.
 */

#pragma once
#include "errchain/common/common.hpp"

namespace errchain
{

/**
 * @brief Exception thrown when an ErrorData payload is read as the wrong type.
 */
class ErrorDataTypeError : public std::runtime_error
{
public:
    explicit ErrorDataTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Exception thrown when reading an empty ErrorData.
 */
class ErrorDataEmptyError : public std::runtime_error
{
public:
    ErrorDataEmptyError()
        : std::runtime_error("ErrorData is empty")
    {}
};

/**
 * @brief An immutable, type-erased payload attached to an error chain node.
 *
 * @details
 * ErrorData holds a value of any copyable or movable type behind a
 * `shared_ptr<const void>` whose deleter remembers the original type. The
 * payload is fixed once created; readers only ever get const access.
 *
 * @par Invariants
 * - `(m_ti == typeid(void))` if and only if `m_pvoid == nullptr`
 * - Stored type is always the decayed type of the value given to `of()`.
 *
 * @par Thread Safety
 * - Safe for simultaneous reading and being copied from.
 *
 * @par Ownership
 * - Copies share the same underlying value.
 */
class ErrorData
{
public:
    /**
     * @brief Default constructor creates an empty payload.
     */
    ErrorData() = default;

    /**
     * @brief Create a payload holding a copy (or move) of @p value.
     * @tparam T The type of value (will be decayed).
     */
    template <typename T>
    [[nodiscard]] static ErrorData of(T&& value);

    [[nodiscard]] bool has_value() const noexcept
    {
        return m_pvoid != nullptr;
    }

    /**
     * @brief Check if stored type matches T.
     * @return true if the payload holds a value of decayed type T.
     */
    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    /**
     * @brief Get the type_index of stored value.
     * @return type_index of stored type, or typeid(void) if empty.
     */
    [[nodiscard]] std::type_index type() const noexcept
    {
        return m_ti;
    }

    /**
     * @brief Access stored value.
     * @throws ErrorDataEmptyError if empty.
     * @throws ErrorDataTypeError if type mismatch.
     */
    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @brief Access stored value as pointer.
     * @return Pointer to stored value, or nullptr if empty or type mismatch.
     */
    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

    /**
     * @brief Get shared ownership of the stored value.
     * @return shared_ptr<const T> if type matches, nullptr otherwise.
     */
    template <typename T>
    [[nodiscard]] std::shared_ptr<const T> get() const noexcept;

private:
    std::shared_ptr<const void> m_pvoid{};
    std::type_index m_ti{typeid(void)};
};

} // namespace errchain
