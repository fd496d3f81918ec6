/**
 * @file error_data.inline.hpp
 * @brief Implementations for type-parameterized member methods in the ErrorData class.
 */
#pragma once
#include "errchain/common/error_data.hpp"

namespace errchain
{

namespace detail
{

/**
 * @brief Helper to get the decayed storage type.
 */
template <typename T>
using payload_type_t = std::decay_t<T>;

} // namespace detail

template <typename T>
ErrorData ErrorData::of(T&& value)
{
    using StorageT = detail::payload_type_t<T>;
    static_assert(!std::is_void_v<StorageT>, "ErrorData: T cannot be void");
    static_assert(!std::is_array_v<StorageT>, "ErrorData: T cannot be an array type");

    ErrorData result;
    result.m_pvoid = std::make_shared<StorageT>(std::forward<T>(value));
    result.m_ti = std::type_index{typeid(StorageT)};
    return result;
}

template <typename T>
bool ErrorData::has_type() const noexcept
{
    using StorageT = detail::payload_type_t<T>;
    static_assert(!std::is_void_v<StorageT>, "ErrorData: T cannot be void");
    return m_ti == std::type_index{typeid(StorageT)};
}

template <typename T>
const T& ErrorData::as() const
{
    using StorageT = detail::payload_type_t<T>;
    static_assert(!std::is_void_v<StorageT>, "ErrorData: T cannot be void");

    if (!m_pvoid)
    {
        throw ErrorDataEmptyError{};
    }
    if (m_ti != std::type_index{typeid(StorageT)})
    {
        throw ErrorDataTypeError{
            "ErrorData type mismatch: expected " + std::string{typeid(StorageT).name()} +
            ", got " + std::string{m_ti.name()}
        };
    }
    return *static_cast<const StorageT*>(m_pvoid.get());
}

template <typename T>
const T* ErrorData::try_as() const noexcept
{
    using StorageT = detail::payload_type_t<T>;
    static_assert(!std::is_void_v<StorageT>, "ErrorData: T cannot be void");

    if (!m_pvoid || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return static_cast<const StorageT*>(m_pvoid.get());
}

template <typename T>
std::shared_ptr<const T> ErrorData::get() const noexcept
{
    using StorageT = detail::payload_type_t<T>;
    static_assert(!std::is_void_v<StorageT>, "ErrorData: T cannot be void");

    if (!m_pvoid || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return std::static_pointer_cast<const StorageT>(m_pvoid);
}

} // namespace errchain
