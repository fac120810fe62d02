#pragma once
// Fields.hpp — операции над необязательными полями: merge, override, default.

#include <optional>
#include <string>
#include <utility>

namespace TunnelConf::Fields
{

/// @brief Заполнить поле, только если оно ещё не задано.
template <class T>
void MergeWith(std::optional<T> &field, const std::optional<T> &other)
{
    if (!field)
    {
        field = other;
    }
}

/// @brief Заменить поле, если в other оно задано (в том числе пустым значением).
template <class T>
void OverrideWith(std::optional<T> &field, const std::optional<T> &other)
{
    if (other)
    {
        field = other;
    }
}

/// @brief Значение по умолчанию для незаданного поля.
template <class T, class U>
void Default(std::optional<T> &field, U &&value)
{
    if (!field)
    {
        field = std::forward<U>(value);
    }
}

/// @brief Значение поля или значение «по нулям» для отрисовки и проверок.
template <class T>
T ValueOr(const std::optional<T> &field, T fallback = T())
{
    return field ? *field : fallback;
}

/// @brief Задано и не пусто.
inline bool IsSet(const std::optional<std::string> &field)
{
    return field && !field->empty();
}

/// @brief "[set]" / "[not set]" вместо секрета.
inline std::string Obfuscate(const std::optional<std::string> &secret)
{
    return IsSet(secret) ? "[set]" : "[not set]";
}

/// @brief "set" / "not set" вместо секрета.
inline std::string SetOrNot(const std::optional<std::string> &secret)
{
    return IsSet(secret) ? "set" : "not set";
}

}
