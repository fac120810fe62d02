#pragma once
// Config.hpp — чтение необязательных полей из JSON и разбор строковых значений.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/json/object.hpp>

namespace Config
{

/**
 * @brief Строковое поле. Отсутствующий ключ и null дают std::nullopt.
 * @throw std::runtime_error Поле есть, но не строка.
 */
std::optional<std::string> OptionalString(const boost::json::object &o, const char *key);

/**
 * @brief Целое поле; допускается строка с числом.
 * @throw std::runtime_error Поле есть, но не целое.
 */
std::optional<std::int64_t> OptionalInt(const boost::json::object &o, const char *key);

/**
 * @brief Логическое поле; допускаются строки yes/no/on/off/true/false/1/0.
 * @throw std::runtime_error Поле есть, но не логическое.
 */
std::optional<bool> OptionalBool(const boost::json::object &o, const char *key);

/**
 * @brief Список строк: массив строк либо строка "a,b,c".
 * @throw std::runtime_error Поле есть, но не список строк.
 */
std::optional<std::vector<std::string>> OptionalStringList(const boost::json::object &o, const char *key);

/**
 * @brief Вложенный объект или nullptr, если ключа нет.
 * @throw std::runtime_error Поле есть, но не объект.
 */
const boost::json::object *OptionalObject(const boost::json::object &o, const char *key);

/**
 * @brief Разбор двоичного значения (yes/no/on/off/true/false/1/0, без учёта регистра).
 * @return std::nullopt для нераспознанной строки.
 */
std::optional<bool> ParseBinary(const std::string &s);

std::string Trim(const std::string &s);

/**
 * @brief Делит строку по разделителю, обрезает пробелы, пустые элементы отбрасывает.
 */
std::vector<std::string> Split(const std::string &s, char separator);

/**
 * @brief Читает файл целиком, убирая UTF-8 BOM.
 * @return std::nullopt, если файла нет.
 * @throw std::runtime_error Путь является каталогом, либо ошибка ввода-вывода.
 */
std::optional<std::string> ReadTextFile(const std::string &path);

}
