#pragma once
// Source.hpp — интерфейс источника фрагмента настроек.

#include <string>

#include "TunnelConf/Settings/Settings.hpp"

namespace TunnelConf
{

/**
 * @brief Источник фрагмента настроек (окружение, файлы, секреты).
 *
 * Read() оставляет незатронутые источником поля незаданными. Если входных
 * данных нет (файл отсутствует), возвращается пустой фрагмент.
 */
class Source
{
public:
    virtual ~Source() = default;

    /// @brief Короткое имя для логов и ошибок, например "environment".
    virtual std::string Name() const = 0;

    /**
     * @brief Прочитать фрагмент.
     * @throw SourceError Некорректные входные данные.
     */
    virtual Settings Read() = 0;
};

}
