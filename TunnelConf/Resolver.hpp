#pragma once
// Resolver.hpp — сборка итоговых настроек: фрагменты -> значения по умолчанию -> проверка.

#include <memory>
#include <vector>

#include "TunnelConf/Settings/Settings.hpp"
#include "TunnelConf/Sources/Source.hpp"

namespace TunnelConf
{

/**
 * @brief Единственный путь к значениям по умолчанию.
 *
 * Порядок всегда один: фрагменты объединяются MergeWith в порядке приоритета,
 * затем применяются явные переопределения OverrideWith, затем один раз
 * SetDefaults и Validate.
 */
class Resolver
{
public:
    /// @param sources Источники, первым идёт самый приоритетный.
    explicit Resolver(std::vector<std::unique_ptr<Source>> sources);

    /**
     * @brief Прочитать все источники и собрать настройки.
     * @throw SourceError Ошибка чтения источника, имя источника в Source().
     * @throw ValidationError Итоговые настройки некорректны.
     */
    Settings Resolve();

    /**
     * @brief Собрать настройки из уже прочитанных фрагментов.
     * @param fragments Фрагменты, первым идёт самый приоритетный.
     * @param overrides Применяются после объединения, последний побеждает.
     * @throw ValidationError
     */
    static Settings Resolve(const std::vector<Settings> &fragments,
                            const std::vector<Settings> &overrides = {});

    /// @brief Копии фрагментов, прочитанных последним Resolve(), в порядке источников.
    const std::vector<Settings> &Fragments() const noexcept { return fragments_; }

    /**
     * @brief Объединить фрагменты одного домена и применить значения по умолчанию
     *        без проверки. ctx передаётся в SetDefaults (например, провайдер для OpenVpn).
     */
    template <class T, class... Ctx>
    static T Combine(const std::vector<T> &fragments,
                     const std::vector<T> &overrides,
                     const Ctx &...ctx)
    {
        T out;
        for (const T &fragment : fragments)
        {
            out.MergeWith(fragment);
        }
        for (const T &o : overrides)
        {
            out.OverrideWith(o);
        }
        out.SetDefaults(ctx...);
        return out;
    }

private:
    std::vector<std::unique_ptr<Source>> sources_;
    std::vector<Settings>                fragments_;
};

}
