#pragma once
// Logger.hpp — Boost.Log: консоль + опциональный файл, уровни из LOG_LEVEL.
// Публичный API в namespace Logger, макросы глобальные.

#include <string>
#include <cstddef>

#include <boost/log/trivial.hpp>

namespace Logger
{
    /// @brief Уровни важности (trace < debug < info < warning < error < fatal).
    using severity_t = boost::log::trivial::severity_level;

    /**
     * @brief Опции инициализации логирования.
     */
    struct Options
    {
        /// @brief Имя приложения, печатается в первой строке лога.
        std::string app_name = "tunnelconf";

        /// @brief Каталог для логов (создаётся при необходимости).
        std::string directory = "logs";

        /// @brief Базовое имя файлов лога.
        std::string base_filename = "tunnelconf";

        /// @brief Включить запись в файл. Для CLI по умолчанию выключено.
        bool enable_file = false;

        /// @brief Включить вывод в консоль (std::clog).
        bool enable_console = true;

        /// @brief Минимальный уровень для файла.
        severity_t file_min_severity = boost::log::trivial::debug;

        /// @brief Минимальный уровень для консоли.
        severity_t console_min_severity = boost::log::trivial::info;

        /// @brief Размер файла для ротации (байты).
        std::size_t rotation_size_bytes = 8ull * 1024 * 1024; // 8 MB
    };

    /**
     * @brief RAII-гвард логирования. Конструктор инициализирует, деструктор сбрасывает и снимает синки.
     * @details Один экземпляр на процесс (обычно в начале main()).
     *          Без гварда Boost.Log пишет в консоль с настройками по умолчанию,
     *          поэтому библиотечный код и тесты логируют без инициализации.
     */
    class Guard
    {
    public:
        /**
         * @brief Добавляет sinks по заданным опциям.
         * @throw std::runtime_error Не удалось создать каталог для файла лога.
         */
        explicit Guard(const Options &opts);

        /// @brief Снимает sinks и сбрасывает буферы.
        ~Guard();

        Guard(const Guard &) = delete;
        Guard &operator=(const Guard &) = delete;
    };

    /**
     * @brief Разбирает имя уровня (trace|debug|info|warning|error|fatal), регистр не важен.
     * @param name Имя уровня.
     * @return Уровень важности.
     * @throw std::invalid_argument Неизвестное имя.
     */
    severity_t ParseSeverity(const std::string &name);
}

/**
 * @brief Лог одной строкой с тэгом перед сообщением.
 * Пример: LOGI("resolver") << "Resolved";  // => ... [info] [resolver] Resolved
 */
#define LOGT(TAG) BOOST_LOG_TRIVIAL(trace)  << "[" << (TAG) << "] "
#define LOGD(TAG) BOOST_LOG_TRIVIAL(debug)  << "[" << (TAG) << "] "
#define LOGI(TAG) BOOST_LOG_TRIVIAL(info)   << "[" << (TAG) << "] "
#define LOGW(TAG) BOOST_LOG_TRIVIAL(warning)<< "[" << (TAG) << "] "
#define LOGE(TAG) BOOST_LOG_TRIVIAL(error)  << "[" << (TAG) << "] "
#define LOGF(TAG) BOOST_LOG_TRIVIAL(fatal)  << "[" << (TAG) << "] "
