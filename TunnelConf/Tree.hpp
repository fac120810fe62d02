#pragma once
// Tree.hpp — отрисовка настроек деревом "├── / └──" для логов и аудита.

#include <optional>
#include <string>
#include <vector>

namespace TunnelConf
{

/**
 * @brief Стиль отрисовки дерева. Незаданные поля берут значения по умолчанию.
 */
struct ToLinesSettings
{
    /// @brief Отступ одного уровня вложенности (по умолчанию 4 пробела).
    std::optional<std::string> indent;
    /// @brief Префикс всех строк уровня, кроме последней (по умолчанию "├── ").
    std::optional<std::string> field_prefix;
    /// @brief Префикс последней строки уровня (по умолчанию "└── ").
    std::optional<std::string> last_field_prefix;

    void SetDefaults();

    bool operator==(const ToLinesSettings &) const = default;
};

namespace Tree
{

/**
 * @brief Узел дерева: заголовок и упорядоченные дочерние узлы.
 *
 * Дочерний узел на глубине d рисуется как indent×d + префикс + заголовок,
 * его дети рисуются на глубине d+1. Стиль передаётся явно, глобального состояния нет.
 */
class Node
{
public:
    explicit Node(std::string title = std::string());

    /**
     * @brief Добавить лист.
     * @return Ссылка на добавленный узел; действительна до следующего Append.
     */
    Node &Append(std::string title);

    /// @brief Добавить готовое поддерево.
    void Append(Node child);

    const std::string &Title() const noexcept { return title_; }
    const std::vector<Node> &Children() const noexcept { return children_; }

    /// @brief Заголовок (если не пуст) и все потомки.
    std::vector<std::string> Lines(ToLinesSettings style = {}) const;

    /// @brief Только потомки, без строки заголовка.
    std::vector<std::string> ChildLines(ToLinesSettings style = {}) const;

    /// @brief Lines(), склеенные через '\n' без завершающего перевода строки.
    std::string String(ToLinesSettings style = {}) const;

private:
    void Render(const ToLinesSettings &style,
                std::size_t depth,
                std::vector<std::string> &out) const;

    std::string       title_;
    std::vector<Node> children_;
};

}

std::string JoinLines(const std::vector<std::string> &lines);

}
