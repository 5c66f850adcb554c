/**
 * @file cli.h
 * @brief CLI-реализация View для GridSnake (через ncurses).
 *
 * Экспортирует объект `cli_view`, реализующий интерфейс @ref ViewInterface
 * в терминале.
 *
 * Пример использования:
 * @code
 * ViewHandle_t view = cli_view.init(62, 32, 60);
 * cli_view.configure_zone(view, "field", 1, 1, 40, 30);
 * // ... draw_element, render, poll_input
 * cli_view.shutdown(view);
 * @endcode
 *
 * @note Для компиляции требуется ncurses (-lncurses).
 * @note init() возвращает NULL, если терминал меньше запрошенной области.
 * @note Не вызывайте функции ncurses напрямую, пока интерфейс активен.
 *
 * @defgroup Cli_view Реализация CLI-интерфейса
 * @ingroup View
 */

#ifndef CLI_H
#define CLI_H

#include "../common/view.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Экземпляр интерфейса отображения на базе ncurses.
 *
 * Матрица поля рисуется символами: тело 'o', еда '*', голова '^' 'v' '<' '>'
 * в зависимости от направления. Вокруг матричных зон рисуется рамка,
 * поэтому зону поля нужно располагать не ближе одной клетки к краю.
 * Текст центрируется по ширине зоны.
 *
 * @note Все функции потоконебезопасны - вызывайте из основного цикла.
 */
extern const ViewInterface cli_view;

#ifdef __cplusplus
}
#endif

#endif // CLI_H

/** @} */
