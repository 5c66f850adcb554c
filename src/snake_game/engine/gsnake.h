/**
 * @file gsnake.h
 * @brief Публичный C интерфейс игры "Змейка"
 *
 * Контроллер и модули отображения работают с игрой только через эти
 * функции и непрозрачный указатель void*. Реализация - C++ класс
 * gsnake::SnakeGame (gsnake_internals.hpp).
 *
 * Типичный цикл:
 * @code
 * void* game = snake_create();
 * snake_handle_input(game, Start, false);
 * while (running) {
 *     snake_update(game);
 *     const GameInfo_t* info = snake_get_info(game);
 *     draw(info);
 *     sleep_ms(gsnake_speed_interval_ms(info->speed));
 * }
 * snake_destroy(game);
 * @endcode
 *
 * @note Все функции безопасны при game == NULL.
 */

#ifndef GSNAKE_H
#define GSNAKE_H

#include <stdbool.h>

#include "gsnake_game.h"

#ifdef __cplusplus
#define GSNAKE_NOEXCEPT noexcept
extern "C" {
#else
#define GSNAKE_NOEXCEPT
#endif

/**
 * @brief Создать игру в состоянии READY
 * @return Непрозрачный указатель или NULL при ошибке
 */
void *snake_create(void) GSNAKE_NOEXCEPT;

/**
 * @brief Уничтожить игру. NULL игнорируется.
 */
void snake_destroy(void *game) GSNAKE_NOEXCEPT;

/**
 * @brief Передать действие пользователя
 *
 * Start - старт/перезапуск, Pause - пауза, Left/Right/Up/Down - поворот.
 * Terminate и Action игра не обрабатывает.
 */
void snake_handle_input(void *game, UserAction_t action,
                        bool hold) GSNAKE_NOEXCEPT;

/**
 * @brief Один тик игры (движение, еда, столкновения)
 */
void snake_update(void *game) GSNAKE_NOEXCEPT;

/**
 * @brief Снимок состояния для отрисовки
 * @return Указатель, валидный до следующего изменяющего вызова, или NULL
 */
const GameInfo_t *snake_get_info(const void *game) GSNAKE_NOEXCEPT;

#ifdef __cplusplus
}
#endif

#endif  // GSNAKE_H
