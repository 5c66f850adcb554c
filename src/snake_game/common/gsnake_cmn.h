/**
 * @file gsnake_cmn.h
 * @brief Общие утилиты GridSnake для работы с GameInfo_t
 *
 * Этот заголовочный файл предоставляет функции, которые используются
 * ядром игры, контроллером и тестами:
 * - Управление памятью для игрового поля
 * - Инициализацию и очистку структуры GameInfo_t
 * - Валидацию вводимых данных и снимка состояния
 * - Пересчёт скорости в период тика
 *
 * Рекорд хранится только в памяти, функций сохранения на диск нет.
 *
 * @version 1.0
 * @date 2026-10-19
 */

#ifndef GSNAKE_CMN_H
#define GSNAKE_CMN_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>

#include "gsnake_game.h"

/**
 * @brief Выделить память для игрового поля (40x30)
 *
 * Выделяет 2D массив размером GSNAKE_GRID_HEIGHT x GSNAKE_GRID_WIDTH целых
 * чисел. Каждый элемент инициализируется значением GSNAKE_CELL_EMPTY.
 *
 * @code
 * int **field = gsnake_allocate_field();
 * field[0][0] = GSNAKE_CELL_FOOD;
 * gsnake_free_field(field);
 * @endcode
 *
 * @return Указатель на новое поле, или NULL при ошибке
 *
 * @note Вызывающая сторона освобождает память через gsnake_free_field().
 *
 * @see gsnake_free_field()
 */
int **gsnake_allocate_field(void);

/**
 * @brief Освободить память игрового поля
 *
 * @param field Указатель на поле (может быть NULL)
 *
 * @see gsnake_allocate_field()
 */
void gsnake_free_field(int **field);

/**
 * @brief Заполнить все клетки поля значением GSNAKE_CELL_EMPTY
 *
 * @param field Указатель на поле. NULL игнорируется.
 */
void gsnake_clear_field(int **field);

/**
 * @brief Создать и инициализировать структуру GameInfo_t
 *
 * Выделяет поле и задаёт значения по умолчанию:
 * - score = 0, high_score = 0
 * - speed = GSNAKE_INITIAL_SPEED
 * - length = GSNAKE_INITIAL_LENGTH, direction = DIR_RIGHT
 * - ready = 1, pause = 0, game_over = 0
 *
 * @return Инициализированная структура. При ошибке выделения field == NULL.
 *
 * @see gsnake_destroy_game_info()
 */
GameInfo_t gsnake_create_game_info(void);

/**
 * @brief Освободить структуру GameInfo_t
 *
 * Освобождает поле и обнуляет структуру. Безопасна при NULL.
 *
 * @param info Указатель на структуру
 */
void gsnake_destroy_game_info(GameInfo_t *info);

/**
 * @brief Проверить, что значение является допустимым UserAction_t
 *
 * @param action Значение действия
 * @return true для значений от Start до Action
 */
bool gsnake_is_valid_action(UserAction_t action);

/**
 * @brief Проверить корректность поля
 *
 * - field и все строки не NULL
 * - каждая клетка содержит код из диапазона GSNAKE_CELL_EMPTY..GSNAKE_CELL_HEAD_RIGHT
 *
 * @param field Указатель на поле
 * @return true если поле корректно
 */
bool gsnake_is_valid_field(int **field);

/**
 * @brief Проверить корректность снимка GameInfo_t
 *
 * - field корректно (см. gsnake_is_valid_field())
 * - score и high_score неотрицательны
 * - length не меньше 1, direction из SnakeDirection_t
 * - speed в диапазоне [1, GSNAKE_MAX_SPEED]
 * - флаги pause, ready, game_over равны 0 или 1
 *
 * @param info Указатель на снимок
 * @return true если все поля корректны
 */
bool gsnake_is_valid_game_info(const GameInfo_t *info);

/**
 * @brief Период тика в миллисекундах для заданной скорости
 *
 * Скорость ограничивается диапазоном [1, GSNAKE_MAX_SPEED], затем
 * возвращается 1000 / speed (целочисленное деление).
 *
 * @code
 * gsnake_speed_interval_ms(10);  // 100
 * gsnake_speed_interval_ms(11);  // 90
 * @endcode
 *
 * @param speed Скорость в тиках в секунду
 * @return Период в миллисекундах
 */
int gsnake_speed_interval_ms(int speed);

#ifdef __cplusplus
}
#endif

#endif  // GSNAKE_CMN_H
