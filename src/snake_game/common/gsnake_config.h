/**
 * @file gsnake_config.h
 * @brief Константы конфигурации игры GridSnake
 *
 * Все параметры задаются на этапе компиляции и не меняются во время работы.
 * Заголовок общий для C и C++ кода: его используют модель, C API,
 * контроллер и модули отображения.
 *
 * @date 2026-10-19
 */

#ifndef GSNAKE_CONFIG_H
#define GSNAKE_CONFIG_H

/*
    Размер игрового поля в клетках (800x600 пикселей при клетке 20 пикселей).
*/
#define GSNAKE_GRID_WIDTH 40
#define GSNAKE_GRID_HEIGHT 30

/*
    Начальная длина змейки после сброса.
*/
#define GSNAKE_INITIAL_LENGTH 3

/*
    Скорость в тиках (ходах) в секунду: начальная и максимальная.
*/
#define GSNAKE_INITIAL_SPEED 10
#define GSNAKE_MAX_SPEED 20

/*
    Каждые GSNAKE_SPEED_STEP_SCORE очков скорость растёт на единицу.
*/
#define GSNAKE_SPEED_STEP_SCORE 5

/*
    Бюджет попыток случайного размещения еды перед запасным вариантом (0,0).
*/
#define GSNAKE_FOOD_RESPAWN_ATTEMPTS 1000

/*
    Коды клеток в GameInfo_t::field.
    Голова кодируется вместе с направлением: HEAD_UP + (int)направление.
*/
#define GSNAKE_CELL_EMPTY 0
#define GSNAKE_CELL_BODY 1
#define GSNAKE_CELL_FOOD 2
#define GSNAKE_CELL_HEAD_UP 3
#define GSNAKE_CELL_HEAD_DOWN 4
#define GSNAKE_CELL_HEAD_LEFT 5
#define GSNAKE_CELL_HEAD_RIGHT 6

#endif  // GSNAKE_CONFIG_H
