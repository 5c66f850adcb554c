/**
 * @file gsnake_game.h
 * @brief Общие типы данных игры GridSnake для C и C++ кода
 *
 * Описывает действия пользователя (UserAction_t), направление движения
 * (SnakeDirection_t) и снимок состояния для отрисовки (GameInfo_t).
 * Эти типы пересекают границу C API: контроллер и модули отображения
 * работают только с ними и никогда не видят внутренние C++ классы.
 *
 * @date 2026-10-19
 */

#ifndef GSNAKE_GAME_H
#define GSNAKE_GAME_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>

#include "gsnake_config.h"

/**
 * @enum UserAction_t
 * @brief Действия пользователя, которые контроллер передаёт в игру.
 *
 * Привязка клавиш к действиям выполняется вне игры (см. game_loop).
 * Terminate и Action игрой не обрабатываются: Terminate означает выход
 * из приложения и перехватывается контроллером.
 */
typedef enum UserAction_t {
  Start,
  Pause,
  Terminate,
  Left,
  Right,
  Up,
  Down,
  Action
} UserAction_t;

/**
 * @enum SnakeDirection_t
 * @brief Направление движения змейки в C API.
 *
 * Порядок совпадает с gsnake::Direction и с кодами головы
 * GSNAKE_CELL_HEAD_UP..GSNAKE_CELL_HEAD_RIGHT.
 */
typedef enum SnakeDirection_t {
  DIR_UP = 0,
  DIR_DOWN,
  DIR_LEFT,
  DIR_RIGHT
} SnakeDirection_t;

/**
 * @struct GameInfo_t
 * @brief Снимок состояния игры для отрисовки.
 *
 * @var GameInfo_t::field
 *      Матрица GSNAKE_GRID_HEIGHT x GSNAKE_GRID_WIDTH, индексация field[y][x].
 *      Значения - коды GSNAKE_CELL_*.
 * @var GameInfo_t::score
 *      Счёт текущего забега.
 * @var GameInfo_t::high_score
 *      Лучший счёт за сессию (только в памяти).
 * @var GameInfo_t::speed
 *      Скорость в тиках в секунду, [1, GSNAKE_MAX_SPEED].
 * @var GameInfo_t::length
 *      Длина тела змейки.
 * @var GameInfo_t::direction
 *      Текущее (зафиксированное) направление головы.
 * @var GameInfo_t::pause, GameInfo_t::ready, GameInfo_t::game_over
 *      Флаги 0/1. Приоритет при выборе экрана: ready > game_over > pause.
 */
typedef struct {
  int **field;
  int score;
  int high_score;
  int speed;
  int length;
  SnakeDirection_t direction;
  int pause;
  int ready;
  int game_over;
} GameInfo_t;

#ifdef __cplusplus
}
#endif

#endif  // GSNAKE_GAME_H
