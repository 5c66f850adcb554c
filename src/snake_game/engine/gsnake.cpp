/**
 * @file gsnake.cpp
 * @brief C API обёртка для C++ реализации gsnake::SnakeGame
 *
 * Все функции объявлены как extern "C" и помечены noexcept, чтобы
 * исключения C++ не пересекали границу C.
 *
 * @note Логика игры находится в gsnake_internals.cpp.
 * @see gsnake.h, gsnake_internals.hpp
 */

#include "gsnake.h"

#include "gsnake_internals.hpp"

extern "C" {

void* snake_create(void) noexcept { return gsnake::SnakeGame::create(); }

void snake_destroy(void* game) noexcept { gsnake::SnakeGame::destroy(game); }

void snake_handle_input(void* game, UserAction_t action, bool hold) noexcept {
  gsnake::SnakeGame::handle_input(game, action, hold);
}

void snake_update(void* game) noexcept { gsnake::SnakeGame::update(game); }

const GameInfo_t* snake_get_info(const void* game) noexcept {
  return gsnake::SnakeGame::get_info(game);
}

}  // extern "C"
