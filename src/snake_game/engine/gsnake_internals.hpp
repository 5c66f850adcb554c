/**
 * @file gsnake_internals.hpp
 * @brief Объявление класса gsnake::SnakeGame - контроллера игры "Змейка"
 *
 * SnakeGame владеет змейкой, едой, счётом и конечным автоматом состояний
 * READY / PLAYING / PAUSED / GAME_OVER. Снаружи доступен двумя путями:
 * - статические методы create / destroy / handle_input / update / get_info
 *   для C API (gsnake.cpp), экземпляр передаётся как непрозрачный void*;
 * - константные аксессоры для тестов и C++ кода.
 *
 * @note Точки входа C API noexcept: исключения не пересекают границу C.
 * @note Потокобезопасность не гарантируется.
 *
 * @see gsnake_internals.cpp - реализация
 * @see gsnake.h             - публичный C интерфейс
 */

#ifndef GSNAKE_INTERNALS_HPP
#define GSNAKE_INTERNALS_HPP

#include "fsm.h"
#include "gsnake_game.h"
#include "gsnake_model.hpp"

namespace gsnake {

/**
 * @enum GameState
 * @brief Состояния игры. Значения - идентификаторы состояний FSM.
 */
enum class GameState : fsm_state_t {
  READY = 0,  ///< Стартовый экран
  PLAYING,    ///< Игра идёт
  PAUSED,     ///< Пауза
  GAME_OVER   ///< Столкновение, ожидание перезапуска
};

/**
 * @enum GameEvent
 * @brief События FSM. Значение 0 зарезервировано под FSM_EVENT_NONE.
 */
enum class GameEvent : fsm_event_t {
  NONE = FSM_EVENT_NONE,
  START,         ///< Старт из READY или перезапуск из GAME_OVER
  PAUSE_TOGGLE,  ///< PLAYING <-> PAUSED
  COLLISION,     ///< Столкновение со стеной или телом
  MOVE_UP,
  MOVE_DOWN,
  MOVE_LEFT,
  MOVE_RIGHT
};

constexpr fsm_state_t to_fsm_state(GameState s) noexcept {
  return static_cast<fsm_state_t>(s);
}
constexpr GameState from_fsm_state(fsm_state_t s) noexcept {
  return static_cast<GameState>(s);
}
constexpr fsm_event_t to_fsm_event(GameEvent e) noexcept {
  return static_cast<fsm_event_t>(e);
}

/**
 * @class SnakeGame
 * @brief Контроллер игры: FSM, тик, счёт, скорость, сброс
 */
class SnakeGame {
 public:
  SnakeGame(const SnakeGame&) = delete;
  SnakeGame& operator=(const SnakeGame&) = delete;
  SnakeGame(SnakeGame&&) = delete;
  SnakeGame& operator=(SnakeGame&&) = delete;

  /* ===== Точки входа C API ===== */

  static void* create() noexcept;
  static void destroy(void* game) noexcept;
  static void handle_input(void* game, UserAction_t action, bool hold) noexcept;
  static void update(void* game) noexcept;
  static const GameInfo_t* get_info(const void* game) noexcept;

  /* ===== Намерения ===== */

  /// Старт из READY или перезапуск из GAME_OVER; иначе no-op.
  void start();
  /// Переключение паузы в PLAYING/PAUSED; иначе no-op.
  void togglePause();
  /// Поворот, только в PLAYING.
  void changeDirection(Direction d) noexcept;

  /// Один тик игры. Вне PLAYING ничего не делает.
  void tick();

  /// Новая партия сразу в PLAYING с сохранением рекорда.
  void resetGame();

  /* ===== Наблюдаемое состояние ===== */

  GameState getState() const noexcept { return from_fsm_state(fsm_.current); }
  bool ready() const noexcept { return getState() == GameState::READY; }
  bool gameOver() const noexcept { return getState() == GameState::GAME_OVER; }
  bool paused() const noexcept { return getState() == GameState::PAUSED; }

  int score() const noexcept { return score_; }
  int highScore() const noexcept { return high_score_; }
  int speed() const noexcept { return speed_; }

  const Snake& snake() const noexcept { return snake_; }
  const Food& food() const noexcept { return food_; }

#ifdef GSNAKE_TEST_ACCESS
  void set_food_for_testing(int x, int y);
  void set_snake_for_testing(const Snake& snake);
  void set_score_for_testing(int score);
#endif

 private:
  SnakeGame();
  ~SnakeGame() noexcept;

  void resetSession_();
  GameEvent mapActionToEvent_(UserAction_t action) const noexcept;
  void processEvent_(GameEvent ev);
  void eatFood_();
  void updateSpeed_() noexcept;
  void updateFieldState_() noexcept;

  static void on_state_enter_(fsm_context_t ctx);
  static void on_game_over_enter_(fsm_context_t ctx);

  static const fsm_transition_t transitions_[];

  fsm_t fsm_{};
  Snake snake_;
  Food food_;
  int score_ = 0;
  int high_score_ = 0;
  int speed_ = kInitialSpeed;
  GameInfo_t info_{};
};

}  // namespace gsnake

#endif  // GSNAKE_INTERNALS_HPP
