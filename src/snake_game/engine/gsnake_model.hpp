/**
 * @file gsnake_model.hpp
 * @brief Модель игрового поля: направление, позиция, змейка, еда
 *
 * Простые типы-значения без наследования и виртуальных функций.
 * Владельцем Snake и Food является gsnake::SnakeGame, модули
 * отображения видят их только через GameInfo_t.
 *
 * @note Все методы однопоточные: синхронизации нет.
 *
 * @see gsnake_internals.hpp - контроллер игры
 */

#ifndef GSNAKE_MODEL_HPP
#define GSNAKE_MODEL_HPP

#include <cstdint>
#include <deque>
#include <random>

#include "gsnake_config.h"

namespace gsnake {

constexpr int kGridWidth = GSNAKE_GRID_WIDTH;
constexpr int kGridHeight = GSNAKE_GRID_HEIGHT;
constexpr int kInitialLength = GSNAKE_INITIAL_LENGTH;
constexpr int kInitialSpeed = GSNAKE_INITIAL_SPEED;
constexpr int kMaxSpeed = GSNAKE_MAX_SPEED;
constexpr int kSpeedStepScore = GSNAKE_SPEED_STEP_SCORE;
constexpr int kFoodRespawnAttempts = GSNAKE_FOOD_RESPAWN_ATTEMPTS;

/**
 * @enum Direction
 * @brief Направление движения. Порядок совпадает с SnakeDirection_t.
 */
enum class Direction { UP = 0, DOWN, LEFT, RIGHT };

/// Противоположное направление (разворот на 180°).
constexpr Direction opposite(Direction d) noexcept {
  switch (d) {
    case Direction::UP:
      return Direction::DOWN;
    case Direction::DOWN:
      return Direction::UP;
    case Direction::LEFT:
      return Direction::RIGHT;
    case Direction::RIGHT:
      return Direction::LEFT;
  }
  return d;
}

/// Смещение по X для единичного вектора направления.
constexpr int dx(Direction d) noexcept {
  return d == Direction::LEFT ? -1 : (d == Direction::RIGHT ? 1 : 0);
}

/// Смещение по Y (ось Y направлена вниз).
constexpr int dy(Direction d) noexcept {
  return d == Direction::UP ? -1 : (d == Direction::DOWN ? 1 : 0);
}

/**
 * @class Position
 * @brief Неизменяемая координата клетки поля
 *
 * Проверки границ нет: выход за поле обнаруживает Snake::check_collision().
 */
class Position {
 public:
  constexpr Position() noexcept = default;
  constexpr Position(int x, int y) noexcept : x_(x), y_(y) {}

  constexpr int x() const noexcept { return x_; }
  constexpr int y() const noexcept { return y_; }

  /// Новая позиция, сдвинутая на единичный вектор направления.
  constexpr Position move(Direction d) const noexcept {
    return Position(x_ + dx(d), y_ + dy(d));
  }

  constexpr bool inside_grid() const noexcept {
    return x_ >= 0 && x_ < kGridWidth && y_ >= 0 && y_ < kGridHeight;
  }

  constexpr bool operator==(const Position& other) const noexcept {
    return x_ == other.x_ && y_ == other.y_;
  }
  constexpr bool operator!=(const Position& other) const noexcept {
    return !(*this == other);
  }

 private:
  int x_ = 0;
  int y_ = 0;
};

/**
 * @class Snake
 * @brief Тело змейки, буфер направления и отложенный рост
 *
 * Тело хранится от головы к хвосту. Направление меняется в два этапа:
 * change_direction() записывает намерение в однослотовый буфер
 * (последняя допустимая запись выигрывает), update() фиксирует его
 * в начале тика. Так между тиками возможен только один поворот.
 *
 * Рост отложенный: grow() увеличивает счётчик, каждый update() расходует
 * не больше одной единицы, оставляя хвост на месте.
 */
class Snake {
 public:
  using Body = std::deque<Position>;

  /// Змейка в начальном положении (см. reset()).
  Snake();

  /// Змейка с заданным телом (голова первой) и направлением.
  Snake(Body body, Direction direction);

  /**
   * @brief Начальное положение
   *
   * Голова в (kGridWidth / 4, kGridHeight / 2), остальные сегменты левее
   * на одну клетку каждый. Направление и буфер - RIGHT, рост - 0.
   */
  void reset();

  /**
   * @brief Запомнить намерение повернуть
   *
   * Запрос, противоположный текущему (а не буферизованному) направлению,
   * молча отбрасывается.
   */
  void change_direction(Direction new_direction) noexcept;

  /**
   * @brief Один шаг: зафиксировать направление, добавить голову,
   * убрать хвост или израсходовать единицу роста
   */
  void update();

  /// Отложить рост на amount клеток. Неположительные значения игнорируются.
  void grow(int amount = 1) noexcept;

  /// Голова вне поля или совпадает с любым другим сегментом.
  bool check_collision() const noexcept;

  bool occupies(const Position& cell) const noexcept;

  const Position& head() const noexcept { return body_.front(); }
  const Body& body() const noexcept { return body_; }
  Direction direction() const noexcept { return direction_; }
  Direction next_direction() const noexcept { return next_direction_; }
  int grow_pending() const noexcept { return grow_pending_; }

 private:
  Body body_;
  Direction direction_ = Direction::RIGHT;
  Direction next_direction_ = Direction::RIGHT;
  int grow_pending_ = 0;
};

/**
 * @class Food
 * @brief Единственная еда на поле
 *
 * respawn() выбирает случайную свободную клетку за ограниченное число
 * попыток (kFoodRespawnAttempts). Если свободная клетка не найдена, еда
 * ставится в (0,0) независимо от занятости: змейка может сразу её съесть.
 */
class Food {
 public:
  /// Генератор инициализируется из std::random_device.
  Food();
  /// Детерминированный генератор для тестов.
  explicit Food(std::uint32_t seed);

  /**
   * @brief Переместить еду в свободную от тела клетку
   * @return true, если клетка найдена; false, если сработал запасной (0,0)
   */
  bool respawn(const Snake::Body& snake_body) noexcept;

  void place(const Position& position) noexcept { position_ = position; }
  const Position& position() const noexcept { return position_; }

 private:
  Position randomCell_() noexcept;

  std::mt19937 gen_;
  Position position_;
};

}  // namespace gsnake

#endif  // GSNAKE_MODEL_HPP
