/**
 * @file gsnake_model.cpp
 * @brief Реализация Snake и Food
 */

#include "gsnake_model.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <functional>
#include <iterator>
#include <thread>
#include <utility>

namespace gsnake {

namespace {

// random_device может не давать энтропии (например, MinGW), тогда
// добавляем время и идентификатор потока.
std::uint32_t seedFromDevice() {
  std::random_device rd;
  return rd.entropy() != 0
             ? rd()
             : static_cast<std::uint32_t>(
                   std::time(nullptr) ^
                   std::hash<std::thread::id>{}(std::this_thread::get_id()));
}

}  // namespace

/* ===== Snake ===== */

Snake::Snake() { reset(); }

Snake::Snake(Body body, Direction direction)
    : body_(std::move(body)),
      direction_(direction),
      next_direction_(direction) {
  if (body_.empty()) reset();
}

void Snake::reset() {
  const int start_x = kGridWidth / 4;
  const int start_y = kGridHeight / 2;

  body_.clear();
  for (int i = 0; i < kInitialLength; ++i) {
    body_.emplace_back(start_x - i, start_y);
  }

  direction_ = Direction::RIGHT;
  next_direction_ = Direction::RIGHT;
  grow_pending_ = 0;
}

void Snake::change_direction(Direction new_direction) noexcept {
  // Сравнение с зафиксированным, а не буферизованным направлением.
  if (new_direction != opposite(direction_)) {
    next_direction_ = new_direction;
  }
}

void Snake::update() {
  direction_ = next_direction_;
  body_.push_front(head().move(direction_));

  if (grow_pending_ > 0) {
    --grow_pending_;
  } else {
    body_.pop_back();
  }
}

void Snake::grow(int amount) noexcept {
  if (amount > 0) grow_pending_ += amount;
}

bool Snake::check_collision() const noexcept {
  const Position& h = head();
  if (!h.inside_grid()) return true;
  return std::find(std::next(body_.begin()), body_.end(), h) != body_.end();
}

bool Snake::occupies(const Position& cell) const noexcept {
  return std::find(body_.begin(), body_.end(), cell) != body_.end();
}

/* ===== Food ===== */

Food::Food() : gen_(seedFromDevice()) { position_ = randomCell_(); }

Food::Food(std::uint32_t seed) : gen_(seed) { position_ = randomCell_(); }

Position Food::randomCell_() noexcept {
  std::uniform_int_distribution<int> dist_x(0, kGridWidth - 1);
  std::uniform_int_distribution<int> dist_y(0, kGridHeight - 1);
  const int x = dist_x(gen_);
  return Position(x, dist_y(gen_));
}

bool Food::respawn(const Snake::Body& snake_body) noexcept {
  for (int attempt = 0; attempt < kFoodRespawnAttempts; ++attempt) {
    Position candidate = randomCell_();
    if (std::find(snake_body.begin(), snake_body.end(), candidate) ==
        snake_body.end()) {
      position_ = candidate;
      return true;
    }
  }

  position_ = Position(0, 0);
  spdlog::warn("[Food] no free cell after {} attempts, placed at (0,0)",
               kFoodRespawnAttempts);
  return false;
}

}  // namespace gsnake
