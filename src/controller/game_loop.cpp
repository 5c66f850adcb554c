/**
 * @file game_loop.cpp
 * @brief Реализация gsnake::GameLoop: ввод, тики, раскладка и отрисовка зон
 *
 * @see game_loop.hpp
 */

#include "game_loop.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

#include "../snake_game/common/gsnake_cmn.h"

namespace gsnake {

namespace {

struct ZoneLayout {
  const char* id;
  int x, y, w, h;
};

// Порядок важен: "status" настраивается последним и рисуется поверх поля.
constexpr ZoneLayout kZones[] = {
    {"field", 1, 1, GSNAKE_GRID_WIDTH, GSNAKE_GRID_HEIGHT},
    {"title", 43, 1, 16, 1},
    {"score_label", 43, 4, 16, 1},
    {"score", 43, 5, 16, 1},
    {"best_label", 43, 7, 16, 1},
    {"best", 43, 8, 16, 1},
    {"speed_label", 43, 10, 16, 1},
    {"speed", 43, 11, 16, 1},
    {"hints", 43, 25, 16, 6},
    {"status", 1, 11, GSNAKE_GRID_WIDTH, 8},
};

constexpr auto kIdleSleep = std::chrono::milliseconds(5);

std::chrono::milliseconds tickPeriod(int speed) {
  return std::chrono::milliseconds(gsnake_speed_interval_ms(speed));
}

}  // namespace

GameLoop::GameLoop(const ViewInterface& view, ViewHandle_t handle, void* game)
    : view_(view),
      handle_(handle),
      game_(game, snake_destroy),
      scheduler_([this] { tick_(); }) {}

bool GameLoop::setup(Clock::time_point now) {
  if (!game_ || !handle_) {
    spdlog::error("[GameLoop] setup without game or view");
    return false;
  }

  for (const ZoneLayout& zone : kZones) {
    if (view_.configure_zone(handle_, zone.id, zone.x, zone.y, zone.w,
                             zone.h) != VIEW_OK) {
      spdlog::error("[GameLoop] view rejected zone '{}'", zone.id);
      return false;
    }
  }

  bool ok = drawText_("title", "GRID SNAKE") &&
            drawText_("score_label", "Score") &&
            drawText_("speed_label", "Speed") &&
            drawText_("hints",
                      "Arrows/WASD move\n"
                      "P  pause\n"
                      "SPACE  start\n"
                      "Q  quit");
  if (!ok) return false;

  speed_ = info()->speed;
  now_ = now;
  if (!scheduler_.start(tickPeriod(speed_), now)) {
    spdlog::error("[GameLoop] cannot start ticks at speed {}", speed_);
    return false;
  }

  running_ = true;
  spdlog::info("[GameLoop] started, tick {} ms", scheduler_.period().count());
  return render_();
}

bool GameLoop::step(Clock::time_point now) {
  if (!running_) return false;
  now_ = now;

  InputEvent_t event{};
  ViewResult_t res;
  while ((res = view_.poll_input(handle_, &event)) == VIEW_OK) {
    if (!handleKey(event.key_code, event.key_state != 0, now)) return false;
  }
  if (res != VIEW_NO_EVENT) {
    spdlog::error("[GameLoop] poll_input failed with code {}",
                  static_cast<int>(res));
    scheduler_.cancel();
    running_ = false;
    failed_ = true;
    return false;
  }

  scheduler_.poll(now);
  return running_;
}

int GameLoop::run() {
  while (step(Clock::now())) {
    std::this_thread::sleep_for(kIdleSleep);
  }
  if (failed_) {
    spdlog::error("[GameLoop] stopped on view failure");
    return 1;
  }
  spdlog::info("[GameLoop] stopped");
  return 0;
}

bool GameLoop::handleKey(int key_code, bool hold, Clock::time_point now) {
  UserAction_t action;
  if (!map_key(key_code, &action)) return true;

  if (action == Terminate) {
    spdlog::info("[GameLoop] quit requested");
    scheduler_.cancel();
    running_ = false;
    return false;
  }

  snake_handle_input(game_.get(), action, hold);
  syncSpeed_(now);

  // Старт и пауза видны сразу, не дожидаясь тика
  if ((action == Start || action == Pause) && !render_()) {
    spdlog::warn("[GameLoop] frame was not rendered");
  }
  return true;
}

bool GameLoop::map_key(int key_code, UserAction_t* action) noexcept {
  if (action == nullptr) return false;

  switch (key_code) {
    case VIEW_KEY_SPACE:
    case VIEW_KEY_ENTER:
      *action = Start;
      return true;
    case VIEW_KEY_PAUSE:
      *action = Pause;
      return true;
    case VIEW_KEY_UP:
      *action = Up;
      return true;
    case VIEW_KEY_DOWN:
      *action = Down;
      return true;
    case VIEW_KEY_LEFT:
      *action = Left;
      return true;
    case VIEW_KEY_RIGHT:
      *action = Right;
      return true;
    case VIEW_KEY_QUIT:
    case VIEW_KEY_ESCAPE:
      *action = Terminate;
      return true;
    default:
      return false;
  }
}

std::string GameLoop::overlay_text(const GameInfo_t& info) {
  if (info.ready) {
    return "SNAKE\n"
           "\n"
           "SPACE - start\n"
           "Arrows/WASD - move\n"
           "P - pause, Q - quit";
  }
  if (info.game_over) {
    std::string text = "GAME OVER\n\n";
    text += "Score: " + std::to_string(info.score) + "\n";
    text += "Best: " + std::to_string(info.high_score) + "\n";
    if (best_highlighted(info)) text += "NEW RECORD!\n";
    text += "SPACE - restart, Q - quit";
    return text;
  }
  if (info.pause) {
    return "PAUSED\n\nP - continue";
  }
  return std::string();
}

bool GameLoop::best_highlighted(const GameInfo_t& info) noexcept {
  return info.high_score > 0 && info.score == info.high_score;
}

void GameLoop::tick_() {
  snake_update(game_.get());
  syncSpeed_(now_);
  if (!render_()) {
    spdlog::warn("[GameLoop] frame was not rendered");
  }
}

bool GameLoop::render_() {
  const GameInfo_t* snapshot = info();
  if (snapshot == nullptr || !gsnake_is_valid_game_info(snapshot)) {
    spdlog::error("[GameLoop] game returned no valid snapshot");
    return false;
  }

  // Поле в row-major, как ждёт ELEMENT_MATRIX
  int cells[GSNAKE_GRID_HEIGHT * GSNAKE_GRID_WIDTH];
  for (int y = 0; y < GSNAKE_GRID_HEIGHT; ++y) {
    for (int x = 0; x < GSNAKE_GRID_WIDTH; ++x) {
      cells[y * GSNAKE_GRID_WIDTH + x] = snapshot->field[y][x];
    }
  }

  ElementData_t field{};
  field.type = ELEMENT_MATRIX;
  field.content.matrix.data = cells;
  field.content.matrix.width = GSNAKE_GRID_WIDTH;
  field.content.matrix.height = GSNAKE_GRID_HEIGHT;
  if (view_.draw_element(handle_, "field", &field) != VIEW_OK) return false;

  bool ok = drawNumber_("score", snapshot->score) &&
            drawText_("best_label",
                      best_highlighted(*snapshot) ? "Best *" : "Best") &&
            drawNumber_("best", snapshot->high_score) &&
            drawNumber_("speed", snapshot->speed);
  if (!ok) return false;

  const std::string overlay = overlay_text(*snapshot);
  ViewResult_t res = overlay.empty()
                         ? view_.clear_element(handle_, "status")
                         : (drawText_("status", overlay) ? VIEW_OK : VIEW_ERROR);
  if (res != VIEW_OK) return false;

  return view_.render(handle_) == VIEW_OK;
}

void GameLoop::syncSpeed_(Clock::time_point now) {
  const GameInfo_t* snapshot = info();
  if (snapshot == nullptr || snapshot->speed == speed_) return;

  speed_ = snapshot->speed;
  if (scheduler_.reschedule(tickPeriod(speed_), now)) {
    spdlog::debug("[GameLoop] speed {}, tick {} ms", speed_,
                  scheduler_.period().count());
  }
}

bool GameLoop::drawText_(const char* zone, const std::string& text) {
  ElementData_t data{};
  data.type = ELEMENT_TEXT;
  data.content.text = text.c_str();
  if (view_.draw_element(handle_, zone, &data) != VIEW_OK) {
    spdlog::error("[GameLoop] cannot draw zone '{}'", zone);
    return false;
  }
  return true;
}

bool GameLoop::drawNumber_(const char* zone, int value) {
  ElementData_t data{};
  data.type = ELEMENT_NUMBER;
  data.content.number = value;
  if (view_.draw_element(handle_, zone, &data) != VIEW_OK) {
    spdlog::error("[GameLoop] cannot draw zone '{}'", zone);
    return false;
  }
  return true;
}

}  // namespace gsnake
