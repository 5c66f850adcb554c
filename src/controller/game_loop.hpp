/**
 * @file game_loop.hpp
 * @brief Контроллер: связывает игру, планировщик тиков и View
 *
 * GameLoop владеет экземпляром игры (snake_create/snake_destroy) и
 * планировщиком. Между тиками он опрашивает ввод View и превращает
 * логические коды клавиш в UserAction_t; на каждом тике вызывает
 * snake_update() и перерисовывает все зоны по снимку GameInfo_t.
 * Смена скорости переустанавливает планировщик с периодом 1000 / speed.
 *
 * Раскладка зон (в символьных клетках):
 * - "field"  - поле 40x30 в позиции (1, 1), вокруг рамка;
 * - правая панель - заголовок, счёт, рекорд, скорость, подсказки;
 * - "status" - поверх поля, оверлей с приоритетом ready > game over > pause.
 *
 * @code
 * ViewHandle_t handle = cli_view.init(gsnake::GameLoop::kViewWidth,
 *                                     gsnake::GameLoop::kViewHeight, 60);
 * gsnake::GameLoop loop(cli_view, handle, snake_create());
 * if (loop.setup()) loop.run();
 * cli_view.shutdown(handle);
 * @endcode
 */

#ifndef GSNAKE_GAME_LOOP_HPP
#define GSNAKE_GAME_LOOP_HPP

#include <memory>
#include <string>

#include "../gui/common/view.h"
#include "../scheduler/tick_scheduler.hpp"
#include "../snake_game/engine/gsnake.h"

namespace gsnake {

class GameLoop {
 public:
  using Clock = TickScheduler::Clock;

  static constexpr int kViewWidth = 60;
  static constexpr int kViewHeight = 32;

  /**
   * @param view   Бэкенд отображения
   * @param handle Контекст, полученный из view.init()
   * @param game   Игра из snake_create(); GameLoop забирает владение
   *
   * View и handle не принадлежат GameLoop и должны пережить его.
   */
  GameLoop(const ViewInterface& view, ViewHandle_t handle, void* game);

  GameLoop(const GameLoop&) = delete;
  GameLoop& operator=(const GameLoop&) = delete;

  /**
   * @brief Настроить зоны, нарисовать стартовый экран и запустить тики
   * @return false, если игра не создана или View отказал в настройке зон
   */
  bool setup(Clock::time_point now = Clock::now());

  /**
   * @brief Одна итерация цикла: весь накопленный ввод, затем тик, если пора
   * @return false, когда пользователь запросил выход
   */
  bool step(Clock::time_point now);

  /// Крутит step() до выхода. Возвращает код завершения процесса:
  /// 0 после клавиши выхода, 1 после отказа View.
  int run();

  /**
   * @brief Обработать одну клавишу
   * @return false для клавиш выхода (q, Escape)
   */
  bool handleKey(int key_code, bool hold, Clock::time_point now);

  bool running() const noexcept { return running_; }
  const TickScheduler& scheduler() const noexcept { return scheduler_; }
  const GameInfo_t* info() const noexcept { return snake_get_info(game_.get()); }

  /**
   * @brief Перевести логический код клавиши в действие игры
   * @return false, если клавиша не связана с действием
   *
   * q и Escape переводятся в Terminate.
   */
  static bool map_key(int key_code, UserAction_t* action) noexcept;

  /// Текст оверлея поверх поля; пустая строка, если игра идёт.
  static std::string overlay_text(const GameInfo_t& info);

  /// Рекорд подсвечивается, когда текущий счёт равен ненулевому рекорду.
  static bool best_highlighted(const GameInfo_t& info) noexcept;

 private:
  void tick_();
  bool render_();
  void syncSpeed_(Clock::time_point now);

  bool drawText_(const char* zone, const std::string& text);
  bool drawNumber_(const char* zone, int value);

  using GamePtr = std::unique_ptr<void, void (*)(void*)>;

  const ViewInterface& view_;
  ViewHandle_t handle_;
  GamePtr game_;
  TickScheduler scheduler_;
  Clock::time_point now_{};
  int speed_ = 0;
  bool running_ = false;
  bool failed_ = false;
};

}  // namespace gsnake

#endif  // GSNAKE_GAME_LOOP_HPP
