/**
 * @file tick_scheduler.hpp
 * @brief Однопоточный периодический планировщик тиков
 *
 * TickScheduler вызывает колбэк с фиксированным периодом. Таймера и потоков
 * нет: основной цикл приложения вызывает poll() с текущим временем, и
 * планировщик решает, пора ли выполнить тик. Время передаётся снаружи,
 * поэтому тесты управляют им без реальных задержек.
 *
 * Гарантии:
 * - за один poll() выполняется не больше одного тика;
 * - колбэк никогда не вызывается повторно, пока не завершился предыдущий;
 * - если цикл отстал, следующий срок переносится на now + period
 *   (пачки догоняющих тиков не бывает);
 * - смена периода - это cancel() + start(); из колбэка это тоже безопасно.
 *
 * @code
 * gsnake::TickScheduler scheduler([&] { tick(); });
 * scheduler.start(std::chrono::milliseconds(100), Clock::now());
 * while (running) {
 *     scheduler.poll(Clock::now());
 * }
 * @endcode
 */

#ifndef GSNAKE_TICK_SCHEDULER_HPP
#define GSNAKE_TICK_SCHEDULER_HPP

#include <chrono>
#include <cstdint>
#include <functional>

namespace gsnake {

class TickScheduler {
 public:
  using Clock = std::chrono::steady_clock;
  using Callback = std::function<void()>;

  explicit TickScheduler(Callback callback);

  /**
   * @brief Запустить периодическую задачу
   * @param period Период, строго больше нуля
   * @param now    Текущее время; первый тик наступит в now + period
   * @return false, если период неположительный (планировщик не меняется)
   */
  bool start(std::chrono::milliseconds period, Clock::time_point now) noexcept;

  /// Остановить задачу. Выполняющийся тик не прерывается.
  void cancel() noexcept;

  /**
   * @brief Переустановить задачу с новым периодом
   *
   * Эквивалентно cancel() + start(period, now). При вызове из колбэка
   * текущий тик завершается, следующий наступит в now + period.
   */
  bool reschedule(std::chrono::milliseconds period,
                  Clock::time_point now) noexcept;

  /**
   * @brief Выполнить тик, если срок наступил
   * @return true, если колбэк был вызван
   */
  bool poll(Clock::time_point now);

  bool active() const noexcept { return active_; }
  std::chrono::milliseconds period() const noexcept { return period_; }
  Clock::time_point deadline() const noexcept { return deadline_; }

 private:
  Callback callback_;
  std::chrono::milliseconds period_{0};
  Clock::time_point deadline_{};
  bool active_ = false;
  bool running_ = false;
  std::uint64_t generation_ = 0;
};

}  // namespace gsnake

#endif  // GSNAKE_TICK_SCHEDULER_HPP
