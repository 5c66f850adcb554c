/**
 * @file gsnake_internals.cpp
 * @brief Реализация контроллера игры "Змейка" на C++17
 *
 * Содержит реализацию класса `gsnake::SnakeGame`, включая:
 * - управление состоянием через конечный автомат (FSM)
 * - пошаговое обновление змейки и проверку столкновений
 * - поедание еды, отложенный рост и повторное размещение еды
 * - обновление счёта, рекорда и скорости
 * - сброс партии с сохранением рекорда
 * - интеграцию с C API через непрозрачные указатели (void*)
 *
 * Архитектурные особенности:
 * - **Паттерн "Непрозрачный указатель"**: экземпляр `SnakeGame` скрыт от C API,
 *   доступ только через статические методы `create` / `destroy` /
 *   `handle_input` / `update` / `get_info`.
 * - **FSM на основе таблицы переходов**: допустимость намерений определяется
 *   таблицей `transitions_`, а не разрозненными проверками флагов.
 * - **Однократное обновление рекорда**: рекорд меняется только в колбэке
 *   входа в GAME_OVER, а тики вне PLAYING ничего не делают.
 *
 * @note Все точки входа C API помечены `noexcept`.
 * @note Потокобезопасность не гарантируется - все вызовы из одного потока.
 *
 * @warning Не изменяйте логику FSM без синхронизации `transitions_` и
 * `processEvent_()`.
 *
 * @see gsnake_internals.hpp - объявление класса и типов
 * @see gsnake_model.hpp     - змейка и еда
 * @see gsnake.cpp           - C API обёртка (extern "C")
 */

#include "gsnake_internals.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <new>
#include <stdexcept>

#include "gsnake_cmn.h"

namespace gsnake {

/**
 * @internal
 * @brief Таблица переходов конечного автомата игры
 *
 * Каждая запись - кортеж
 * { текущее_состояние, событие, новое_состояние, on_exit, on_enter }.
 *
 * @par Логика переходов:
 * - READY + START → PLAYING: первая партия, змейка и еда уже на поле.
 * - PLAYING + PAUSE_TOGGLE → PAUSED и обратно.
 * - PLAYING + COLLISION → GAME_OVER: обновление рекорда (on_enter).
 *
 * @note START в GAME_OVER не входит в таблицу: processEvent_() передаёт его
 *       в resetGame(), экран READY пропускается.
 * @note Правил для MOVE_* нет: повороты обрабатываются в processEvent_()
 *       и допустимы только в PLAYING.
 * @note Отсутствие правила означает, что намерение в этом состоянии
 *       игнорируется.
 */
const fsm_transition_t SnakeGame::transitions_[] = {
    // READY → PLAYING: запуск по START
    {to_fsm_state(GameState::READY), to_fsm_event(GameEvent::START),
     to_fsm_state(GameState::PLAYING), nullptr, &SnakeGame::on_state_enter_},

    // PLAYING → PAUSED
    {to_fsm_state(GameState::PLAYING), to_fsm_event(GameEvent::PAUSE_TOGGLE),
     to_fsm_state(GameState::PAUSED), nullptr, &SnakeGame::on_state_enter_},

    // PAUSED → PLAYING
    {to_fsm_state(GameState::PAUSED), to_fsm_event(GameEvent::PAUSE_TOGGLE),
     to_fsm_state(GameState::PLAYING), nullptr, &SnakeGame::on_state_enter_},

    // PLAYING → GAME_OVER: столкновение
    {to_fsm_state(GameState::PLAYING), to_fsm_event(GameEvent::COLLISION),
     to_fsm_state(GameState::GAME_OVER), nullptr,
     &SnakeGame::on_game_over_enter_},
};

namespace {

Direction toDirection(GameEvent ev) noexcept {
  switch (ev) {
    case GameEvent::MOVE_UP:
      return Direction::UP;
    case GameEvent::MOVE_DOWN:
      return Direction::DOWN;
    case GameEvent::MOVE_LEFT:
      return Direction::LEFT;
    default:
      return Direction::RIGHT;
  }
}

const char* stateName(GameState s) noexcept {
  switch (s) {
    case GameState::READY:
      return "READY";
    case GameState::PLAYING:
      return "PLAYING";
    case GameState::PAUSED:
      return "PAUSED";
    case GameState::GAME_OVER:
      return "GAME_OVER";
  }
  return "?";
}

}  // namespace

#ifdef GSNAKE_TEST_ACCESS
void SnakeGame::set_food_for_testing(int x, int y) {
  food_.place(Position(x, y));
}

void SnakeGame::set_snake_for_testing(const Snake& snake) { snake_ = snake; }

void SnakeGame::set_score_for_testing(int score) { score_ = score; }
#endif

/**
 * @brief Создаёт новый экземпляр игры
 * @return Непрозрачный указатель на игру в состоянии READY или nullptr
 *
 * Змейка стоит в начальном положении, еда уже размещена на свободной
 * клетке, счёт 0, скорость GSNAKE_INITIAL_SPEED, рекорд 0.
 *
 * @note Ошибки выделения памяти (поле GameInfo_t, тело змейки) и ошибки
 *       инициализации генератора случайных чисел перехватываются и
 *       превращаются в nullptr.
 *
 * @par Пример:
 * @code
 * void* game = snake_create();
 * if (!game) {
 *     return -1;
 * }
 * // ... игра
 * snake_destroy(game);
 * @endcode
 */
void* SnakeGame::create() noexcept {
  try {
    return new SnakeGame();
  } catch (const std::bad_alloc&) {
    spdlog::error("[Snake] out of memory while creating the game");
  } catch (const std::exception& e) {
    spdlog::error("[Snake] failed to create the game: {}", e.what());
  }
  return nullptr;
}

/**
 * @brief Уничтожает экземпляр игры
 * @param[in] game Указатель от create(). nullptr игнорируется.
 *
 * @warning После вызова указатель недействителен, как и все снимки
 * GameInfo_t, полученные через get_info().
 */
void SnakeGame::destroy(void* game) noexcept {
  if (game != nullptr) {
    delete static_cast<SnakeGame*>(game);
  }
}

/**
 * @brief Обрабатывает действие пользователя
 * @param[in] game   Экземпляр игры (nullptr игнорируется)
 * @param[in] action Действие пользователя
 * @param[in] hold   Флаг удержания клавиши - не используется
 *
 * Поддерживаемые действия:
 * - Start → START (из READY или GAME_OVER)
 * - Pause → PAUSE_TOGGLE (из PLAYING или PAUSED)
 * - Left/Right/Up/Down → буферизованный поворот (только в PLAYING)
 * - Terminate, Action → игнорируются (выход обрабатывает контроллер)
 *
 * @note Действия в неподходящем состоянии молча игнорируются, как и
 *       значения вне UserAction_t.
 */
void SnakeGame::handle_input(void* game, UserAction_t action,
                             bool hold) noexcept {
  (void)hold;
  if (!game || !gsnake_is_valid_action(action)) return;
  auto* self = static_cast<SnakeGame*>(game);
  auto event = self->mapActionToEvent_(action);
  if (event == GameEvent::NONE) return;
  try {
    self->processEvent_(event);
  } catch (const std::bad_alloc&) {
    spdlog::error("[Snake] out of memory while handling input");
  }
}

/**
 * @brief Один тик игры
 * @param[in] game Экземпляр игры (nullptr игнорируется)
 *
 * @see tick()
 */
void SnakeGame::update(void* game) noexcept {
  if (game == nullptr) return;
  try {
    static_cast<SnakeGame*>(game)->tick();
  } catch (const std::bad_alloc&) {
    spdlog::error("[Snake] out of memory during tick");
  }
}

/**
 * @brief Возвращает снимок состояния для отрисовки
 * @param[in] game Экземпляр игры
 * @return Указатель на GameInfo_t или nullptr при game == nullptr
 *
 * Перед возвратом поле пересобирается через updateFieldState_().
 *
 * @warning Указатель валиден только до следующего вызова update(),
 * handle_input() или destroy().
 */
const GameInfo_t* SnakeGame::get_info(const void* game) noexcept {
  if (game == nullptr) {
    return nullptr;
  }
  // Снимок - кэш отрисовки, логическое состояние не меняется.
  auto* self = const_cast<SnakeGame*>(static_cast<const SnakeGame*>(game));
  self->updateFieldState_();
  return &self->info_;
}

/**
 * @private
 * @brief Конструктор - игра в состоянии READY
 *
 * @throw std::bad_alloc если не удалось выделить поле GameInfo_t
 */
SnakeGame::SnakeGame() {
  info_ = gsnake_create_game_info();
  if (info_.field == nullptr) {
    throw std::bad_alloc();
  }

  resetSession_();

  if (!fsm_init(&fsm_, this, transitions_,
                sizeof(transitions_) / sizeof(transitions_[0]),
                to_fsm_state(GameState::READY))) {
    gsnake_destroy_game_info(&info_);
    throw std::logic_error("fsm_init rejected the transition table");
  }
  spdlog::debug("[Snake] game created, grid {}x{}", kGridWidth, kGridHeight);
}

SnakeGame::~SnakeGame() noexcept {
  fsm_destroy(&fsm_);
  gsnake_destroy_game_info(&info_);
}

void SnakeGame::start() { processEvent_(GameEvent::START); }

void SnakeGame::togglePause() {
  processEvent_(GameEvent::PAUSE_TOGGLE);
}

void SnakeGame::changeDirection(Direction d) noexcept {
  if (getState() == GameState::PLAYING) {
    snake_.change_direction(d);
  }
}

/**
 * @brief Выполняет один игровой тик
 *
 * Работает только в состоянии PLAYING:
 * 1. snake_.update() - фиксация направления и шаг
 * 2. голова на еде → eatFood_(): счёт, рост, новая еда, скорость
 * 3. snake_.check_collision() → событие COLLISION (переход в GAME_OVER)
 *
 * В READY, PAUSED и GAME_OVER тик ничего не меняет, поэтому лишние тики
 * после конца игры не влияют ни на поле, ни на рекорд.
 */
void SnakeGame::tick() {
  if (getState() != GameState::PLAYING) return;

  snake_.update();

  if (snake_.head() == food_.position()) {
    eatFood_();
  }

  if (snake_.check_collision()) {
    processEvent_(GameEvent::COLLISION);
  }
}

/**
 * @brief Начинает новую партию сразу в состоянии PLAYING
 *
 * Сбрасывает змейку, еду, счёт и скорость, снимает паузу и флаги
 * READY/GAME_OVER. Рекорд сохраняется. Повторный вызов даёт такое же
 * свежее состояние (кроме случайной позиции еды). Через этот же путь идёт
 * перезапуск по START из GAME_OVER.
 */
void SnakeGame::resetGame() {
  resetSession_();
  if (!fsm_init(&fsm_, this, transitions_,
                sizeof(transitions_) / sizeof(transitions_[0]),
                to_fsm_state(GameState::PLAYING))) {
    spdlog::error("[Snake] fsm_init rejected the transition table");
    return;
  }
  spdlog::info("[Snake] game reset, best {}", high_score_);
}

/**
 * @private
 * @brief Сброс данных партии без изменения состояния FSM
 */
void SnakeGame::resetSession_() {
  snake_.reset();
  food_.respawn(snake_.body());
  score_ = 0;
  speed_ = kInitialSpeed;
}

/**
 * @private
 * @brief Преобразует действие пользователя в событие
 *
 * Маппинг статичен и не зависит от состояния. Terminate и Action
 * превращаются в NONE.
 */
GameEvent SnakeGame::mapActionToEvent_(UserAction_t action) const noexcept {
  switch (action) {
    case Start:
      return GameEvent::START;
    case Pause:
      return GameEvent::PAUSE_TOGGLE;
    case Left:
      return GameEvent::MOVE_LEFT;
    case Right:
      return GameEvent::MOVE_RIGHT;
    case Up:
      return GameEvent::MOVE_UP;
    case Down:
      return GameEvent::MOVE_DOWN;
    case Terminate:
    case Action:
    default:
      return GameEvent::NONE;
  }
}

/**
 * @private
 * @brief Централизованная обработка событий
 *
 * - MOVE_* → snake_.change_direction(), только в PLAYING
 * - START в GAME_OVER → resetGame()
 * - остальные → fsm_process_event(); если правила нет, событие
 *   игнорируется
 */
void SnakeGame::processEvent_(GameEvent ev) {
  switch (ev) {
    case GameEvent::NONE:
      return;
    case GameEvent::MOVE_UP:
    case GameEvent::MOVE_DOWN:
    case GameEvent::MOVE_LEFT:
    case GameEvent::MOVE_RIGHT:
      changeDirection(toDirection(ev));
      return;
    case GameEvent::START:
      if (gameOver()) {
        resetGame();
        return;
      }
      break;
    default:
      break;
  }

  if (!fsm_process_event(&fsm_, to_fsm_event(ev))) {
    spdlog::debug("[Snake] event {} ignored in {}", to_fsm_event(ev),
                  stateName(getState()));
  }
}


/**
 * @private
 * @brief Поедание еды
 *
 * Счёт +1, рост откладывается на следующий тик, еда переносится на
 * свободную клетку, скорость пересчитывается.
 *
 * @note Рекорд здесь не меняется - только при входе в GAME_OVER.
 */
void SnakeGame::eatFood_() {
  score_ += 1;
  snake_.grow(1);
  food_.respawn(snake_.body());
  updateSpeed_();
  spdlog::debug("[Snake] food eaten, score {}, next food at ({}, {})", score_,
                food_.position().x(), food_.position().y());
}

/**
 * @private
 * @brief Пересчёт скорости по счёту
 *
 * speed = min(GSNAKE_MAX_SPEED, GSNAKE_INITIAL_SPEED + score / 5),
 * но не меньше 1.
 *
 * Пример:
 * - score = 0  → 10
 * - score = 5  → 11
 * - score = 49 → 19
 * - score ≥ 50 → 20 (ограничение)
 */
void SnakeGame::updateSpeed_() noexcept {
  int next = std::min(kMaxSpeed, kInitialSpeed + score_ / kSpeedStepScore);
  next = std::max(1, next);
  if (next != speed_) {
    spdlog::debug("[Snake] speed {} -> {}", speed_, next);
    speed_ = next;
  }
}

/**
 * @private
 * @brief Пересобирает GameInfo_t для отрисовки
 *
 * Коды клеток:
 * - GSNAKE_CELL_EMPTY - пусто
 * - GSNAKE_CELL_FOOD  - еда
 * - GSNAKE_CELL_BODY  - тело
 * - GSNAKE_CELL_HEAD_UP + направление - голова
 *
 * Еда рисуется первой, поэтому голова на еде видна как голова.
 * Сегменты вне поля (голова после удара о стену) пропускаются.
 */
void SnakeGame::updateFieldState_() noexcept {
  gsnake_clear_field(info_.field);

  const Position& food = food_.position();
  if (food.inside_grid()) {
    info_.field[food.y()][food.x()] = GSNAKE_CELL_FOOD;
  }

  const auto& body = snake_.body();
  for (std::size_t i = 1; i < body.size(); ++i) {
    if (body[i].inside_grid()) {
      info_.field[body[i].y()][body[i].x()] = GSNAKE_CELL_BODY;
    }
  }

  const Position& head = snake_.head();
  if (head.inside_grid()) {
    info_.field[head.y()][head.x()] =
        GSNAKE_CELL_HEAD_UP + static_cast<int>(snake_.direction());
  }

  info_.score = score_;
  info_.high_score = high_score_;
  info_.speed = speed_;
  info_.length = static_cast<int>(body.size());
  info_.direction = static_cast<SnakeDirection_t>(snake_.direction());
  info_.ready = ready() ? 1 : 0;
  info_.game_over = gameOver() ? 1 : 0;
  info_.pause = paused() ? 1 : 0;
}

void SnakeGame::on_state_enter_(fsm_context_t ctx) {
  auto* self = static_cast<SnakeGame*>(ctx);
  spdlog::info("[Snake] state -> {}", stateName(self->getState()));
}

/**
 * @brief Вход в GAME_OVER: рекорд = max(рекорд, счёт)
 *
 * Вызывается ровно один раз на каждое столкновение: повторный COLLISION
 * в GAME_OVER не имеет правила, а тики вне PLAYING пропускаются.
 */
void SnakeGame::on_game_over_enter_(fsm_context_t ctx) {
  auto* self = static_cast<SnakeGame*>(ctx);
  const bool record = self->score_ > self->high_score_;
  self->high_score_ = std::max(self->high_score_, self->score_);
  spdlog::info("[Snake] game over, score {} | best {}{}", self->score_,
               self->high_score_, record ? " (new record)" : "");
}

}  // namespace gsnake
