/**
 * @file fsm.h
 * @defgroup FSM Табличный конечный автомат
 * @brief Табличный конечный автомат для игровой логики GridSnake
 *
 * Библиотека описывает состояния и события целыми числами, а правила
 * перехода - статической таблицей. Игровой код задаёт перечисления и
 * колбэки, автомат только ищет правило и вызывает колбэки.
 *
 * ### Пример использования
 *
 * @code
 * enum { EVT_START = 1, EVT_PAUSE_TOGGLE, EVT_COLLISION };
 * enum { ST_READY = 0, ST_PLAYING, ST_PAUSED, ST_GAME_OVER };
 *
 * typedef struct {
 *   int score;
 *   int high_score;
 * } Session;
 *
 * void on_enter_game_over(fsm_context_t ctx) {
 *   Session *s = (Session *)ctx;
 *   if (s->score > s->high_score) s->high_score = s->score;
 * }
 *
 * void on_exit_game_over(fsm_context_t ctx) {
 *   ((Session *)ctx)->score = 0;
 * }
 *
 * const fsm_transition_t table[] = {
 *   {ST_READY, EVT_START, ST_PLAYING, NULL, NULL},
 *   {ST_PLAYING, EVT_PAUSE_TOGGLE, ST_PAUSED, NULL, NULL},
 *   {ST_PAUSED, EVT_PAUSE_TOGGLE, ST_PLAYING, NULL, NULL},
 *   {ST_PLAYING, EVT_COLLISION, ST_GAME_OVER, NULL, on_enter_game_over},
 *   {ST_GAME_OVER, EVT_START, ST_PLAYING, on_exit_game_over, NULL},
 * };
 *
 * fsm_t fsm;
 * Session session = {0};
 *
 * fsm_init(&fsm, &session, table, 5, ST_READY);
 * fsm_process_event(&fsm, EVT_START);             // READY -> PLAYING
 * @endcode
 *
 * @date 2026-10-19
 *
 * @{
 */

#ifndef FSM_H
#define FSM_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>

/**
 * @def FSM_EVENT_NONE
 * @brief Специальное событие для автоматических переходов.
 *
 * Правило с этим событием выполняется функцией fsm_update() без внешнего
 * триггера.
 *
 * @warning Не используйте 0 для пользовательских событий.
 */
#define FSM_EVENT_NONE 0

/**
 * @typedef fsm_event_t
 * @brief Идентификатор события. Значение 0 зарезервировано.
 */
typedef int fsm_event_t;

/**
 * @typedef fsm_state_t
 * @brief Идентификатор состояния.
 */
typedef int fsm_state_t;

/**
 * @typedef fsm_context_t
 * @brief Пользовательский контекст, передаваемый в колбэки (может быть NULL).
 */
typedef void *fsm_context_t;

/**
 * @typedef fsm_cb_t
 * @brief Колбэк входа или выхода из состояния.
 *
 * Во время on_exit поле fsm_t::current ещё равно исходному состоянию,
 * во время on_enter - уже целевому.
 *
 * @note Вложенные вызовы fsm_process_event() из колбэка отклоняются
 *       (флаг processing).
 */
typedef void (*fsm_cb_t)(fsm_context_t ctx);

/**
 * @struct fsm_transition_t
 * @brief Правило "из src по event перейти в dst".
 *
 * @note При совпадении нескольких правил выполняется первое по порядку.
 */
typedef struct {
  fsm_state_t src;
  fsm_event_t event;
  fsm_state_t dst;
  fsm_cb_t on_exit;
  fsm_cb_t on_enter;
} fsm_transition_t;

/**
 * @struct fsm_t
 * @brief Состояние автомата.
 *
 * @var fsm_t::transitions
 *      Таблица переходов (автомат ей не владеет).
 * @var fsm_t::count
 *      Количество правил.
 * @var fsm_t::current
 *      Текущее состояние.
 * @var fsm_t::ctx
 *      Пользовательский контекст.
 * @var fsm_t::processing
 *      Признак выполняющегося перехода.
 */
typedef struct {
  const fsm_transition_t *transitions;
  size_t count;
  fsm_state_t current;
  fsm_context_t ctx;
  bool processing;
} fsm_t;

/**
 * @brief Инициализировать автомат.
 *
 * @param[out] fsm         Автомат (не NULL).
 * @param[in]  ctx         Контекст колбэков (может быть NULL).
 * @param[in]  transitions Таблица переходов (не NULL).
 * @param[in]  count       Количество правил (> 0).
 * @param[in]  start_state Начальное состояние.
 * @return true при успехе, false при некорректных аргументах.
 *
 * @note on_enter начального состояния не вызывается.
 */
bool fsm_init(fsm_t *fsm, fsm_context_t ctx,
              const fsm_transition_t *transitions, size_t count,
              fsm_state_t start_state);

/**
 * @brief Отвязать автомат от таблицы и контекста.
 *
 * @param[in,out] fsm Автомат (может быть NULL).
 */
void fsm_destroy(fsm_t *fsm);

/**
 * @brief Обработать событие.
 *
 * Ищет правило с `src == current` и заданным событием, выполняет
 * on_exit, смену состояния и on_enter.
 *
 * @param[in,out] fsm   Автомат.
 * @param[in]     event Событие.
 * @return true, если переход выполнен.
 *
 * @note Возвращает false при fsm == NULL, при отсутствии правила и при
 *       вызове из колбэка.
 */
bool fsm_process_event(fsm_t *fsm, fsm_event_t event);

/**
 * @brief Выполнить автоматический переход по FSM_EVENT_NONE.
 *
 * @param[in,out] fsm Автомат (может быть NULL).
 */
void fsm_update(fsm_t *fsm);

#ifdef __cplusplus
}
#endif

#endif /* FSM_H */

/** @} */
