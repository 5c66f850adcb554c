/**
 * @file view.h
 * @brief Публичный API модулей отображения GridSnake
 *
 * Абстрактный интерфейс (ViewInterface) для любых бэкендов отображения
 * (ncurses, Qt). View ничего не знает об игре: контроллер (game_loop)
 * читает GameInfo_t, раскладывает его по зонам и передаёт сюда готовые
 * тексты, числа и матрицы.
 *
 * Основные идеи:
 * - ViewHandle_t - непрозрачный указатель на контекст бэкенда.
 * - Зоны задаются в символьных клетках; Qt-бэкенд масштабирует их в пиксели.
 * - Ввод возвращается логическими кодами VIEW_KEY_*, одинаковыми для всех
 *   бэкендов: стрелки приводятся к 'w' 'a' 's' 'd'.
 * - Ошибки возвращаются кодами ViewResult_t.
 *
 * @defgroup View Интерфейс модулей отображения
 * @{
 */

#ifndef VIEW_H
#define VIEW_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @typedef ViewHandle_t
 * @brief Непрозрачный указатель на контекст View-модуля.
 */
typedef void *ViewHandle_t;

/**
 * @enum ViewResult_t
 * @brief Результат операций View.
 */
typedef enum {
    VIEW_OK,              ///< Операция успешна
    VIEW_ERROR,           ///< Общая ошибка
    VIEW_INVALID_ID,      ///< Зона с таким element_id не настроена
    VIEW_BAD_DATA,        ///< Некорректные данные
    VIEW_NOT_INITIALIZED, ///< View не инициализирован
    VIEW_NO_EVENT         ///< Событий ввода нет (для poll_input)
} ViewResult_t;

/*
    Логические коды клавиш, которые возвращает poll_input().
*/
#define VIEW_KEY_UP     'w'
#define VIEW_KEY_LEFT   'a'
#define VIEW_KEY_DOWN   's'
#define VIEW_KEY_RIGHT  'd'
#define VIEW_KEY_PAUSE  'p'
#define VIEW_KEY_QUIT   'q'
#define VIEW_KEY_SPACE  ' '
#define VIEW_KEY_ENTER  '\n'
#define VIEW_KEY_ESCAPE 27

/**
 * @struct InputEvent_t
 * @brief Событие ввода.
 *
 * @var InputEvent_t::key_code
 *     Логический код клавиши (VIEW_KEY_* или ASCII-символ в нижнем регистре).
 * @var InputEvent_t::key_state
 *     0 - однократное нажатие, 1 - автоповтор/удержание.
 */
typedef struct {
    int key_code;
    int key_state;
} InputEvent_t;

/**
 * @enum ElementType_t
 * @brief Тип содержимого зоны.
 */
typedef enum {
    ELEMENT_TEXT,   ///< const char* (поддерживает '\n')
    ELEMENT_NUMBER, ///< int
    ELEMENT_MATRIX  ///< двумерный массив кодов клеток GSNAKE_CELL_*
} ElementType_t;

/**
 * @struct ElementData_t
 * @brief Контейнер данных для отрисовки.
 *
 * @note Бэкенд копирует текст (до 511 байт) и матрицу при draw_element(),
 *       после вызова память вызывающего можно переиспользовать.
 * @note Матрица в row-major порядке: (x, y) → индекс y * width + x.
 */
typedef struct ElementData_t {
    ElementType_t type;
    union {
        const char *text;      ///< для ELEMENT_TEXT
        int         number;    ///< для ELEMENT_NUMBER
        struct {               ///< для ELEMENT_MATRIX
            const int *data;
            int        width;
            int        height;
        } matrix;
    } content;
} ElementData_t;

/**
 * @brief Интерфейс View (аналог vtable).
 *
 * @code
 * ViewHandle_t view = cli_view.init(40, 30, 60);
 * cli_view.configure_zone(view, "field", 1, 1, 40, 30);
 * @endcode
 */
typedef struct ViewInterface {
    int version; ///< Версия интерфейса (VIEW_INTERFACE_VERSION)

    /**
     * @brief Инициализация бэкенда.
     * @param width, height Размер области в символьных клетках
     * @param fps           Частота опроса ввода
     * @return Контекст или NULL при ошибке
     */
    ViewHandle_t (*init)(int width, int height, int fps);

    /**
     * @brief Настраивает зону вывода.
     * @param element_id Имя зоны (до 31 символа)
     * @param x, y       Позиция в символьных клетках
     * @param max_width, max_height Размер в символьных клетках
     * @return VIEW_OK при успехе
     *
     * @note Если зона уже существует - перезаписывается.
     */
    ViewResult_t (*configure_zone)(ViewHandle_t handle,
                                   const char   *element_id,
                                   int           x,
                                   int           y,
                                   int           max_width,
                                   int           max_height);

    /**
     * @brief Записывает содержимое зоны в буфер.
     * @return VIEW_INVALID_ID, если зона не настроена
     */
    ViewResult_t (*draw_element)(ViewHandle_t          handle,
                                 const char            *element_id,
                                 const ElementData_t   *data);

    /**
     * @brief Очищает содержимое зоны (зона не отрисовывается до следующего
     *        draw_element).
     */
    ViewResult_t (*clear_element)(ViewHandle_t handle, const char *element_id);

    /**
     * @brief Выводит буфер на экран.
     */
    ViewResult_t (*render)(ViewHandle_t handle);

    /**
     * @brief Читает событие ввода без блокировки.
     * @return VIEW_OK при наличии события, VIEW_NO_EVENT - если нет
     *
     * @note Закрытие окна бэкенд сообщает как VIEW_KEY_ESCAPE.
     */
    ViewResult_t (*poll_input)(ViewHandle_t handle, InputEvent_t *event);

    /**
     * @brief Завершает работу и освобождает ресурсы.
     */
    ViewResult_t (*shutdown)(ViewHandle_t handle);
} ViewInterface;

/* Текущая версия API */
#define VIEW_INTERFACE_VERSION 2

#ifdef __cplusplus
}
#endif

#endif // VIEW_H

/** @} */
