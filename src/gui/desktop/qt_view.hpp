#pragma once

extern "C" {
#include "../common/view.h"   // ViewInterface, ViewHandle_t, ElementData_t, InputEvent_t
}

/**
 * @brief Экземпляр Qt-интерфейса для GridSnake.
 *
 * Реализует контракт ViewInterface на Qt-виджетах. Зоны задаются в
 * символьных клетках и масштабируются в квадраты по 16 пикселей.
 *
 * @note init() требует уже созданного QApplication и возвращает nullptr
 *       без него.
 * @note poll_input() сам прокачивает очередь событий Qt, отдельный
 *       QApplication::exec() не нужен.
 */
extern const ViewInterface qt_view;
