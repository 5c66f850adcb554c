/**
 * @file qt_view.cpp
 * @brief Qt6 Widgets реализация ViewInterface
 *
 * Окно и виджет поля живут в QtViewContext. Клавиши складываются в очередь
 * и отдаются через poll_input(), который заодно прокачивает события Qt.
 *
 * @see qt_view.hpp, view.h
 */

#include "qt_view.hpp"

#include <QApplication>
#include <QCloseEvent>
#include <QKeyEvent>
#include <QMainWindow>
#include <QPainter>
#include <QWidget>

#include <algorithm>
#include <cstring>
#include <queue>
#include <string>
#include <vector>

#include "gsnake_config.h"

namespace {

constexpr int kCellPx = 16;
constexpr std::size_t kMaxZoneName = 31;
constexpr std::size_t kMaxText = 511;

// ---------- Внутренние структуры (скрыты за ViewHandle_t) ----------

struct Zone {
    std::string name;
    int x = 0, y = 0, w = 0, h = 0;

    bool hasData = false;
    ElementType_t type = ELEMENT_TEXT;
    QString text;
    int number = 0;
    std::vector<int> matrix;
    int matrixW = 0, matrixH = 0;
};

QColor colorForCell(int value) {
    switch (value) {
    case GSNAKE_CELL_BODY:       return QColor(46, 204, 113);
    case GSNAKE_CELL_FOOD:       return QColor(231, 76, 60);
    case GSNAKE_CELL_HEAD_UP:
    case GSNAKE_CELL_HEAD_DOWN:
    case GSNAKE_CELL_HEAD_LEFT:
    case GSNAKE_CELL_HEAD_RIGHT: return QColor(241, 196, 15);
    default:                     return QColor(20, 20, 20);
    }
}

int mapQtKey(const QKeyEvent *event) {
    switch (event->key()) {
    case Qt::Key_Left:   return VIEW_KEY_LEFT;
    case Qt::Key_Right:  return VIEW_KEY_RIGHT;
    case Qt::Key_Up:     return VIEW_KEY_UP;
    case Qt::Key_Down:   return VIEW_KEY_DOWN;
    case Qt::Key_Space:  return VIEW_KEY_SPACE;
    case Qt::Key_Return:
    case Qt::Key_Enter:  return VIEW_KEY_ENTER;
    case Qt::Key_Escape: return VIEW_KEY_ESCAPE;
    default:
        break;
    }
    if (event->text().isEmpty())
        return 0;
    const char ch = event->text().at(0).toLower().toLatin1();
    return ch > 0 ? ch : 0;
}

class GameWidget : public QWidget {
public:
    explicit GameWidget(QWidget *parent = nullptr)
        : QWidget(parent)
    {
        setFocusPolicy(Qt::StrongFocus);
    }

    Zone *findZone(const char *id) {
        auto it = std::find_if(zones_.begin(), zones_.end(),
                               [id](const Zone &z) { return z.name == id; });
        return it == zones_.end() ? nullptr : &*it;
    }

    Zone &addZone(const char *id) {
        zones_.emplace_back();
        zones_.back().name = id;
        return zones_.back();
    }

    void pushInput(const InputEvent_t &ev) { inputQueue_.push(ev); }

    // Очередь событий клавиатуры для poll_input()
    bool popInput(InputEvent_t &out) {
        if (inputQueue_.empty())
            return false;
        out = inputQueue_.front();
        inputQueue_.pop();
        return true;
    }

protected:
    void paintEvent(QPaintEvent *) override {
        QPainter p(this);
        p.fillRect(rect(), Qt::black);

        // Зоны рисуются в порядке настройки: более поздние поверх ранних
        for (const Zone &z : zones_) {
            if (!z.hasData)
                continue;

            QRect area(z.x * kCellPx, z.y * kCellPx,
                       z.w * kCellPx, z.h * kCellPx);

            switch (z.type) {
            case ELEMENT_TEXT:
                p.setPen(Qt::white);
                p.drawText(area, Qt::AlignHCenter | Qt::AlignTop, z.text);
                break;
            case ELEMENT_NUMBER:
                p.setPen(Qt::white);
                p.drawText(area, Qt::AlignRight | Qt::AlignVCenter,
                           QString::number(z.number));
                break;
            case ELEMENT_MATRIX:
                drawMatrix_(p, area, z);
                break;
            }
        }
    }

    void keyPressEvent(QKeyEvent *event) override {
        InputEvent_t ev{};
        ev.key_code = mapQtKey(event);
        ev.key_state = event->isAutoRepeat() ? 1 : 0;

        if (ev.key_code != 0) {
            inputQueue_.push(ev);
            event->accept();
            return;
        }
        QWidget::keyPressEvent(event);
    }

private:
    static void drawMatrix_(QPainter &p, const QRect &area, const Zone &z) {
        p.setPen(Qt::gray);
        p.drawRect(area.adjusted(-1, -1, 0, 0));

        const int rows = std::min(z.matrixH, z.h);
        const int cols = std::min(z.matrixW, z.w);
        for (int row = 0; row < rows; ++row) {
            for (int col = 0; col < cols; ++col) {
                const int value = z.matrix[row * z.matrixW + col];
                if (value == GSNAKE_CELL_EMPTY)
                    continue;
                QRect cell(area.x() + col * kCellPx, area.y() + row * kCellPx,
                           kCellPx, kCellPx);
                p.fillRect(cell.adjusted(1, 1, -1, -1), colorForCell(value));
            }
        }
    }

    std::vector<Zone> zones_;
    std::queue<InputEvent_t> inputQueue_;
};

// Окно не закрывается само: закрытие превращается в Escape для контроллера
class GameWindow : public QMainWindow {
public:
    explicit GameWindow(GameWidget *widget) : widget_(widget) {
        setCentralWidget(widget_);
        setWindowTitle(QStringLiteral("GridSnake"));
    }

protected:
    void closeEvent(QCloseEvent *event) override {
        InputEvent_t ev{};
        ev.key_code = VIEW_KEY_ESCAPE;
        widget_->pushInput(ev);
        event->ignore();
    }

private:
    GameWidget *widget_;
};

// Контекст Qt-View
struct QtViewContext {
    int width;
    int height;
    int fps;
    GameWindow *window;
    GameWidget *widget;
};

// ---------- Реализация ViewInterface для Qt ----------

ViewHandle_t qt_init(int width, int height, int fps) {
    if (width <= 0 || height <= 0 || fps < 1)
        return nullptr;

    if (!QApplication::instance())
        return nullptr;

    QtViewContext *ctx = new QtViewContext{};
    ctx->width = width;
    ctx->height = height;
    ctx->fps = fps;

    ctx->widget = new GameWidget;
    ctx->window = new GameWindow(ctx->widget);
    ctx->window->setFixedSize(width * kCellPx, height * kCellPx);

    // Показываем окно, но не блокируем
    ctx->window->show();
    ctx->widget->setFocus();
    QApplication::processEvents();

    return static_cast<ViewHandle_t>(ctx);
}

ViewResult_t qt_configure_zone(ViewHandle_t handle, const char *element_id,
                               int x, int y, int max_w, int max_h)
{
    if (!handle) return VIEW_NOT_INITIALIZED;
    if (!element_id || element_id[0] == '\0') return VIEW_BAD_DATA;
    if (std::strlen(element_id) > kMaxZoneName) return VIEW_BAD_DATA;
    if (x < 0 || y < 0 || max_w <= 0 || max_h <= 0) return VIEW_BAD_DATA;

    QtViewContext *ctx = static_cast<QtViewContext *>(handle);
    Zone *z = ctx->widget->findZone(element_id);
    if (!z)
        z = &ctx->widget->addZone(element_id);

    z->x = x;
    z->y = y;
    z->w = max_w;
    z->h = max_h;
    return VIEW_OK;
}

ViewResult_t qt_draw_element(ViewHandle_t handle, const char *element_id,
                             const ElementData_t *data)
{
    if (!handle) return VIEW_NOT_INITIALIZED;
    if (!element_id || !data) return VIEW_BAD_DATA;

    QtViewContext *ctx = static_cast<QtViewContext *>(handle);
    Zone *z = ctx->widget->findZone(element_id);
    if (!z) return VIEW_INVALID_ID;

    switch (data->type) {
    case ELEMENT_TEXT: {
        if (!data->content.text) return VIEW_BAD_DATA;
        const std::size_t len = std::min(std::strlen(data->content.text), kMaxText);
        z->text = QString::fromUtf8(data->content.text, static_cast<int>(len));
        break;
    }
    case ELEMENT_NUMBER:
        z->number = data->content.number;
        break;
    case ELEMENT_MATRIX: {
        const int mw = data->content.matrix.width;
        const int mh = data->content.matrix.height;
        const int *arr = data->content.matrix.data;
        if (!arr || mw <= 0 || mh <= 0) return VIEW_BAD_DATA;
        z->matrix.assign(arr, arr + static_cast<std::size_t>(mw) * mh);
        z->matrixW = mw;
        z->matrixH = mh;
        break;
    }
    default:
        return VIEW_BAD_DATA;
    }

    z->type = data->type;
    z->hasData = true;
    return VIEW_OK;
}

ViewResult_t qt_clear_element(ViewHandle_t handle, const char *element_id) {
    if (!handle) return VIEW_NOT_INITIALIZED;
    if (!element_id) return VIEW_BAD_DATA;

    QtViewContext *ctx = static_cast<QtViewContext *>(handle);
    Zone *z = ctx->widget->findZone(element_id);
    if (!z) return VIEW_INVALID_ID;

    z->hasData = false;
    z->matrix.clear();
    z->text.clear();
    return VIEW_OK;
}

ViewResult_t qt_render(ViewHandle_t handle) {
    if (!handle) return VIEW_NOT_INITIALIZED;

    QtViewContext *ctx = static_cast<QtViewContext *>(handle);
    ctx->widget->update();
    return VIEW_OK;
}

ViewResult_t qt_poll_input(ViewHandle_t handle, InputEvent_t *event) {
    if (!handle) return VIEW_NOT_INITIALIZED;
    if (!event) return VIEW_ERROR;

    QApplication::processEvents();

    QtViewContext *ctx = static_cast<QtViewContext *>(handle);
    InputEvent_t ev{};
    if (ctx->widget->popInput(ev)) {
        *event = ev;
        return VIEW_OK;
    }

    event->key_code = 0;
    event->key_state = 0;
    return VIEW_NO_EVENT;
}

ViewResult_t qt_shutdown(ViewHandle_t handle) {
    if (!handle) return VIEW_NOT_INITIALIZED;

    QtViewContext *ctx = static_cast<QtViewContext *>(handle);
    // Виджет принадлежит окну и удаляется вместе с ним
    ctx->window->hide();
    delete ctx->window;
    delete ctx;

    QApplication::processEvents();
    return VIEW_OK;
}

}  // namespace

// Экспортируемый экземпляр Qt-View
const ViewInterface qt_view = {
    VIEW_INTERFACE_VERSION,
    qt_init,
    qt_configure_zone,
    qt_draw_element,
    qt_clear_element,
    qt_render,
    qt_poll_input,
    qt_shutdown,
};
