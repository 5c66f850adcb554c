/**
 * @file desktop_main.cpp
 * @brief Точка входа Qt-версии GridSnake
 *
 * Цикл событий Qt прокачивается из GameLoop через qt_view.poll_input(),
 * поэтому QApplication::exec() не вызывается.
 */

#include <QApplication>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "../controller/game_loop.hpp"
#include "../gui/desktop/qt_view.hpp"

namespace {

constexpr int kInputFps = 60;

}  // namespace

int main(int argc, char* argv[]) {
  QApplication app(argc, argv);
  spdlog::cfg::load_env_levels();

  void* game = snake_create();
  if (game == nullptr) {
    spdlog::critical("[Main] cannot create game");
    return 1;
  }

  ViewHandle_t handle = qt_view.init(gsnake::GameLoop::kViewWidth,
                                     gsnake::GameLoop::kViewHeight, kInputFps);
  if (handle == nullptr) {
    snake_destroy(game);
    spdlog::critical("[Main] cannot open game window");
    return 1;
  }

  int code = 1;
  {
    gsnake::GameLoop loop(qt_view, handle, game);
    if (loop.setup()) code = loop.run();
  }

  if (qt_view.shutdown(handle) != VIEW_OK) {
    spdlog::error("[Main] window shutdown failed");
    code = 1;
  }
  return code;
}
