/**
 * @file cli_main.cpp
 * @brief Точка входа терминальной версии GridSnake
 *
 * ncurses занимает терминал целиком, поэтому журнал пишется в файл
 * gsnake.log в текущем каталоге. Уровень задаётся переменной окружения
 * SPDLOG_LEVEL (например, SPDLOG_LEVEL=debug).
 */

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <cstdio>

#include "../controller/game_loop.hpp"
#include "../gui/cli/cli.h"

namespace {

constexpr int kInputFps = 60;

bool setupLogging() {
  try {
    auto logger = spdlog::basic_logger_mt("gsnake", "gsnake.log", true);
    spdlog::set_default_logger(logger);
    spdlog::cfg::load_env_levels();
    spdlog::flush_on(spdlog::level::warn);
  } catch (const spdlog::spdlog_ex& ex) {
    std::fprintf(stderr, "gsnake: cannot open log: %s\n", ex.what());
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!setupLogging()) return 1;

  void* game = snake_create();
  if (game == nullptr) {
    spdlog::critical("[Main] cannot create game");
    return 1;
  }

  ViewHandle_t handle = cli_view.init(gsnake::GameLoop::kViewWidth,
                                      gsnake::GameLoop::kViewHeight, kInputFps);
  if (handle == nullptr) {
    snake_destroy(game);
    spdlog::critical("[Main] terminal init failed, need at least {}x{}",
                     gsnake::GameLoop::kViewWidth,
                     gsnake::GameLoop::kViewHeight);
    std::fprintf(stderr, "gsnake: terminal must be at least %dx%d\n",
                 gsnake::GameLoop::kViewWidth, gsnake::GameLoop::kViewHeight);
    return 1;
  }

  int code = 1;
  {
    gsnake::GameLoop loop(cli_view, handle, game);
    if (loop.setup()) code = loop.run();
  }

  if (cli_view.shutdown(handle) != VIEW_OK) {
    spdlog::error("[Main] terminal shutdown failed");
    code = 1;
  }
  spdlog::shutdown();
  return code;
}
