#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "game_loop.hpp"
#include "gsnake_internals.hpp"

using gsnake::GameLoop;
using std::chrono::milliseconds;

namespace {

// View без экрана: запоминает последнее содержимое каждой зоны
struct FakeView {
  std::set<std::string> zones;
  std::map<std::string, std::string> text;
  std::map<std::string, int> numbers;
  std::vector<int> field;
  std::deque<int> keys;
  int renders = 0;
  bool broken_input = false;
};

FakeView *Ctx(ViewHandle_t handle) { return static_cast<FakeView *>(handle); }

ViewHandle_t FakeInit(int, int, int) { return nullptr; }

ViewResult_t FakeConfigure(ViewHandle_t handle, const char *id, int, int, int,
                           int) {
  Ctx(handle)->zones.insert(id);
  return VIEW_OK;
}

ViewResult_t FakeDraw(ViewHandle_t handle, const char *id,
                      const ElementData_t *data) {
  FakeView *view = Ctx(handle);
  if (view->zones.count(id) == 0) return VIEW_INVALID_ID;

  switch (data->type) {
    case ELEMENT_TEXT:
      view->text[id] = data->content.text;
      break;
    case ELEMENT_NUMBER:
      view->numbers[id] = data->content.number;
      break;
    case ELEMENT_MATRIX:
      view->field.assign(data->content.matrix.data,
                         data->content.matrix.data +
                             data->content.matrix.width *
                                 data->content.matrix.height);
      break;
  }
  return VIEW_OK;
}

ViewResult_t FakeClear(ViewHandle_t handle, const char *id) {
  FakeView *view = Ctx(handle);
  if (view->zones.count(id) == 0) return VIEW_INVALID_ID;
  view->text.erase(id);
  return VIEW_OK;
}

ViewResult_t FakeRender(ViewHandle_t handle) {
  ++Ctx(handle)->renders;
  return VIEW_OK;
}

ViewResult_t FakePoll(ViewHandle_t handle, InputEvent_t *event) {
  FakeView *view = Ctx(handle);
  if (view->broken_input) return VIEW_ERROR;
  if (view->keys.empty()) return VIEW_NO_EVENT;
  event->key_code = view->keys.front();
  event->key_state = 0;
  view->keys.pop_front();
  return VIEW_OK;
}

ViewResult_t FakeShutdown(ViewHandle_t) { return VIEW_OK; }

const ViewInterface kFakeView = {
    VIEW_INTERFACE_VERSION, FakeInit,   FakeConfigure, FakeDraw,
    FakeClear,              FakeRender, FakePoll,      FakeShutdown,
};

const GameLoop::Clock::time_point kT0{};

GameInfo_t MakeInfo(int ready, int game_over, int pause, int score,
                    int best) {
  GameInfo_t info{};
  info.ready = ready;
  info.game_over = game_over;
  info.pause = pause;
  info.score = score;
  info.high_score = best;
  return info;
}

class GameLoopTest : public ::testing::Test {
 protected:
  FakeView view;
  gsnake::SnakeGame *game = nullptr;
  std::unique_ptr<GameLoop> loop;

  void SetUp() override {
    void *handle = snake_create();
    ASSERT_NE(handle, nullptr);
    game = static_cast<gsnake::SnakeGame *>(handle);
    loop.reset(new GameLoop(kFakeView, &view, handle));
    ASSERT_TRUE(loop->setup(kT0));
  }

  void Press(int key) { view.keys.push_back(key); }
};

}  // namespace

/* ===== Клавиши и тексты ===== */

TEST(GameLoopMappingTest, KeysMapToActions) {
  UserAction_t action;
  ASSERT_TRUE(GameLoop::map_key(' ', &action));
  EXPECT_EQ(action, Start);
  ASSERT_TRUE(GameLoop::map_key('\n', &action));
  EXPECT_EQ(action, Start);
  ASSERT_TRUE(GameLoop::map_key('p', &action));
  EXPECT_EQ(action, Pause);
  ASSERT_TRUE(GameLoop::map_key('w', &action));
  EXPECT_EQ(action, Up);
  ASSERT_TRUE(GameLoop::map_key('a', &action));
  EXPECT_EQ(action, Left);
  ASSERT_TRUE(GameLoop::map_key('s', &action));
  EXPECT_EQ(action, Down);
  ASSERT_TRUE(GameLoop::map_key('d', &action));
  EXPECT_EQ(action, Right);
  ASSERT_TRUE(GameLoop::map_key('q', &action));
  EXPECT_EQ(action, Terminate);
  ASSERT_TRUE(GameLoop::map_key(27, &action));
  EXPECT_EQ(action, Terminate);

  EXPECT_FALSE(GameLoop::map_key('x', &action));
  EXPECT_FALSE(GameLoop::map_key(' ', nullptr));
}

TEST(GameLoopMappingTest, OverlayPriority) {
  // ready > game over > pause
  EXPECT_EQ(GameLoop::overlay_text(MakeInfo(1, 1, 1, 0, 0)).rfind("SNAKE", 0),
            0u);
  EXPECT_EQ(
      GameLoop::overlay_text(MakeInfo(0, 1, 1, 3, 5)).rfind("GAME OVER", 0),
      0u);
  EXPECT_EQ(GameLoop::overlay_text(MakeInfo(0, 0, 1, 3, 5)).rfind("PAUSED", 0),
            0u);
  EXPECT_TRUE(GameLoop::overlay_text(MakeInfo(0, 0, 0, 3, 5)).empty());
}

TEST(GameLoopMappingTest, GameOverShowsScoresAndRecord) {
  const std::string record = GameLoop::overlay_text(MakeInfo(0, 1, 0, 8, 8));
  EXPECT_NE(record.find("Score: 8"), std::string::npos);
  EXPECT_NE(record.find("Best: 8"), std::string::npos);
  EXPECT_NE(record.find("NEW RECORD"), std::string::npos);

  const std::string plain = GameLoop::overlay_text(MakeInfo(0, 1, 0, 2, 8));
  EXPECT_EQ(plain.find("NEW RECORD"), std::string::npos);
}

TEST(GameLoopMappingTest, BestHighlightNeedsNonZeroRecord) {
  EXPECT_FALSE(GameLoop::best_highlighted(MakeInfo(0, 0, 0, 0, 0)));
  EXPECT_FALSE(GameLoop::best_highlighted(MakeInfo(0, 0, 0, 3, 5)));
  EXPECT_TRUE(GameLoop::best_highlighted(MakeInfo(0, 0, 0, 5, 5)));
}

/* ===== Цикл ===== */

TEST(GameLoopSetupTest, FailsWithoutGame) {
  FakeView view;
  GameLoop loop(kFakeView, &view, nullptr);
  EXPECT_FALSE(loop.setup(kT0));
  EXPECT_FALSE(loop.running());
}

TEST_F(GameLoopTest, SetupDrawsReadyScreen) {
  EXPECT_TRUE(loop->running());
  EXPECT_TRUE(loop->scheduler().active());
  EXPECT_EQ(loop->scheduler().period(), milliseconds(100));

  EXPECT_EQ(view.renders, 1);
  EXPECT_EQ(view.field.size(),
            static_cast<size_t>(GSNAKE_GRID_WIDTH * GSNAKE_GRID_HEIGHT));
  EXPECT_EQ(view.numbers["score"], 0);
  EXPECT_EQ(view.numbers["speed"], 10);
  EXPECT_EQ(view.text["best_label"], "Best");
  ASSERT_EQ(view.text.count("status"), 1u);
  EXPECT_EQ(view.text["status"].rfind("SNAKE", 0), 0u);
}

TEST_F(GameLoopTest, StartKeyHidesOverlay) {
  Press(' ');
  EXPECT_TRUE(loop->step(kT0 + milliseconds(1)));
  EXPECT_EQ(loop->info()->ready, 0);
  EXPECT_EQ(view.text.count("status"), 0u);
}

TEST_F(GameLoopTest, PauseKeyShowsOverlay) {
  Press(' ');
  Press('p');
  EXPECT_TRUE(loop->step(kT0 + milliseconds(1)));
  EXPECT_EQ(view.text["status"].rfind("PAUSED", 0), 0u);
}

TEST_F(GameLoopTest, TicksMoveSnakeOnSchedule) {
  Press(' ');
  ASSERT_TRUE(loop->step(kT0 + milliseconds(1)));
  const int renders = view.renders;
  const gsnake::Position head = game->snake().head();

  ASSERT_TRUE(loop->step(kT0 + milliseconds(50)));
  EXPECT_EQ(game->snake().head(), head);
  EXPECT_EQ(view.renders, renders);

  ASSERT_TRUE(loop->step(kT0 + milliseconds(100)));
  EXPECT_EQ(game->snake().head(), head.move(gsnake::Direction::RIGHT));
  EXPECT_EQ(view.renders, renders + 1);
}

TEST_F(GameLoopTest, SpeedChangeReschedulesTicks) {
  Press(' ');
  ASSERT_TRUE(loop->step(kT0 + milliseconds(1)));

  game->set_snake_for_testing(
      gsnake::Snake({{5, 5}, {4, 5}, {3, 5}}, gsnake::Direction::RIGHT));
  game->set_score_for_testing(4);
  game->set_food_for_testing(6, 5);

  ASSERT_TRUE(loop->step(kT0 + milliseconds(100)));
  EXPECT_EQ(loop->info()->speed, 11);
  EXPECT_EQ(loop->scheduler().period(), milliseconds(90));
  EXPECT_EQ(loop->scheduler().deadline(), kT0 + milliseconds(190));
  EXPECT_EQ(view.numbers["speed"], 11);
}

TEST_F(GameLoopTest, QuitKeyStopsLoop) {
  Press('q');
  EXPECT_FALSE(loop->step(kT0 + milliseconds(1)));
  EXPECT_FALSE(loop->running());
  EXPECT_FALSE(loop->scheduler().active());
  EXPECT_FALSE(loop->step(kT0 + milliseconds(2)));
}

TEST_F(GameLoopTest, EscapeStopsLoop) {
  Press(27);
  EXPECT_FALSE(loop->step(kT0 + milliseconds(1)));
}

TEST_F(GameLoopTest, BrokenInputStopsLoop) {
  view.broken_input = true;
  EXPECT_FALSE(loop->step(kT0 + milliseconds(1)));
  EXPECT_FALSE(loop->running());
}

TEST_F(GameLoopTest, RestartReturnsTicksToInitialSpeed) {
  Press(' ');
  ASSERT_TRUE(loop->step(kT0 + milliseconds(1)));

  game->set_snake_for_testing(
      gsnake::Snake({{5, 5}, {4, 5}, {3, 5}}, gsnake::Direction::RIGHT));
  game->set_score_for_testing(24);
  game->set_food_for_testing(6, 5);
  ASSERT_TRUE(loop->step(kT0 + milliseconds(100)));
  ASSERT_EQ(loop->info()->speed, 15);
  ASSERT_EQ(loop->scheduler().period(), milliseconds(66));

  game->set_snake_for_testing(
      gsnake::Snake({{0, 5}, {1, 5}, {2, 5}}, gsnake::Direction::LEFT));
  game->set_food_for_testing(20, 20);
  ASSERT_TRUE(loop->step(kT0 + milliseconds(166)));
  ASSERT_EQ(loop->info()->game_over, 1);

  Press(' ');
  ASSERT_TRUE(loop->step(kT0 + milliseconds(170)));
  EXPECT_EQ(loop->info()->game_over, 0);
  EXPECT_EQ(loop->info()->speed, 10);
  EXPECT_EQ(loop->scheduler().period(), milliseconds(100));
  EXPECT_EQ(loop->scheduler().deadline(), kT0 + milliseconds(270));
  EXPECT_EQ(view.numbers["speed"], 10);
}

TEST_F(GameLoopTest, RunReturnsZeroAfterQuitKey) {
  Press('q');
  EXPECT_EQ(loop->run(), 0);
}

TEST_F(GameLoopTest, RunReturnsErrorWhenInputFails) {
  view.broken_input = true;
  EXPECT_EQ(loop->run(), 1);
  EXPECT_FALSE(loop->running());
  EXPECT_FALSE(loop->scheduler().active());
}

TEST_F(GameLoopTest, UnknownKeysAreIgnored) {
  Press('z');
  Press('7');
  EXPECT_TRUE(loop->step(kT0 + milliseconds(1)));
  EXPECT_EQ(loop->info()->ready, 1);
}
