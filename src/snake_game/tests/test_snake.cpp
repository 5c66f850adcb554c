#include <gtest/gtest.h>

#include <utility>

extern "C" {
#include "gsnake_cmn.h"
}

#include "gsnake.h"

constexpr int kFieldHeight = GSNAKE_GRID_HEIGHT;
constexpr int kFieldWidth = GSNAKE_GRID_WIDTH;

// Базовые настройки для большинства тестов
class SnakeTest : public ::testing::Test {
 protected:
  void* game = nullptr;

  void SetUp() override {
    game = snake_create();
    ASSERT_NE(game, nullptr);
  }

  void TearDown() override {
    snake_destroy(game);
    game = nullptr;
  }

  const GameInfo_t* Info() {
    const GameInfo_t* info = snake_get_info(game);
    EXPECT_NE(info, nullptr);
    return info;
  }

  void Tick(int n = 1) {
    for (int i = 0; i < n; ++i) {
      snake_update(game);
    }
  }
};

static bool IsHead(int cell) {
  return cell >= GSNAKE_CELL_HEAD_UP && cell <= GSNAKE_CELL_HEAD_RIGHT;
}

static std::pair<int, int> FindHead(const GameInfo_t* info) {
  for (int y = 0; y < kFieldHeight; ++y) {
    for (int x = 0; x < kFieldWidth; ++x) {
      if (IsHead(info->field[y][x])) {
        return {y, x};
      }
    }
  }
  return {-1, -1};  // Голова не найдена
}

static bool SameField(int** a, int before[kFieldHeight][kFieldWidth]) {
  for (int y = 0; y < kFieldHeight; ++y)
    for (int x = 0; x < kFieldWidth; ++x)
      if (a[y][x] != before[y][x]) return false;
  return true;
}

static void CopyField(int** from, int to[kFieldHeight][kFieldWidth]) {
  for (int y = 0; y < kFieldHeight; ++y)
    for (int x = 0; x < kFieldWidth; ++x) to[y][x] = from[y][x];
}

/* ===== API и интерфейс ===== */

TEST(SnakeApiTest, CreateDestroyNullSafe) {
  // NULL в destroy не должен падать
  snake_destroy(nullptr);
  snake_update(nullptr);
  snake_handle_input(nullptr, Start, false);
  EXPECT_EQ(snake_get_info(nullptr), nullptr);

  void* game = snake_create();
  ASSERT_NE(game, nullptr);

  const GameInfo_t* info = snake_get_info(game);
  ASSERT_NE(info, nullptr);
  EXPECT_TRUE(gsnake_is_valid_game_info(info));

  // Проверка начальных значений
  EXPECT_EQ(info->score, 0);
  EXPECT_EQ(info->high_score, 0);
  EXPECT_EQ(info->speed, GSNAKE_INITIAL_SPEED);
  EXPECT_EQ(info->length, GSNAKE_INITIAL_LENGTH);
  EXPECT_EQ(info->direction, DIR_RIGHT);
  EXPECT_EQ(info->ready, 1) << "Game should start on the ready screen";
  EXPECT_EQ(info->pause, 0);
  EXPECT_EQ(info->game_over, 0);

  snake_destroy(game);
}

TEST(SnakeApiTest, TwoGamesAreIndependent) {
  void* a = snake_create();
  void* b = snake_create();
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);

  snake_handle_input(a, Start, false);
  EXPECT_EQ(snake_get_info(a)->ready, 0);
  EXPECT_EQ(snake_get_info(b)->ready, 1);

  snake_destroy(a);
  snake_destroy(b);
}

/* ===== Начальное состояние и READY ===== */

TEST_F(SnakeTest, FieldStableOnReadyScreen) {
  int before[kFieldHeight][kFieldWidth];
  CopyField(Info()->field, before);

  Tick(5);
  EXPECT_TRUE(SameField(Info()->field, before));
  EXPECT_EQ(Info()->ready, 1);
}

TEST_F(SnakeTest, DirectionIgnoredOnReadyScreen) {
  snake_handle_input(game, Up, false);
  snake_handle_input(game, Start, false);
  Tick(1);

  auto [y, x] = FindHead(Info());
  EXPECT_EQ(y, kFieldHeight / 2);
  EXPECT_EQ(x, kFieldWidth / 4 + 1) << "Змейка должна пойти вправо";
}

TEST_F(SnakeTest, InitialStateFieldAndSnake) {
  snake_handle_input(game, Start, false);
  Tick(1);

  const GameInfo_t* info = Info();
  int snake_len = 0, food = 0, head_count = 0;
  for (int y = 0; y < kFieldHeight; ++y) {
    for (int x = 0; x < kFieldWidth; ++x) {
      int cell = info->field[y][x];
      if (cell == GSNAKE_CELL_EMPTY) continue;
      if (cell == GSNAKE_CELL_BODY) {
        ++snake_len;
      } else if (IsHead(cell)) {
        ++snake_len;
        ++head_count;
      } else if (cell == GSNAKE_CELL_FOOD) {
        ++food;
      } else {
        FAIL() << "Invalid cell value at [" << y << "][" << x << "]: " << cell;
      }
    }
  }
  EXPECT_EQ(snake_len, info->length);
  EXPECT_GE(snake_len, GSNAKE_INITIAL_LENGTH);
  EXPECT_EQ(head_count, 1);
  EXPECT_EQ(food, 1);
}

/* ===== Движение и изменение направления ===== */

TEST_F(SnakeTest, MoveRightByDefault) {
  snake_handle_input(game, Start, false);
  Tick(1);
  auto [y1, x1] = FindHead(Info());
  ASSERT_NE(x1, -1) << "Голова змейки должна быть видна после Start";
  EXPECT_EQ(Info()->field[y1][x1], GSNAKE_CELL_HEAD_RIGHT);

  Tick(1);
  auto [y2, x2] = FindHead(Info());
  EXPECT_EQ(y1, y2) << "Змейка должна двигаться горизонтально";
  EXPECT_EQ(x2, x1 + 1) << "Змейка должна двигаться вправо по умолчанию";
}

TEST_F(SnakeTest, ChangeDirectionUpValid) {
  snake_handle_input(game, Start, false);
  Tick(1);
  auto [y1, x1] = FindHead(Info());

  snake_handle_input(game, Up, false);
  Tick(1);
  auto [y2, x2] = FindHead(Info());

  EXPECT_EQ(y1 - 1, y2) << "Змейка должна двигаться вверх";
  EXPECT_EQ(x2, x1);
  EXPECT_EQ(Info()->direction, DIR_UP);
  EXPECT_EQ(Info()->field[y2][x2], GSNAKE_CELL_HEAD_UP);
}

TEST_F(SnakeTest, ChangeDirectionDownLeftValid) {
  snake_handle_input(game, Start, false);
  Tick(1);
  auto [y1, x1] = FindHead(Info());

  snake_handle_input(game, Down, false);
  Tick(1);
  auto [y2, x2] = FindHead(Info());
  EXPECT_EQ(y1 + 1, y2) << "Змейка должна двигаться вниз";
  EXPECT_EQ(x2, x1);

  snake_handle_input(game, Left, false);
  Tick(1);
  auto [y3, x3] = FindHead(Info());
  EXPECT_EQ(y3, y2);
  EXPECT_EQ(x3, x1 - 1) << "Змейка должна двигаться влево";
}

TEST_F(SnakeTest, PreventReverseDirection) {
  snake_handle_input(game, Start, false);
  Tick(1);
  auto [y1, x1] = FindHead(Info());

  // Попытка разворота на 180°: вправо → влево
  snake_handle_input(game, Left, false);
  Tick(1);
  auto [y2, x2] = FindHead(Info());

  EXPECT_EQ(x2, x1 + 1) << "Змейка продолжает движение вправо";
  EXPECT_EQ(y2, y1);
}

TEST_F(SnakeTest, LastDirectionBeforeTickWins) {
  snake_handle_input(game, Start, false);
  Tick(1);
  auto [y1, x1] = FindHead(Info());

  snake_handle_input(game, Up, false);
  snake_handle_input(game, Down, false);
  Tick(1);
  auto [y2, x2] = FindHead(Info());

  EXPECT_EQ(x2, x1);
  EXPECT_EQ(y2, y1 + 1) << "Действует последнее допустимое намерение";
}

/* ===== Пауза и возобновление ===== */

TEST_F(SnakeTest, PauseAndResume) {
  snake_handle_input(game, Start, false);
  Tick(1);

  snake_handle_input(game, Pause, false);
  EXPECT_EQ(Info()->pause, 1) << "Игра должна встать на паузу";
  auto [y2, x2] = FindHead(Info());

  // В паузе поле не меняется, повороты не принимаются
  snake_handle_input(game, Up, false);
  Tick(3);
  auto [y3, x3] = FindHead(Info());
  EXPECT_EQ(x3, x2);
  EXPECT_EQ(y3, y2);

  snake_handle_input(game, Pause, false);
  EXPECT_EQ(Info()->pause, 0) << "Игра должна быть снята с паузы";

  Tick(1);
  auto [y5, x5] = FindHead(Info());
  EXPECT_EQ(x5, x2 + 1) << "Змейка должна сместиться вправо";
  EXPECT_EQ(y5, y2);
}

TEST_F(SnakeTest, PauseIgnoredOnReadyScreen) {
  snake_handle_input(game, Pause, false);
  EXPECT_EQ(Info()->pause, 0);
  EXPECT_EQ(Info()->ready, 1);
}

TEST_F(SnakeTest, StartIgnoredWhilePaused) {
  snake_handle_input(game, Start, false);
  snake_handle_input(game, Pause, false);
  snake_handle_input(game, Start, false);
  EXPECT_EQ(Info()->pause, 1);
}

/* ===== Столкновения ===== */

TEST_F(SnakeTest, CollisionWithRightWall) {
  snake_handle_input(game, Start, false);
  Tick(1);

  auto [head_y, head_x] = FindHead(Info());
  ASSERT_NE(head_x, -1);

  const int steps_needed = kFieldWidth - 1 - head_x;
  ASSERT_GT(steps_needed, 0) << "Змейка уже у правой стены";
  Tick(steps_needed);

  auto [y_after, x_after] = FindHead(Info());
  EXPECT_EQ(x_after, kFieldWidth - 1) << "Змейка должна достичь правой стены";
  EXPECT_EQ(Info()->game_over, 0);

  // Шаг за границу
  Tick(1);
  EXPECT_EQ(Info()->game_over, 1);
  EXPECT_EQ(Info()->high_score, Info()->score);

  int post_collision[kFieldHeight][kFieldWidth];
  CopyField(Info()->field, post_collision);

  // Игра закончена: поле не должно меняться
  Tick(5);
  EXPECT_TRUE(SameField(Info()->field, post_collision))
      << "Поле должно замереть после столкновения (GAME_OVER)";
}

TEST_F(SnakeTest, RestartAfterGameOverGoesStraightToPlaying) {
  snake_handle_input(game, Start, false);
  snake_handle_input(game, Up, false);
  Tick(kFieldHeight);
  ASSERT_EQ(Info()->game_over, 1);

  snake_handle_input(game, Start, false);
  const GameInfo_t* info = Info();
  EXPECT_EQ(info->game_over, 0);
  EXPECT_EQ(info->ready, 0);
  EXPECT_EQ(info->score, 0);
  EXPECT_EQ(info->speed, GSNAKE_INITIAL_SPEED);
  EXPECT_EQ(info->length, GSNAKE_INITIAL_LENGTH);
  EXPECT_EQ(info->direction, DIR_RIGHT);

  auto [y, x] = FindHead(info);
  EXPECT_EQ(y, kFieldHeight / 2);
  EXPECT_EQ(x, kFieldWidth / 4);
}

TEST_F(SnakeTest, TerminateAndActionAreIgnored) {
  snake_handle_input(game, Terminate, false);
  snake_handle_input(game, Action, true);
  EXPECT_EQ(Info()->ready, 1);

  snake_handle_input(game, Start, false);
  snake_handle_input(game, Terminate, false);
  EXPECT_EQ(Info()->ready, 0);
  EXPECT_EQ(Info()->game_over, 0);
}

/* ===== Общие утилиты ===== */

TEST(SnakeCommonTest, GameInfoLifecycle) {
  GameInfo_t info = gsnake_create_game_info();
  ASSERT_NE(info.field, nullptr);
  EXPECT_TRUE(gsnake_is_valid_game_info(&info));
  EXPECT_EQ(info.ready, 1);

  info.field[3][4] = GSNAKE_CELL_FOOD;
  gsnake_clear_field(info.field);
  EXPECT_EQ(info.field[3][4], GSNAKE_CELL_EMPTY);

  info.field[0][0] = 99;
  EXPECT_FALSE(gsnake_is_valid_field(info.field));
  EXPECT_FALSE(gsnake_is_valid_game_info(&info));
  info.field[0][0] = GSNAKE_CELL_EMPTY;

  info.speed = GSNAKE_MAX_SPEED + 1;
  EXPECT_FALSE(gsnake_is_valid_game_info(&info));

  gsnake_destroy_game_info(&info);
  EXPECT_EQ(info.field, nullptr);
  gsnake_destroy_game_info(nullptr);
}

TEST(SnakeCommonTest, ActionValidation) {
  EXPECT_TRUE(gsnake_is_valid_action(Start));
  EXPECT_TRUE(gsnake_is_valid_action(Action));
  EXPECT_FALSE(gsnake_is_valid_field(nullptr));
  EXPECT_FALSE(gsnake_is_valid_game_info(nullptr));
}
