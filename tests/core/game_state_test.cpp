#include <gtest/gtest.h>
#include <memory>
#include "connectfour/core/game_state.h"
#include "connectfour/core/errors.h"

namespace connectfour {
namespace core {

class GameStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        state = std::make_unique<GameState>(std::vector<Token>{"X", "O"});
    }

    // Bottom-up contents of a 1-based column in the current view
    std::vector<std::optional<Token>> columnContents(int column) const {
        StateView view = state->exposeView();
        std::vector<std::optional<Token>> cells;
        for (int row = view.getRows() - 1; row >= 0; --row) {
            cells.push_back(view.at(row, column - 1));
        }
        return cells;
    }

    std::unique_ptr<GameState> state;
};

TEST_F(GameStateTest, InitialState) {
    EXPECT_EQ(state->getBoardSize(), (BoardSize{6, 7}));
    EXPECT_EQ(state->countPieces(), 0);
    EXPECT_EQ(state->openColumns().size(), 7u);
    EXPECT_EQ(state->checkOutcome().status, OutcomeStatus::UNFINISHED);

    StateView view = state->exposeView();
    EXPECT_EQ(view.getBoard().size(), 42u);
    for (const auto& cell : view.getBoard()) {
        EXPECT_FALSE(cell.has_value());
    }
}

TEST_F(GameStateTest, PlaceDropsToBottom) {
    state->place(4, "X");

    StateView view = state->exposeView();
    ASSERT_TRUE(view.at(5, 3).has_value());
    EXPECT_EQ(*view.at(5, 3), "X");
    EXPECT_FALSE(view.at(4, 3).has_value());
    EXPECT_EQ(state->countPieces(), 1);
}

TEST_F(GameStateTest, PlacementsStackWithoutGaps) {
    state->place(2, "X");
    state->place(2, "O");
    state->place(2, "X");

    auto cells = columnContents(2);
    EXPECT_EQ(cells[0], std::optional<Token>("X"));
    EXPECT_EQ(cells[1], std::optional<Token>("O"));
    EXPECT_EQ(cells[2], std::optional<Token>("X"));
    EXPECT_FALSE(cells[3].has_value());
    EXPECT_FALSE(cells[4].has_value());
    EXPECT_FALSE(cells[5].has_value());
}

TEST_F(GameStateTest, FullColumnFailsWithoutMutation) {
    for (int i = 0; i < 6; ++i) {
        state->place(1, i % 2 == 0 ? "X" : "O");
    }
    EXPECT_TRUE(state->isColumnFull(1));

    std::vector<std::optional<Token>> before = state->exposeView().getBoard();

    try {
        state->place(1, "X");
        FAIL() << "Placing into a full column should throw";
    } catch (const ActionError& e) {
        EXPECT_EQ(e.getColumn(), 1);
    }

    EXPECT_EQ(state->exposeView().getBoard(), before);
    EXPECT_EQ(state->countPieces(), 6);
    EXPECT_EQ(state->openColumns(), (std::vector<int>{2, 3, 4, 5, 6, 7}));
}

TEST_F(GameStateTest, ColumnOutsideBoardIsActionError) {
    EXPECT_THROW(state->place(0, "X"), ActionError);
    EXPECT_THROW(state->place(8, "X"), ActionError);
    EXPECT_THROW(state->place(-3, "X"), ActionError);
    EXPECT_THROW(state->isColumnFull(8), ActionError);
    EXPECT_EQ(state->countPieces(), 0);
}

TEST_F(GameStateTest, UnknownTokenIsRejected) {
    EXPECT_THROW(state->place(1, "Z"), GameStateException);
    EXPECT_EQ(state->countPieces(), 0);
}

TEST_F(GameStateTest, HorizontalWin) {
    for (int column = 1; column <= 3; ++column) {
        state->place(column, "X");
        state->place(column, "O");
        EXPECT_EQ(state->checkOutcome().status, OutcomeStatus::UNFINISHED);
    }
    state->place(4, "X");

    OutcomeCheck check = state->checkOutcome();
    EXPECT_EQ(check.status, OutcomeStatus::WIN);
    ASSERT_TRUE(check.winner.has_value());
    EXPECT_EQ(*check.winner, "X");
    ASSERT_TRUE(check.winningLine.has_value());
    EXPECT_EQ(*check.winningLine, (Line{35, 36, 37, 38}));
}

TEST_F(GameStateTest, VerticalWin) {
    for (int i = 0; i < 4; ++i) {
        state->place(7, "O");
    }

    OutcomeCheck check = state->checkOutcome();
    EXPECT_EQ(check.status, OutcomeStatus::WIN);
    EXPECT_EQ(check.winner, std::optional<Token>("O"));
    EXPECT_EQ(*check.winningLine, (Line{20, 27, 34, 41}));
}

TEST_F(GameStateTest, DiagonalWinRising) {
    // X on (5,0), (4,1), (3,2), (2,3): bottom-left to top-right
    state->place(1, "X");
    state->place(2, "O");
    state->place(2, "X");
    state->place(3, "O");
    state->place(3, "O");
    state->place(3, "X");
    state->place(4, "O");
    state->place(4, "O");
    state->place(4, "O");
    EXPECT_EQ(state->checkOutcome().status, OutcomeStatus::UNFINISHED);
    state->place(4, "X");

    OutcomeCheck check = state->checkOutcome();
    EXPECT_EQ(check.status, OutcomeStatus::WIN);
    EXPECT_EQ(check.winner, std::optional<Token>("X"));
    EXPECT_EQ(*check.winningLine, (Line{17, 23, 29, 35}));
}

TEST_F(GameStateTest, DiagonalWinFalling) {
    // O on (2,0), (3,1), (4,2), (5,3): top-left to bottom-right
    state->place(1, "X");
    state->place(1, "X");
    state->place(1, "X");
    state->place(1, "O");
    state->place(2, "X");
    state->place(2, "X");
    state->place(2, "O");
    state->place(3, "X");
    state->place(3, "O");
    EXPECT_EQ(state->checkOutcome().status, OutcomeStatus::UNFINISHED);
    state->place(4, "O");

    OutcomeCheck check = state->checkOutcome();
    EXPECT_EQ(check.status, OutcomeStatus::WIN);
    EXPECT_EQ(check.winner, std::optional<Token>("O"));
    EXPECT_EQ(*check.winningLine, (Line{14, 22, 30, 38}));
}

TEST_F(GameStateTest, FullBoardWithoutLineIsDraw) {
    // Alternating pairs in every row and column, no four in a row anywhere
    GameState small(std::vector<Token>{"X", "O"}, BoardSize{4, 4});
    const char* pattern[4] = {"XXOO", "OOXX", "XXOO", "OOXX"};

    // Fill bottom row first
    for (int row = 3; row >= 0; --row) {
        for (int column = 0; column < 4; ++column) {
            small.place(column + 1, Token(1, pattern[row][column]));
        }
    }

    OutcomeCheck check = small.checkOutcome();
    EXPECT_EQ(check.status, OutcomeStatus::DRAW);
    EXPECT_FALSE(check.winner.has_value());
    EXPECT_TRUE(small.openColumns().empty());
}

TEST_F(GameStateTest, FullStandardBoardWithoutLineIsDraw) {
    // Top row first
    const char* pattern[6] = {
        "OXXOOOX",
        "XOOXXXO",
        "OOOXOXO",
        "XXOXOOO",
        "XOXOXXX",
        "XXOOXOX"
    };

    for (int row = 5; row >= 0; --row) {
        for (int column = 0; column < 7; ++column) {
            ASSERT_EQ(state->checkOutcome().status, OutcomeStatus::UNFINISHED)
                << "before (" << row << ", " << column << ")";
            state->place(column + 1, Token(1, pattern[row][column]));
        }
    }

    OutcomeCheck check = state->checkOutcome();
    EXPECT_EQ(check.status, OutcomeStatus::DRAW);
    EXPECT_FALSE(check.winner.has_value());
    EXPECT_FALSE(check.winningLine.has_value());
    EXPECT_EQ(state->countPieces(), 42);
    EXPECT_TRUE(state->openColumns().empty());
}

TEST_F(GameStateTest, WinOnLastCellIsWinNotDraw) {
    GameState tiny(std::vector<Token>{"X", "O"}, BoardSize{1, 4});
    for (int column = 1; column <= 4; ++column) {
        tiny.place(column, "X");
    }

    EXPECT_EQ(tiny.checkOutcome().status, OutcomeStatus::WIN);
}

TEST_F(GameStateTest, ViewTranslatesToExternalTokens) {
    GameState named(std::vector<Token>{"alice", "bob"}, BoardSize{4, 5});
    named.place(1, "alice");
    named.place(5, "bob");

    StateView view = named.exposeView();
    EXPECT_EQ(view.getRows(), 4);
    EXPECT_EQ(view.getColumns(), 5);

    for (const auto& cell : view.getBoard()) {
        if (cell) {
            EXPECT_TRUE(*cell == "alice" || *cell == "bob");
        }
    }
    EXPECT_EQ(view.at(3, 0), std::optional<Token>("alice"));
    EXPECT_EQ(view.at(3, 4), std::optional<Token>("bob"));
}

TEST_F(GameStateTest, ViewIsDetachedFromState) {
    StateView before = state->exposeView();
    state->place(3, "X");

    EXPECT_FALSE(before.at(5, 2).has_value());
    EXPECT_TRUE(state->exposeView().at(5, 2).has_value());
}

TEST_F(GameStateTest, ToStringUsesFirstCharacterOfTokens) {
    GameState named(std::vector<Token>{"Xavier", "Olga"}, BoardSize{2, 3});
    named.place(1, "Xavier");
    named.place(3, "Olga");

    EXPECT_EQ(named.toString(), "[ , , ]\n[X, ,O]");
}

TEST_F(GameStateTest, ConstructionErrors) {
    EXPECT_THROW(GameState(std::vector<Token>{"X", "X"}), GameConstructionError);
    EXPECT_THROW(GameState(std::vector<Token>{"X", ""}), GameConstructionError);
    EXPECT_THROW(GameState(std::vector<Token>{"X", "O"}, BoardSize{0, 7}), GameConstructionError);
    EXPECT_THROW(GameState(std::vector<Token>{"X", "O"}, BoardSize{6, -2}), GameConstructionError);
}

TEST(TokenMapTest, BijectionInRegistrationOrder) {
    TokenMap map(std::vector<Token>{"red", "yellow", "green"});

    EXPECT_EQ(map.size(), 3u);
    EXPECT_EQ(map.toInternal("red"), 1);
    EXPECT_EQ(map.toInternal("yellow"), 2);
    EXPECT_EQ(map.toInternal("green"), 3);
    EXPECT_EQ(map.toExternal(2), "yellow");

    for (const auto& token : map.tokens()) {
        EXPECT_EQ(map.toExternal(map.toInternal(token)), token);
    }

    EXPECT_THROW(map.toInternal("blue"), GameStateException);
    EXPECT_THROW(map.toExternal(EMPTY_CELL), GameStateException);
    EXPECT_THROW(map.toExternal(4), GameStateException);
}

} // namespace core
} // namespace connectfour
