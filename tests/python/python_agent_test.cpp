#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <pybind11/embed.h>
#include <pybind11/stl.h>
#include "connectfour/python/bindings.h"

namespace py = pybind11;

PYBIND11_EMBEDDED_MODULE(_connectfour_cpp, m) {
    connectfour::python::registerBindings(m);
}

namespace connectfour {
namespace python {

namespace {
// Python agent that keeps everything the game hands it
const char* KEEPING_AGENT_SOURCE = R"(
import _connectfour_cpp as cf

class KeepingAgent(cf.Agent):
    def __init__(self, token):
        cf.Agent.__init__(self, token)
        self.views = []
        self.outcome = None

    def select_action(self, view):
        self.views.append(view)
        return cf.Action.place(view.open_columns()[0])

    def notify_outcome(self, outcome):
        self.outcome = outcome

def play_game(seed):
    config = cf.GameConfig()
    config.seed = seed
    config.log_level = "off"
    agents = [KeepingAgent("X"), KeepingAgent("O")]
    game = cf.Game(agents, (3, 3), config)
    return agents, game.play()
)";
} // namespace

class PythonAgentTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        interpreter = std::make_unique<py::scoped_interpreter>();
        py::exec(KEEPING_AGENT_SOURCE);
    }

    static void TearDownTestSuite() {
        interpreter.reset();
    }

    // Plays one 3x3 game, then a second one so freed memory gets reused
    py::tuple playTwice() {
        py::tuple played = py::globals()["play_game"](19).cast<py::tuple>();
        py::globals()["play_game"](23);
        return played;
    }

    static std::unique_ptr<py::scoped_interpreter> interpreter;
};

std::unique_ptr<py::scoped_interpreter> PythonAgentTest::interpreter;

TEST_F(PythonAgentTest, KeptViewsOutliveTheirTurn) {
    py::tuple played = playTwice();
    py::list agentList = played[0].cast<py::list>();
    ASSERT_EQ(agentList.size(), 2u);

    for (auto agent : agentList) {
        py::list views = agent.attr("views").cast<py::list>();
        ASSERT_FALSE(views.empty());

        std::vector<int> counts;
        for (auto view : views) {
            auto board = view.attr("board").cast<std::vector<std::optional<std::string>>>();
            ASSERT_EQ(board.size(), 9u);

            int count = 0;
            for (const auto& cell : board) {
                if (cell) {
                    EXPECT_TRUE(*cell == "X" || *cell == "O");
                    ++count;
                }
            }
            counts.push_back(count);
        }

        // Turns alternate, so each kept view holds two more pieces than the last
        for (size_t i = 1; i < counts.size(); ++i) {
            EXPECT_EQ(counts[i], counts[i - 1] + 2);
        }
    }
}

TEST_F(PythonAgentTest, KeptOutcomeOutlivesPlay) {
    py::tuple played = playTwice();
    py::list agentList = played[0].cast<py::list>();
    py::object returned = played[1];

    for (auto agent : agentList) {
        py::object kept = agent.attr("outcome");
        ASSERT_FALSE(kept.is_none());

        EXPECT_TRUE(kept.attr("is_finalized")().cast<bool>());
        EXPECT_EQ(kept.attr("record").cast<py::list>().size(), 9u);
        EXPECT_EQ(py::str(kept).cast<std::string>(), py::str(returned).cast<std::string>());
    }
}

} // namespace python
} // namespace connectfour
