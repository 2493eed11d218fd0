// src/pybind/python_bindings.cpp
#include "connectfour/python/bindings.h"

#include <pybind11/stl.h>

#include "connectfour/core/action.h"
#include "connectfour/core/errors.h"
#include "connectfour/core/game_config.h"
#include "connectfour/core/outcome.h"
#include "connectfour/core/state_view.h"
#include "connectfour/agents/agent.h"
#include "connectfour/agents/random_agent.h"
#include "connectfour/game/game.h"

namespace py = pybind11;

namespace connectfour {
namespace python {

// Lets Python classes derive from Agent.
// The view and the outcome only live for the duration of the call, so Python
// receives its own copies and may keep them.
class PyAgent : public agents::Agent {
public:
    using agents::Agent::Agent;

    core::Action selectAction(const core::StateView& view) override {
        PYBIND11_OVERRIDE_PURE_NAME(core::Action, agents::Agent, "select_action", selectAction,
                                    core::StateView(view));
    }

    void notifyOutcome(const core::Outcome& outcome) override {
        PYBIND11_OVERRIDE_PURE_NAME(void, agents::Agent, "notify_outcome", notifyOutcome,
                                    core::Outcome(outcome));
    }
};

void registerBindings(py::module& m) {
    // Exceptions
    auto gameStateError = py::register_exception<core::GameStateException>(m, "GameStateError", PyExc_RuntimeError);
    py::register_exception<core::ActionError>(m, "ActionError", gameStateError.ptr());
    py::register_exception<core::ProtocolError>(m, "ProtocolError", gameStateError.ptr());
    py::register_exception<core::GameConstructionError>(m, "GameConstructionError", PyExc_ValueError);

    // Enums
    py::enum_<core::ActionKind>(m, "ActionKind")
        .value("PLACE", core::ActionKind::PLACE)
        .export_values();

    py::enum_<core::ResultTag>(m, "ResultTag")
        .value("PENDING", core::ResultTag::PENDING)
        .value("WIN", core::ResultTag::WIN)
        .value("LOSE", core::ResultTag::LOSE)
        .value("DRAW", core::ResultTag::DRAW)
        .export_values();

    py::enum_<game::GameStatus>(m, "GameStatus")
        .value("NOT_STARTED", game::GameStatus::NOT_STARTED)
        .value("IN_PROGRESS", game::GameStatus::IN_PROGRESS)
        .value("WON", game::GameStatus::WON)
        .value("DRAWN", game::GameStatus::DRAWN)
        .value("FORFEITED", game::GameStatus::FORFEITED)
        .value("ABORTED", game::GameStatus::ABORTED)
        .export_values();

    // Data classes
    py::class_<core::Action>(m, "Action")
        .def(py::init([](core::ActionKind kind, int column) { return core::Action{kind, column}; }),
             py::arg("kind"), py::arg("column"))
        .def_readonly("kind", &core::Action::kind)
        .def_readonly("column", &core::Action::column)
        .def_static("place", &core::Action::place, py::arg("column"))
        .def("__str__", &core::Action::toString);

    py::class_<core::StateView>(m, "StateView")
        .def_property_readonly("board_size", [](const core::StateView& view) {
            return py::make_tuple(view.getRows(), view.getColumns());
        })
        .def_property_readonly("board", &core::StateView::getBoard)
        .def("at", &core::StateView::at, py::arg("row"), py::arg("column"))
        .def("open_columns", &core::StateView::openColumns)
        .def("__str__", &core::StateView::toString);

    py::class_<core::AgentResult>(m, "AgentResult")
        .def_readonly("token", &core::AgentResult::token)
        .def_readonly("result", &core::AgentResult::result);

    py::class_<core::RecordEntry>(m, "RecordEntry")
        .def_readonly("token", &core::RecordEntry::token)
        .def_readonly("action", &core::RecordEntry::action);

    py::class_<core::Outcome>(m, "Outcome")
        .def("get_result", &core::Outcome::getResult, py::arg("token"))
        .def_property_readonly("results", &core::Outcome::getResults)
        .def_property_readonly("record", &core::Outcome::getRecord)
        .def("is_finalized", &core::Outcome::isFinalized)
        .def("to_json", &core::Outcome::toJson)
        .def_static("from_json", &core::Outcome::fromJson, py::arg("json"))
        .def("save_to_file", &core::Outcome::saveToFile, py::arg("filename"))
        .def("__str__", &core::Outcome::toString);

    py::class_<core::GameConfig>(m, "GameConfig")
        .def(py::init<>())
        .def_readwrite("rows", &core::GameConfig::rows)
        .def_readwrite("columns", &core::GameConfig::columns)
        .def_readwrite("seed", &core::GameConfig::seed)
        .def_readwrite("max_invalid_attempts", &core::GameConfig::maxInvalidAttempts)
        .def_readwrite("log_level", &core::GameConfig::logLevel)
        .def("validate", &core::GameConfig::validate)
        .def("to_json", &core::GameConfig::toJson)
        .def_static("from_json", &core::GameConfig::fromJson, py::arg("json"));

    // Agents
    py::class_<agents::Agent, PyAgent, std::shared_ptr<agents::Agent>>(m, "Agent")
        .def(py::init<core::Token>(), py::arg("token"))
        .def_property_readonly("token", &agents::Agent::getToken)
        .def("select_action", &agents::Agent::selectAction, py::arg("view"))
        .def("notify_outcome", &agents::Agent::notifyOutcome, py::arg("outcome"));

    py::class_<agents::RandomAgent, agents::Agent, std::shared_ptr<agents::RandomAgent>>(m, "RandomAgent")
        .def(py::init<core::Token, unsigned int>(), py::arg("token"), py::arg("seed") = 0);

    // Game
    py::class_<game::Game>(m, "Game")
        .def(py::init([](std::vector<std::shared_ptr<agents::Agent>> agentList,
                         std::pair<int, int> boardSize,
                         const core::GameConfig& config) {
                 return std::make_unique<game::Game>(
                     std::move(agentList), core::BoardSize{boardSize.first, boardSize.second}, config);
             }),
             py::arg("agents"),
             py::arg("board_size") = std::make_pair(6, 7),
             py::arg("config") = core::GameConfig{},
             py::keep_alive<1, 2>())
        .def("play", &game::Game::play)
        .def_property_readonly("status", &game::Game::getStatus)
        .def_property_readonly("turn_order", &game::Game::getTurnOrder);
}

} // namespace python
} // namespace connectfour
