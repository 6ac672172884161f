/// @file pybind_module.cpp
/// pybind11 bindings for the chess rules engine.
///
/// Exposes the `_chessref_engine` Python module: one shared game driven by
/// module-level functions, plus a `Game` class for independent instances.
/// State and history come back as dicts shaped like the REST payloads, so
/// the HTTP layer only has to serialize them.

#include <chessref/synchronized_engine.hpp>

#include <optional>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <stdexcept>
#include <string>

namespace py = pybind11;

namespace {

/// Carries a rejected move across the C++/Python boundary.
class IllegalMove : public std::runtime_error {
   public:
    explicit IllegalMove(const chessref::Error& e)
        : std::runtime_error(e.message), code_(chessref::to_string(e.code)) {}

    [[nodiscard]] const std::string& code() const noexcept { return code_; }

   private:
    std::string code_;
};

/// Python type object for `IllegalMoveError`; owned by the module for its lifetime.
PyObject* g_illegal_move_error = nullptr;

/// The single game served by the module-level functions.
chessref::SynchronizedEngine& shared_game() {
    static chessref::SynchronizedEngine game;
    return game;
}

// ── Dict conversion ─────────────────────────────────────────────────────────

py::dict piece_dict(const chessref::Piece& p) {
    py::dict d;
    d["type"] = std::string(chessref::to_string(p.type));
    d["color"] = std::string(chessref::to_string(p.color));
    return d;
}

py::dict state_dict(const chessref::GameSnapshot& snap) {
    py::list board;
    for (const auto& entry : snap.board) {
        py::dict item;
        item["position"] = entry.square;
        item["piece"] = piece_dict(entry.piece);
        board.append(item);
    }
    py::dict d;
    d["board"] = board;
    d["current_turn"] = std::string(chessref::to_string(snap.current_turn));
    d["game_status"] = std::string(chessref::to_string(snap.status));
    return d;
}

py::dict record_dict(const chessref::MoveRecord& r) {
    py::dict d;
    d["moveNumber"] = r.move_number;
    d["color"] = std::string(chessref::to_string(r.color));
    d["from"] = r.from;
    d["to"] = r.to;
    d["capture"] = r.capture;
    d["piece"] = piece_dict(r.piece);
    if (r.promotion) {
        d["promotion"] = std::string(1, chessref::promotion_char(*r.promotion));
    }
    return d;
}

py::list history_list(const std::vector<chessref::MoveRecord>& history) {
    py::list out;
    for (const auto& r : history) out.append(record_dict(r));
    return out;
}

// ── Operations ──────────────────────────────────────────────────────────────

py::dict get_state(const chessref::SynchronizedEngine& game) {
    chessref::GameSnapshot snap;
    {
        py::gil_scoped_release release;
        snap = game.state();
    }
    return state_dict(snap);
}

py::list get_history(const chessref::SynchronizedEngine& game) {
    std::vector<chessref::MoveRecord> history;
    {
        py::gil_scoped_release release;
        history = game.history();
    }
    return history_list(history);
}

py::dict apply_move(chessref::SynchronizedEngine& game, const std::string& from_sq,
                    const std::string& to_sq, const std::optional<std::string>& promotion) {
    std::optional<chessref::Result<chessref::MoveRecord>> result;
    {
        py::gil_scoped_release release;
        std::optional<std::string_view> code;
        if (promotion) code = *promotion;
        result.emplace(game.apply_move(from_sq, to_sq, code));
    }
    if (!result->ok()) throw IllegalMove(result->error());
    return record_dict(result->value());
}

py::dict restart(chessref::SynchronizedEngine& game) {
    chessref::GameSnapshot snap;
    {
        py::gil_scoped_release release;
        snap = game.restart_and_state();
    }
    py::dict d;
    d["state"] = state_dict(snap);
    d["history"] = py::list();
    return d;
}

}  // namespace

PYBIND11_MODULE(_chessref_engine, m) {
    m.doc() = "Single-game chess rules engine (pybind11)";

    // ── IllegalMoveError ────────────────────────────────────────────────
    g_illegal_move_error =
        PyErr_NewException("_chessref_engine.IllegalMoveError", PyExc_ValueError, nullptr);
    if (g_illegal_move_error == nullptr) throw py::error_already_set();
    m.add_object("IllegalMoveError", py::handle(g_illegal_move_error));

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const IllegalMove& e) {
            // Raise an instance so the handler can read `err.code`.
            py::object inst = py::reinterpret_borrow<py::object>(g_illegal_move_error)(e.what());
            inst.attr("code") = e.code();
            PyErr_SetObject(g_illegal_move_error, inst.ptr());
        }
    });

    // ── Game class ──────────────────────────────────────────────────────
    py::class_<chessref::SynchronizedEngine>(m, "Game")
        .def(py::init<>(), "Create a game in the standard starting position.")
        .def("get_state", &get_state,
             "Occupied squares, current_turn and game_status as a dict.")
        .def("get_history", &get_history, "Chronological list of move dicts.")
        .def("apply_move", &apply_move, py::arg("from_sq"), py::arg("to_sq"),
             py::arg("promotion") = py::none(),
             R"doc(Validate and apply a move for the side to move.

Returns the move dict. Raises ``IllegalMoveError`` (a ``ValueError``) when
the move is rejected; ``err.code`` names the failure kind.)doc")
        .def("restart", &restart, "Reset to the starting position and clear history.");

    // ── Shared game ─────────────────────────────────────────────────────
    m.def("get_state", [] { return get_state(shared_game()); },
          "State of the shared game.");
    m.def("get_history", [] { return get_history(shared_game()); },
          "History of the shared game.");
    m.def(
        "apply_move",
        [](const std::string& from_sq, const std::string& to_sq,
           const std::optional<std::string>& promotion) {
            return apply_move(shared_game(), from_sq, to_sq, promotion);
        },
        py::arg("from_sq"), py::arg("to_sq"), py::arg("promotion") = py::none(),
        "Apply a move to the shared game.");
    m.def("restart", [] { return restart(shared_game()); }, "Restart the shared game.");
}
