#include "../include/whodat/catalog.hpp"
#include "../include/whodat/config.hpp"
#include "../include/whodat/errors.hpp"
#include "../include/whodat/game_engine.hpp"

#include "json_bridge.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

namespace {

nlohmann::json py_to_json(py::handle handle) {
  if (handle.is_none()) {
    return nullptr;
  }
  if (py::isinstance<py::bool_>(handle)) {
    return handle.cast<bool>();
  }
  if (py::isinstance<py::int_>(handle)) {
    return static_cast<long long>(handle.cast<long long>());
  }
  if (py::isinstance<py::float_>(handle)) {
    return handle.cast<double>();
  }
  if (py::isinstance<py::str>(handle)) {
    return handle.cast<std::string>();
  }
  if (py::isinstance<py::dict>(handle)) {
    nlohmann::json json_obj = nlohmann::json::object();
    for (auto item : handle.cast<py::dict>()) {
      auto key = py::cast<std::string>(item.first);
      json_obj[key] = py_to_json(item.second);
    }
    return json_obj;
  }
  if (py::isinstance<py::list>(handle) || py::isinstance<py::tuple>(handle)) {
    nlohmann::json json_array = nlohmann::json::array();
    for (auto item : handle.cast<py::sequence>()) {
      json_array.push_back(py_to_json(item));
    }
    return json_array;
  }
  throw std::runtime_error("Unsupported Python type for JSON conversion");
}

py::object json_to_py(const nlohmann::json& json_value) {
  if (json_value.is_null()) {
    return py::none();
  }
  if (json_value.is_boolean()) {
    return py::bool_(json_value.get<bool>());
  }
  if (json_value.is_number_integer()) {
    return py::int_(json_value.get<long long>());
  }
  if (json_value.is_number_float()) {
    return py::float_(json_value.get<double>());
  }
  if (json_value.is_string()) {
    return py::str(json_value.get<std::string>());
  }
  if (json_value.is_array()) {
    py::list list;
    for (const auto& element : json_value) {
      list.append(json_to_py(element));
    }
    return list;
  }
  if (json_value.is_object()) {
    py::dict dict;
    for (const auto& entry : json_value.items()) {
      dict[py::str(entry.key())] = json_to_py(entry.value());
    }
    return dict;
  }
  throw std::runtime_error("Unhandled JSON type");
}

// Stateless wrapper: every call takes and returns the serialized game state,
// so a web handler only has to store the blob per session.
class PyGameEngine {
public:
  PyGameEngine(const std::string& entities_path, const std::string& questions_path,
               py::object config_obj)
      : engine_(whodat::make_engine(
            whodat::load_catalog(entities_path, questions_path),
            config_obj.is_none() ? whodat::EngineConfig{}
                                 : whodat::engine_config_from_json(py_to_json(config_obj)))) {}

  py::object start_game() {
    auto start = engine_->new_game();
    return respond(start.state, whodat::bridge::to_json(start.next));
  }

  py::object answer(const std::string& state_blob, const std::string& attribute_key,
                    const std::string& answer_label) {
    auto state = engine_->deserialize(state_blob);
    auto next = engine_->answer(state, attribute_key, std::string_view(answer_label));
    return respond(state, whodat::bridge::to_json(next));
  }

  py::object confirm_guess(const std::string& state_blob, const std::string& guess,
                           bool correct) {
    auto state = engine_->deserialize(state_blob);
    const whodat::Entity& entity = resolve(guess);
    if (correct) {
      auto candidates = engine_->confirm_guess(state, entity.id);
      return respond(state, whodat::bridge::won_payload(entity.name, candidates));
    }
    auto next = engine_->reject_guess(state, entity.id);
    return respond(state, whodat::bridge::to_json(next));
  }

  py::object current(const std::string& state_blob) {
    auto state = engine_->deserialize(state_blob);
    return json_to_py(whodat::bridge::to_json(engine_->current(state)));
  }

  py::object config() const {
    return json_to_py(whodat::to_json(engine_->config()));
  }

private:
  const whodat::Entity& resolve(const std::string& guess) const {
    const auto& catalog = engine_->catalog();
    if (const auto* entity = catalog.find_entity(guess)) {
      return *entity;
    }
    if (const auto* entity = catalog.find_entity_by_name(guess)) {
      return *entity;
    }
    throw whodat::InvalidMove("Unknown entity '" + guess + "'");
  }

  py::object respond(const whodat::GameState& state, nlohmann::json payload) const {
    payload["state"] = engine_->serialize(state);
    return json_to_py(payload);
  }

  std::unique_ptr<whodat::GameEngine> engine_;
};

} // namespace

PYBIND11_MODULE(_whodat, m) {
  py::register_exception<whodat::DatasetError>(m, "DatasetError", PyExc_RuntimeError);
  py::register_exception<whodat::InvalidAnswer>(m, "InvalidAnswer", PyExc_ValueError);
  py::register_exception<whodat::StateCorruptError>(m, "StateCorruptError", PyExc_RuntimeError);
  py::register_exception<whodat::InvalidMove>(m, "InvalidMove", PyExc_RuntimeError);

  py::class_<PyGameEngine>(m, "GameEngine")
      .def(py::init<std::string, std::string, py::object>(), py::arg("entities_path"),
           py::arg("questions_path"), py::arg("config") = py::none())
      .def("start_game", &PyGameEngine::start_game)
      .def("answer", &PyGameEngine::answer, py::arg("state"), py::arg("attribute_key"),
           py::arg("answer"))
      .def("confirm_guess", &PyGameEngine::confirm_guess, py::arg("state"), py::arg("guess"),
           py::arg("correct"))
      .def("current", &PyGameEngine::current, py::arg("state"))
      .def("config", &PyGameEngine::config);
}
