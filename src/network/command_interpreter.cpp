#include "network/command_interpreter.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace flatkv::network {

CommandInterpreter::CommandInterpreter(std::shared_ptr<Store> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("CommandInterpreter requires a Store");
    }
}

std::string CommandInterpreter::execute(std::string_view line) const {
    auto parse_result = parse_command(line);
    if (const auto* err = std::get_if<ErrorResp>(&parse_result)) {
        return serialize_error(*err);
    }
    return dispatch(std::get<Command>(parse_result));
}

std::string CommandInterpreter::dispatch(const Command& cmd) const {
    return std::visit(
        [this](const auto& c) -> std::string {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, SetCmd>) {
                return store_->set(c.key, c.value);
            } else if constexpr (std::is_same_v<T, GetCmd>) {
                return store_->get(c.key);
            } else if constexpr (std::is_same_v<T, RemoveCmd>) {
                return store_->remove(c.key);
            } else if constexpr (std::is_same_v<T, PrintCmd>) {
                return store_->print();
            }
        },
        cmd);
}

} // namespace flatkv::network
