#pragma once

#include "network/protocol.hpp"
#include "storage/store.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace flatkv::network {

// Turns one raw command line into the response text for it.
//
// Stateless apart from the shared Store reference: one instance per session
// or one shared by all sessions behaves the same.  Protocol errors come back
// as "ERROR: ..." text without touching the Store.
class CommandInterpreter {
public:
    explicit CommandInterpreter(std::shared_ptr<Store> store);

    // Parse `line` and run it against the Store.
    [[nodiscard]] std::string execute(std::string_view line) const;

    // Run an already-parsed command.
    [[nodiscard]] std::string dispatch(const Command& cmd) const;

private:
    std::shared_ptr<Store> store_;
};

} // namespace flatkv::network
