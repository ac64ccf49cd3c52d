#pragma once

#include <string>
#include <vector>

namespace vista {

struct VistaError {
    enum Code {
        CommandFailure,
        MissingObject,
        NotReady,
        Destroyed,
        AlreadyExists,
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg
    };

    Code code = CommandFailure;
    std::string message;
    std::string hint;

    // Populated for CommandFailure
    std::string command;
    int exit_code = 0;
    std::string stderr_text;

    VistaError() = default;
    VistaError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    VistaError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // A failed subprocess. `command` is the space-joined argv.
    static VistaError command_failure(const std::vector<std::string>& args,
                                      int exit_code,
                                      std::string stderr_text);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace vista
