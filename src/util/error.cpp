#include <vista/error.hpp>

namespace vista {

const char* VistaError::code_name(Code c) {
    switch (c) {
        case CommandFailure: return "CommandFailure";
        case MissingObject:  return "MissingObject";
        case NotReady:       return "NotReady";
        case Destroyed:      return "Destroyed";
        case AlreadyExists:  return "AlreadyExists";
        case IO:             return "IO";
        case Parse:          return "Parse";
        case Config:         return "Config";
        case NotFound:       return "NotFound";
        case InvalidArg:     return "InvalidArg";
    }
    return "Unknown";
}

VistaError VistaError::command_failure(const std::vector<std::string>& args,
                                       int exit_code,
                                       std::string stderr_text) {
    std::string cmd;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) cmd += ' ';
        cmd += args[i];
    }

    // First stderr line makes the most useful one-line message
    std::string first_line = stderr_text.substr(0, stderr_text.find('\n'));

    VistaError err{CommandFailure, "'" + cmd + "' exited with code "
                                   + std::to_string(exit_code)};
    if (!first_line.empty()) {
        err.message += ": " + first_line;
    }
    err.command = std::move(cmd);
    err.exit_code = exit_code;
    err.stderr_text = std::move(stderr_text);
    return err;
}

std::string VistaError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!command.empty()) {
        result += "\n  command: ";
        result += command;
        result += "\n  exit code: ";
        result += std::to_string(exit_code);
    }

    if (!stderr_text.empty()) {
        result += "\n  stderr: ";
        std::string trimmed = stderr_text;
        while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
            trimmed.pop_back();
        }
        result += trimmed;
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace vista
