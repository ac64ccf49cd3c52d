#include <catch2/catch.hpp>
#include <vista/error.hpp>
#include <string>

using namespace vista;

TEST_CASE("VistaError format() with hint", "[error]") {
    VistaError e{VistaError::NotReady, "stage_files: no repository is loaded", "run init"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[NotReady]") != std::string::npos);
    REQUIRE(formatted.find("no repository is loaded") != std::string::npos);
    REQUIRE(formatted.find("hint: run init") != std::string::npos);
}

TEST_CASE("VistaError format() without hint or command", "[error]") {
    VistaError e{VistaError::Parse, "unexpected hunk header"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Parse]") != std::string::npos);
    REQUIRE(formatted.find("unexpected hunk header") != std::string::npos);
    REQUIRE(formatted.find("hint:") == std::string::npos);
    REQUIRE(formatted.find("command:") == std::string::npos);
}

TEST_CASE("default VistaError has a defined code", "[error]") {
    VistaError e;
    REQUIRE(e.code == VistaError::CommandFailure);
    REQUIRE(e.exit_code == 0);
    REQUIRE(e.message.empty());
    REQUIRE(e.format().find("error[CommandFailure]") != std::string::npos);
}

TEST_CASE("command_failure records the command line", "[error]") {
    auto e = VistaError::command_failure({"git", "merge", "--abort"}, 128,
                                         "error: Entry 'animal.txt' would be overwritten\nmore\n");
    REQUIRE(e.code == VistaError::CommandFailure);
    REQUIRE(e.command == "git merge --abort");
    REQUIRE(e.exit_code == 128);
    REQUIRE(e.stderr_text.find("more") != std::string::npos);
    // Only the first stderr line goes into the message
    REQUIRE(e.message.find("would be overwritten") != std::string::npos);
    REQUIRE(e.message.find("more") == std::string::npos);
}

TEST_CASE("command_failure format() shows command, exit code and stderr", "[error]") {
    auto e = VistaError::command_failure({"git", "commit", "-m", "x"}, 1, "nothing to commit\n");
    auto formatted = e.format();
    REQUIRE(formatted.find("error[CommandFailure]") != std::string::npos);
    REQUIRE(formatted.find("command: git commit -m x") != std::string::npos);
    REQUIRE(formatted.find("exit code: 1") != std::string::npos);
    REQUIRE(formatted.find("stderr: nothing to commit") != std::string::npos);
    REQUIRE(formatted.back() != '\n');
}

TEST_CASE("command_failure with empty stderr", "[error]") {
    auto e = VistaError::command_failure({"git", "status"}, 2, "");
    REQUIRE(e.message == "'git status' exited with code 2");
    REQUIRE(e.format().find("stderr:") == std::string::npos);
}

TEST_CASE("VistaError code_name() for all codes", "[error]") {
    REQUIRE(std::string(VistaError::code_name(VistaError::CommandFailure)) == "CommandFailure");
    REQUIRE(std::string(VistaError::code_name(VistaError::MissingObject)) == "MissingObject");
    REQUIRE(std::string(VistaError::code_name(VistaError::NotReady)) == "NotReady");
    REQUIRE(std::string(VistaError::code_name(VistaError::Destroyed)) == "Destroyed");
    REQUIRE(std::string(VistaError::code_name(VistaError::AlreadyExists)) == "AlreadyExists");
    REQUIRE(std::string(VistaError::code_name(VistaError::IO)) == "IO");
    REQUIRE(std::string(VistaError::code_name(VistaError::Parse)) == "Parse");
    REQUIRE(std::string(VistaError::code_name(VistaError::Config)) == "Config");
    REQUIRE(std::string(VistaError::code_name(VistaError::NotFound)) == "NotFound");
    REQUIRE(std::string(VistaError::code_name(VistaError::InvalidArg)) == "InvalidArg");
}
