#include <catch2/catch.hpp>

#include <csignal>

#include "helpers.hpp"
#include "process.hpp"

TEST_CASE("Exit code and output are captured", "[process]") {
    TempDir tmp;
    const auto script = WriteScript(tmp / "noisy", "echo hello\necho oops >&2\nexit 3");

    ChildProcess child(script.string(), {});
    REQUIRE(child.Pid() > 0);

    const ExitInfo info = child.Wait();
    CHECK(info.exited_normally);
    CHECK(info.exit_code == 3);
    CHECK_FALSE(info.Success());
    CHECK(info.output.find("hello") != std::string::npos);
    CHECK(info.output.find("oops") != std::string::npos);
    CHECK(info.Describe() == "exit code 3");
}

TEST_CASE("Arguments reach the child", "[process]") {
    TempDir tmp;
    const auto script = WriteScript(tmp / "args", "echo \"$@\"");

    ChildProcess child(script.string(), {"--port", "5600", "--verbose"});
    const ExitInfo info = child.Wait();
    CHECK(info.Success());
    CHECK(info.output == "--port 5600 --verbose\n");
}

TEST_CASE("An executable that can't be run raises ProcessError", "[process]") {
    TempDir tmp;
    REQUIRE_THROWS_AS(ChildProcess((tmp / "missing").string(), {}), ProcessError);

    WriteFile(tmp / "plain", "not a program");
    REQUIRE_THROWS_AS(ChildProcess((tmp / "plain").string(), {}), ProcessError);
}

TEST_CASE("Terminate delivers SIGTERM", "[process]") {
    TempDir tmp;
    const auto script = WriteScript(tmp / "sleeper", "exec sleep 30");

    ChildProcess child(script.string(), {});
    REQUIRE(child.Terminate());

    const ExitInfo info = child.Wait();
    CHECK_FALSE(info.exited_normally);
    CHECK(info.signal == SIGTERM);
    CHECK_FALSE(child.Terminate());
}

TEST_CASE("Terminate reaches the whole process group", "[process]") {
    TempDir tmp;
    const auto pidFile = tmp / "helper.pid";
    const auto script =
        WriteScript(tmp / "wrapper", "sleep 30 &\necho $! > " + pidFile.string() + "\nwait");

    ChildProcess child(script.string(), {});
    const pid_t helper = ReadPidFile(pidFile);
    REQUIRE(helper > 0);
    REQUIRE(IsProcessAlive(helper));

    REQUIRE(child.Terminate());
    const ExitInfo info = child.Wait();
    CHECK_FALSE(info.Success());
    CHECK(WaitFor([&] { return !IsProcessAlive(helper); }));
}
