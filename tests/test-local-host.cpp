#include <prochost/local_host.hpp>

#include <procshell/command.hpp>
#include <procshell/errors.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/system_error.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace std::string_literals;
using procshell::Buffer;
using procshell::Bytes;
using procshell::Child;
using procshell::Command;
using procshell::Event;
using procshell::ExecOutput;
using procshell::ShellErrc;
using testing::ElementsAre;
namespace event = procshell::event;

class LocalHostTest : public testing::Test
{
protected:
    boost::asio::io_context io_context;
    prochost::LocalHost host{io_context, prochost::Scope{}.allow_program("sh")};

    auto execute(Command const& command) -> ExecOutput
    {
        std::optional<ExecOutput> result;
        std::exception_ptr failure;
        command.async_execute([&](std::exception_ptr const error, ExecOutput output) {
            failure = error;
            result = std::move(output);
        });
        io_context.run();
        if (failure)
        {
            std::rethrow_exception(failure);
        }
        return *result;
    }

    auto shell(std::string script, procshell::SpawnOptions options = {}) -> Command
    {
        return Command::create(host, "sh", {"-c", std::move(script)}, std::move(options));
    }
};

TEST_F(LocalHostTest, Message)
{
    auto const output = execute(shell("echo message"));
    EXPECT_EQ(output, (ExecOutput{0, std::nullopt, "message"s, ""s}));
    EXPECT_EQ(host.running(), 0u);
}

TEST_F(LocalHostTest, KilledBySignal)
{
    auto const output = execute(shell("kill -9 $$"));
    EXPECT_FALSE(output.code);
    EXPECT_EQ(output.signal, 9);
}

TEST_F(LocalHostTest, ExitCodeAndStreams)
{
    auto const output = execute(shell("echo out; echo err >&2; echo more; exit 3"));
    EXPECT_EQ(output.code, 3);
    EXPECT_FALSE(output.signal);
    EXPECT_EQ(output.stdout_data, Buffer{"out\nmore"s});
    EXPECT_EQ(output.stderr_data, Buffer{"err"s});
}

TEST_F(LocalHostTest, LineTerminators)
{
    auto const output = execute(shell("printf 'dos\\r\\nmac\\runix\\nlast'"));
    EXPECT_EQ(output.stdout_data, Buffer{"dos\nmac\nunix\nlast"s});
}

TEST_F(LocalHostTest, RawEncoding)
{
    procshell::SpawnOptions options;
    options.encoding = procshell::Encoding::Raw;
    auto const output = execute(shell("printf 'a\\001b\\n'", options));
    EXPECT_EQ(output.stdout_data, Buffer{(Bytes{'a', 1, 'b', '\n'})});
    EXPECT_EQ(output.stderr_data, Buffer{Bytes{}});
}

TEST_F(LocalHostTest, CharsetDecoding)
{
    procshell::SpawnOptions options;
    options.charset = "windows-1252";
    auto const output = execute(shell("printf 'caf\\351\\n'", options));
    EXPECT_EQ(output.stdout_data, Buffer{"caf\xC3\xA9"s});
}

TEST_F(LocalHostTest, UnknownCharset)
{
    procshell::SpawnOptions options;
    options.charset = "no-such-charset";
    try
    {
        execute(shell("echo never", options));
        FAIL() << "the charset label is not known";
    }
    catch (boost::system::system_error const& e)
    {
        EXPECT_EQ(e.code(), ShellErrc::UnknownEncoding);
    }
    EXPECT_EQ(host.running(), 0u);
}

TEST_F(LocalHostTest, CharsetIgnoredForRaw)
{
    procshell::SpawnOptions options;
    options.encoding = procshell::Encoding::Raw;
    options.charset = "no-such-charset";
    auto const output = execute(shell("echo bytes", options));
    EXPECT_EQ(output.stdout_data, Buffer{(Bytes{'b', 'y', 't', 'e', 's', '\n'})});
}

TEST_F(LocalHostTest, InvalidUtf8)
{
    auto command = shell("printf 'ok\\n\\377\\n'");
    std::vector<std::string> lines;
    std::vector<std::string> errors;
    command.stdout_emitter().on("data", [&](Buffer const& line) { lines.push_back(procshell::as_text(line)); });
    command.on("error", [&](Event const& e) { errors.push_back(std::get<event::Error>(e).message); });

    EXPECT_THROW(execute(command), procshell::ProcessError);
    EXPECT_THAT(lines, ElementsAre("ok"));
    EXPECT_EQ(errors.size(), 1u);
    EXPECT_EQ(host.running(), 0u);
}

TEST_F(LocalHostTest, EnvironmentAdditions)
{
    procshell::SpawnOptions options;
    options.env->emplace("PROCSHELL_TEST", "value");
    auto const output = execute(shell("echo $PROCSHELL_TEST", options));
    EXPECT_EQ(output.stdout_data, Buffer{"value"s});
}

TEST_F(LocalHostTest, EnvironmentCleared)
{
    procshell::SpawnOptions options;
    options.env.reset();
    auto const output = execute(shell("echo ${HOME:-unset}", options));
    EXPECT_EQ(output.stdout_data, Buffer{"unset"s});
}

TEST_F(LocalHostTest, WorkingDirectory)
{
    procshell::SpawnOptions options;
    options.cwd = "/";
    auto const output = execute(shell("pwd", options));
    EXPECT_EQ(output.stdout_data, Buffer{"/"s});
}

TEST_F(LocalHostTest, ProgramNotAllowed)
{
    auto const command = Command::create(host, "ls");
    try
    {
        execute(command);
        FAIL() << "ls is not in scope";
    }
    catch (boost::system::system_error const& e)
    {
        EXPECT_EQ(e.code(), ShellErrc::ProgramNotAllowed);
    }
}

TEST_F(LocalHostTest, SidecarNotAllowed)
{
    auto const command = Command::sidecar(host, "sh");
    std::optional<boost::system::error_code> result;
    command.async_spawn([&](boost::system::error_code const error, Child) { result = error; });
    io_context.run();

    ASSERT_TRUE(result);
    EXPECT_EQ(*result, ShellErrc::SidecarNotAllowed);
}

TEST_F(LocalHostTest, ProgramNotFound)
{
    host.get_scope().allow_program("procshell-test-no-such-program");
    auto const command = Command::create(host, "procshell-test-no-such-program");
    std::optional<boost::system::error_code> result;
    command.async_spawn([&](boost::system::error_code const error, Child) { result = error; });
    io_context.run();

    ASSERT_TRUE(result);
    EXPECT_EQ(*result, ShellErrc::ProgramNotFound);
}

TEST_F(LocalHostTest, WriteToStdin)
{
    auto command = shell("read line; echo \"got $line\"");
    std::vector<std::string> lines;
    std::optional<event::Terminated> status;
    command.stdout_emitter().on("data", [&](Buffer const& line) { lines.push_back(procshell::as_text(line)); });
    command.on("close", [&](Event const& e) { status = std::get<event::Terminated>(e); });

    std::optional<boost::system::error_code> written;
    command.async_spawn([&](boost::system::error_code const error, Child const child) {
        ASSERT_FALSE(error);
        EXPECT_NE(child.pid(), 0u);
        child.async_write("hello\n"s, [&](boost::system::error_code const error) { written = error; });
    });
    io_context.run();

    ASSERT_TRUE(written);
    EXPECT_FALSE(*written);
    EXPECT_THAT(lines, ElementsAre("got hello"));
    ASSERT_TRUE(status);
    EXPECT_EQ(status->code, 0);
}

TEST_F(LocalHostTest, Kill)
{
    auto command = shell("echo ready; exec sleep 30");
    std::optional<event::Terminated> status;
    std::optional<Child> child;
    command.stdout_emitter().on("data", [&](Buffer const&) {
        child->async_kill([](boost::system::error_code const error) { EXPECT_FALSE(error); });
    });
    command.on("close", [&](Event const& e) { status = std::get<event::Terminated>(e); });
    command.async_spawn([&](boost::system::error_code const error, Child const c) {
        ASSERT_FALSE(error);
        child = c;
    });
    io_context.run();

    ASSERT_TRUE(status);
    EXPECT_FALSE(status->code);
    EXPECT_EQ(status->signal, 9);
}

TEST_F(LocalHostTest, KillAfterExitWhileOutputOpen)
{
    // the background sleep keeps stdout open after the shell is reaped
    auto command = shell("sleep 1 & echo started");
    std::optional<event::Terminated> status;
    std::optional<Child> child;
    std::optional<boost::system::error_code> killed;
    boost::asio::steady_timer timer{io_context};
    command.stdout_emitter().on("data", [&](Buffer const&) {
        timer.expires_after(std::chrono::milliseconds{300});
        timer.async_wait([&](boost::system::error_code) {
            child->async_kill([&](boost::system::error_code const error) { killed = error; });
        });
    });
    command.on("close", [&](Event const& e) { status = std::get<event::Terminated>(e); });
    command.async_spawn([&](boost::system::error_code const error, Child const c) {
        ASSERT_FALSE(error);
        child = c;
    });
    io_context.run();

    ASSERT_TRUE(killed);
    EXPECT_FALSE(*killed);
    ASSERT_TRUE(status);
    EXPECT_EQ(status->code, 0);
    EXPECT_FALSE(status->signal);
}

TEST_F(LocalHostTest, UnknownPid)
{
    Child const child{host, 1};
    std::vector<boost::system::error_code> results;
    child.async_write("ignored"s, [&](boost::system::error_code const error) { results.push_back(error); });
    child.async_kill([&](boost::system::error_code const error) { results.push_back(error); });
    io_context.run();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0]);
    EXPECT_FALSE(results[1]);
}

} // namespace
