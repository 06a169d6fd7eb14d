#include "procshell/command.hpp"

#include "procshell/errors.hpp"
#include "procshell/overloaded.hpp"

#include <boost/system/system_error.hpp>

#include <utility>
#include <variant>

namespace procshell {

using detail::overloaded;

Command::Command(Host& host, std::string program, std::vector<std::string> args, SpawnOptions options)
    : host_{&host}
    , program_{std::move(program)}
    , args_{std::move(args)}
    , options_{std::move(options)}
    , emitters_{std::make_shared<Emitters>()}
{
}

auto Command::create(Host& host, std::string program, Args args, SpawnOptions options) -> Command
{
    return Command{host, std::move(program), std::move(args).release(), std::move(options)};
}

auto Command::sidecar(Host& host, std::string program, Args args, SpawnOptions options) -> Command
{
    options.sidecar = true;
    return Command{host, std::move(program), std::move(args).release(), std::move(options)};
}

auto Command::dispatch(Emitters& emitters, Event const& event) -> void
{
    std::visit(overloaded {
        [&](event::Error const&) { emitters.root.emit("error", event); },
        [&](event::Terminated const&) { emitters.root.emit("close", event); },
        [&](event::Stdout const& out) { emitters.out.emit("data", out.line); },
        [&](event::Stderr const& err) { emitters.err.emit("data", err.line); },
    }, event);
}

auto Command::start_spawn(std::shared_ptr<Emitters> own, std::function<void(boost::system::error_code, Child)> handler) const -> void
{
    // The command's emitters see the event first, then the emitters
    // private to this spawn, if any.
    auto channel = Channel{[emitters = emitters_, own = std::move(own)](Event const& event) {
        dispatch(*emitters, event);
        if (own)
        {
            dispatch(*own, event);
        }
    }};

    // The request is a copy: the command can change or go away while
    // the host works on it.
    host_->execute_process(
        SpawnRequest{program_, args_, options_},
        std::move(channel),
        [host = host_, handler = std::move(handler)](boost::system::error_code const error, Pid const pid) {
            if (error)
            {
                handler(error, Child{});
            }
            else
            {
                handler({}, Child{*host, pid});
            }
        }
    );
}

namespace {

/// State of one execute operation shared by its listeners
struct Execution
{
    std::function<void(std::exception_ptr, ExecOutput)> handler;
    Encoding encoding;
    std::vector<Buffer> stdout_chunks;
    std::vector<Buffer> stderr_chunks;
    bool done;

    auto finish(std::exception_ptr const error, ExecOutput output) -> void
    {
        if (done)
        {
            return;
        }
        done = true;
        auto const complete = std::move(handler);
        complete(error, std::move(output));
    }
};

} // namespace

auto Command::start_execute(std::function<void(std::exception_ptr, ExecOutput)> handler) const -> void
{
    auto const execution = std::make_shared<Execution>();
    execution->handler = std::move(handler);
    execution->encoding = options_.encoding;
    execution->done = false;

    // Only this spawn's channel feeds these. They are released with the
    // channel, and the listeners with them.
    auto const own = std::make_shared<Emitters>();

    own->root.once("error", [execution](Event const& event) {
        std::string message;
        if (auto const* const error = std::get_if<event::Error>(&event))
        {
            message = error->message;
        }
        execution->finish(std::make_exception_ptr(ProcessError{message}), {});
    });

    own->out.on("data", [execution](Buffer const& line) {
        execution->stdout_chunks.push_back(line);
    });

    own->err.on("data", [execution](Buffer const& line) {
        execution->stderr_chunks.push_back(line);
    });

    own->root.once("close", [execution](Event const& event) {
        ExecOutput output;
        if (auto const* const terminated = std::get_if<event::Terminated>(&event))
        {
            output.code = terminated->code;
            output.signal = terminated->signal;
        }
        output.stdout_data = collect_output(execution->encoding, execution->stdout_chunks);
        output.stderr_data = collect_output(execution->encoding, execution->stderr_chunks);
        execution->finish(nullptr, std::move(output));
    });

    start_spawn(own, [execution](boost::system::error_code const error, Child) {
        if (error)
        {
            execution->finish(std::make_exception_ptr(boost::system::system_error{error}), {});
        }
    });
}

} // namespace procshell
