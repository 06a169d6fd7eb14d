#include "prochost/local_host.hpp"

#include "prochost/linebuffer.hpp"

#include <procshell/errors.hpp>
#include <procshell/event.hpp>

#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <boost/locale/encoding.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <signal.h>
#include <sys/wait.h>

#include <cerrno>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace prochost {

namespace process = boost::process::v2;

using procshell::Encoding;
using procshell::Pid;

/// @brief State of one process started by the local host
struct LocalHost::Running : std::enable_shared_from_this<Running>
{
    struct PendingWrite
    {
        procshell::Bytes data;
        CompletionHandler handler;
    };

    std::weak_ptr<Children> children_;
    procshell::Channel channel_;
    Encoding encoding_;
    std::optional<std::string> charset_;

    boost::asio::writable_pipe stdin_;
    boost::asio::readable_pipe stdout_;
    boost::asio::readable_pipe stderr_;
    process::process proc_;
    Pid pid_;

    LineBuffer stdout_lines_;
    LineBuffer stderr_lines_;

    /// Outstanding stages: stdout drained, stderr drained, process exited
    int stage_;

    /// The process was reaped, its pid may belong to someone else now
    bool exited_;

    procshell::event::Terminated status_;
    std::optional<std::string> failure_;

    std::deque<PendingWrite> writes_;
    bool writing_;

    Running(
        boost::asio::io_context& io_context,
        std::weak_ptr<Children> children,
        procshell::Channel channel,
        Encoding const encoding,
        std::optional<std::string> charset
    )
        : children_{std::move(children)}
        , channel_{std::move(channel)}
        , encoding_{encoding}
        , charset_{std::move(charset)}
        , stdin_{io_context}
        , stdout_{io_context}
        , stderr_{io_context}
        , proc_{io_context}
        , pid_{0}
        , stdout_lines_{line_buffer_size}
        , stderr_lines_{line_buffer_size}
        , stage_{3}
        , exited_{false}
        , writing_{false}
    {
    }

    auto start() -> void
    {
        read_output(stdout_, stdout_lines_, true);
        read_output(stderr_, stderr_lines_, false);

        proc_.async_wait(
            [self = shared_from_this()](boost::system::error_code const error, int) {
                self->exited_ = true;
                if (error)
                {
                    self->fail(error.message());
                }
                else
                {
                    auto const native = self->proc_.native_exit_code();
                    if (WIFSIGNALED(native))
                    {
                        self->status_ = {std::nullopt, WTERMSIG(native)};
                    }
                    else
                    {
                        self->status_ = {WEXITSTATUS(native), std::nullopt};
                    }
                }
                self->complete();
            }
        );
    }

    auto fail(std::string message) -> void
    {
        // the first failure is the one reported
        if (not failure_)
        {
            failure_ = std::move(message);
        }
    }

    auto deliver(bool const is_stdout, std::string_view const line) -> void
    {
        namespace conv = boost::locale::conv;

        procshell::Buffer buffer;
        if (Encoding::Raw == encoding_)
        {
            buffer = procshell::to_bytes(line);
        }
        else if (charset_)
        {
            // undecodable bytes are dropped along with a byte order mark
            auto text = conv::to_utf<char>(line.data(), line.data() + line.size(), *charset_, conv::skip);
            if (text.starts_with("\xEF\xBB\xBF"))
            {
                text.erase(0, 3);
            }
            buffer = std::move(text);
        }
        else
        {
            try
            {
                buffer = conv::utf_to_utf<char>(line.data(), line.data() + line.size(), conv::stop);
            }
            catch (conv::conversion_error const&)
            {
                // Terminal: the channel drops the rest of this process's events
                channel_.send(procshell::event::Error{"stream did not contain valid UTF-8"});
                return;
            }
        }

        if (is_stdout)
        {
            channel_.send(procshell::event::Stdout{std::move(buffer)});
        }
        else
        {
            channel_.send(procshell::event::Stderr{std::move(buffer)});
        }
    }

    auto read_output(boost::asio::readable_pipe& pipe, LineBuffer& lines, bool const is_stdout) -> void
    {
        pipe.async_read_some(
            lines.prepare(),
            [self = shared_from_this(), &pipe, &lines, is_stdout](boost::system::error_code const error, std::size_t const n) {
                if (error)
                {
                    // flush an unterminated last line
                    if (auto const rest = lines.take_rest())
                    {
                        self->deliver(is_stdout, *rest);
                    }
                    if (boost::asio::error::eof != error)
                    {
                        self->fail(error.message());
                    }
                    self->complete();
                    return;
                }

                lines.commit(n);
                while (auto const line = lines.next_line())
                {
                    self->deliver(is_stdout, *line);
                }
                lines.shift();

                // a line longer than the buffer is delivered in pieces
                if (lines.full())
                {
                    if (auto const rest = lines.take_rest())
                    {
                        self->deliver(is_stdout, *rest);
                    }
                    lines.shift();
                }

                self->read_output(pipe, lines, is_stdout);
            }
        );
    }

    auto complete() -> void
    {
        if (--stage_ > 0)
        {
            return;
        }

        boost::system::error_code ignored;
        stdin_.close(ignored);

        if (auto const children = children_.lock())
        {
            children->erase(pid_);
        }

        if (failure_)
        {
            channel_.send(procshell::event::Error{*failure_});
        }
        else
        {
            channel_.send(status_);
        }
    }

    auto write(procshell::Bytes data, CompletionHandler handler) -> void
    {
        if (not stdin_.is_open())
        {
            boost::asio::post(stdin_.get_executor(), [handler = std::move(handler)]() {
                handler(procshell::ShellErrc::ChildClosed);
            });
            return;
        }

        writes_.push_back({std::move(data), std::move(handler)});
        if (not writing_)
        {
            writing_ = true;
            write_actual();
        }
    }

    auto write_actual() -> void
    {
        boost::asio::async_write(
            stdin_,
            boost::asio::buffer(writes_.front().data),
            [self = shared_from_this()](boost::system::error_code const error, std::size_t) {
                auto const handler = std::move(self->writes_.front().handler);
                self->writes_.pop_front();
                handler(error);

                if (self->writes_.empty())
                {
                    self->writing_ = false;
                }
                else
                {
                    self->write_actual();
                }
            }
        );
    }
};

namespace {

/**
 * @brief Find the executable for a spawn request
 *
 * Sidecars live next to our own executable. Other programs without a
 * directory component are found on PATH.
 */
auto resolve_program(procshell::SpawnRequest const& request, boost::system::error_code& error) -> boost::filesystem::path
{
    if (request.options.sidecar)
    {
        auto const self_exe = boost::filesystem::read_symlink("/proc/self/exe", error);
        if (error)
        {
            return {};
        }
        return self_exe.parent_path() / request.program;
    }

    boost::filesystem::path file{request.program};
    if (not file.has_parent_path())
    {
        file = process::environment::find_executable(file);
        if (file.empty())
        {
            error = procshell::ShellErrc::ProgramNotFound;
        }
    }
    return file;
}

/**
 * @brief Compute the environment of a child process
 *
 * @param additions variables added to our own environment, or nothing
 *                  to start from an empty environment
 */
auto make_environment(std::optional<std::map<std::string, std::string>> const& additions)
    -> std::vector<process::environment::key_value_pair>
{
    std::vector<process::environment::key_value_pair> result;
    if (not additions)
    {
        return result;
    }

    std::map<std::string, std::string> merged;
    for (auto const& kv : process::environment::current())
    {
        merged.insert_or_assign(kv.key().string(), kv.value().string());
    }
    for (auto const& [key, value] : *additions)
    {
        merged.insert_or_assign(key, value);
    }

    result.reserve(merged.size());
    for (auto const& [key, value] : merged)
    {
        result.emplace_back(key + "=" + value);
    }
    return result;
}

} // namespace

LocalHost::LocalHost(boost::asio::io_context& io_context, Scope scope)
    : io_context_{io_context}
    , scope_{std::move(scope)}
    , children_{std::make_shared<Children>()}
{
}

LocalHost::~LocalHost()
{
    for (auto const& [pid, running] : *children_)
    {
        if (not running->exited_)
        {
            boost::system::error_code ignored;
            running->proc_.terminate(ignored);
        }
    }
}

auto LocalHost::get_executor() -> boost::asio::any_io_executor
{
    return io_context_.get_executor();
}

auto LocalHost::execute_process(
    procshell::SpawnRequest request,
    procshell::Channel channel,
    SpawnHandler handler
) -> void
{
    auto const deny = [this, &handler](boost::system::error_code const error) {
        boost::asio::post(io_context_, [handler = std::move(handler), error]() {
            handler(error, 0);
        });
    };

    if (request.options.sidecar)
    {
        if (not scope_.allows_sidecar(request.program))
        {
            return deny(procshell::ShellErrc::SidecarNotAllowed);
        }
    }
    else if (not scope_.allows_program(request.program))
    {
        return deny(procshell::ShellErrc::ProgramNotAllowed);
    }

    if (Encoding::Text == request.options.encoding && request.options.charset)
    {
        try
        {
            boost::locale::conv::to_utf<char>(std::string{}, *request.options.charset);
        }
        catch (boost::locale::conv::invalid_charset_error const&)
        {
            return deny(procshell::ShellErrc::UnknownEncoding);
        }
    }

    boost::system::error_code error;
    auto const file = resolve_program(request, error);
    if (error)
    {
        return deny(error);
    }

    auto const self = std::make_shared<Running>(
        io_context_, children_, std::move(channel), request.options.encoding, request.options.charset);

    try
    {
        auto const start_dir = request.options.cwd
            ? boost::filesystem::path{request.options.cwd->native()}
            : boost::filesystem::current_path();

        self->proc_ = process::process{
            io_context_,
            file,
            request.args,
            process::process_stdio{
                .in = {self->stdin_},
                .out = {self->stdout_},
                .err = {self->stderr_},
            },
            process::process_start_dir{start_dir},
            process::process_environment{make_environment(request.options.env)},
        };
    }
    catch (boost::system::system_error const& e)
    {
        return deny(e.code());
    }

    auto const pid = static_cast<Pid>(self->proc_.id());
    self->pid_ = pid;
    children_->insert_or_assign(pid, self);

    // the acknowledgement is queued ahead of every event
    boost::asio::post(io_context_, [handler = std::move(handler), pid]() {
        handler({}, pid);
    });
    self->start();
}

auto LocalHost::write_stdin(Pid const pid, procshell::Buffer buffer, CompletionHandler handler) -> void
{
    auto const it = children_->find(pid);
    if (it == children_->end())
    {
        // unknown or finished processes are silently ignored
        boost::asio::post(io_context_, [handler = std::move(handler)]() {
            handler({});
        });
        return;
    }

    it->second->write(procshell::as_bytes(buffer), std::move(handler));
}

auto LocalHost::kill_process(Pid const pid, CompletionHandler handler) -> void
{
    boost::system::error_code error;

    // The signal is sent without reaping so the pending wait reports
    // the exit status. A process that already exited is left alone even
    // while its output is still being drained.
    auto const it = children_->find(pid);
    if (it != children_->end() && not it->second->exited_ && -1 == ::kill(it->second->proc_.id(), SIGKILL))
    {
        error.assign(errno, boost::system::system_category());
    }

    boost::asio::post(io_context_, [handler = std::move(handler), error]() {
        handler(error);
    });
}

} // namespace prochost
