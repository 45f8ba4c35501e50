#include "agent_session.hpp"

#include "ag/debug_log.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char **environ;

namespace ag::chat
{
    namespace
    {
        std::vector<std::string> splitWords(const std::string &text)
        {
            std::vector<std::string> words;
            std::string current;
            for (char ch : text)
            {
                current.push_back(ch);
                if (ch == ' ' || ch == '\n')
                {
                    words.push_back(std::move(current));
                    current.clear();
                }
            }
            if (!current.empty())
                words.push_back(std::move(current));
            return words;
        }

        std::string replyFor(const std::string &prompt)
        {
            std::string reply = "You said: " + prompt + "\n\n";
            reply += "Prefix a prompt with ! to run it as a shell command, for example "
                     "!ls -la. Its output streams into a terminal block below the prompt.";
            return reply;
        }

        constexpr int kPollIntervalMs = 50;

        // Raw wait status of a reaped child, or -1 when waitpid fails.
        int waitForChild(pid_t pid)
        {
            int status = 0;
            while (::waitpid(pid, &status, 0) == -1)
            {
                if (errno != EINTR)
                    return -1;
            }
            return status;
        }

        int exitCodeFrom(int status)
        {
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            if (WIFSIGNALED(status))
                return 128 + WTERMSIG(status);
            return status;
        }
    } // namespace

    AgentSession::~AgentSession()
    {
        cancelTurn();
    }

    void AgentSession::startTurn(std::string prompt)
    {
        cancelTurn();

        push(transcript::TranscriptEvent(transcript::UserMessage{prompt}));

        auto task = std::make_unique<TurnTask>();
        TurnTask *rawTask = task.get();
        bool command = !prompt.empty() && prompt.front() == '!';
        rawTask->worker = std::thread([this, rawTask, command, prompt = std::move(prompt)]() mutable {
            if (command)
                runCommandTurn(*rawTask, prompt.substr(1));
            else
                runReplyTurn(*rawTask, std::move(prompt));
            rawTask->finished.store(true, std::memory_order_release);
        });
        activeTurn_ = std::move(task);
    }

    void AgentSession::cancelTurn()
    {
        if (!activeTurn_)
            return;
        activeTurn_->cancel.store(true, std::memory_order_release);
        if (activeTurn_->worker.joinable())
            activeTurn_->worker.join();
        activeTurn_.reset();
    }

    bool AgentSession::turnInProgress() const
    {
        return activeTurn_ && !activeTurn_->finished.load(std::memory_order_acquire);
    }

    std::vector<SessionUpdate> AgentSession::takeUpdates()
    {
        joinIfFinished();
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SessionUpdate> updates;
        updates.swap(pending_);
        return updates;
    }

    void AgentSession::push(SessionUpdate update)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(update));
    }

    void AgentSession::joinIfFinished()
    {
        if (!activeTurn_ || !activeTurn_->finished.load(std::memory_order_acquire))
            return;
        if (activeTurn_->worker.joinable())
            activeTurn_->worker.join();
        activeTurn_.reset();
    }

    void AgentSession::pause(const TurnTask &task) const
    {
        if (chunkDelay_.count() > 0 && !task.cancel.load(std::memory_order_acquire))
            std::this_thread::sleep_for(chunkDelay_);
    }

    void AgentSession::runReplyTurn(TurnTask &task, std::string prompt)
    {
        push(transcript::TranscriptEvent(transcript::ThoughtChunk{"Composing a reply."}));
        pause(task);

        for (auto &word : splitWords(replyFor(prompt)))
        {
            if (task.cancel.load(std::memory_order_acquire))
            {
                push(transcript::TranscriptEvent(transcript::TurnError{"cancelled"}));
                return;
            }
            push(transcript::TranscriptEvent(transcript::MessageChunk{std::move(word)}));
            pause(task);
        }
        push(transcript::TranscriptEvent(transcript::TurnComplete{}));
    }

    void AgentSession::runCommandTurn(TurnTask &task, std::string command)
    {
        const int number = nextToolCall_.fetch_add(1);
        const std::string callId = "call-" + std::to_string(number);
        const std::string terminalId = "term-" + std::to_string(number);

        push(transcript::TranscriptEvent(transcript::MessageChunk{"Running the command.\n"}));

        auto buffer = transcript::OutputBuffer::create();
        transcript::ToolCallStarted started;
        started.id = callId;
        started.title = command;
        started.kind = "execute";
        started.status = transcript::ToolCallStatus::InProgress;
        started.terminal_id = terminalId;
        push(transcript::TranscriptEvent(started));
        push(TerminalAttached{terminalId, buffer});

        int outputPipe[2]{-1, -1};
        if (::pipe(outputPipe) == -1)
        {
            std::string reason = std::strerror(errno);
            log::debug("agent", "pipe failed: " + reason);
            push(transcript::TranscriptEvent(transcript::TurnError{"cannot start command: " + reason}));
            return;
        }

        // stderr joins stdout so failures show in the terminal block. The child
        // leads its own process group so a cancel reaches everything it forks.
        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_adddup2(&actions, outputPipe[1], STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&actions, outputPipe[1], STDERR_FILENO);
        posix_spawn_file_actions_addclose(&actions, outputPipe[0]);
        posix_spawn_file_actions_addclose(&actions, outputPipe[1]);

        posix_spawnattr_t attributes;
        posix_spawnattr_init(&attributes);
        posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
        posix_spawnattr_setpgroup(&attributes, 0);

        std::array<char *, 4> argv{const_cast<char *>("sh"), const_cast<char *>("-c"),
                                   command.data(), nullptr};
        pid_t childPid = -1;
        int spawnStatus = ::posix_spawn(&childPid, "/bin/sh", &actions, &attributes, argv.data(), environ);
        posix_spawnattr_destroy(&attributes);
        posix_spawn_file_actions_destroy(&actions);
        ::close(outputPipe[1]);

        if (spawnStatus != 0)
        {
            ::close(outputPipe[0]);
            std::string reason = std::strerror(spawnStatus);
            log::debug("agent", "posix_spawn failed: " + reason);
            push(transcript::TranscriptEvent(transcript::TurnError{"cannot start command: " + reason}));
            return;
        }

        std::array<char, 512> chunk{};
        const int fd = outputPipe[0];
        bool cancelled = false;
        while (true)
        {
            if (task.cancel.load(std::memory_order_acquire))
            {
                cancelled = true;
                ::kill(-childPid, SIGKILL);
                break;
            }
            pollfd readable{fd, POLLIN, 0};
            int ready = ::poll(&readable, 1, kPollIntervalMs);
            if (ready == 0 || (ready < 0 && errno == EINTR))
                continue;
            if (ready < 0)
            {
                log::debug("agent", "poll error on " + terminalId + ": " + std::strerror(errno));
                buffer->poison();
                break;
            }
            ssize_t count = ::read(fd, chunk.data(), chunk.size());
            if (count > 0)
            {
                buffer->append(std::string_view(chunk.data(), static_cast<std::size_t>(count)));
                continue;
            }
            if (count < 0 && errno == EINTR)
                continue;
            if (count < 0)
            {
                log::debug("agent", "read error on " + terminalId + ": " + std::strerror(errno));
                buffer->poison();
            }
            break;
        }
        ::close(fd);
        // A broken pipe leaves the command running; stop it before waiting.
        if (buffer->poisoned())
            ::kill(-childPid, SIGKILL);

        int status = waitForChild(childPid);
        if (cancelled)
        {
            push(transcript::TranscriptEvent(transcript::TurnError{"cancelled"}));
            return;
        }
        if (status == -1)
        {
            push(transcript::TranscriptEvent(transcript::TurnError{"cannot collect command status"}));
            return;
        }

        int exitCode = exitCodeFrom(status);
        transcript::ToolCallUpdated done;
        done.id = callId;
        done.status = exitCode == 0 ? transcript::ToolCallStatus::Completed : transcript::ToolCallStatus::Failed;
        push(transcript::TranscriptEvent(done));
        push(transcript::TranscriptEvent(
            transcript::MessageChunk{"\nThe command exited with status " + std::to_string(exitCode) + "."}));
        push(transcript::TranscriptEvent(transcript::TurnComplete{}));
    }

} // namespace ag::chat
