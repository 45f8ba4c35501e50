#pragma once

#include "ag/transcript/output_buffer.hpp"
#include "ag/transcript/transcript.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace ag::chat
{

    // A live terminal the UI should register before the next output sync.
    struct TerminalAttached
    {
        std::string terminalId;
        transcript::OutputHandle buffer;
    };

    using SessionUpdate = std::variant<transcript::TranscriptEvent, TerminalAttached>;

    /**
     * @brief Built-in agent producing transcript events on a worker thread.
     *
     * Plain prompts get a streamed reply. A prompt starting with '!' runs the
     * rest as a shell command whose output streams into a terminal tool call.
     * The UI thread collects the queued updates with takeUpdates().
     */
    class AgentSession
    {
    public:
        AgentSession() = default;
        ~AgentSession();

        AgentSession(const AgentSession &) = delete;
        AgentSession &operator=(const AgentSession &) = delete;

        void startTurn(std::string prompt);
        void cancelTurn();
        bool turnInProgress() const;

        std::vector<SessionUpdate> takeUpdates();

        void setChunkDelay(std::chrono::milliseconds delay) noexcept { chunkDelay_ = delay; }

    private:
        struct TurnTask
        {
            std::thread worker;
            std::atomic<bool> cancel{false};
            std::atomic<bool> finished{false};
        };

        void push(SessionUpdate update);
        void joinIfFinished();
        void runReplyTurn(TurnTask &task, std::string prompt);
        void runCommandTurn(TurnTask &task, std::string command);
        void pause(const TurnTask &task) const;

        mutable std::mutex mutex_;
        std::vector<SessionUpdate> pending_;
        std::unique_ptr<TurnTask> activeTurn_;
        std::atomic<int> nextToolCall_{1};
        std::chrono::milliseconds chunkDelay_{30};
    };

} // namespace ag::chat
