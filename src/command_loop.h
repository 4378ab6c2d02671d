#pragma once

#include <string>
#include <optional>
#include <istream>
#include <atomic>

#include "json_protocol.h"

namespace scribe {

class ModelManager;
class TranscriptionExecutor;

/**
 * Reads commands one line at a time and runs each to completion before
 * reading the next.
 */
class CommandLoop {
public:
    CommandLoop(ModelManager& models, TranscriptionExecutor& executor, EventWriter& events,
                std::optional<std::string> defaultLanguage = std::nullopt);

    /**
     * Process lines until QUIT, end of input, or stopRequested becomes true.
     * stopRequested is checked between commands and may be null.
     */
    void run(std::istream& in, const std::atomic<bool>* stopRequested = nullptr);

    /**
     * Handle one parsed command
     * @return false once the loop should stop
     */
    bool dispatch(const Command& cmd);

    bool isRunning() const { return m_running; }

    // Number of non-empty commands handled so far
    size_t commandsHandled() const { return m_commandsHandled; }

private:
    ModelManager& m_models;
    TranscriptionExecutor& m_executor;
    EventWriter& m_events;
    std::optional<std::string> m_defaultLanguage;

    bool m_running = true;
    size_t m_commandsHandled = 0;
};

} // namespace scribe
