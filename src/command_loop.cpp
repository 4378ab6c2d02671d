#include "command_loop.h"
#include "model_manager.h"
#include "transcription_executor.h"
#include <iostream>

namespace scribe {

CommandLoop::CommandLoop(ModelManager& models, TranscriptionExecutor& executor, EventWriter& events,
                         std::optional<std::string> defaultLanguage)
    : m_models(models)
    , m_executor(executor)
    , m_events(events)
    , m_defaultLanguage(std::move(defaultLanguage))
{
}

void CommandLoop::run(std::istream& in, const std::atomic<bool>* stopRequested) {
    std::string line;

    auto stopPending = [stopRequested]() {
        return stopRequested && stopRequested->load();
    };

    // Checked before each read and again once it returns
    while (m_running && !stopPending() && std::getline(in, line)) {
        if (stopPending()) {
            break;
        }

        Command cmd = parseCommand(line);
        if (cmd.type == CommandType::Empty) {
            continue;
        }

        m_running = dispatch(cmd);
    }

    if (m_running) {
        if (stopPending()) {
            std::cerr << "[Loop] Stop requested" << std::endl;
        } else {
            std::cerr << "[Loop] End of input" << std::endl;
        }
        m_running = false;
    }
}

bool CommandLoop::dispatch(const Command& cmd) {
    switch (cmd.type) {
        case CommandType::Empty:
            return true;

        case CommandType::Quit:
            ++m_commandsHandled;
            std::cerr << "[Loop] Received quit command" << std::endl;
            m_events.sendStatus(StatusState::Shutdown, "Shutting down");
            return false;

        case CommandType::LoadModel:
            ++m_commandsHandled;
            if (cmd.argument.empty()) {
                m_events.sendError("LOAD_MODEL requires a model identifier");
            } else {
                m_models.load(cmd.argument);
            }
            return true;

        case CommandType::CheckModel:
            ++m_commandsHandled;
            if (cmd.argument.empty()) {
                m_events.sendError("CHECK_MODEL requires a model identifier");
            } else {
                m_models.checkStatus(cmd.argument);
            }
            return true;

        case CommandType::Transcribe: {
            ++m_commandsHandled;
            TranscriptionRequest request;
            request.audioPath = cmd.argument;
            request.language = m_defaultLanguage;
            m_executor.transcribe(request);
            return true;
        }
    }
    return true;
}

} // namespace scribe
