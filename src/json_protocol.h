#pragma once

#include <string>
#include <ostream>
#include <mutex>

namespace scribe {

/**
 * Line protocol for communicating with the host application.
 *
 * Input commands (stdin, one per line):
 *   QUIT                    - Clean shutdown (any case)
 *   LOAD_MODEL:<model>      - Load or switch to a model
 *   CHECK_MODEL:<model>     - Report whether a model is in the local cache
 *   <path>                  - Transcribe an audio file
 *
 * Model identifiers need at least two components ("org/name" or
 * "org/name/file"); a bare "name" is rejected with an error event.
 *
 * Output events (stdout, one JSON object per line):
 *   {"type":"status","state":"...","details":"..."}
 *   {"type":"download_progress","progress":0,"model":"..."}
 *   {"type":"ready","model":"...","message":"..."}
 *   {"type":"model_status","model":"...","cached":false,"short_name":"..."}
 *   {"type":"transcription","text":"...","language":"...","duration":1.234}
 *   {"type":"error","message":"..."}
 *   {"type":"fatal","message":"..."}
 */

enum class CommandType {
    Empty,
    Quit,
    LoadModel,
    CheckModel,
    Transcribe
};

struct Command {
    CommandType type = CommandType::Empty;
    std::string argument;
};

// Classify one line read from stdin. Never fails: anything that is not a
// known command is an audio path.
Command parseCommand(const std::string& line);

enum class StatusState {
    Initializing,
    Downloading,
    Loading,
    Cached,
    Transcribing,
    Shutdown
};

const char* toString(StatusState state);

/**
 * Serializes events to the output stream, one flushed line per event.
 * Writes are serialized by an internal mutex so that events emitted from a
 * download callback cannot interleave with the command thread.
 */
class EventWriter {
public:
    explicit EventWriter(std::ostream& out);

    EventWriter(const EventWriter&) = delete;
    EventWriter& operator=(const EventWriter&) = delete;

    void sendStatus(StatusState state, const std::string& details);
    void sendDownloadProgress(int progress, const std::string& model);
    void sendReady(const std::string& model, const std::string& message);
    void sendModelStatus(const std::string& model, bool cached, const std::string& shortName);
    void sendTranscription(const std::string& text, const std::string& language, double duration);
    void sendError(const std::string& message);
    void sendFatal(const std::string& message);

private:
    void writeLine(const std::string& line);

    std::ostream& m_out;
    std::mutex m_mutex;
};

// Utility to escape JSON strings. Invalid UTF-8 is replaced with U+FFFD.
std::string escapeJson(const std::string& str);

// Strip leading and trailing whitespace, keeping everything in between
std::string trim(const std::string& str);

} // namespace scribe
