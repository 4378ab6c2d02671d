#include "json_protocol.h"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace scribe {

namespace {

const char* const kLoadModelPrefix = "LOAD_MODEL:";
const char* const kCheckModelPrefix = "CHECK_MODEL:";
const char* const kQuitCommand = "quit";

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::string quoted(const std::string& str) {
    return "\"" + escapeJson(str) + "\"";
}

} // namespace

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

Command parseCommand(const std::string& line) {
    Command cmd;

    std::string text = trim(line);
    if (text.empty()) {
        cmd.type = CommandType::Empty;
        return cmd;
    }

    // Convert to lowercase for comparison
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == kQuitCommand) {
        cmd.type = CommandType::Quit;
    } else if (startsWith(text, kLoadModelPrefix)) {
        cmd.type = CommandType::LoadModel;
        cmd.argument = trim(text.substr(std::char_traits<char>::length(kLoadModelPrefix)));
    } else if (startsWith(text, kCheckModelPrefix)) {
        cmd.type = CommandType::CheckModel;
        cmd.argument = trim(text.substr(std::char_traits<char>::length(kCheckModelPrefix)));
    } else {
        cmd.type = CommandType::Transcribe;
        cmd.argument = text;
    }

    return cmd;
}

const char* toString(StatusState state) {
    switch (state) {
        case StatusState::Initializing: return "initializing";
        case StatusState::Downloading:  return "downloading";
        case StatusState::Loading:      return "loading";
        case StatusState::Cached:       return "cached";
        case StatusState::Transcribing: return "transcribing";
        case StatusState::Shutdown:     return "shutdown";
    }
    return "unknown";
}

namespace {

// Length of the well-formed UTF-8 sequence starting at str[pos], 0 if the
// bytes there are not valid UTF-8 (overlong forms and surrogates included)
size_t utf8SequenceLength(const std::string& str, size_t pos) {
    const auto byte = [&](size_t i) { return static_cast<unsigned char>(str[i]); };
    const unsigned char lead = byte(pos);

    size_t length = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) low = 0xA0;
        if (lead == 0xED) high = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) low = 0x90;
        if (lead == 0xF4) high = 0x8F;
    } else {
        return 0;
    }

    if (pos + length > str.size()) {
        return 0;
    }
    if (byte(pos + 1) < low || byte(pos + 1) > high) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        if (byte(pos + i) < 0x80 || byte(pos + i) > 0xBF) {
            return 0;
        }
    }
    return length;
}

} // namespace

std::string escapeJson(const std::string& str) {
    std::ostringstream ss;
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        switch (c) {
            case '"':  ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control character - use unicode escape
                    ss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                       << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else if (static_cast<unsigned char>(c) < 0x80) {
                    ss << c;
                } else if (size_t length = utf8SequenceLength(str, i)) {
                    ss.write(str.data() + i, static_cast<std::streamsize>(length));
                    i += length - 1;
                } else {
                    ss << "\xEF\xBF\xBD";
                }
        }
    }
    return ss.str();
}

EventWriter::EventWriter(std::ostream& out)
    : m_out(out)
{
}

void EventWriter::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << line << '\n';
    m_out.flush();
}

void EventWriter::sendStatus(StatusState state, const std::string& details) {
    writeLine("{\"type\":\"status\",\"state\":" + quoted(toString(state)) +
              ",\"details\":" + quoted(details) + "}");
}

void EventWriter::sendDownloadProgress(int progress, const std::string& model) {
    progress = std::max(0, std::min(100, progress));
    writeLine("{\"type\":\"download_progress\",\"progress\":" + std::to_string(progress) +
              ",\"model\":" + quoted(model) + "}");
}

void EventWriter::sendReady(const std::string& model, const std::string& message) {
    writeLine("{\"type\":\"ready\",\"model\":" + quoted(model) +
              ",\"message\":" + quoted(message) + "}");
}

void EventWriter::sendModelStatus(const std::string& model, bool cached, const std::string& shortName) {
    writeLine("{\"type\":\"model_status\",\"model\":" + quoted(model) +
              ",\"cached\":" + (cached ? "true" : "false") +
              ",\"short_name\":" + quoted(shortName) + "}");
}

void EventWriter::sendTranscription(const std::string& text, const std::string& language, double duration) {
    std::ostringstream seconds;
    seconds << std::fixed << std::setprecision(3) << duration;

    writeLine("{\"type\":\"transcription\",\"text\":" + quoted(text) +
              ",\"language\":" + quoted(language) +
              ",\"duration\":" + seconds.str() + "}");
}

void EventWriter::sendError(const std::string& message) {
    writeLine("{\"type\":\"error\",\"message\":" + quoted(message) + "}");
}

void EventWriter::sendFatal(const std::string& message) {
    writeLine("{\"type\":\"fatal\",\"message\":" + quoted(message) + "}");
}

} // namespace scribe
