#include "logger.hpp"

StreamLogSink::StreamLogSink(std::ostream& stream) : out(stream) {}

void StreamLogSink::write(const std::string& tag, const char* marker, const std::string& message) {
    std::lock_guard<std::mutex> lock(writeMutex);
    out << "[" << tag << "] " << marker << message << std::endl;
}

void StreamLogSink::info(const std::string& tag, const std::string& message) {
    write(tag, "", message);
}

void StreamLogSink::warn(const std::string& tag, const std::string& message) {
    write(tag, "WARN ", message);
}

void StreamLogSink::error(const std::string& tag, const std::string& message) {
    write(tag, "ERROR ", message);
}
