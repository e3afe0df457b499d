#pragma once

#include <mutex>
#include <ostream>
#include <string>

class LogSink {
public:
    virtual ~LogSink() {}

    virtual void info(const std::string& tag, const std::string& message) = 0;
    virtual void warn(const std::string& tag, const std::string& message) = 0;
    virtual void error(const std::string& tag, const std::string& message) = 0;
};

// Writes "[TAG] message" lines; warnings and errors carry a marker after the tag.
class StreamLogSink : public LogSink {
private:
    std::ostream& out;
    std::mutex writeMutex;

    void write(const std::string& tag, const char* marker, const std::string& message);

public:
    explicit StreamLogSink(std::ostream& stream);

    void info(const std::string& tag, const std::string& message) override;
    void warn(const std::string& tag, const std::string& message) override;
    void error(const std::string& tag, const std::string& message) override;
};

class NullLogSink : public LogSink {
public:
    void info(const std::string&, const std::string&) override {}
    void warn(const std::string&, const std::string&) override {}
    void error(const std::string&, const std::string&) override {}
};
