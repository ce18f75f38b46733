#include <atomic>
#include <cstring>
#include <ctime>

#include "logger.hpp"

static Logger               embedded(false, Logger::Level::Message);
static std::atomic<Logger*> defaultLog(&embedded);

void SetDefaultLogger(Logger* log) {
    defaultLog.store(log != NULL ? log : &embedded);
}
Logger* GetDefaultLogger() {
    return defaultLog.load();
}

bool ParseLevel(const std::string& name, Logger::Level* level) {
    static const char* names[] = { "error", "warning", "info", "message", "debug" };

    for (int i = 0; i < 5; i++) {
        if (name == names[i]) {
            *level = (Logger::Level)i;
            return true;
        }
    }

    return false;
}

static void timestamp(char* buffer, size_t len, const char* format) {
    time_t rawtime;
    struct tm timeinfo;

    time(&rawtime);
    localtime_r(&rawtime, &timeinfo);
    strftime(buffer, len, format, &timeinfo);
}

Logger::Logger(bool log, Level level, const std::string& logPath)
      : logPath(logPath)
{
    verbosity = level;
    SetLogging(log);
}

Logger::~Logger() {
    std::lock_guard<std::mutex> guard(lock);
    setLogging(false);
}

Logger::Level& Logger::Verbosity() {
    return verbosity;
}

bool Logger::IsLogging() {
    return log;
}

void Logger::SetEcho(bool echo) {
    this->echo = echo;
}

void Logger::SetLogging(bool log) {
    bool opened;

    {
        std::lock_guard<std::mutex> guard(lock);
        setLogging(log);
        opened = this->log;
    }

    if (log && !opened)
        Warning("Logger::SetLogging", "Failed to open log file '%s'", logPath.c_str());
}

// Caller holds the lock
void Logger::setLogging(bool log) {
    this->log = log;

    if (!log && logFile != NULL) {
        // Write log end time to file
        char buffer[80];
        timestamp(buffer, sizeof(buffer), "%d-%m-%Y %H:%M:%S");

        fprintf(logFile, "*** Log end: %s ***\n", buffer);

        fclose(logFile);
        logFile = NULL;
    } else if (log) {
        // logPath can't change, so any file already open is the right one
        if (logFile == NULL) {
            if (!logPath.empty())
                logFile = fopen(logPath.c_str(), "a");

            if (logFile == NULL) {
                this->log = false;
            } else {
                // Write log start time to file
                char buffer[80];
                timestamp(buffer, sizeof(buffer), "%H:%M:%S");

                fprintf(logFile, "** Log start: %s **\n", buffer);

                fflush(logFile);
            }
        }
    }
}

void Logger::Print(Level type, const char* sender, const char* format, va_list args) {
    static const char* messages[] = { errorMess, warnMess, infoMess, messMess, dbugMess };
    static const int   colors[]   = {         1,        3,        2,        6,        7 };

    if (type > verbosity)
        return;

    std::lock_guard<std::mutex> guard(lock);

    va_list logArgs;
    va_copy(logArgs, args);
    va_list lastArgs;
    va_copy(lastArgs, args);

    if (echo) {
        printf("\033[1;3%dm[%s] %s: \033[0m", colors[(int)type], sender, messages[(int)type]);
        vprintf(format, args);
        printf("\n");
    }

    if (log && logFile != NULL) {
        char buffer[80];
        timestamp(buffer, sizeof(buffer), "%d-%m-%Y %H:%M:%S");

        fprintf(logFile, "[%s] ", buffer);

        fprintf(logFile, "[%s] %s: ", sender, messages[(int)type]);
        vfprintf(logFile, format, logArgs);
        fprintf(logFile, "\n");

        fflush(logFile);
    }

    char message[256];
    vsnprintf(message, sizeof(message), format, lastArgs);
    message[sizeof(message) - 1] = '\0';

    if (messageLog.size() > 512)
        messageLog.erase(messageLog.begin());

    messageLog.push_back(std::string(sender) + ": " + message);

    va_end(logArgs);
    va_end(lastArgs);
}

void Logger::Print(Level type, const char* sender, const char* format, ...) {
    va_list args;
    va_start(args, format);

    Print(type, sender, format, args);

    va_end(args);
}

void Logger::Error(const char* sender, const char* format, ...) {
    va_list args;
    va_start(args, format);

    Print(Level::Error, sender, format, args);

    va_end(args);
}
void Logger::Warning(const char* sender, const char* format, ...) {
    va_list args;
    va_start(args, format);

    Print(Level::Warning, sender, format, args);

    va_end(args);
}
void Logger::Info(const char* sender, const char* format, ...) {
    va_list args;
    va_start(args, format);

    Print(Level::Info, sender, format, args);

    va_end(args);
}
void Logger::Message(const char* sender, const char* format, ...) {
    va_list args;
    va_start(args, format);

    Print(Level::Message, sender, format, args);

    va_end(args);
}
void Logger::Debug(const char* sender, const char* format, ...) {
    va_list args;
    va_start(args, format);

    Print(Level::Debug, sender, format, args);

    va_end(args);
}

std::vector<std::string> Logger::GetMessages() {
    std::lock_guard<std::mutex> guard(lock);
    return messageLog;
}
void Logger::ClearMessages() {
    std::lock_guard<std::mutex> guard(lock);
    messageLog.clear();
}
