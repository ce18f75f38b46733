/*******************************************************************************
* Class for display / logging of errors and other messages
*******************************************************************************/

#ifndef _ROWAN_LOGGER_
#define _ROWAN_LOGGER_

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

/*
* Message logging class
* 
* Writes to terminal and optionally a file. The most recent messages are kept
* in memory, this is the diagnostics channel for every soft fallback.
*/
class Logger {
public:
    enum class Level {
        Error,   // Critical error
        Warning, // Recoverable error
        Info,    // General information
        Message, // Other
        Debug    // Debug message
    };

    // Copy of the retained messages, oldest first
    std::vector<std::string> GetMessages();
    void ClearMessages();

    /*
    * Prints / logs an error
    *
    * Args:
    * sender - function sending message
    * format - output format (like printf)
    * ...    - output
    */
    void Error(const char* sdr, const char* format, ...);
    /*
    * Prints / logs a warning
    *
    * Args:
    * sender - function sending message
    * format - output format (like printf)
    * ...    - output
    */
    void Warning(const char* sdr, const char* format, ...);
    /*
    * Prints / logs info
    *
    * Args:
    * sender - function sending message
    * format - output format (like printf)
    * ...    - output
    */
    void Info(const char* sdr, const char* format, ...);
    /*
    * Prints / logs a message
    *
    * Args:
    * sender - function sending message
    * format - output format (like printf)
    * ...    - output
    */
    void Message(const char* sdr, const char* format, ...);
    /*
    * Prints / logs a debug message
    *
    * Args:
    * sender - function sending message
    * format - output format (like printf)
    * ...    - output
    */
    void Debug(const char* sdr, const char* format, ...);
    /*
    * Generic print / log function
    *
    * Args:
    * type   - message type
    * sender - function sending message
    * format - output format (like printf)
    * ...    - output
    */
    void Print(Level type, const char* sdr, const char* format, ...);
    /*
    * Generic print / log function
    *
    * Args:
    * type   - message type
    * sender - function sending message
    * format - output format (like printf)
    * args   - output args as va_list
    */
    void Print(Level type, const char* sdr, const char* format, va_list args);

    // Current verbosity level
    Level& Verbosity();
    // Logging to file?
    bool IsLogging();
    // Enable / Disable logging
    void SetLogging(bool log);
    // Echo messages to the terminal?
    void SetEcho(bool echo);

    /*
    * Logger constructor
    *
    * @param log       - log messages to file
    * @param verbosity - lowest level message to log
    * @param logPath   - path to log file
    */
    Logger(bool log, Logger::Level verbosity, const std::string& logPath = "");
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
private:
    // Location to write log
    const std::string logPath;
    // Logfile pointer
    FILE* logFile = NULL;
    // Logging enabled?
    bool log  = false;
    bool echo = true;
    // Verbosity level
    Logger::Level verbosity;
    std::vector<std::string> messageLog;
    std::mutex lock;

    const char* errorMess = "Error";
    const char* warnMess  = "Warning";
    const char* infoMess  = "Info";
    const char* messMess  = "Message";
    const char* dbugMess  = "Debug";

    void setLogging(bool log);
};

// Parse "error", "warning", "info", "message" or "debug", returns false if unknown
bool ParseLevel(const std::string& name, Logger::Level* level);

// The previous default logger must outlive every thread still printing through it
void SetDefaultLogger(Logger* log);
Logger* GetDefaultLogger();

#endif

#define DispError(sdr, msg, ...) GetDefaultLogger()->Error(sdr, msg, ##__VA_ARGS__)
#define DispWarning(sdr, msg, ...) GetDefaultLogger()->Warning(sdr, msg, ##__VA_ARGS__)
#define DispInfo(sdr, msg, ...) GetDefaultLogger()->Info(sdr, msg, ##__VA_ARGS__)
#define DispMessage(sdr, msg, ...) GetDefaultLogger()->Message(sdr, msg, ##__VA_ARGS__)

#ifdef DEBUG
    #define DispDebug(sdr, msg, ...) GetDefaultLogger()->Debug(sdr, msg, ##__VA_ARGS__)
#else
    #define DispDebug(sdr, msg, ...)
#endif
