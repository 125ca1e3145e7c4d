#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Process-wide logging for training, evaluation and prediction.
 *
 * The Logger class implements a singleton pattern to provide centralized
 * logging throughout the application. Each message is timestamped and
 * tagged INFO or ERROR. Messages go to the console (errors to stderr) and,
 * once startLogging() has been called, to a log file as well.
 */
class Logger {
  private:
    std::ofstream log_file;       ///< Output file stream, open while file logging is active
    std::string log_file_path;    ///< Path to the current log file
    bool logging_enabled;         ///< Whether messages are emitted at all
    bool console_output;          ///< Whether messages are echoed to the console
    std::mutex mutex_;

    /// Singleton instance
    static std::unique_ptr<Logger> instance;

    /**
     * @brief Private constructor for singleton pattern.
     *
     * Starts enabled, console only.
     */
    Logger();

    static std::string timestamp();

  public:
    /**
     * @brief Gets the singleton logger instance.
     * @return Reference to the global logger
     */
    static Logger& getInstance();

    /**
     * @brief Starts mirroring messages to a file.
     *
     * Creates parent directories if needed and truncates the file.
     *
     * @param file_path Path to log file (default: "morpho_predictor.log")
     * @throws std::runtime_error if file cannot be opened
     */
    void startLogging(const std::string& file_path = "morpho_predictor.log");

    /**
     * @brief Stops file logging and closes the log file.
     */
    void stopLogging();

    /**
     * @brief Logs a message with optional error level.
     *
     * @param message Text to log
     * @param is_error Whether to mark as error (default: false)
     */
    void log(const std::string& message, bool is_error = false);

    bool isLoggingEnabled() const {
        return logging_enabled;
    }

    bool isFileLoggingActive() const {
        return log_file.is_open();
    }

    void disableLogging() {
        logging_enabled = false;
    }

    void enableLogging() {
        logging_enabled = true;
    }

    /**
     * @brief Turns the console echo on or off (file logging is unaffected).
     */
    void setConsoleOutput(bool enabled) {
        console_output = enabled;
    }

    // Prevent copying and assignment for singleton
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    ~Logger();
};

#endif // LOGGER_HPP
