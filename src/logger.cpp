#include "../include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>

std::unique_ptr<Logger> Logger::instance = nullptr;

Logger::Logger() : logging_enabled(true), console_output(true) {}

Logger::~Logger() {
    stopLogging();
}

Logger& Logger::getInstance() {
    if (!instance) {
        instance = std::unique_ptr<Logger>(new Logger());
    }
    return *instance;
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::string stamp(std::ctime(&time));
    return stamp.substr(0, stamp.length() - 1); // Remove trailing newline
}

void Logger::startLogging(const std::string& file_path) {
    stopLogging();

    std::lock_guard<std::mutex> lock(mutex_);
    log_file_path = file_path;

    // Create directories if they don't exist
    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    log_file.open(file_path, std::ios::out | std::ios::trunc);
    if (!log_file.is_open()) {
        throw std::runtime_error("Failed to open log file: " + file_path);
    }

    log_file << "=== Logging started at " << timestamp() << " ===" << std::endl;
}

void Logger::stopLogging() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!log_file.is_open()) {
        return;
    }
    log_file << "=== Logging stopped at " << timestamp() << " ===" << std::endl;
    log_file.close();
}

void Logger::log(const std::string& message, bool is_error) {
    if (!logging_enabled) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string line = "[" + timestamp() + "] " + (is_error ? "ERROR: " : "INFO: ") + message;

    if (console_output) {
        if (is_error) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }
    if (log_file.is_open()) {
        log_file << line << std::endl;
    }
}
