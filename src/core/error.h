#pragma once

#include <stdexcept>
#include <string>

namespace easel {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Thrown when start_task is called on a driver that already has an active task.
class AlreadyRunningError : public Error {
public:
    explicit AlreadyRunningError(const std::string& message) : Error(message) {}
};

class TransportError : public Error {
public:
    explicit TransportError(const std::string& message) : Error(message) {}
};

class GitError : public Error {
public:
    explicit GitError(const std::string& message) : Error(message) {}
};

class FileSystemError : public Error {
public:
    explicit FileSystemError(const std::string& message) : Error(message) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message) : Error(message) {}
};

struct OperationResult {
    bool success = false;
    std::string error;
};

}
