#pragma once

#include <stdexcept>
#include <string>

// Bad or missing argument; raised before any rendering starts.
class ConfigError : public std::runtime_error {
public:
    ConfigError(const std::string& argument, const std::string& message)
        : std::runtime_error("--" + argument + ": " + message), arg(argument) {}

    const std::string& argument() const { return arg; }

private:
    std::string arg;
};

// The frame sink failed to open, write or finalize its output.
class EncoderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A fractal worker thread threw while computing its pixels.
class WorkerError : public std::runtime_error {
public:
    WorkerError(int worker, const std::string& message)
        : std::runtime_error("fractal worker " + std::to_string(worker) +
                             " failed: " + message),
          index(worker) {}

    int worker_index() const { return index; }

private:
    int index;
};
