#pragma once

#include <stdexcept>
#include <string>

// Base of every error the engine reports to its caller.
class BrewError : public std::runtime_error {
public:
    explicit BrewError(const std::string& message) : std::runtime_error(message) {}
};

class BrewNotInstalled : public BrewError {
public:
    BrewNotInstalled();
};

// The executable could not be started at all.
class LaunchFailure : public BrewError {
public:
    LaunchFailure(const std::string& executable, int error_number);

    const std::string& executable() const { return executable_; }
    int error_number() const { return error_number_; }

private:
    std::string executable_;
    int error_number_;
};

// The process ran and reported failure.
class NonZeroExit : public BrewError {
public:
    NonZeroExit(int exit_code, const std::string& std_err);

    int exit_code() const { return exit_code_; }
    const std::string& std_err() const { return std_err_; }

private:
    int exit_code_;
    std::string std_err_;
};

// Structured output did not match the expected schema.
class MalformedOutput : public BrewError {
public:
    explicit MalformedOutput(const std::string& detail);
};

class PackageNotFound : public BrewError {
public:
    explicit PackageNotFound(const std::string& package_name);

    const std::string& package_name() const { return package_name_; }

private:
    std::string package_name_;
};

class NetworkError : public BrewError {
public:
    NetworkError(const std::string& url, const std::string& detail);
};
