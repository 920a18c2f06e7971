#include "brew_error.hpp"
#include <cstring>

BrewNotInstalled::BrewNotInstalled()
    : BrewError("Homebrew is not installed. Visit https://brew.sh to install it.") {}

LaunchFailure::LaunchFailure(const std::string& executable, int error_number)
    : BrewError("Failed to launch '" + executable + "': " + std::strerror(error_number)),
      executable_(executable),
      error_number_(error_number) {}

NonZeroExit::NonZeroExit(int exit_code, const std::string& std_err)
    : BrewError("Homebrew command failed with exit code " + std::to_string(exit_code) +
                (std_err.empty() ? std::string() : ": " + std_err)),
      exit_code_(exit_code),
      std_err_(std_err) {}

MalformedOutput::MalformedOutput(const std::string& detail)
    : BrewError("Received invalid output from Homebrew: " + detail) {}

PackageNotFound::PackageNotFound(const std::string& package_name)
    : BrewError("Package '" + package_name + "' not found"),
      package_name_(package_name) {}

NetworkError::NetworkError(const std::string& url, const std::string& detail)
    : BrewError("Failed to fetch " + url + ": " + detail) {}
