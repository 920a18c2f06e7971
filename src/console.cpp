#include "console.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

const std::string RED = "\033[31m";
const std::string GREEN = "\033[32m";
const std::string BLUE = "\033[34m";
const std::string YELLOW = "\033[33m";
const std::string GRAY = "\033[90m";
const std::string RESET = "\033[0m";

static std::atomic<bool> verbose_output{false};
// Snapshot queries log from several threads at once.
static std::mutex output_mutex;

void set_verbose(bool verbose) {
    verbose_output = verbose;
}

bool is_verbose() {
    return verbose_output;
}

void print_progress(const std::string& message, int percentage) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << BLUE << "[" << percentage << "%] " << message << RESET << std::endl;
}

void print_info(const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << BLUE << "==> " << RESET << message << std::endl;
}

void print_error(const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << RED << "Error: " << message << RESET << std::endl;
}

void print_success(const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << GREEN << message << RESET << std::endl;
}

void print_debug(const std::string& message) {
    if (!verbose_output) return;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << GRAY << "debug: " << message << RESET << std::endl;
}
