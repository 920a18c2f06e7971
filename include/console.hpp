#pragma once

#include <string>

extern const std::string RED;
extern const std::string GREEN;
extern const std::string BLUE;
extern const std::string YELLOW;
extern const std::string GRAY;
extern const std::string RESET;

void set_verbose(bool verbose);
bool is_verbose();

void print_progress(const std::string& message, int percentage);
void print_info(const std::string& message);
void print_error(const std::string& message);
void print_success(const std::string& message);
void print_debug(const std::string& message);
