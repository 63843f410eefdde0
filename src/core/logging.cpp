#include "ankiplace/logging.hpp"

#include <iostream>
#include <mutex>

namespace ankiplace {

namespace {

std::mutex log_mutex;

void write_line(std::ostream& out, std::string_view level, std::string_view tag,
                std::string_view message) {
    std::lock_guard lock(log_mutex);
    out << "[" << tag << "] ";
    if (!level.empty())
        out << level << ": ";
    out << message << std::endl;
}

} // namespace

void log_info(std::string_view tag, std::string_view message) {
    write_line(std::cout, "", tag, message);
}

void log_warn(std::string_view tag, std::string_view message) {
    write_line(std::cerr, "warning", tag, message);
}

void log_error(std::string_view tag, std::string_view message) {
    write_line(std::cerr, "error", tag, message);
}

} // namespace ankiplace
