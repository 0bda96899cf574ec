#include "lib.hpp"

// Formats a printf-style message and prefixes it with the call site.
// Variadic arguments must be C types (use .c_str() for strings).
std::string error_text(const std::string& msg, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);

    // two passes: size first, then write
    va_list args_copy;
    va_copy(args_copy, args);
    int required_size = std::vsnprintf(nullptr, 0, msg.c_str(), args_copy);
    va_end(args_copy);

    if (required_size < 0) {
        va_end(args);
        throw std::runtime_error("Error: Failed to determine required buffer size.");
    }

    std::vector<char> buffer(required_size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), msg.c_str(), args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line << ": " << buffer.data();
    return ss.str();
}
