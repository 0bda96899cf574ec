#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <sstream> // To build the final string

namespace migrator {

// Base of every error raised by the migrator; catch this to handle them all.
class MigratorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Setup problems: migrations root missing / not a directory, bad config file.
class ConfigError : public MigratorError {
public:
    using MigratorError::MigratorError;
};

// Two migration files share a version but not a name.
class DuplicateVersionError : public MigratorError {
public:
    using MigratorError::MigratorError;
};

// Listing or reading migration definitions failed.
class SourceError : public MigratorError {
public:
    using MigratorError::MigratorError;
};

// Reading the application log failed.
class LogError : public MigratorError {
public:
    using MigratorError::MigratorError;
};

// The log table holds a row we cannot interpret.
class InvalidLogTableError : public LogError {
public:
    using LogError::LogError;
};

} // namespace migrator

std::string error_text(const std::string& msg, const char* file, int line, ...);

// A helper macro to automatically pass __FILE__ and __LINE__
#define THROW(msg, ...) throw std::runtime_error(error_text(msg, __FILE__, __LINE__, ##__VA_ARGS__))
#define THROW_AS(type, msg, ...) throw type(error_text(msg, __FILE__, __LINE__, ##__VA_ARGS__))
