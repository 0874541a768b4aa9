#ifndef PYVAL_LOGGER_H_
#define PYVAL_LOGGER_H_

#include <filesystem>

// Make the default logger safe to use in forked children
void InitLogger();
// Add a file sink next to the console one
bool LogToFile(const std::filesystem::path&);

#endif  // PYVAL_LOGGER_H_
