#ifndef PYVAL_UTILS_H_
#define PYVAL_UTILS_H_

#include <ctime>
#include <string>
#include <vector>

#include "exec.h"

extern const char kVersionString[];

const char* ExitStatusName(ExitStatus);

std::vector<std::string> SplitString(const std::string&, char delim);
// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> ParseCommaArgs(const std::string&);
std::string Trim(const std::string&, const char* chars = " \t\r\n");
// Cut at most max_bytes without splitting a UTF-8 sequence
std::string Utf8Cut(const std::string&, size_t max_bytes);

bool ParseTrue(const std::string&);
bool ParseFalse(const std::string&);

// 59 -> "59s", 3661 -> "1h:1m:1s"; label = false gives "1:1:1"
std::string TimeFromSecs(long secs, bool label = true);
// "Wednesday, February 5 2014 1:05:06pm"
std::string HumanTime(std::time_t t, bool short_names = false);

#endif  // PYVAL_UTILS_H_
