#ifndef UTILS_H_
#define UTILS_H_

#include <string>
#include <filesystem>

#include <pyval/utils.h>

namespace fs = std::filesystem;

// close every descriptor >= minfd; used in forked children before exec
int CloseFrom(int minfd);

void ReplaceAll(std::string& str, const std::string& from, const std::string& to);
// remove every occurrence of the given characters
std::string StripChars(const std::string& str, const char* chars);

bool CreateDirs(const fs::path&);

#endif  // UTILS_H_
