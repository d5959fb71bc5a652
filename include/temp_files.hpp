#pragma once

#include <string>

namespace dictate {

// Random hex token for temporary file names
std::string make_token();

// $TMPDIR or /tmp
std::string temp_directory();

// <dir>/<prefix><token><suffix>
std::string make_temp_path(const std::string& dir, const std::string& prefix, const std::string& suffix);

bool file_exists(const std::string& path);

// Removes the file if present; failures are logged under `tag`
void remove_file(const std::string& path, const char* tag);

} // namespace dictate
