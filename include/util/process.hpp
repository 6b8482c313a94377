#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace shrine::util {

struct ProcessResult {
    int exit_code = -1;
    std::string output;     // stdout and stderr, interleaved
};

// fork/execvp with the working directory set to cwd; 127 when the binary is missing
ProcessResult runProcess(const std::vector<std::string>& argv, const std::filesystem::path& cwd);

}
