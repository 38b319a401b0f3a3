/**
 * @file command.cpp
 * @brief Shell command helpers
 */

#include "voxserve/command.h"

#include <cstdio>

#ifdef _WIN32
#define VOXSERVE_POPEN _popen
#define VOXSERVE_PCLOSE _pclose
#else
#include <sys/wait.h>
#define VOXSERVE_POPEN popen
#define VOXSERVE_PCLOSE pclose
#endif

namespace voxserve {

std::string shell_quote(const std::string& arg) {
#ifdef _WIN32
    return "\"" + arg + "\"";
#else
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
#endif
}

std::string expand_command(const std::string& templ, const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(templ.size() + 64);
    size_t i = 0;
    while (i < templ.size()) {
        if (templ[i] == '{') {
            size_t close = templ.find('}', i + 1);
            if (close != std::string::npos) {
                auto it = values.find(templ.substr(i + 1, close - i - 1));
                if (it != values.end()) {
                    out += shell_quote(it->second);
                    i = close + 1;
                    continue;
                }
            }
        }
        out += templ[i++];
    }
    return out;
}

int run_command(const std::string& command, std::string& output) {
    FILE* pipe = VOXSERVE_POPEN(command.c_str(), "r");
    if (!pipe) {
        return -1;
    }
    char buffer[4096];
    size_t n;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }
    int status = VOXSERVE_PCLOSE(pipe);
#ifndef _WIN32
    if (status != -1 && WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
#endif
    return status;
}

} // namespace voxserve
