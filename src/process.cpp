#include "process.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#ifdef _WIN32
#define popen _popen
#define pclose _pclose
#else
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace {

// Scratch file the child's stderr is redirected into; removed on scope exit.
class StderrCapture {
public:
    StderrCapture() {
#ifdef _WIN32
        char* name = _tempnam(nullptr, "wifiwatch");
        if (!name) {
            throw std::runtime_error("cannot create stderr capture file");
        }
        path_ = name;
        std::free(name);
#else
        char name[] = "/tmp/wifiwatch-stderr-XXXXXX";
        int fd = mkstemp(name);
        if (fd == -1) {
            throw std::runtime_error(std::string("cannot create stderr capture file: ") + std::strerror(errno));
        }
        close(fd);
        path_ = name;
#endif
    }

    ~StderrCapture() { std::remove(path_.c_str()); }

    StderrCapture(const StderrCapture&) = delete;
    StderrCapture& operator=(const StderrCapture&) = delete;

    std::string wrap(const std::string& commandLine) const {
#ifdef _WIN32
        return "(" + commandLine + ") 2>\"" + path_ + "\"";
#else
        return "{ " + commandLine + "\n} 2>'" + path_ + "'";
#endif
    }

    std::string contents() const {
        std::ifstream file(path_);
        std::ostringstream text;
        text << file.rdbuf();
        return text.str();
    }

private:
    std::string path_;
};

}

CommandResult runCommand(const std::string& commandLine) {
    spdlog::debug("[Process] exec: {}", commandLine);

    StderrCapture stderrCapture;
    FILE* pipe = popen(stderrCapture.wrap(commandLine).c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("failed to start '" + commandLine + "': " + std::strerror(errno));
    }

    CommandResult result;
    std::array<char, 512> buffer;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe);
#ifdef _WIN32
    result.exitCode = status;
#else
    if (status == -1) {
        result.exitCode = -1;
    } else {
        result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
#endif
    result.errorOutput = stderrCapture.contents();

    if (result.exitCode != 0) {
        spdlog::debug("[Process] '{}' exited with code {}", commandLine, result.exitCode);
    } else if (!result.errorOutput.empty()) {
        spdlog::debug("[Process] '{}' wrote to stderr: {}", commandLine, result.errorOutput);
    }
    return result;
}
