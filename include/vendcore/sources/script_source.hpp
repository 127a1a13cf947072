#pragma once

#include "../command_source.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace vendcore::sources {

namespace fs = std::filesystem;

// Follows a JSON-lines file and emits one request per appended line.
// Blank lines and lines starting with '#' are skipped.
class ScriptSource : public PollingCommandSource {
public:
    ScriptSource(std::string name, std::string path, std::chrono::milliseconds interval)
        : PollingCommandSource(std::move(name), interval)
        , path_(std::move(path))
        , offset_(0) {}

    ~ScriptSource() override {
        disconnect();
    }

    // Returns the number of requests emitted. A partial last line is left
    // for the next call.
    std::size_t read_new_lines() {
        std::error_code ec;
        if (!fs::exists(path_, ec)) {
            return 0;
        }

        auto size = fs::file_size(path_, ec);
        if (ec) {
            VENDCORE_LOG_COMPONENT("script", warn, "Source '{}' cannot stat {}: {}", name(), path_, ec.message());
            return 0;
        }
        if (size < offset_) {
            VENDCORE_LOG_COMPONENT("script", info, "Source '{}': {} was truncated, reading from the start", name(), path_);
            offset_ = 0;
        }
        if (size == offset_) {
            return 0;
        }

        std::ifstream file(path_, std::ios::binary);
        if (!file.is_open()) {
            VENDCORE_LOG_COMPONENT("script", warn, "Source '{}' cannot open {}", name(), path_);
            return 0;
        }
        file.seekg(static_cast<std::streamoff>(offset_));

        std::size_t emitted = 0;
        std::string line;
        while (std::getline(file, line)) {
            if (file.eof()) {
                break;
            }
            offset_ += line.size() + 1;
            if (emit_line(line)) {
                ++emitted;
            }
        }
        return emitted;
    }

    const std::string& path() const { return path_; }

protected:
    void poll() override {
        read_new_lines();
    }

private:
    bool emit_line(const std::string& line) {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            return false;
        }

        json request;
        try {
            request = json::parse(line);
        } catch (const json::parse_error& e) {
            VENDCORE_LOG_COMPONENT("script", error, "Source '{}' skipped unparsable line '{}': {}", name(), line, e.what());
            return false;
        }
        emit(request);
        return true;
    }

    std::string path_;
    std::uintmax_t offset_;
};

} // namespace vendcore::sources
