#include "engage/commenter.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#include <unistd.h>

#include <opencv2/imgcodecs.hpp>

#include "engage/common.hpp"

namespace engage {
namespace {

std::filesystem::path scratchFile(const std::string& scratchDir)
{
    static std::atomic<unsigned> sequence{0};
    std::filesystem::path directory;
    if (scratchDir.empty()) {
        std::error_code ec;
        directory = std::filesystem::temp_directory_path(ec);
        if (ec) {
            directory = "/tmp";
        }
    } else {
        directory = scratchDir;
    }
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    std::ostringstream name;
    name << "engage_comment_" << ::getpid() << '_' << ticks << '_' << sequence.fetch_add(1) << ".png";
    return directory / name.str();
}

// Removes the scratch frame on scope exit.
struct ScratchGuard {
    std::filesystem::path path;
    ~ScratchGuard() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

}  // namespace

std::string cleanReply(const std::string& raw)
{
    std::string reply = trim(raw);
    if (reply.size() >= 2) {
        char first = reply.front();
        char last = reply.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            reply = trim(reply.substr(1, reply.size() - 2));
        }
    }
    return reply;
}

CommandCommenter::CommandCommenter(std::string command, std::string scratch_dir)
    : command_(std::move(command)), scratch_dir_(std::move(scratch_dir))
{
    if (trim(command_).empty()) {
        throw std::invalid_argument("Commenter command must not be empty");
    }
}

std::optional<std::string> CommandCommenter::describeAndComment(const cv::Mat& frame,
                                                                const std::string& persona)
{
    if (frame.empty()) {
        return std::nullopt;
    }

    ScratchGuard scratch{scratchFile(scratch_dir_)};
    try {
        if (!cv::imwrite(scratch.path.string(), frame)) {
            std::cerr << "[Commenter] cannot write " << scratch.path << std::endl;
            return std::nullopt;
        }
    } catch (const cv::Exception& ex) {
        std::cerr << "[Commenter] cannot write " << scratch.path << ": " << ex.what() << std::endl;
        return std::nullopt;
    }

    std::string command = command_ + " " + shellQuote(scratch.path.string()) + " " + shellQuote(persona);
    ProcessResult result = runProcess(command);
    if (result.exit_status != 0) {
        std::cerr << "[Commenter] command exited with " << result.exit_status << std::endl;
        return std::nullopt;
    }

    std::string reply = cleanReply(result.output);
    if (reply.empty()) {
        std::cerr << "[Commenter] command produced no reply" << std::endl;
        return std::nullopt;
    }
    return reply;
}

}  // namespace engage
