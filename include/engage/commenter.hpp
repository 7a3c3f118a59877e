#pragma once

#include <string>

#include "engage/device.hpp"

namespace engage {

// Delegates reply generation to an external program. The program is called
// as `<command> <frame.png> <persona>` and its trimmed stdout is the reply.
class CommandCommenter : public Commenter {
public:
    explicit CommandCommenter(std::string command, std::string scratch_dir = {});

    std::optional<std::string> describeAndComment(const cv::Mat& frame,
                                                  const std::string& persona) override;

private:
    std::string command_;
    std::string scratch_dir_;
};

// Strips whitespace and one pair of surrounding quotes.
std::string cleanReply(const std::string& raw);

}  // namespace engage
