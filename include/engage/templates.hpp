#pragma once

#include <map>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace engage {

// Names of the controls the actions look for.
namespace controls {
inline constexpr const char* kLikeButton = "like_button";
inline constexpr const char* kCommentButton = "comment_button";
inline constexpr const char* kRetweetButton = "retweet_button";
inline constexpr const char* kRepostOption = "repost_option";
inline constexpr const char* kFollowButton = "follow_button";
}  // namespace controls

inline constexpr double kDefaultThreshold = 0.65;

struct ReferenceTemplate {
    std::string name;
    std::string path;
    cv::Mat image;
    double threshold = kDefaultThreshold;
};

class TemplateLibrary {
public:
    TemplateLibrary() = default;

    // Reads a YAML manifest:
    //
    //   default_threshold: 0.65
    //   templates:
    //     - name: like_button
    //       path: template_like_button.png
    //       threshold: 0.7
    //
    // Relative image paths resolve against the manifest's directory. Throws
    // std::runtime_error for a malformed manifest and ImageLoadError for an
    // unreadable image.
    static TemplateLibrary loadManifest(const std::string& path);

    void add(ReferenceTemplate tmpl);

    bool contains(const std::string& name) const;
    const ReferenceTemplate& at(const std::string& name) const;
    std::vector<std::string> names() const;
    std::size_t size() const { return templates_.size(); }

private:
    std::map<std::string, ReferenceTemplate> templates_;
};

}  // namespace engage
