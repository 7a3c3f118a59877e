#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "engage/json.hpp"
#include "engage/templates.hpp"

namespace engage {

enum class SelectionPolicy {
    Topmost,            // smallest y; the post's own control sits above reply controls
    HighestConfidence,  // best match wins; menu options whose position varies
};

const char* toString(SelectionPolicy policy);

struct Candidate {
    int x = 0;
    int y = 0;
    double confidence = 0.0;
};

struct LocateResult {
    bool found = false;
    int x = 0;
    int y = 0;
    // Confidence of the selected candidate when found, otherwise the best
    // confidence observed anywhere on the correlation surface.
    double confidence = 0.0;
    std::size_t candidate_count = 0;

    static LocateResult Found(int x, int y, double confidence, std::size_t count);
    static LocateResult NotFound(double best_confidence);

    bool operator==(const LocateResult& other) const;
    bool operator!=(const LocateResult& other) const { return !(*this == other); }
};

Json toJson(const LocateResult& result);

struct LocatorOptions {
    int dedup_radius = 50;
    bool grayscale = false;
};

// Collapses candidates whose vertical centers are closer than `radius`.
// Candidates are visited top to bottom; the first one of a cluster is kept.
std::vector<Candidate> deduplicateCandidates(std::vector<Candidate> candidates, int radius);

// Throws std::invalid_argument on an empty set.
const Candidate& selectCandidate(const std::vector<Candidate>& distinct, SelectionPolicy policy);

// Normalized cross-correlation search of `tmpl` over `frame`. Pure; throws
// ImageLoadError for a frame or template that cannot be matched.
LocateResult locate(const cv::Mat& frame,
                    const ReferenceTemplate& tmpl,
                    SelectionPolicy policy,
                    const LocatorOptions& options = {});

class Locator {
public:
    virtual ~Locator() = default;

    virtual LocateResult locate(const cv::Mat& frame,
                                const std::string& control,
                                SelectionPolicy policy) const = 0;
};

// Locator backed by a loaded template library. Immutable after
// construction, so one instance can serve concurrent actions.
class TemplateLocator : public Locator {
public:
    TemplateLocator(TemplateLibrary library, LocatorOptions options);

    LocateResult locate(const cv::Mat& frame,
                        const std::string& control,
                        SelectionPolicy policy) const override;

    const TemplateLibrary& library() const { return library_; }
    const LocatorOptions& options() const { return options_; }

private:
    TemplateLibrary library_;
    LocatorOptions options_;
};

}  // namespace engage
