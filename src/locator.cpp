#include "engage/locator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <opencv2/imgproc.hpp>

#include "engage/common.hpp"

namespace engage {
namespace {

double clampConfidence(double value)
{
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::min(1.0, std::max(0.0, value));
}

cv::Mat toGray(const cv::Mat& image)
{
    if (image.channels() == 1) {
        return image;
    }
    cv::Mat gray;
    cv::cvtColor(image, gray, image.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    return gray;
}

void validate(const cv::Mat& frame, const ReferenceTemplate& tmpl)
{
    if (frame.empty()) {
        throw ImageLoadError("Frame is empty");
    }
    if (tmpl.image.empty()) {
        throw ImageLoadError("Template '" + tmpl.name + "' is empty");
    }
    if (frame.depth() != tmpl.image.depth() ||
        (frame.depth() != CV_8U && frame.depth() != CV_32F)) {
        throw ImageLoadError("Unsupported pixel depth for template '" + tmpl.name + "'");
    }
    for (const cv::Mat* image : {&frame, &tmpl.image}) {
        int channels = image->channels();
        if (channels != 1 && channels != 3 && channels != 4) {
            throw ImageLoadError("Unsupported channel count " + std::to_string(channels) +
                                 " for template '" + tmpl.name + "'");
        }
    }
    if (tmpl.image.cols > frame.cols || tmpl.image.rows > frame.rows) {
        throw ImageLoadError("Template '" + tmpl.name + "' is larger than the frame");
    }
}

}  // namespace

const char* toString(SelectionPolicy policy)
{
    switch (policy) {
    case SelectionPolicy::Topmost: return "topmost";
    case SelectionPolicy::HighestConfidence: return "highest_confidence";
    }
    return "unknown";
}

LocateResult LocateResult::Found(int x, int y, double confidence, std::size_t count)
{
    LocateResult result;
    result.found = true;
    result.x = x;
    result.y = y;
    result.confidence = confidence;
    result.candidate_count = count;
    return result;
}

LocateResult LocateResult::NotFound(double best_confidence)
{
    LocateResult result;
    result.confidence = best_confidence;
    return result;
}

bool LocateResult::operator==(const LocateResult& other) const
{
    return found == other.found && x == other.x && y == other.y &&
           confidence == other.confidence && candidate_count == other.candidate_count;
}

Json toJson(const LocateResult& result)
{
    Json value = Json::object();
    value["success"] = result.found;
    if (result.found) {
        value["x"] = result.x;
        value["y"] = result.y;
    } else {
        value["error"] = "NOT_FOUND";
        value["x"] = nullptr;
        value["y"] = nullptr;
    }
    value["confidence"] = result.confidence;
    value["count"] = static_cast<int>(result.candidate_count);
    return value;
}

std::vector<Candidate> deduplicateCandidates(std::vector<Candidate> candidates, int radius)
{
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.y < b.y; });

    std::vector<Candidate> distinct;
    for (const auto& candidate : candidates) {
        bool duplicate = false;
        for (const auto& kept : distinct) {
            if (std::abs(candidate.y - kept.y) < radius) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            distinct.push_back(candidate);
        }
    }
    return distinct;
}

const Candidate& selectCandidate(const std::vector<Candidate>& distinct, SelectionPolicy policy)
{
    if (distinct.empty()) {
        throw std::invalid_argument("No candidates to select from");
    }
    if (policy == SelectionPolicy::Topmost) {
        return *std::min_element(distinct.begin(), distinct.end(),
                                 [](const Candidate& a, const Candidate& b) { return a.y < b.y; });
    }
    return *std::max_element(distinct.begin(), distinct.end(),
                             [](const Candidate& a, const Candidate& b) {
                                 return a.confidence < b.confidence;
                             });
}

LocateResult locate(const cv::Mat& frame,
                    const ReferenceTemplate& tmpl,
                    SelectionPolicy policy,
                    const LocatorOptions& options)
{
    validate(frame, tmpl);

    cv::Mat image = frame;
    cv::Mat templ = tmpl.image;
    cv::Mat surface;
    try {
        if (options.grayscale || image.channels() != templ.channels()) {
            image = toGray(image);
            templ = toGray(templ);
        }
        cv::matchTemplate(image, templ, surface, cv::TM_CCOEFF_NORMED);
    } catch (const cv::Exception& ex) {
        throw ImageLoadError(std::string("Template matching failed for '") + tmpl.name + "': " + ex.what());
    }
    cv::patchNaNs(surface, 0.0);

    const int halfW = templ.cols / 2;
    const int halfH = templ.rows / 2;

    std::vector<Candidate> candidates;
    double best = 0.0;
    for (int row = 0; row < surface.rows; ++row) {
        const float* line = surface.ptr<float>(row);
        for (int col = 0; col < surface.cols; ++col) {
            double conf = clampConfidence(line[col]);
            best = std::max(best, conf);
            if (conf >= tmpl.threshold) {
                candidates.push_back(Candidate{col + halfW, row + halfH, conf});
            }
        }
    }

    if (candidates.empty()) {
        return LocateResult::NotFound(best);
    }

    std::vector<Candidate> distinct = deduplicateCandidates(std::move(candidates), options.dedup_radius);
    const Candidate& selected = selectCandidate(distinct, policy);
    return LocateResult::Found(selected.x, selected.y, selected.confidence, distinct.size());
}

TemplateLocator::TemplateLocator(TemplateLibrary library, LocatorOptions options)
    : library_(std::move(library)), options_(options) {}

LocateResult TemplateLocator::locate(const cv::Mat& frame,
                                     const std::string& control,
                                     SelectionPolicy policy) const
{
    const ReferenceTemplate& tmpl = library_.at(control);
    LocateResult result = engage::locate(frame, tmpl, policy, options_);
    if (result.found) {
        std::cerr << "[Locator] " << control << " found at (" << result.x << ", " << result.y
                  << ") confidence " << result.confidence << ", " << result.candidate_count
                  << " distinct candidate(s), policy " << toString(policy) << std::endl;
    } else {
        std::cerr << "[Locator] " << control << " not found, best confidence "
                  << result.confidence << " (threshold " << tmpl.threshold << ")" << std::endl;
    }
    return result;
}

}  // namespace engage
