#include "image_matcher.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace marionette {
namespace vision {

namespace {
    // Both images as 8-bit, same channel count: gray if either side is gray
    void harmonize(const cv::Mat& image, const cv::Mat& templ, cv::Mat& imageOut, cv::Mat& templOut) {
        auto toBgrOrGray = [](const cv::Mat& in, bool gray) {
            cv::Mat out;
            if (gray) {
                if (in.channels() == 3) cv::cvtColor(in, out, cv::COLOR_BGR2GRAY);
                else if (in.channels() == 4) cv::cvtColor(in, out, cv::COLOR_BGRA2GRAY);
                else out = in;
            } else {
                if (in.channels() == 4) cv::cvtColor(in, out, cv::COLOR_BGRA2BGR);
                else out = in;
            }
            if (out.depth() != CV_8U) {
                cv::Mat converted;
                out.convertTo(converted, CV_8U);
                out = converted;
            }
            return out;
        };

        bool gray = image.channels() == 1 || templ.channels() == 1;
        imageOut = toBgrOrGray(image, gray);
        templOut = toBgrOrGray(templ, gray);
    }

    bool isFlat(const cv::Mat& templ) {
        cv::Scalar mean, stddev;
        cv::meanStdDev(templ, mean, stddev);
        for (int c = 0; c < templ.channels(); ++c) {
            if (stddev[c] > 1e-6) return false;
        }
        return true;
    }

    // Confidence map in [0, 1], one entry per top-left position
    cv::Mat confidenceMap(const cv::Mat& image, const cv::Mat& templ) {
        cv::Mat scores;
        if (isFlat(templ)) {
            // Mean squared difference per sample, as an 8-bit rms distance
            cv::matchTemplate(image, templ, scores, cv::TM_SQDIFF);
            double samples = static_cast<double>(templ.total()) * templ.channels();
            cv::max(scores, 0.0, scores);
            scores = scores / samples;
            cv::sqrt(scores, scores);
            scores = 1.0 - scores / 255.0;
        } else {
            cv::matchTemplate(image, templ, scores, cv::TM_CCOEFF_NORMED);
            cv::patchNaNs(scores, 0.0);
        }
        cv::threshold(scores, scores, 1.0, 1.0, cv::THRESH_TRUNC);
        cv::threshold(scores, scores, 0.0, 0.0, cv::THRESH_TOZERO);
        return scores;
    }

    cv::Mat scaled(const cv::Mat& templ, double factor) {
        if (std::abs(factor - 1.0) < 1e-9) {
            return templ;
        }
        cv::Mat out;
        cv::resize(templ, out, cv::Size(), factor, factor,
                   factor < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR);
        return out;
    }

    const float SUPPRESSED = -1.0f;

    bool rowMajorBefore(const ocal::Rectangle& a, const ocal::Rectangle& b) {
        return a.y != b.y ? a.y < b.y : a.x < b.x;
    }

    bool overlaps(const ocal::Rectangle& a, const ocal::Rectangle& b) {
        return !a.intersect(b).empty();
    }
}

std::string MatchResult::toString() const {
    std::ostringstream ss;
    ss << (found ? "found" : "not found") << " " << templatePath << " at " << bounds.toString()
       << " confidence=" << confidence << " scale=" << scale;
    return ss.str();
}

ImageMatcher::ImageMatcher(double defaultSimilarity, std::vector<double> scaleFactors)
    : m_defaultSimilarity(defaultSimilarity), m_scaleFactors(std::move(scaleFactors)) {
    if (m_defaultSimilarity < 0.0 || m_defaultSimilarity > 1.0) {
        throw ImageMatchError("Default similarity must be within [0, 1]",
                              std::to_string(m_defaultSimilarity));
    }
    m_scaleFactors.erase(std::remove_if(m_scaleFactors.begin(), m_scaleFactors.end(),
                                        [](double f) { return !(f > 0.0); }),
                         m_scaleFactors.end());
    if (m_scaleFactors.empty()) {
        m_scaleFactors.push_back(1.0);
    }
}

double ImageMatcher::resolveThreshold(const Template& templ, std::optional<double> minSimilarity) const {
    double threshold = minSimilarity ? *minSimilarity
                                     : templ.similarityOverride.value_or(m_defaultSimilarity);
    if (threshold < 0.0 || threshold > 1.0) {
        throw ImageMatchError("Similarity threshold must be within [0, 1]",
                              std::to_string(threshold), templ.path);
    }
    return threshold;
}

MatchResult ImageMatcher::findBestMatch(const cv::Mat& screenshot, const Template& templ,
                                        std::optional<double> minSimilarity) const {
    if (screenshot.empty()) {
        throw ImageMatchError("Screenshot is empty", "", templ.path);
    }
    if (templ.image.empty()) {
        throw ImageMatchError("Template image is empty", "", templ.path);
    }
    double threshold = resolveThreshold(templ, minSimilarity);

    SCOPED_TIMER("image_match");

    cv::Mat image, base;
    harmonize(screenshot, templ.image, image, base);

    MatchResult best;
    best.templatePath = templ.path;
    bool anyScaleFits = false;
    bool haveCandidate = false;

    for (double factor : m_scaleFactors) {
        cv::Mat candidate = scaled(base, factor);
        if (candidate.empty() || candidate.cols > image.cols || candidate.rows > image.rows) {
            continue;
        }
        anyScaleFits = true;

        cv::Mat scores = confidenceMap(image, candidate);
        double minVal = 0.0, maxVal = 0.0;
        cv::Point minLoc, maxLoc;
        cv::minMaxLoc(scores, &minVal, &maxVal, &minLoc, &maxLoc);

        // Strictly greater: the earlier scale keeps a tie
        if (!haveCandidate || maxVal > best.confidence) {
            haveCandidate = true;
            best.confidence = maxVal;
            best.bounds = ocal::Rectangle(maxLoc.x, maxLoc.y, candidate.cols, candidate.rows);
            best.scale = factor;
        }
    }

    if (!anyScaleFits) {
        SLOG_DEBUG().message("Template larger than screenshot at every scale")
            .context("template", templ.path);
        return best;
    }

    best.found = best.confidence >= threshold;

    SLOG_DEBUG().message("Template match evaluated")
        .context("template", templ.path)
        .context("found", best.found)
        .context("confidence", best.confidence)
        .context("threshold", threshold)
        .context("scale", best.scale);
    return best;
}

std::vector<MatchResult> ImageMatcher::findAll(const cv::Mat& screenshot, const Template& templ,
                                               std::optional<double> minSimilarity,
                                               size_t maxMatches) const {
    if (screenshot.empty()) {
        throw ImageMatchError("Screenshot is empty", "", templ.path);
    }
    if (templ.image.empty()) {
        throw ImageMatchError("Template image is empty", "", templ.path);
    }
    double threshold = resolveThreshold(templ, minSimilarity);

    SCOPED_TIMER("image_match_all");

    cv::Mat image, base;
    harmonize(screenshot, templ.image, image, base);

    std::vector<MatchResult> candidates;
    for (double factor : m_scaleFactors) {
        cv::Mat candidate = scaled(base, factor);
        if (candidate.empty() || candidate.cols > image.cols || candidate.rows > image.rows) {
            continue;
        }

        // Take the peak, then blank every top-left whose window would overlap it.
        // minMaxLoc reports the first peak in row-major order.
        cv::Mat scores = confidenceMap(image, candidate);
        const cv::Rect all(0, 0, scores.cols, scores.rows);
        for (size_t taken = 0; taken < maxMatches; ++taken) {
            double maxVal = 0.0;
            cv::Point maxLoc;
            cv::minMaxLoc(scores, nullptr, &maxVal, nullptr, &maxLoc);
            if (maxVal < threshold) {
                break;
            }

            MatchResult match;
            match.found = true;
            match.bounds = ocal::Rectangle(maxLoc.x, maxLoc.y, candidate.cols, candidate.rows);
            match.confidence = maxVal;
            match.scale = factor;
            candidates.push_back(match);

            cv::Rect overlapping(maxLoc.x - candidate.cols + 1, maxLoc.y - candidate.rows + 1,
                                 2 * candidate.cols - 1, 2 * candidate.rows - 1);
            scores(overlapping & all).setTo(SUPPRESSED);
        }
    }

    // Merge the scales; stable_sort keeps scale order between equal scores at the same position
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const MatchResult& a, const MatchResult& b) {
                         if (a.confidence != b.confidence) return a.confidence > b.confidence;
                         return rowMajorBefore(a.bounds, b.bounds);
                     });

    std::vector<MatchResult> accepted;
    for (const auto& candidate : candidates) {
        if (accepted.size() >= maxMatches) {
            break;
        }
        bool suppressed = std::any_of(accepted.begin(), accepted.end(),
                                      [&candidate](const MatchResult& kept) {
                                          return overlaps(kept.bounds, candidate.bounds);
                                      });
        if (!suppressed) {
            accepted.push_back(candidate);
            accepted.back().templatePath = templ.path;
        }
    }

    SLOG_DEBUG().message("Template occurrences collected")
        .context("template", templ.path)
        .context("matches", accepted.size())
        .context("limit", maxMatches)
        .context("threshold", threshold);
    return accepted;
}

MatchResult ImageMatcher::findInRegion(const cv::Mat& screenshot, const Template& templ,
                                       const ocal::Rectangle& region,
                                       std::optional<double> minSimilarity) const {
    if (screenshot.empty()) {
        throw ImageMatchError("Screenshot is empty", "", templ.path);
    }
    ocal::Rectangle clipped = region.intersect(ocal::Rectangle(0, 0, screenshot.cols, screenshot.rows));
    if (clipped.empty()) {
        throw ImageMatchError("Search region lies outside the screenshot", region.toString(), templ.path);
    }

    // ROI view, no copy
    MatchResult result = findBestMatch(screenshot(clipped.toCvRect()), templ, minSimilarity);
    result.bounds.x += clipped.x;
    result.bounds.y += clipped.y;
    return result;
}

double ImageMatcher::compare(const cv::Mat& imageA, const cv::Mat& imageB) const {
    if (imageA.empty() || imageB.empty()) {
        throw ImageMatchError("Cannot compare an empty image");
    }
    if (imageA.size() != imageB.size()) {
        throw ImageMatchError("Compared images differ in size",
                              std::to_string(imageA.cols) + "x" + std::to_string(imageA.rows) + " vs " +
                              std::to_string(imageB.cols) + "x" + std::to_string(imageB.rows));
    }

    cv::Mat a, b;
    harmonize(imageA, imageB, a, b);
    cv::Mat scores = confidenceMap(a, b);
    return static_cast<double>(scores.at<float>(0, 0));
}

} // namespace vision
} // namespace marionette
