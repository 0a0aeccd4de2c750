#pragma once

#include <opencv2/core.hpp>
#include <atomic>
#include <map>
#include <optional>
#include <vector>

namespace IconForge {

struct UnsharpParams {
    double radius;
    int percent;
    int threshold;
};

struct ExportOptions {
    std::vector<int> sizes;            // empty = every preset size
    unsigned int threadLimit = 0;      // 0 = hardware concurrency
    bool binaryAlpha = false;          // also render hard-alpha variants
    bool verboseOutput = false;
};

struct ExportResult {
    std::map<int, cv::Mat> images;
    std::map<int, cv::Mat> binaryAlphaImages;
    bool cancelled = false;
};

class IconExporter {
public:
    static const std::vector<int>& windowsSizes();
    static const std::vector<int>& macSizes();
    static const std::vector<int>& webSizes();
    static const std::vector<int>& allSizes();

    // Small icons get extra crispness; above 64px the resample is left alone
    static std::optional<UnsharpParams> sharpenParamsForSize(int size);

    // Square the master (transparent pad), resample to size x size, sharpen small sizes
    static cv::Mat renderSize(const cv::Mat& master, int size);

    // alpha >= 128 -> 255, otherwise 0
    static cv::Mat binaryAlpha(const cv::Mat& rgba);

    /**
     * Render every requested size on a bounded worker pool. Each size is an
     * independent resample, so workers only share the work index. When
     * `cancelFlag` becomes true no further size is started and in-flight
     * renders are discarded; completed sizes are still returned.
     *
     * @throws std::invalid_argument for non-positive sizes
     * @throws std::runtime_error when a size fails to render
     */
    static ExportResult exportSizes(const cv::Mat& master, const ExportOptions& options,
                                    const std::atomic<bool>* cancelFlag = nullptr);
};

} // namespace IconForge
