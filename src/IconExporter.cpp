#include "IconExporter.hpp"
#include "ImageOps.hpp"
#include "CompositionEngine.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

using namespace cv;
using namespace std;

namespace IconForge {

const vector<int>& IconExporter::windowsSizes() {
    static const vector<int> sizes = {16, 32, 48, 256};
    return sizes;
}

const vector<int>& IconExporter::macSizes() {
    static const vector<int> sizes = {16, 32, 64, 128, 256, 512, 1024};
    return sizes;
}

const vector<int>& IconExporter::webSizes() {
    static const vector<int> sizes = {100};
    return sizes;
}

const vector<int>& IconExporter::allSizes() {
    static const vector<int> sizes = [] {
        vector<int> merged;
        for (const auto* preset : {&windowsSizes(), &macSizes(), &webSizes()}) {
            merged.insert(merged.end(), preset->begin(), preset->end());
        }
        sort(merged.begin(), merged.end());
        merged.erase(unique(merged.begin(), merged.end()), merged.end());
        return merged;
    }();
    return sizes;
}

optional<UnsharpParams> IconExporter::sharpenParamsForSize(int size) {
    if (size <= 32) {
        return UnsharpParams{0.5, 150, 2};
    }
    if (size <= 64) {
        return UnsharpParams{0.5, 100, 3};
    }
    return nullopt;
}

Mat IconExporter::renderSize(const Mat& master, int size) {
    if (size <= 0) {
        throw invalid_argument("Export size must be positive, got " + to_string(size));
    }

    Mat square = ImageOps::ensureRGBA(master);
    if (square.empty()) {
        return Mat(size, size, CV_8UC4, Scalar::all(0));
    }
    if (square.cols != square.rows) {
        square = CompositionEngine::placeCentered(square, std::max(square.cols, square.rows));
    }

    Mat resized = ImageOps::resizeRGBA(square, Size(size, size));
    if (auto sharpen = sharpenParamsForSize(size)) {
        resized = ImageOps::unsharpMask(resized, sharpen->radius, sharpen->percent, sharpen->threshold);
    }
    return resized;
}

Mat IconExporter::binaryAlpha(const Mat& rgba) {
    if (!ImageOps::isRGBA(rgba)) {
        return rgba.clone();
    }
    Mat alpha = ImageOps::extractAlpha(rgba);
    threshold(alpha, alpha, 127, 255, THRESH_BINARY);
    return ImageOps::replaceAlpha(rgba, alpha);
}

ExportResult IconExporter::exportSizes(const Mat& master, const ExportOptions& options,
                                       const atomic<bool>* cancelFlag) {
    const vector<int>& sizes = options.sizes.empty() ? allSizes() : options.sizes;
    for (int size : sizes) {
        if (size <= 0) {
            throw invalid_argument("Export size must be positive, got " + to_string(size));
        }
    }

    ExportResult result;
    if (sizes.empty()) {
        return result;
    }

    auto isCancelled = [cancelFlag]() {
        return cancelFlag && cancelFlag->load(memory_order_relaxed);
    };

    unsigned int workerCount = options.threadLimit > 0 ? options.threadLimit : thread::hardware_concurrency();
    if (workerCount == 0) {
        workerCount = 1;
    }
    workerCount = std::min<unsigned int>(workerCount, static_cast<unsigned int>(sizes.size()));

    if (options.verboseOutput) {
        cout << "[INFO] Exporting " << sizes.size() << " sizes on " << workerCount << " worker(s)" << endl;
    }

    // One slot per size; a slot is only marked done once its image is complete
    vector<Mat> rendered(sizes.size());
    vector<Mat> renderedBinary(sizes.size());
    vector<char> done(sizes.size(), 0);

    atomic<size_t> nextIndex{0};
    atomic<bool> failed{false};
    mutex errorMutex;
    string firstError;

    auto work = [&]() {
        while (!failed.load(memory_order_relaxed) && !isCancelled()) {
            size_t idx = nextIndex.fetch_add(1, memory_order_relaxed);
            if (idx >= sizes.size()) {
                break;
            }
            try {
                Mat image = renderSize(master, sizes[idx]);
                Mat hard = options.binaryAlpha ? binaryAlpha(image) : Mat();
                if (isCancelled()) {
                    break;
                }
                rendered[idx] = std::move(image);
                renderedBinary[idx] = std::move(hard);
                done[idx] = 1;
            } catch (const exception& e) {
                {
                    scoped_lock lock(errorMutex);
                    if (firstError.empty()) {
                        firstError = "Size " + to_string(sizes[idx]) + ": " + e.what();
                    }
                }
                failed.store(true, memory_order_relaxed);
                break;
            }
        }
    };

    if (workerCount == 1) {
        work();
    } else {
        vector<thread> workers;
        workers.reserve(workerCount);
        for (unsigned int i = 0; i < workerCount; ++i) {
            workers.emplace_back(work);
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    if (failed.load(memory_order_relaxed)) {
        throw runtime_error(firstError.empty() ? "Failed to render icon size" : firstError);
    }

    for (size_t i = 0; i < sizes.size(); i++) {
        if (!done[i]) {
            continue;
        }
        result.images[sizes[i]] = rendered[i];
        if (options.binaryAlpha) {
            result.binaryAlphaImages[sizes[i]] = renderedBinary[i];
        }
    }
    result.cancelled = isCancelled() && result.images.size() < sizes.size();

    if (options.verboseOutput) {
        cout << "[INFO] Exported " << result.images.size() << " of " << sizes.size() << " sizes"
             << (result.cancelled ? " (cancelled)" : "") << endl;
    }
    return result;
}

} // namespace IconForge
