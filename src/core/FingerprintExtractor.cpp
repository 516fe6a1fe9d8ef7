#include "FingerprintExtractor.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "../utils/Log.hpp"

namespace fs = std::filesystem;

namespace DupFinder
{

Fingerprint FingerprintExtractor::extract(const std::vector<unsigned char>& bytes) {
    if (bytes.empty()) {
        throw ExtractionError("empty input");
    }

    cv::Mat image;
    try {
        // imdecode picks the codec from the signature bytes, never from a name or MIME type.
        // Decoding to BGR keeps the gray conversion identical for every codec.
        image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw ExtractionError(e.what());
    }

    if (image.empty()) {
        throw ExtractionError("no decoder accepted " + std::to_string(bytes.size()) + " bytes");
    }
    return fromImage(image);
}

std::optional<Fingerprint> FingerprintExtractor::tryExtract(const std::vector<unsigned char>& bytes) {
    try {
        return extract(bytes);
    } catch (const ExtractionError& e) {
        Log::debug(e.what());
        return std::nullopt;
    }
}

std::optional<Fingerprint> FingerprintExtractor::extractFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        Log::debug("Cannot open " + path.string());
        return std::nullopt;
    }

    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(file)),
                                     std::istreambuf_iterator<char>());
    return tryExtract(bytes);
}

Fingerprint FingerprintExtractor::fromImage(const cv::Mat& image) {
    if (image.empty()) {
        throw ExtractionError("empty image");
    }

    cv::Mat gray;
    try {
        if (image.channels() == 4) {
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
        } else if (image.channels() == 3) {
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
        } else {
            gray = image;
        }
        if (gray.depth() != CV_8U) {
            gray.convertTo(gray, CV_8U);
        }
    } catch (const cv::Exception& e) {
        throw ExtractionError(e.what());
    }
    return computePerceptualHash(gray);
}

Fingerprint FingerprintExtractor::computePerceptualHash(const cv::Mat& gray) {
    // 1. Smooth out compression noise, 2. shrink to the DCT input size
    cv::Mat blurred;
    cv::blur(gray, blurred, cv::Size(BLUR_KERNEL, BLUR_KERNEL));

    cv::Mat resized;
    cv::resize(blurred, resized, cv::Size(DCT_SIZE, DCT_SIZE), 0, 0, cv::INTER_AREA);

    cv::Mat samples;
    resized.convertTo(samples, CV_32F);

    // 3. DCT, 4. keep the low frequencies without the DC row/column
    cv::Mat spectrum;
    cv::dct(samples, spectrum);
    cv::Mat lowFreq = spectrum(cv::Rect(1, 1, HASH_SIDE, HASH_SIDE)).clone();

    std::vector<float> coeffs(lowFreq.begin<float>(), lowFreq.end<float>());
    if (coeffs.size() != FINGERPRINT_BITS) {
        throw std::logic_error("perceptual hash produced " + std::to_string(coeffs.size()) + " bits");
    }

    // 5. Median of the block
    std::vector<float> sorted = coeffs;
    std::sort(sorted.begin(), sorted.end());
    const size_t mid = sorted.size() / 2;
    const float median = (sorted[mid - 1] + sorted[mid]) / 2.0f;

    // 6. One bit per coefficient, MSB first
    Fingerprint hash = 0;
    for (size_t i = 0; i < coeffs.size(); ++i) {
        if (coeffs[i] > median) {
            hash |= (Fingerprint{1} << (FINGERPRINT_BITS - 1 - i));
        }
    }
    return hash;
}

} // namespace DupFinder
