#pragma once

#include <filesystem>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>

#include "Common.hpp"

namespace DupFinder
{

/**
 * @brief Turns encoded image bytes into a 64-bit perceptual fingerprint (DCT pHash).
 *
 * Visually near-identical images (re-encoded, resized, recompressed) map to
 * fingerprints a few bits apart; unrelated images differ in roughly half of
 * the bits. All methods are pure.
 */
class FingerprintExtractor {
public:
    /**
     * @brief Decodes `bytes` (format sniffed from content) and fingerprints the image.
     * @throws ExtractionError if no decoder accepts the bytes.
     */
    static Fingerprint extract(const std::vector<unsigned char>& bytes);

    /**
     * @brief Same as extract(), but returns std::nullopt for undecodable input.
     */
    static std::optional<Fingerprint> tryExtract(const std::vector<unsigned char>& bytes);

    /**
     * @brief Reads a file from disk and fingerprints it.
     * @return std::nullopt if the file cannot be read or is not an image.
     */
    static std::optional<Fingerprint> extractFile(const std::filesystem::path& path);

    /**
     * @brief Fingerprints an already decoded image (gray, BGR or BGRA, 8-bit).
     */
    static Fingerprint fromImage(const cv::Mat& image);

private:
    static constexpr int DCT_SIZE = 32;
    static constexpr int HASH_SIDE = 8;
    static constexpr int BLUR_KERNEL = 7;

    static Fingerprint computePerceptualHash(const cv::Mat& gray);
};

} // namespace DupFinder
