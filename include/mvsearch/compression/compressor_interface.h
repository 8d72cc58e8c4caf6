#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>
#include <mvsearch/core/types.h>

namespace mvsearch::compression {

/**
 * @brief Supported compression algorithms
 */
enum class CompressionAlgorithm : uint8_t {
    None = 0,      ///< No compression
    Zstandard = 1, ///< Zstandard (fast, good ratio)
};

/**
 * @brief Result of a compression operation
 */
struct CompressionResult {
    std::vector<std::byte> data;             ///< Compressed data
    size_t originalSize = 0;                 ///< Size before compression
    size_t compressedSize = 0;               ///< Size after compression
    CompressionAlgorithm algorithm = CompressionAlgorithm::None;
    uint8_t level = 0;                       ///< Compression level used
    std::chrono::microseconds duration{0};   ///< Time taken

    /**
     * @brief Ratio of original to compressed size
     */
    [[nodiscard]] double ratio() const noexcept {
        return compressedSize > 0 ? static_cast<double>(originalSize) / compressedSize : 0.0;
    }
};

/**
 * @brief Abstract interface for compression algorithms
 */
class ICompressor {
public:
    virtual ~ICompressor() = default;

    /**
     * @brief Compress data
     * @param data Input data to compress
     * @param level Compression level (0 = default for algorithm)
     */
    [[nodiscard]] virtual Result<CompressionResult> compress(std::span<const std::byte> data,
                                                             uint8_t level = 0) = 0;

    /**
     * @brief Decompress data
     * @param data Compressed data
     * @param expectedSize Expected uncompressed size (hint for allocation)
     */
    [[nodiscard]] virtual Result<std::vector<std::byte>> decompress(std::span<const std::byte> data,
                                                                    size_t expectedSize = 0) = 0;
};

/**
 * @brief Create a compressor for the given algorithm
 * @return nullptr for CompressionAlgorithm::None
 */
std::unique_ptr<ICompressor> createCompressor(CompressionAlgorithm algorithm);

} // namespace mvsearch::compression
