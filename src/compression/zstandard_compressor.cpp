#include "zstandard_compressor.h"

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <chrono>
#include <mutex>
#include <zstd.h>

namespace mvsearch::compression {

namespace {
constexpr uint8_t DEFAULT_COMPRESSION_LEVEL = 3;

/**
 * @brief Convert Zstandard error to Result error
 */
[[nodiscard]] Error makeZstdError(const char* operation, size_t code) {
    return Error{ErrorCode::CompressionError,
                 fmt::format("{} failed: {}", operation, ZSTD_getErrorName(code))};
}
} // namespace

//-----------------------------------------------------------------------------
// ZstandardCompressor::Impl
//-----------------------------------------------------------------------------

class ZstandardCompressor::Impl {
public:
    Impl() {
        cctx.reset(ZSTD_createCCtx());
        if (!cctx) {
            spdlog::error("Failed to create Zstandard compression context");
        }

        dctx.reset(ZSTD_createDCtx());
        if (!dctx) {
            spdlog::error("Failed to create Zstandard decompression context");
        }
    }

    [[nodiscard]] Result<CompressionResult> compress(std::span<const std::byte> data,
                                                     uint8_t level) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!cctx) {
            return Error{ErrorCode::InvalidState, "Compression context not initialized"};
        }

        if (level == 0) {
            level = DEFAULT_COMPRESSION_LEVEL;
        }

        if (level < 1 || level > 22) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Invalid compression level: {}", level)};
        }

        const size_t maxSize = ZSTD_compressBound(data.size());
        std::vector<std::byte> compressed(maxSize);

        auto start = std::chrono::steady_clock::now();

        const size_t result = ZSTD_compressCCtx(cctx.get(), compressed.data(), compressed.size(),
                                                data.data(), data.size(), level);

        if (ZSTD_isError(result)) {
            return makeZstdError("ZSTD_compressCCtx", result);
        }

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);

        compressed.resize(result);

        CompressionResult compResult;
        compResult.data = std::move(compressed);
        compResult.algorithm = CompressionAlgorithm::Zstandard;
        compResult.level = level;
        compResult.originalSize = data.size();
        compResult.compressedSize = result;
        compResult.duration = duration;

        spdlog::trace("Zstandard compressed {} bytes to {} bytes in {}us", data.size(), result,
                      duration.count());

        return compResult;
    }

    [[nodiscard]] Result<std::vector<std::byte>> decompress(std::span<const std::byte> data,
                                                            size_t expectedSize) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!dctx) {
            return Error{ErrorCode::InvalidState, "Decompression context not initialized"};
        }

        size_t decompressedSize = expectedSize;
        if (decompressedSize == 0) {
            const unsigned long long frameSize =
                ZSTD_getFrameContentSize(data.data(), data.size());
            if (frameSize == ZSTD_CONTENTSIZE_ERROR) {
                return Error{ErrorCode::InvalidData, "Not a valid Zstandard frame"};
            }
            decompressedSize = frameSize == ZSTD_CONTENTSIZE_UNKNOWN
                                   ? data.size() * 4
                                   : static_cast<size_t>(frameSize);
        }

        std::vector<std::byte> decompressed(decompressedSize);

        const size_t result = ZSTD_decompressDCtx(dctx.get(), decompressed.data(),
                                                  decompressed.size(), data.data(), data.size());

        if (ZSTD_isError(result)) {
            return makeZstdError("ZSTD_decompressDCtx", result);
        }

        decompressed.resize(result);
        return decompressed;
    }

    std::mutex mutex;
    std::unique_ptr<ZSTD_CCtx, decltype(&ZSTD_freeCCtx)> cctx{nullptr, &ZSTD_freeCCtx};
    std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> dctx{nullptr, &ZSTD_freeDCtx};
};

//-----------------------------------------------------------------------------
// ZstandardCompressor
//-----------------------------------------------------------------------------

ZstandardCompressor::ZstandardCompressor() : pImpl(std::make_unique<Impl>()) {}

ZstandardCompressor::~ZstandardCompressor() = default;

Result<CompressionResult> ZstandardCompressor::compress(std::span<const std::byte> data,
                                                        uint8_t level) {
    return pImpl->compress(data, level);
}

Result<std::vector<std::byte>> ZstandardCompressor::decompress(std::span<const std::byte> data,
                                                               size_t expectedSize) {
    return pImpl->decompress(data, expectedSize);
}

std::unique_ptr<ICompressor> createCompressor(CompressionAlgorithm algorithm) {
    switch (algorithm) {
        case CompressionAlgorithm::Zstandard:
            return std::make_unique<ZstandardCompressor>();
        case CompressionAlgorithm::None:
            return nullptr;
    }
    return nullptr;
}

} // namespace mvsearch::compression
