#pragma once

#include <memory>
#include <mvsearch/compression/compressor_interface.h>

namespace mvsearch::compression {

/**
 * @brief Zstandard compression implementation
 *
 * Thread-safe. Contexts are reused across calls and guarded by a mutex.
 */
class ZstandardCompressor final : public ICompressor {
public:
    ZstandardCompressor();
    ~ZstandardCompressor() override;

    [[nodiscard]] Result<CompressionResult> compress(std::span<const std::byte> data,
                                                     uint8_t level = 0) override;

    [[nodiscard]] Result<std::vector<std::byte>> decompress(std::span<const std::byte> data,
                                                            size_t expectedSize = 0) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mvsearch::compression
