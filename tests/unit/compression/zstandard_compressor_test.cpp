#include <cstring>
#include <random>
#include <vector>
#include <gtest/gtest.h>
#include <mvsearch/compression/compressor_interface.h>

using namespace mvsearch;
using namespace mvsearch::compression;

class ZstandardCompressorTest : public ::testing::Test {
protected:
    void SetUp() override {
        compressor_ = createCompressor(CompressionAlgorithm::Zstandard);
        ASSERT_NE(compressor_, nullptr);
    }

    // Generate test data patterns
    std::vector<std::byte> generateTestData(size_t size, int pattern) {
        std::vector<std::byte> data(size);

        switch (pattern) {
            case 0: // All zeros (highly compressible)
                std::fill(data.begin(), data.end(), std::byte{0});
                break;

            case 1: // Random data (incompressible)
            {
                std::mt19937 gen(1234);
                std::uniform_int_distribution<> dis(0, 255);
                for (auto& b : data) {
                    b = std::byte{static_cast<uint8_t>(dis(gen))};
                }
            } break;

            case 2: // Embedding-like: quantized floats with repetition
            {
                std::vector<float> floats(size / sizeof(float));
                for (size_t i = 0; i < floats.size(); ++i) {
                    floats[i] = static_cast<float>(i % 16) * 0.125f;
                }
                std::memcpy(data.data(), floats.data(), floats.size() * sizeof(float));
            } break;
        }

        return data;
    }

    std::unique_ptr<ICompressor> compressor_;
};

TEST(CompressorFactoryTest, NoneYieldsNoCompressor) {
    EXPECT_EQ(createCompressor(CompressionAlgorithm::None), nullptr);
}

TEST_F(ZstandardCompressorTest, CompressEmptyData) {
    std::vector<std::byte> empty;

    auto result = compressor_->compress(empty);
    ASSERT_TRUE(result.has_value());

    const auto& compressed = result.value();
    EXPECT_EQ(compressed.algorithm, CompressionAlgorithm::Zstandard);
    EXPECT_EQ(compressed.originalSize, 0u);

    auto decompressed = compressor_->decompress(compressed.data);
    ASSERT_TRUE(decompressed.has_value());
    EXPECT_TRUE(decompressed.value().empty());
}

TEST_F(ZstandardCompressorTest, EmbeddingBytesRoundTrip) {
    auto data = generateTestData(384 * sizeof(float), 2);

    auto result = compressor_->compress(data);
    ASSERT_TRUE(result.has_value());
    EXPECT_LT(result.value().compressedSize, data.size());
    EXPECT_GT(result.value().ratio(), 1.0);

    auto decompressed = compressor_->decompress(result.value().data, data.size());
    ASSERT_TRUE(decompressed.has_value());
    EXPECT_EQ(decompressed.value(), data);
}

TEST_F(ZstandardCompressorTest, DecompressWithoutSizeHint) {
    auto data = generateTestData(4096, 0);

    auto result = compressor_->compress(data);
    ASSERT_TRUE(result.has_value());

    auto decompressed = compressor_->decompress(result.value().data);
    ASSERT_TRUE(decompressed.has_value());
    EXPECT_EQ(decompressed.value(), data);
}

TEST_F(ZstandardCompressorTest, CompressionLevels) {
    auto data = generateTestData(16384, 2);

    for (uint8_t level : {1, 3, 9, 19}) {
        auto result = compressor_->compress(data, level);
        ASSERT_TRUE(result.has_value()) << "Level " << static_cast<int>(level);
        EXPECT_EQ(result.value().level, level);
    }

    auto defaultLevel = compressor_->compress(data, 0);
    ASSERT_TRUE(defaultLevel.has_value());
    EXPECT_GT(defaultLevel.value().level, 0);
}

TEST_F(ZstandardCompressorTest, InvalidLevelRejected) {
    auto data = generateTestData(128, 0);
    auto result = compressor_->compress(data, 23);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ZstandardCompressorTest, IncompressibleData) {
    auto data = generateTestData(8192, 1);

    auto result = compressor_->compress(data);
    ASSERT_TRUE(result.has_value());
    EXPECT_GE(result.value().compressedSize, data.size() / 2);

    auto decompressed = compressor_->decompress(result.value().data, data.size());
    ASSERT_TRUE(decompressed.has_value());
    EXPECT_EQ(decompressed.value(), data);
}

TEST_F(ZstandardCompressorTest, DecompressCorruptedData) {
    auto data = generateTestData(1024, 1);

    auto result = compressor_->decompress(data);
    EXPECT_FALSE(result.has_value());
}
