#include <gtest/gtest.h>

#include "test_volumes.hpp"
#include "volume/errors.hpp"
#include "volume/volume.hpp"

#include <cstdint>
#include <set>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

using namespace medslice;
using medslice::testing_support::coordinate_volume;
using medslice::testing_support::encode_coord;
using medslice::testing_support::to_le_bytes;

namespace {

using Triple = std::tuple<uint16_t, size_t, size_t>; // value, x, y

std::vector<Triple> collect(const Frame& frame) {
    std::vector<Triple> out;
    for (const FrameElement e : frame) out.emplace_back(e.voxel().value(), e.x(), e.y());
    return out;
}

constexpr size_t kX = 4;
constexpr size_t kY = 3;
constexpr size_t kZ = 5;

class CoordinateVolumeTest : public ::testing::Test {
protected:
    CoordinateVolumeTest()
        : data_(coordinate_volume(kX, kY, kZ)),
          volume_(Volume::open(VolumeMetadata(kX, kY, kZ), data_)) {}

    std::vector<uint8_t> data_;
    Volume volume_;
};

} // namespace

// =============================================================================
// End-to-end 2x2x2 scenario
// =============================================================================

class TinyVolumeTest : public ::testing::Test {
protected:
    TinyVolumeTest()
        : data_(to_le_bytes({0, 1, 2, 3, 4, 5, 6, 7})),
          volume_(Volume::open(VolumeMetadata::parse("DimSize = 2 2 2"), data_)) {}

    std::vector<uint8_t> data_;
    Volume volume_;
};

TEST_F(TinyVolumeTest, ZFrames) {
    EXPECT_EQ(collect(volume_.zframe(0)),
              (std::vector<Triple>{{0, 0, 0}, {1, 1, 0}, {2, 0, 1}, {3, 1, 1}}));
    EXPECT_EQ(collect(volume_.zframe(1)),
              (std::vector<Triple>{{4, 0, 0}, {5, 1, 0}, {6, 0, 1}, {7, 1, 1}}));
}

TEST_F(TinyVolumeTest, YFramesWalkZBackwards) {
    EXPECT_EQ(collect(volume_.yframe(0)),
              (std::vector<Triple>{{4, 0, 0}, {5, 1, 0}, {0, 0, 1}, {1, 1, 1}}));
    EXPECT_EQ(collect(volume_.yframe(1)),
              (std::vector<Triple>{{6, 0, 0}, {7, 1, 0}, {2, 0, 1}, {3, 1, 1}}));
}

TEST_F(TinyVolumeTest, XFramesWalkZBackwards) {
    EXPECT_EQ(collect(volume_.xframe(0)),
              (std::vector<Triple>{{4, 0, 0}, {6, 1, 0}, {0, 0, 1}, {2, 1, 1}}));
    EXPECT_EQ(collect(volume_.xframe(1)),
              (std::vector<Triple>{{5, 0, 0}, {7, 1, 0}, {1, 0, 1}, {3, 1, 1}}));
}

// =============================================================================
// Traversal order on a coordinate-encoded volume
// =============================================================================

TEST_F(CoordinateVolumeTest, ZFrameShapeAndValues) {
    for (size_t k = 0; k < kZ; ++k) {
        const Frame frame = volume_.zframe(k);
        EXPECT_EQ(frame.axis(), Axis::Z);
        EXPECT_EQ(frame.index(), k);
        EXPECT_EQ(frame.width(), kX);
        EXPECT_EQ(frame.height(), kY);
        ASSERT_EQ(frame.size(), kX * kY);

        size_t i = 0;
        for (const FrameElement e : frame) {
            EXPECT_EQ(e.x(), i % kX);
            EXPECT_EQ(e.y(), i / kX);
            EXPECT_EQ(e.voxel().value(), encode_coord(e.x(), e.y(), k, kX, kY));
            ++i;
        }
        EXPECT_EQ(i, kX * kY);
    }
}

TEST_F(CoordinateVolumeTest, YFrameShapeAndValues) {
    for (size_t k = 0; k < kY; ++k) {
        const Frame frame = volume_.yframe(k);
        EXPECT_EQ(frame.width(), kX);
        EXPECT_EQ(frame.height(), kZ);
        ASSERT_EQ(frame.size(), kX * kZ);

        size_t i = 0;
        for (const FrameElement e : frame) {
            EXPECT_EQ(e.x(), i % kX);
            EXPECT_EQ(e.y(), i / kX);
            // frame row 0 is the last Z-frame
            const size_t z = kZ - 1 - e.y();
            EXPECT_EQ(e.voxel().value(), encode_coord(e.x(), k, z, kX, kY));
            ++i;
        }
        EXPECT_EQ(i, kX * kZ);
    }
}

TEST_F(CoordinateVolumeTest, XFrameShapeAndValues) {
    for (size_t k = 0; k < kX; ++k) {
        const Frame frame = volume_.xframe(k);
        EXPECT_EQ(frame.width(), kY);
        EXPECT_EQ(frame.height(), kZ);
        ASSERT_EQ(frame.size(), kY * kZ);

        size_t i = 0;
        for (const FrameElement e : frame) {
            EXPECT_EQ(e.x(), i % kY);
            EXPECT_EQ(e.y(), i / kY);
            const size_t z = kZ - 1 - e.y();
            EXPECT_EQ(e.voxel().value(), encode_coord(k, e.x(), z, kX, kY));
            ++i;
        }
        EXPECT_EQ(i, kY * kZ);
    }
}

TEST_F(CoordinateVolumeTest, EveryFramePositionVisitedOnce) {
    for (Axis axis : {Axis::X, Axis::Y, Axis::Z}) {
        const Frame frame = volume_.frame(axis, 1);
        std::set<std::pair<size_t, size_t>> seen;
        for (const FrameElement e : frame) {
            ASSERT_LT(e.x(), frame.width());
            ASSERT_LT(e.y(), frame.height());
            EXPECT_TRUE(seen.emplace(e.x(), e.y()).second) << axis_name(axis);
        }
        EXPECT_EQ(seen.size(), frame.size()) << axis_name(axis);
    }
}

TEST_F(CoordinateVolumeTest, ByteOffsetStrides) {
    const size_t row_bytes = kX * 2;
    const size_t zframe_bytes = kX * kY * 2;

    const Frame z = volume_.zframe(2);
    EXPECT_EQ(z.byte_offset(0), 2 * zframe_bytes);
    EXPECT_EQ(z.byte_offset(1) - z.byte_offset(0), 2u);

    // rows are contiguous, consecutive Z-frames step backwards
    const Frame y = volume_.yframe(1);
    EXPECT_EQ(y.byte_offset(0), (kZ - 1) * zframe_bytes + row_bytes);
    EXPECT_EQ(y.byte_offset(1) - y.byte_offset(0), 2u);
    EXPECT_EQ(y.byte_offset(0) - y.byte_offset(kX), zframe_bytes);

    // columns step a full row per element
    const Frame x = volume_.xframe(3);
    EXPECT_EQ(x.byte_offset(0), (kZ - 1) * zframe_bytes + 3 * 2);
    EXPECT_EQ(x.byte_offset(1) - x.byte_offset(0), row_bytes);
    EXPECT_EQ(x.byte_offset(0) - x.byte_offset(kY), zframe_bytes);
}

TEST_F(CoordinateVolumeTest, FramesAreIndependent) {
    const auto expected_x = collect(volume_.xframe(2));
    const auto expected_y = collect(volume_.yframe(1));

    // interleave two traversals
    const Frame x = volume_.xframe(2);
    const Frame y = volume_.yframe(1);
    auto xi = x.begin();
    auto yi = y.begin();
    std::vector<Triple> got_x, got_y;
    while (xi != x.end() || yi != y.end()) {
        if (xi != x.end()) {
            const FrameElement e = *xi++;
            got_x.emplace_back(e.voxel().value(), e.x(), e.y());
        }
        if (yi != y.end()) {
            const FrameElement e = *yi;
            ++yi;
            got_y.emplace_back(e.voxel().value(), e.x(), e.y());
        }
    }
    EXPECT_EQ(got_x, expected_x);
    EXPECT_EQ(got_y, expected_y);
    EXPECT_EQ(collect(volume_.xframe(2)), expected_x);
}

TEST_F(CoordinateVolumeTest, IteratorOutlivesTemporaryFrame) {
    auto it = volume_.zframe(1).begin();
    const FrameElement e = *it;
    EXPECT_EQ(e.voxel().value(), encode_coord(0, 0, 1, kX, kY));
}

TEST_F(CoordinateVolumeTest, ConcurrentExtraction) {
    const auto expected = collect(volume_.xframe(1));

    std::vector<std::vector<Triple>> results(4);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < results.size(); ++t) {
        threads.emplace_back([this, t, &results]() { results[t] = collect(volume_.xframe(1)); });
    }
    for (auto& th : threads) th.join();

    for (const auto& r : results) EXPECT_EQ(r, expected);
}

// =============================================================================
// Lazy value validation
// =============================================================================

TEST(FrameLazinessTest, BadSampleOnlyFailsItsOwnElement) {
    // zframe(0) of a 3x1x1 volume: 1, 0xFFFF, 3
    const auto data = to_le_bytes({1, 0xFFFF, 3});
    const auto volume = Volume::open(VolumeMetadata(3, 1, 1), data);

    auto it = volume.zframe(0).begin();
    EXPECT_EQ((*it).voxel().value(), 1);
    ++it;
    try {
        (*it).voxel();
        FAIL() << "expected VoxelValueOutOfRange";
    } catch (const VoxelValueOutOfRange& e) {
        EXPECT_EQ(e.value(), 0xFFFF);
    }
    EXPECT_EQ((*it).x(), 1u);
    ++it;
    EXPECT_EQ((*it).voxel().value(), 3);
}

TEST(FrameLazinessTest, PartialConsumptionNeverSeesLaterBadSample) {
    std::vector<uint16_t> samples(16, 100);
    samples.back() = 4096;
    const auto data = to_le_bytes(samples);
    const auto volume = Volume::open(VolumeMetadata(4, 4, 1), data);

    const Frame frame = volume.zframe(0);
    size_t consumed = 0;
    for (const FrameElement e : frame) {
        EXPECT_NO_THROW(e.voxel());
        if (++consumed == 8) break;
    }
    EXPECT_EQ(consumed, 8u);

    size_t failures = 0;
    for (const FrameElement e : frame) {
        try {
            e.voxel();
        } catch (const VoxelValueOutOfRange&) {
            ++failures;
        }
    }
    EXPECT_EQ(failures, 1u);
}

TEST(FrameLazinessTest, EmptyFrameYieldsNothing) {
    const std::vector<uint8_t> empty;
    const auto volume = Volume::open(VolumeMetadata(0, 3, 2), empty);
    const Frame frame = volume.yframe(0);
    EXPECT_EQ(frame.size(), 0u);
    EXPECT_TRUE(frame.begin() == frame.end());
}
