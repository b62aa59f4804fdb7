#include <gtest/gtest.h>
#include <brush/pixmap.hpp>
#include <cstring>
#include <vector>

using namespace brush;

// --- PixmapInfo ---

TEST(PixmapInfo, Make) {
    auto info = PixmapInfo::Make(100, 200, PixelFormat::RGBA16Float);
    EXPECT_EQ(info.width, 100);
    EXPECT_EQ(info.height, 200);
    EXPECT_EQ(info.stride, 100 * 8);
    EXPECT_EQ(info.format, PixelFormat::RGBA16Float);
}

TEST(PixmapInfo, MakeRGBA) {
    auto info = PixmapInfo::MakeRGBA(64, 32);
    EXPECT_EQ(info.format, PixelFormat::RGBA8Unorm);
    EXPECT_EQ(info.stride, 64 * 4);
}

TEST(PixmapInfo, ComputeByteSize) {
    auto info = PixmapInfo::Make(10, 20, PixelFormat::RGBA32Float);
    // stride = 10 * 16 = 160, byteSize = 160 * 20 = 3200
    EXPECT_EQ(info.computeByteSize(), 3200);
}

TEST(PixmapInfo, BytesPerPixelOfUnsupportedFormat) {
    EXPECT_EQ(PixmapInfo::Make(4, 4, PixelFormat::R8Unorm).bytesPerPixel(), 0);
}

// --- Pixmap::Alloc ---

TEST(Pixmap, AllocCreatesZeroedPixmap) {
    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(16, 16));
    ASSERT_TRUE(pm.valid());
    EXPECT_EQ(pm.width(), 16);
    EXPECT_EQ(pm.stride(), 16 * 4);
    for (i32 i = 0; i < 16 * 16 * 4; ++i) {
        EXPECT_EQ(pm.addr8()[i], 0);
    }
}

TEST(Pixmap, AllocRejectsBadInfo) {
    EXPECT_FALSE(Pixmap::Alloc(PixmapInfo::MakeRGBA(0, 16)).valid());
    EXPECT_FALSE(Pixmap::Alloc(PixmapInfo::MakeRGBA(16, 0)).valid());
    EXPECT_FALSE(Pixmap::Alloc(PixmapInfo::Make(4, 4, PixelFormat::Depth32Float)).valid());
}

TEST(Pixmap, AllocWidensShortStride) {
    PixmapInfo info = PixmapInfo::MakeRGBA(8, 2);
    info.stride = 3;
    auto pm = Pixmap::Alloc(info);
    EXPECT_EQ(pm.stride(), 32);
}

// --- Texel access ---

TEST(Pixmap, ReadWritePixel) {
    auto pm = Pixmap::Alloc(PixmapInfo::Make(4, 4, PixelFormat::RGBA32Float));
    LinearColor c{0.25f, 0.5f, 0.75f, 1.0f};
    pm.writePixel(2, 3, c);
    EXPECT_EQ(pm.readPixel(2, 3), c);
    EXPECT_EQ(pm.readPixel(0, 0), (LinearColor{0, 0, 0, 0}));
}

TEST(Pixmap, ClearFillsEveryTexel) {
    auto pm = Pixmap::Alloc(PixmapInfo::Make(3, 2, PixelFormat::RGBA16Float));
    pm.clear({1, 0, 0, 1});
    for (i32 y = 0; y < 2; ++y) {
        for (i32 x = 0; x < 3; ++x) {
            EXPECT_EQ(pm.readPixel(x, y), (LinearColor{1, 0, 0, 1}));
        }
    }
}

TEST(Pixmap, PixelAddrHonoursStride) {
    PixmapInfo info = PixmapInfo::MakeRGBA(2, 2);
    info.stride = 16;
    auto pm = Pixmap::Alloc(info);
    EXPECT_EQ(pm.pixelAddr(1, 1) - pm.addr8(), 16 + 4);
}

// --- Wrap ---

TEST(Pixmap, WrapDoesNotOwn) {
    std::vector<u8> storage(2 * 2 * 4, 0);
    {
        auto pm = Pixmap::Wrap(PixmapInfo::MakeRGBA(2, 2), storage.data());
        pm.writePixel(1, 0, {1, 1, 1, 1});
    }
    EXPECT_EQ(storage[4], 255);
    EXPECT_EQ(storage[7], 255);
}

// --- Ownership ---

TEST(Pixmap, MoveTransfersOwnership) {
    auto a = Pixmap::Alloc(PixmapInfo::MakeRGBA(4, 4));
    void* pixels = a.addr();
    Pixmap b(std::move(a));
    EXPECT_FALSE(a.valid());
    EXPECT_EQ(b.addr(), pixels);

    Pixmap c;
    c = std::move(b);
    EXPECT_EQ(c.addr(), pixels);
    EXPECT_FALSE(b.valid());
}

TEST(Pixmap, ReallocateZeroes) {
    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(2, 2));
    pm.clear(Color::white());
    pm.reallocate(PixmapInfo::MakeRGBA(5, 3));
    ASSERT_TRUE(pm.valid());
    EXPECT_EQ(pm.width(), 5);
    EXPECT_EQ(pm.readPixel(4, 2), (LinearColor{0, 0, 0, 0}));
}

TEST(Pixmap, ResetReleases) {
    auto pm = Pixmap::Alloc(PixmapInfo::MakeRGBA(2, 2));
    pm.reset();
    EXPECT_FALSE(pm.valid());
    EXPECT_EQ(pm.addr(), nullptr);
}
