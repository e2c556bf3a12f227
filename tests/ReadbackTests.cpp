#include "DeviceFixture.hpp"

#include <gtest/gtest.h>

namespace surfbridge
{

TEST_F(DeviceTest, ReadSurfacePixelsTopDown)
{
  Size const size(3, 4);
  auto surface = CreateTextureSurface(*m_context, size);
  ASSERT_TRUE(surface);
  fake::State().m_packAlignment = 8;

  SurfacePixels pixels;
  ASSERT_EQ(m_device->ReadSurfacePixels(*m_context, *surface, pixels), ErrorCode::Ok);

  EXPECT_EQ(pixels.m_size, size);
  EXPECT_EQ(pixels.m_stride, 12u);
  ASSERT_EQ(pixels.m_data.size(), 48u);

  // The fake fills GL row r (from the bottom) with red = r, green = x.
  for (int32_t y = 0; y < size.m_height; ++y)
  {
    for (int32_t x = 0; x < size.m_width; ++x)
    {
      uint8_t const * pixel = pixels.m_data.data() + y * pixels.m_stride + x * 4;
      EXPECT_EQ(pixel[0], static_cast<uint8_t>(size.m_height - 1 - y));
      EXPECT_EQ(pixel[1], static_cast<uint8_t>(x));
      EXPECT_EQ(pixel[3], 0xff);
    }
  }

  auto const & state = fake::State();
  EXPECT_TRUE(state.m_readWhileLocked);
  EXPECT_EQ(state.m_readFramebuffer, static_cast<GLint>(surface->GetFramebuffer()));
  EXPECT_EQ(state.m_readPackAlignment, 1);
  EXPECT_EQ(state.m_packAlignment, 8);
  EXPECT_EQ(state.m_boundFramebuffer, 0);
  EXPECT_EQ(state.CountLocked(), 0u);
  EXPECT_TRUE(state.m_current.IsNull());

  EXPECT_EQ(m_device->DestroySurface(*m_context, std::move(surface)), ErrorCode::Ok);
}

TEST_F(DeviceTest, ReadSurfacePixelsFromForeignContext)
{
  auto other = CreateContext();
  ASSERT_TRUE(other);
  auto surface = CreateTextureSurface(*m_context, Size(4, 4));
  ASSERT_TRUE(surface);

  SurfacePixels pixels;
  EXPECT_EQ(m_device->ReadSurfacePixels(*other, *surface, pixels), ErrorCode::IncompatibleSurface);
  EXPECT_TRUE(pixels.m_data.empty());

  EXPECT_EQ(m_device->DestroySurface(*m_context, std::move(surface)), ErrorCode::Ok);
  m_device->DestroyContext(std::move(other));
}

TEST_F(DeviceTest, ReadWidgetSurfaceIsUnimplemented)
{
  WindowHandle const window = reinterpret_cast<WindowHandle>(0x5150);
  fake::State().m_windows[window] = Size(10, 10);
  auto surface = CreateWidgetSurface(*m_context, window);
  ASSERT_TRUE(surface);

  SurfacePixels pixels;
  EXPECT_EQ(m_device->ReadSurfacePixels(*m_context, *surface, pixels), ErrorCode::Unimplemented);

  EXPECT_EQ(m_device->DestroySurface(*m_context, std::move(surface)), ErrorCode::Ok);
}

}  // namespace surfbridge
