#include "DeviceFixture.hpp"

#include <gtest/gtest.h>

namespace surfbridge
{

namespace
{
WindowHandle const kWindow = reinterpret_cast<WindowHandle>(0xABC0);
}  // namespace

TEST_F(DeviceTest, SurfaceTextureRoundTrip)
{
  auto consumer = CreateContext();
  ASSERT_TRUE(consumer);

  auto surface = CreateTextureSurface(*m_context, Size(128, 64));
  ASSERT_TRUE(surface);
  Size const size = surface->GetSize();
  SurfaceID const id = surface->GetId();
  ContextID const contextId = surface->GetContextId();

  std::unique_ptr<SurfaceTexture> surfaceTexture;
  ASSERT_EQ(m_device->CreateSurfaceTexture(*consumer, std::move(surface), surfaceTexture), ErrorCode::Ok);
  ASSERT_TRUE(surfaceTexture);
  EXPECT_FALSE(surface);
  EXPECT_NE(surfaceTexture->GetTextureName(), 0u);
  EXPECT_EQ(surfaceTexture->GetSurface().GetId(), id);

  auto const & state = fake::State();
  // A second, read-only registration that stays locked while the wrapper lives.
  ASSERT_EQ(state.m_registrations.size(), 2u);
  size_t readOnly = 0;
  for (auto const & entry : state.m_registrations)
  {
    if (entry.second.m_access == static_cast<GLenum>(kInteropAccessReadOnly))
    {
      ++readOnly;
      EXPECT_TRUE(entry.second.m_locked);
      EXPECT_EQ(entry.second.m_glName, surfaceTexture->GetTextureName());
    }
  }
  EXPECT_EQ(readOnly, 1u);
  EXPECT_EQ(state.m_liveTextures.size(), 2u);

  EXPECT_EQ(state.m_texParameters.at(GL_TEXTURE_MAG_FILTER), GL_LINEAR);
  EXPECT_EQ(state.m_texParameters.at(GL_TEXTURE_MIN_FILTER), GL_LINEAR);
  EXPECT_EQ(state.m_texParameters.at(GL_TEXTURE_WRAP_S), GL_CLAMP_TO_EDGE);
  EXPECT_EQ(state.m_texParameters.at(GL_TEXTURE_WRAP_T), GL_CLAMP_TO_EDGE);
  EXPECT_EQ(state.m_boundTexture, 0);
  EXPECT_TRUE(state.m_current.IsNull());

  ASSERT_EQ(m_device->DestroySurfaceTexture(*consumer, std::move(surfaceTexture), surface), ErrorCode::Ok);
  ASSERT_TRUE(surface);
  EXPECT_EQ(surface->GetSize(), size);
  EXPECT_EQ(surface->GetId(), id);
  EXPECT_EQ(surface->GetContextId(), contextId);

  EXPECT_EQ(state.m_registrations.size(), 1u);
  EXPECT_EQ(state.m_liveTextures.size(), 1u);
  EXPECT_EQ(state.m_crossContextDeletes, 0);

  EXPECT_EQ(m_device->DestroySurface(*m_context, std::move(surface)), ErrorCode::Ok);
  EXPECT_TRUE(state.m_textures.empty());
  EXPECT_EQ(state.m_crossContextDeletes, 0);

  m_device->DestroyContext(std::move(consumer));
}

TEST_F(DeviceTest, SurfaceTextureInCreatingContext)
{
  auto surface = CreateTextureSurface(*m_context, Size(16, 16));
  ASSERT_TRUE(surface);

  std::unique_ptr<SurfaceTexture> surfaceTexture;
  ASSERT_EQ(m_device->CreateSurfaceTexture(*m_context, std::move(surface), surfaceTexture), ErrorCode::Ok);

  // The producer's own registration is independent of the sampling one.
  m_device->LockSurface(surfaceTexture->GetSurface());
  m_device->UnlockSurface(surfaceTexture->GetSurface());

  ASSERT_EQ(m_device->DestroySurfaceTexture(*m_context, std::move(surfaceTexture), surface), ErrorCode::Ok);
  EXPECT_EQ(m_device->DestroySurface(*m_context, std::move(surface)), ErrorCode::Ok);
}

TEST_F(DeviceTest, SurfaceTextureDestroyedInOtherContextIsIncompatible)
{
  auto consumer = CreateContext();
  ASSERT_TRUE(consumer);

  auto surface = CreateTextureSurface(*m_context, Size(16, 16));
  ASSERT_TRUE(surface);

  std::unique_ptr<SurfaceTexture> surfaceTexture;
  ASSERT_EQ(m_device->CreateSurfaceTexture(*consumer, std::move(surface), surfaceTexture), ErrorCode::Ok);
  EXPECT_EQ(surfaceTexture->GetContextId(), consumer->GetId());
  size_t const textures = fake::State().m_textures.size();

  EXPECT_EQ(m_device->DestroySurfaceTexture(*m_context, std::move(surfaceTexture), surface),
            ErrorCode::IncompatibleSurface);
  EXPECT_FALSE(surface);

  // Nothing is released from the wrong context: both registrations and textures leak.
  auto const & state = fake::State();
  EXPECT_EQ(state.m_crossContextDeletes, 0);
  EXPECT_EQ(state.m_textures.size(), textures);
  EXPECT_EQ(state.m_registrations.size(), 2u);
  EXPECT_EQ(state.CountLocked(), 1u);

  m_device->DestroyContext(std::move(consumer));
}

TEST_F(DeviceTest, SurfaceTextureCreateMakeCurrentFailure)
{
  auto surface = CreateTextureSurface(*m_context, Size(16, 16));
  ASSERT_TRUE(surface);

  fake::State().m_failMakeCurrent = true;
  std::unique_ptr<SurfaceTexture> surfaceTexture;
  Error const error = m_device->CreateSurfaceTexture(*m_context, std::move(surface), surfaceTexture);
  EXPECT_EQ(error, ErrorCode::MakeCurrentFailed);
  EXPECT_EQ(error.GetNativeError(), static_cast<uint32_t>(fake::kErrorInvalidPixelFormat));
  // The surface was consumed and reclaimed without aborting.
  EXPECT_FALSE(surface);
  EXPECT_FALSE(surfaceTexture);
  EXPECT_EQ(fake::State().m_registrations.size(), 1u);
  fake::State().m_failMakeCurrent = false;
}

TEST_F(DeviceTest, SurfaceTextureDestroyMakeCurrentFailure)
{
  auto surface = CreateTextureSurface(*m_context, Size(16, 16));
  ASSERT_TRUE(surface);

  std::unique_ptr<SurfaceTexture> surfaceTexture;
  ASSERT_EQ(m_device->CreateSurfaceTexture(*m_context, std::move(surface), surfaceTexture), ErrorCode::Ok);

  fake::State().m_failMakeCurrent = true;
  Error const error = m_device->DestroySurfaceTexture(*m_context, std::move(surfaceTexture), surface);
  EXPECT_EQ(error, ErrorCode::MakeCurrentFailed);
  EXPECT_FALSE(surfaceTexture);
  EXPECT_FALSE(surface);
  // The sampling registration stays locked and leaks with the surface.
  EXPECT_EQ(fake::State().CountLocked(), 1u);
  fake::State().m_failMakeCurrent = false;
}

TEST_F(DeviceTest, SurfaceTextureOfWidgetFails)
{
  fake::State().m_windows[kWindow] = Size(100, 100);
  auto surface = CreateWidgetSurface(*m_context, kWindow);
  ASSERT_TRUE(surface);

  std::unique_ptr<SurfaceTexture> surfaceTexture;
  EXPECT_EQ(m_device->CreateSurfaceTexture(*m_context, std::move(surface), surfaceTexture),
            ErrorCode::WidgetAttached);
  EXPECT_FALSE(surfaceTexture);
  EXPECT_FALSE(surface);
}

TEST_F(DeviceTest, SurfaceTextureImportFailure)
{
  auto surface = CreateTextureSurface(*m_context, Size(16, 16));
  ASSERT_TRUE(surface);

  fake::State().m_failOpenTexture = true;
  std::unique_ptr<SurfaceTexture> surfaceTexture;
  EXPECT_EQ(m_device->CreateSurfaceTexture(*m_context, std::move(surface), surfaceTexture),
            ErrorCode::SurfaceImportFailed);
  EXPECT_FALSE(surfaceTexture);
  EXPECT_FALSE(surface);
  EXPECT_TRUE(fake::State().m_current.IsNull());
}

TEST_F(DeviceTest, SurfaceTextureRegistrationFailure)
{
  auto surface = CreateTextureSurface(*m_context, Size(16, 16));
  ASSERT_TRUE(surface);
  size_t const textures = fake::State().m_textures.size();

  fake::State().m_failRegister = true;
  std::unique_ptr<SurfaceTexture> surfaceTexture;
  Error const error = m_device->CreateSurfaceTexture(*m_context, std::move(surface), surfaceTexture);
  EXPECT_EQ(error, ErrorCode::SurfaceImportFailed);
  EXPECT_EQ(error.GetNativeError(), static_cast<uint32_t>(fake::kErrorInvalidData));

  // The sampling texture is released, the consumed surface's objects are leaked.
  EXPECT_EQ(fake::State().m_textures.size(), textures);
  EXPECT_EQ(fake::State().m_registrations.size(), 1u);
}

}  // namespace surfbridge
