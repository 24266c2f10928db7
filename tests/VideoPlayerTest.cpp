/*
 * SyncPlayerCore - An audio/video playback and recording core.
 * Copyright (C) 2025 Kovey <zzwaaa0396@qq.com>
 *
 * This file is part of SyncPlayerCore.
 *
 * SyncPlayerCore is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

// 播放引擎测试：通过 TestFakes.h 中的替身驱动 VideoPlayer

#include "../src/include/VideoPlayer.h"
#include "TestFakes.h"

#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace {

// 线程安全地记录帧回调
class CallbackLog {
 public:
  VideoPlayer::FrameCallback callback()
  {
    return [this](int64_t index, double pts) {
      std::lock_guard<std::mutex> lock(mutex_);
      entries_.emplace_back(index, pts);
    };
  }

  std::vector<std::pair<int64_t, double>> entries() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }

  size_t size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  std::vector<int64_t> indices() const
  {
    std::vector<int64_t> out;
    for (const auto& e : entries()) out.push_back(e.first);
    return out;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::pair<int64_t, double>> entries_;
};

std::unique_ptr<VideoPlayer> makeVideoOnly(int frames, int fps, PlayerConfig config = PlayerConfig())
{
  return std::make_unique<VideoPlayer>(FakeFrameSource::video(frames, fps), nullptr, nullptr, config);
}

}  // namespace

// --- 构造 ---

TEST(VideoPlayerTest, ExposesStreamProperties)
{
  auto player = makeVideoOnly(20, 10);
  EXPECT_DOUBLE_EQ(player->fps(), 10.0);
  EXPECT_DOUBLE_EQ(player->duration(), 2.0);
  EXPECT_EQ(player->width(), 64);
  EXPECT_EQ(player->height(), 48);
  EXPECT_FALSE(player->hasAudio());
  EXPECT_FALSE(player->isPaused());
  EXPECT_FALSE(player->isStopped());
  EXPECT_EQ(player->loopLimit(), 1);
}

TEST(VideoPlayerTest, MissingFileIsSourceError)
{
  EXPECT_THROW(VideoPlayer("/nonexistent/dir/clip.mp4"), SourceError);
}

TEST(VideoPlayerTest, SourceWithoutVideoIsSourceError)
{
  auto video = FakeFrameSource::video(10, 10);
  video->setHasStream(false);
  EXPECT_THROW(VideoPlayer(std::move(video), nullptr, nullptr), SourceError);
}

TEST(VideoPlayerTest, AudioDeviceFailureDegradesWhenTolerated)
{
  PlayerConfig config;
  config.tolerateAudioFailure = true;
  VideoPlayer player(FakeFrameSource::video(10, 10), FakeFrameSource::audio(1.0),
                     std::make_unique<FakeAudioOutput>(false), config);
  EXPECT_FALSE(player.hasAudio());
}

TEST(VideoPlayerTest, AudioDeviceFailureIsDeviceErrorWhenNotTolerated)
{
  PlayerConfig config;
  config.tolerateAudioFailure = false;
  EXPECT_THROW(VideoPlayer(FakeFrameSource::video(10, 10), FakeFrameSource::audio(1.0),
                           std::make_unique<FakeAudioOutput>(false), config),
               DeviceError);
}

TEST(VideoPlayerTest, AudioOutputFollowsSourceChannels)
{
  auto output = std::make_unique<FakeAudioOutput>();
  FakeAudioOutput* out = output.get();
  PlayerConfig config;
  config.frequency = 48000;
  VideoPlayer player(FakeFrameSource::video(10, 10), FakeFrameSource::audio(1.0, 44100, 1),
                     std::move(output), config);
  EXPECT_TRUE(player.hasAudio());
  EXPECT_EQ(out->openedRate(), 48000);
  EXPECT_EQ(out->openedChannels(), 1);
}

TEST(VideoPlayerTest, ConfigValuesAreClamped)
{
  PlayerConfig config;
  config.speed = 100.0;
  config.volume = 3.0;
  config.loop = -4;
  auto player = makeVideoOnly(10, 10, config);
  EXPECT_DOUBLE_EQ(player->speed(), config.maxSpeed);
  EXPECT_DOUBLE_EQ(player->volume(), 1.0);
  EXPECT_EQ(player->loopLimit(), 0);

  player->setPlaybackSpeed(0.0);
  EXPECT_DOUBLE_EQ(player->speed(), config.minSpeed);
  player->setVolume(-1.0);
  EXPECT_DOUBLE_EQ(player->volume(), 0.0);
  player->increaseVolume(0.25);
  EXPECT_DOUBLE_EQ(player->volume(), 0.25);
  player->increasePlaybackSpeed(1.0);
  EXPECT_NEAR(player->speed(), config.minSpeed + 1.0, 1e-9);
}

TEST(VideoPlayerTest, GetFrameBeforeStartIsBlackCanvas)
{
  auto player = makeVideoOnly(10, 10);
  SurfacePtr frame = player->getFrame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(frame->w, 64);
  EXPECT_EQ(frame->h, 48);
  EXPECT_EQ(static_cast<const uint8_t*>(frame->pixels)[0], 0);

  SurfacePtr scaled = player->getFrame(32, 16);
  ASSERT_TRUE(scaled);
  EXPECT_EQ(scaled->w, 32);
  EXPECT_EQ(scaled->h, 16);
}

// --- 生命周期 ---

TEST(VideoPlayerTest, StopIsIdempotent)
{
  auto player = makeVideoOnly(50, 25);
  player->start();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  player->stop();
  EXPECT_TRUE(player->isStopped());
  const int64_t published = player->stats().frames_published;
  const int64_t index = player->currentFrameIndex();

  player->stop();
  EXPECT_TRUE(player->isStopped());
  EXPECT_EQ(player->stats().frames_published, published);
  EXPECT_EQ(player->currentFrameIndex(), index);
}

TEST(VideoPlayerTest, StopWithoutStart)
{
  auto player = makeVideoOnly(10, 10);
  player->stop();
  player->stop();
  EXPECT_TRUE(player->isStopped());
}

TEST(VideoPlayerTest, TransportAfterStopIsNoop)
{
  auto player = makeVideoOnly(10, 10);
  player->start();
  player->stop();

  player->togglePause();
  player->move(0.5);
  player->forwardFrame();
  player->rewind(1.0);
  EXPECT_FALSE(player->isPaused());
  EXPECT_TRUE(player->isStopped());
  EXPECT_TRUE(player->getFrame());
}

TEST(VideoPlayerTest, AudioLessClipEndsOnTime)
{
  // 2 秒、10 fps、无音频
  auto player = makeVideoOnly(20, 10);
  player->start();
  std::this_thread::sleep_for(std::chrono::milliseconds(2500));

  EXPECT_TRUE(player->isStopped());
  const int64_t published = player->stats().frames_published;
  EXPECT_GE(published, 19);
  EXPECT_LE(published, 21);
  EXPECT_EQ(player->videoLoopCount(), 1);
  EXPECT_TRUE(player->lastError().empty());
}

TEST(VideoPlayerTest, LoopTwiceOnThreeFrames)
{
  PlayerConfig config;
  config.loop = 2;
  auto player = makeVideoOnly(3, 30, config);
  CallbackLog log;
  player->setFrameCallback(log.callback());

  player->start();
  ASSERT_TRUE(waitUntil([&] { return player->isStopped(); }, 3000));

  EXPECT_EQ(player->videoLoopCount(), 2);
  const std::vector<int64_t> expected = { 0, 1, 2, 0, 1, 2 };
  EXPECT_EQ(log.indices(), expected);
  EXPECT_EQ(player->stats().frames_dropped, 0);
}

TEST(VideoPlayerTest, InfiniteLoopKeepsPlaying)
{
  PlayerConfig config;
  config.loop = 0;
  auto player = makeVideoOnly(2, 50, config);
  player->start();
  ASSERT_TRUE(waitUntil([&] { return player->videoLoopCount() >= 3; }, 2000));
  EXPECT_FALSE(player->isStopped());
  player->stop();
}

TEST(VideoPlayerTest, DecodeErrorStopsSession)
{
  auto video = FakeFrameSource::video(20, 50);
  video->failAt(5);
  VideoPlayer player(std::move(video), nullptr, nullptr);
  player.start();
  ASSERT_TRUE(waitUntil([&] { return player.isStopped(); }, 2000));
  EXPECT_FALSE(player.lastError().empty());
  EXPECT_EQ(player.stats().frames_published, 5);
}

TEST(VideoPlayerTest, StopClosesSourcesAfterJoin)
{
  auto video = FakeFrameSource::video(100, 25);
  FakeFrameSource* source = video.get();
  VideoPlayer player(std::move(video), nullptr, nullptr);
  player.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(source->isClosed());
  player.stop();
  EXPECT_TRUE(source->isClosed());
}

// --- 暂停 ---

TEST(VideoPlayerTest, DoubleTogglePauseIsRoundTrip)
{
  auto player = makeVideoOnly(30, 30);
  CallbackLog log;
  player->setFrameCallback(log.callback());

  player->start();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  player->togglePause();
  player->togglePause();
  EXPECT_FALSE(player->isPaused());

  ASSERT_TRUE(waitUntil([&] { return player->isStopped(); }, 3000));
  std::vector<int64_t> expected;
  for (int64_t i = 0; i < 30; ++i) expected.push_back(i);
  EXPECT_EQ(log.indices(), expected);
  EXPECT_EQ(player->stats().frames_dropped, 0);
}

TEST(VideoPlayerTest, PauseHoldsPresentation)
{
  auto player = makeVideoOnly(100, 25);
  player->start();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  player->togglePause();
  EXPECT_TRUE(player->isPaused());
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  const int64_t held = player->stats().frames_published;
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  EXPECT_EQ(player->stats().frames_published, held);

  player->togglePause();
  ASSERT_TRUE(waitUntil([&] { return player->stats().frames_published > held; }, 1000));
  player->stop();
}

TEST(VideoPlayerTest, PauseSuspendsAudioDevice)
{
  auto output = std::make_unique<FakeAudioOutput>();
  FakeAudioOutput* out = output.get();
  VideoPlayer player(FakeFrameSource::video(50, 10), FakeFrameSource::audio(5.0), std::move(output));
  player.start();
  ASSERT_TRUE(waitUntil([&] { return out->bufferCount() >= 2; }, 2000));

  player.togglePause();
  EXPECT_TRUE(out->isPaused());
  player.togglePause();
  EXPECT_FALSE(out->isPaused());
  player.stop();
}

// --- Seek ---

TEST(VideoPlayerTest, SeekWhilePlayingLandsWithinOneFrame)
{
  auto player = makeVideoOnly(100, 10);
  CallbackLog log;
  player->setFrameCallback(log.callback());
  player->start();
  std::this_thread::sleep_for(std::chrono::milliseconds(250));

  player->move(6.0);
  const size_t before = log.size();
  ASSERT_TRUE(waitUntil([&] { return log.size() > before; }, 1000));

  const auto next = log.entries()[before];
  EXPECT_NEAR(next.second, 6.0, 0.1);
  EXPECT_NEAR(player->position(), 6.0, 0.1 + 1e-9);
  player->stop();
}

TEST(VideoPlayerTest, SeekWithAudioResetsClock)
{
  auto output = std::make_unique<FakeAudioOutput>();
  FakeAudioOutput* out = output.get();
  VideoPlayer player(FakeFrameSource::video(100, 10), FakeFrameSource::audio(10.0), std::move(output));
  CallbackLog log;
  player.setFrameCallback(log.callback());
  player.start();
  ASSERT_TRUE(waitUntil([&] { return log.size() >= 2; }, 2000));

  const int flushes = out->flushCount();
  player.move(4.0);
  EXPECT_GT(out->flushCount(), flushes);
  const size_t before = log.size();
  ASSERT_TRUE(waitUntil([&] { return log.size() > before; }, 2000));

  EXPECT_NEAR(log.entries()[before].second, 4.0, 0.1);
  EXPECT_NEAR(player.position(), 4.0, 0.2);
  player.stop();
}

TEST(VideoPlayerTest, SeekWhilePausedShowsTargetAndStaysPaused)
{
  auto player = makeVideoOnly(100, 10);
  player->start();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  player->togglePause();

  player->move(5.0);
  EXPECT_TRUE(player->isPaused());
  EXPECT_EQ(player->currentFrameIndex(), 50);
  EXPECT_NEAR(player->position(), 5.0, 1e-9);
  EXPECT_TRUE(player->isFrameFresh());

  // 第 50 帧的 R 通道为 50
  SurfacePtr frame = player->getFrame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(static_cast<const uint8_t*>(frame->pixels)[0], 50);

  const int64_t published = player->stats().frames_published;
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_EQ(player->stats().frames_published, published);
  player->stop();
}

TEST(VideoPlayerTest, SeekClampsToDuration)
{
  auto player = makeVideoOnly(20, 10);
  player->move(-3.0);
  EXPECT_NEAR(player->position(), 0.0, 1e-9);
  player->move(99.0);
  EXPECT_NEAR(player->position(), 2.0, 1e-9);
}

TEST(VideoPlayerTest, SeekBeforeStartPositionsCursor)
{
  auto player = makeVideoOnly(100, 10);
  CallbackLog log;
  player->setFrameCallback(log.callback());
  player->move(3.0);
  EXPECT_EQ(player->currentFrameIndex(), 30);

  player->start();
  ASSERT_TRUE(waitUntil([&] { return log.size() >= 3; }, 2000));
  const auto indices = log.indices();
  EXPECT_EQ(indices[0], 30);
  EXPECT_EQ(indices[1], 31);
  player->stop();
}

TEST(VideoPlayerTest, FrameStepsWhilePaused)
{
  auto player = makeVideoOnly(100, 10);
  player->start();
  player->togglePause();

  player->moveFrame(10);
  EXPECT_EQ(player->currentFrameIndex(), 10);
  player->forwardFrame();
  EXPECT_EQ(player->currentFrameIndex(), 11);
  player->rewindFrame(2);
  EXPECT_EQ(player->currentFrameIndex(), 9);
  player->forward(2.0);
  EXPECT_EQ(player->currentFrameIndex(), 29);
  player->rewind(100.0);
  EXPECT_EQ(player->currentFrameIndex(), 0);
  player->stop();
}

// 关键帧间隔 12：seek 落在目标之前，需要解码跳过到目标帧
TEST(VideoPlayerTest, FrameStepsAdvanceAcrossKeyframeGroups)
{
  auto source = FakeFrameSource::video(100, 10);
  source->setKeyframeInterval(12);
  VideoPlayer player(std::move(source), nullptr, nullptr);
  player.start();
  player.togglePause();

  player.moveFrame(10);
  EXPECT_EQ(player.currentFrameIndex(), 10);
  player.forwardFrame();
  EXPECT_EQ(player.currentFrameIndex(), 11);
  player.forwardFrame();
  EXPECT_EQ(player.currentFrameIndex(), 12);
  player.forwardFrame();
  EXPECT_EQ(player.currentFrameIndex(), 13);
  player.rewindFrame();
  EXPECT_EQ(player.currentFrameIndex(), 12);

  SurfacePtr frame = player.getFrame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(static_cast<const uint8_t*>(frame->pixels)[0], 12);
  EXPECT_GT(player.stats().frames_skipped, 0);
  player.stop();
}

TEST(VideoPlayerTest, SeekWhilePlayingSkipsToTargetFrame)
{
  auto source = FakeFrameSource::video(100, 10);
  source->setKeyframeInterval(12);
  VideoPlayer player(std::move(source), nullptr, nullptr);
  CallbackLog log;
  player.setFrameCallback(log.callback());
  player.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(150));

  player.move(3.0);
  const size_t before = log.size();
  ASSERT_TRUE(waitUntil([&] { return log.size() > before; }, 1000));

  EXPECT_EQ(log.entries()[before].first, 30);
  player.stop();
}

// --- 音频 ---

TEST(VideoPlayerTest, VolumeAppliesFromNextBuffer)
{
  auto output = std::make_unique<FakeAudioOutput>();
  FakeAudioOutput* out = output.get();
  VideoPlayer player(FakeFrameSource::video(50, 10), FakeFrameSource::audio(5.0, 44100, 2, 0.5f),
                     std::move(output));
  player.start();
  ASSERT_TRUE(waitUntil([&] { return out->bufferCount() >= 2; }, 2000));

  player.setVolume(0.5);
  const size_t n = out->bufferCount();
  ASSERT_TRUE(waitUntil([&] { return out->bufferCount() >= n + 3; }, 2000));
  player.stop();

  const auto buffers = out->buffers();
  for (size_t i = 0; i < n; ++i) {
    ASSERT_FALSE(buffers[i].empty());
    EXPECT_NEAR(buffers[i].front(), 0.5f, 1e-6);
  }
  // 第 n 块可能在调用时已经处理完毕，此后每一块都必须是新音量
  for (size_t i = n + 1; i < buffers.size(); ++i) {
    for (float s : buffers[i]) {
      ASSERT_NEAR(s, 0.25f, 1e-6);
    }
  }
}

TEST(VideoPlayerTest, AudioEndingFirstLeavesVideoRunning)
{
  // 音频 0.3 秒，视频 1 秒
  VideoPlayer player(FakeFrameSource::video(10, 10), FakeFrameSource::audio(0.3),
                     std::make_unique<FakeAudioOutput>());
  player.start();
  ASSERT_TRUE(waitUntil([&] { return player.isStopped(); }, 3000));
  EXPECT_EQ(player.audioLoopCount(), 1);
  EXPECT_GE(player.stats().frames_published, 9);
  EXPECT_TRUE(player.lastError().empty());
}

TEST(VideoPlayerTest, BackwardSeekAfterAudioEndedResumesAudio)
{
  // 音频 0.5 秒，视频 5 秒
  VideoPlayer player(FakeFrameSource::video(50, 10), FakeFrameSource::audio(0.5),
                     std::make_unique<FakeAudioOutput>());
  player.start();
  ASSERT_TRUE(waitUntil([&] { return player.audioLoopCount() == 1; }, 3000));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  const int64_t buffers = player.stats().audio_buffers;

  player.move(0.1);
  ASSERT_TRUE(waitUntil([&] { return player.stats().audio_buffers > buffers; }, 2000));
  EXPECT_FALSE(player.isStopped());

  // 再次读完不会多计一轮
  std::this_thread::sleep_for(std::chrono::milliseconds(700));
  EXPECT_EQ(player.audioLoopCount(), 1);
  player.stop();
  EXPECT_TRUE(player.lastError().empty());
}

TEST(VideoPlayerTest, PausedSeekAfterAudioEndedStaysQuiet)
{
  auto output = std::make_unique<FakeAudioOutput>();
  FakeAudioOutput* out = output.get();
  VideoPlayer player(FakeFrameSource::video(50, 10), FakeFrameSource::audio(0.5), std::move(output));
  player.start();
  ASSERT_TRUE(waitUntil([&] { return player.audioLoopCount() == 1; }, 3000));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  player.togglePause();
  player.move(0.0);
  const size_t written = out->buffers().size();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  EXPECT_EQ(out->buffers().size(), written);

  player.togglePause();
  ASSERT_TRUE(waitUntil([&] { return out->buffers().size() > written; }, 2000));
  player.stop();
}

TEST(VideoPlayerTest, AudioWriteFailureDegradesToVideoOnly)
{
  auto output = std::make_unique<FakeAudioOutput>();
  FakeAudioOutput* out = output.get();
  VideoPlayer player(FakeFrameSource::video(30, 10), FakeFrameSource::audio(3.0), std::move(output));
  player.start();
  ASSERT_TRUE(waitUntil([&] { return out->bufferCount() >= 1; }, 2000));

  out->failWrites();
  ASSERT_TRUE(waitUntil([&] { return !player.hasAudio(); }, 2000));
  EXPECT_FALSE(player.isStopped());
  EXPECT_TRUE(player.lastError().empty());
  player.stop();
}

TEST(VideoPlayerTest, AudioWriteFailureStopsWhenNotTolerated)
{
  PlayerConfig config;
  config.tolerateAudioFailure = false;
  auto output = std::make_unique<FakeAudioOutput>();
  FakeAudioOutput* out = output.get();
  VideoPlayer player(FakeFrameSource::video(30, 10), FakeFrameSource::audio(3.0), std::move(output), config);
  player.start();
  ASSERT_TRUE(waitUntil([&] { return out->bufferCount() >= 1; }, 2000));

  out->failWrites();
  ASSERT_TRUE(waitUntil([&] { return player.isStopped(); }, 2000));
  EXPECT_FALSE(player.lastError().empty());
}
