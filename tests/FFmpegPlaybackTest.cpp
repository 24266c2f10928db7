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

// 真实 FFmpeg 链路：用 mpeg4 编码一段 2 秒、10 fps 的无音频片段，再交给播放器播放

#include "../src/include/FFmpegMediaEncoder.h"
#include "../src/include/FFmpegFrameSource.h"
#include "../src/include/VideoFrameConverter.h"
#include "../src/include/VideoPlayer.h"

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <thread>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/log.h>
}

namespace {

const int kFrames = 20;
const int kFps = 10;

class FFmpegPlaybackTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    av_log_set_level(AV_LOG_ERROR);
    if (!avcodec_find_encoder_by_name("mpeg4")) {
      GTEST_SKIP() << "mpeg4 encoder not available";
    }
    path_ = ::testing::TempDir() + "syncplayer_clip.avi";
    ASSERT_TRUE(writeClip(path_));
  }

  void TearDown() override
  {
    if (!path_.empty()) {
      std::remove(path_.c_str());
    }
  }

  // 第 i 帧整幅填充灰度 i * 10
  static bool writeClip(const std::string& path)
  {
    RecorderConfig config;
    config.outputFile = path;
    config.width = 64;
    config.height = 48;
    config.frameRate = kFps;
    config.videoCodec = "mpeg4";
    config.pixelFormat = "yuv420p";

    FFmpegMediaEncoder encoder;
    if (!encoder.open(config)) {
      return false;
    }

    VideoFrameConverter converter;
    SurfacePtr canvas = createSurface(config.width, config.height, SDL_PIXELFORMAT_RGBA32);
    if (!canvas) {
      return false;
    }
    for (int i = 0; i < kFrames; ++i) {
      const Uint8 level = static_cast<Uint8>(i * 10);
      SDL_FillRect(canvas.get(), nullptr, SDL_MapRGBA(canvas->format, level, level, level, 255));

      AVFrame* frame = av_frame_alloc();
      frame->format = encoder.videoPixelFormat();
      frame->width = config.width;
      frame->height = config.height;
      if (av_frame_get_buffer(frame, 0) < 0 || converter.toFrame(canvas.get(), frame) < 0) {
        av_frame_free(&frame);
        return false;
      }
      frame->pts = i;
      const int ret = encoder.encodeVideo(frame);
      av_frame_free(&frame);
      if (ret < 0) {
        return false;
      }
    }
    const bool flushed = encoder.flush() >= 0;
    encoder.close();
    return flushed;
  }

  std::string path_;
};

}  // namespace

TEST_F(FFmpegPlaybackTest, FrameSourceDecodesEveryFrame)
{
  FFmpegFrameSource source(AVMEDIA_TYPE_VIDEO);
  ASSERT_TRUE(source.open(path_));

  const StreamInfo info = source.info();
  EXPECT_TRUE(info.hasStream);
  EXPECT_EQ(info.width, 64);
  EXPECT_EQ(info.height, 48);
  EXPECT_NEAR(av_q2d(info.frameRate), 10.0, 1e-6);

  AVFrame* frame = av_frame_alloc();
  int decoded = 0;
  double last_pts = -1.0;
  while (source.readFrame(frame) == 0) {
    const double pts = frame->pts * av_q2d(source.timeBase());
    EXPECT_GT(pts, last_pts);
    last_pts = pts;
    ++decoded;
    av_frame_unref(frame);
  }
  EXPECT_EQ(decoded, kFrames);
  EXPECT_EQ(source.readFrame(frame), AVERROR_EOF);

  // 回到开头后可以重新读取
  ASSERT_TRUE(source.seek(0.0));
  ASSERT_EQ(source.readFrame(frame), 0);
  EXPECT_NEAR(frame->pts * av_q2d(source.timeBase()), 0.0, 1e-6);
  av_frame_free(&frame);
  source.close();
}

TEST_F(FFmpegPlaybackTest, AudioCursorFailsOnSilentClip)
{
  FFmpegFrameSource source(AVMEDIA_TYPE_AUDIO);
  EXPECT_FALSE(source.open(path_));
}

TEST_F(FFmpegPlaybackTest, PlayerPlaysClipToEnd)
{
  VideoPlayer player(path_);
  EXPECT_FALSE(player.hasAudio());
  EXPECT_NEAR(player.fps(), 10.0, 1e-6);
  EXPECT_NEAR(player.duration(), 2.0, 0.15);

  player.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(2500));
  EXPECT_TRUE(player.isStopped());
  EXPECT_GE(player.stats().frames_published, kFrames - 1);
  EXPECT_LE(player.stats().frames_published, kFrames + 1);
  EXPECT_TRUE(player.lastError().empty());

  SurfacePtr last = player.getFrame();
  ASSERT_TRUE(last);
  EXPECT_EQ(last->w, 64);
}

TEST_F(FFmpegPlaybackTest, PlayerOpensInMemoryBytes)
{
  std::ifstream file(path_, std::ios::binary);
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  ASSERT_FALSE(bytes.empty());

  VideoPlayer player(std::move(bytes));
  EXPECT_EQ(player.width(), 64);
  EXPECT_EQ(player.height(), 48);

  player.togglePause();
  player.start();
  player.move(1.0);
  EXPECT_NEAR(player.currentFrameIndex(), 10, 1);
  player.stop();
}
