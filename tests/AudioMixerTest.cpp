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

#include "../src/include/AudioMixer.h"

#include <gtest/gtest.h>
#include <vector>

TEST(AudioMixerTest, VolumeScalesEverySample)
{
  std::vector<float> samples = { 0.5f, -0.5f, 1.0f, 0.0f };
  AudioMixer::applyVolume(samples, 0.5);
  EXPECT_FLOAT_EQ(samples[0], 0.25f);
  EXPECT_FLOAT_EQ(samples[1], -0.25f);
  EXPECT_FLOAT_EQ(samples[2], 0.5f);
  EXPECT_FLOAT_EQ(samples[3], 0.0f);
}

TEST(AudioMixerTest, FullVolumeLeavesSamplesUntouched)
{
  std::vector<float> samples = { 0.3f, -0.7f };
  AudioMixer::applyVolume(samples, 1.0);
  EXPECT_FLOAT_EQ(samples[0], 0.3f);
  EXPECT_FLOAT_EQ(samples[1], -0.7f);
}

TEST(AudioMixerTest, NonPositiveVolumeSilences)
{
  std::vector<float> samples = { 0.3f, -0.7f };
  AudioMixer::applyVolume(samples, -1.0);
  EXPECT_FLOAT_EQ(samples[0], 0.0f);
  EXPECT_FLOAT_EQ(samples[1], 0.0f);
}

TEST(AudioMixerTest, DoubleSpeedKeepsEveryOtherFrame)
{
  // 立体声，4 帧
  std::vector<float> samples = { 0, 10, 1, 11, 2, 12, 3, 13 };
  std::vector<float> out = AudioMixer::changeSpeed(samples, 2, 2.0);
  ASSERT_EQ(out.size(), 4u);
  EXPECT_FLOAT_EQ(out[0], 0);
  EXPECT_FLOAT_EQ(out[1], 10);
  EXPECT_FLOAT_EQ(out[2], 2);
  EXPECT_FLOAT_EQ(out[3], 12);
}

TEST(AudioMixerTest, HalfSpeedRepeatsFrames)
{
  std::vector<float> samples = { 0, 1, 2 };
  std::vector<float> out = AudioMixer::changeSpeed(samples, 1, 0.5);
  ASSERT_EQ(out.size(), 6u);
  const std::vector<float> expected = { 0, 0, 1, 1, 2, 2 };
  EXPECT_EQ(out, expected);
}

TEST(AudioMixerTest, UnitSpeedReturnsInput)
{
  std::vector<float> samples = { 0.1f, 0.2f, 0.3f };
  EXPECT_EQ(AudioMixer::changeSpeed(samples, 1, 1.0), samples);
  EXPECT_EQ(AudioMixer::changeSpeed(samples, 1, 0.0), samples);
}
