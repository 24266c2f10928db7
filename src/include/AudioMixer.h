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

#pragma once

#include <vector>

/**
 * @class AudioMixer
 * @brief 对交错 float 样本做音量与变速处理。
 */
class AudioMixer {
public:
	/**
	 * @brief 逐样本乘以音量。volume 被钳制到 [0, 1]。
	 */
	static void applyVolume(std::vector<float>& samples, double volume);

	/**
	 * @brief 按最近邻下标抽取/重复样本帧来改变播放速度。
	 *
	 * 输出帧数为 floor(frames / speed)，第 i 帧取自输入第 floor(i * speed) 帧。
	 * 这是有损的做法：音调随速度一起改变，抽取时还会产生混叠。
	 * speed 为 1（或非正数）时原样返回。
	 */
	static std::vector<float> changeSpeed(const std::vector<float>& samples, int channels, double speed);
};
