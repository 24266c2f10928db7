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

#include <string>

// 播放器配置。超出范围的值在 VideoPlayer 构造时被钳制。
struct PlayerConfig {
	double speed = 1.0;         // 播放速度
	double volume = 1.0;        // 音量 [0, 1]
	int loop = 1;               // 播放次数，0 表示无限循环
	int frequency = 44100;      // 音频输出采样率

	double minSpeed = 0.1;
	double maxSpeed = 8.0;

	// --- 同步参数 (单位: 秒) ---
	// 视频帧超前主时钟超过此值时，以不超过此值的步长休眠等待
	double syncThreshold = 0.005;
	// 视频帧落后主时钟超过此值时，直接丢弃
	double dropThreshold = 0.1;
	// 音频设备队列中允许积压的最长时长，超过则 write() 等待
	double audioQueueLimit = 0.1;

	// 音频输出失败时，是否降级为无声的纯视频播放（而不是终止会话）
	bool tolerateAudioFailure = true;
};

// 录制器配置
struct RecorderConfig {
	std::string outputFile;
	int width = 0;
	int height = 0;
	int frameRate = 30;
	std::string videoCodec = "libx264";
	std::string pixelFormat = "yuv420p";

	bool recordAudio = false;
	int frequency = 44100;
	int channels = 2;
	std::string channelLayout = "stereo";
	std::string audioCodec = "aac";

	size_t queueCapacity = 50;      // 待编码帧队列容量，满则丢弃最旧的帧
	int dequeueTimeoutMs = 100;     // 编码线程出队的最长等待时间
};
