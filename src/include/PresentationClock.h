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

#include <cstdint>
#include <mutex>

// 时钟在某一时刻的完整读数
struct ClockSnapshot {
	double seconds = 0.0;   // 媒体时间轴上的位置（秒）
	int64_t index = 0;      // 对应的帧序号（视频）或采样序号（音频）
	bool valid = false;     // 是否已有写入者发布过时间
};

/**
 * @class PresentationClock
 * @brief 音视频两个解码线程共享的参考时钟。
 *
 * 正常情况下由音频线程写入（音频为主时钟），视频线程读取；
 * 没有音频时由视频线程自己写入，供外部查询播放位置。
 * 读者只关心“最新值”，因此使用互斥锁保护的单个标量，而不是消息队列。
 */
class PresentationClock {
public:
	PresentationClock() = default;

	PresentationClock(const PresentationClock&) = delete;
	PresentationClock& operator=(const PresentationClock&) = delete;

	/**
	 * @brief 发布新的时间戳（正常播放路径）。
	 */
	void update(double seconds, int64_t index);

	/**
	 * @brief Seek 之后将时钟重置为目标位置。
	 * 这是时钟唯一允许后退的时机。
	 */
	void reset(double seconds, int64_t index);

	/**
	 * @brief 清空时钟，回到“尚无写入者”的状态。
	 */
	void clear();

	ClockSnapshot snapshot() const;

	/**
	 * @brief 当前时间（秒），若尚未被写入则返回 0。
	 */
	double seconds() const;

	bool hasValue() const;

private:
	mutable std::mutex m_mutex;
	ClockSnapshot m_value;
};
