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

#include <mutex>
#include <condition_variable>

/**
 * @class PauseGate
 * @brief 两个解码线程共同等待的二值闸门。
 *
 * set() 打开闸门（恢复播放），clear() 关闭闸门（暂停）。
 * 线程在每次循环开始处调用 wait()，闸门关闭时阻塞而不是忙等。
 * 闸门还记录当前停在 wait() 中的线程数量，Seek 流程据此确认
 * 解码线程已经停稳，再去移动它们的解码游标。
 */
class PauseGate {
public:
	// 初始状态为打开
	PauseGate() = default;

	PauseGate(const PauseGate&) = delete;
	PauseGate& operator=(const PauseGate&) = delete;

	void set();
	void clear();
	bool isSet() const;

	/**
	 * @brief 闸门关闭时阻塞，直到 set() 被调用。
	 * @return 确实停靠过返回 true，闸门本来就打开返回 false
	 */
	bool wait();

	/**
	 * @brief 等待至少 count 个线程停在 wait() 中。
	 * @param timeout_ms 最长等待时间（毫秒）
	 * @return 在超时前满足条件返回 true
	 */
	bool waitForParked(int count, int timeout_ms);

	int parkedCount() const;

private:
	mutable std::mutex m_mutex;
	std::condition_variable m_open_cond;     // 等待闸门打开
	std::condition_variable m_parked_cond;   // 等待线程停靠
	bool m_open = true;
	int m_parked = 0;
};
