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

#include "SurfaceUtils.h"

/**
 * @class FrameSlot
 * @brief 单槽位的“最新解码帧”缓冲区。
 *
 * 视频解码线程是唯一写者，宿主渲染循环是读者。
 * 槽位只保存最新的一帧：写者发布新帧时直接替换旧帧，
 * 读者来不及取走的帧自然被丢弃。新帧带“未使用”标记，
 * 读者据此区分新帧与重复读取。
 */
class FrameSlot {
public:
	FrameSlot() = default;

	FrameSlot(const FrameSlot&) = delete;
	FrameSlot& operator=(const FrameSlot&) = delete;

	/**
	 * @brief 用黑色画布初始化槽位，首帧解码前 get() 返回它。
	 * @return 画布创建失败时返回 false
	 */
	bool reset(int width, int height);

	/**
	 * @brief 发布新帧，接管其所有权并标记为“未使用”。
	 */
	void publish(SurfacePtr surface);

	/**
	 * @brief 取得当前帧的拷贝并标记为“已使用”。从不等待新帧。
	 * @param width, height 目标尺寸；任一为 0 时返回原尺寸
	 * @return 槽位为空或拷贝失败时返回 nullptr
	 */
	SurfacePtr get(int width = 0, int height = 0);

	bool isFresh() const;

	// 自 reset() 以来发布过的帧数
	int64_t publishedCount() const;

private:
	mutable std::mutex m_mutex;
	SurfacePtr m_surface;
	bool m_fresh = false;
	int64_t m_published = 0;
};
