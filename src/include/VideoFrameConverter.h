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

#include "SurfaceUtils.h"

extern "C" {
#include <libavutil/frame.h>
#include <libavutil/pixfmt.h>
}

struct SwsContext;

/**
 * @class VideoFrameConverter
 * @brief AVFrame 与 SDL_Surface 之间的像素格式转换（libswscale）。
 *
 * 播放方向：解码帧 -> RGB24 画面；录制方向：RGBA 画面 -> 编码器像素格式的 AVFrame。
 * 内部缓存 SwsContext，尺寸或格式不变时复用。非线程安全，每个线程各持有一个实例。
 */
class VideoFrameConverter {
public:
	VideoFrameConverter() = default;
	~VideoFrameConverter();

	VideoFrameConverter(const VideoFrameConverter&) = delete;
	VideoFrameConverter& operator=(const VideoFrameConverter&) = delete;

	/**
	 * @brief 将解码后的视频帧转换为同尺寸的 RGB24 画面。
	 * @return 失败时返回 nullptr
	 */
	SurfacePtr toSurface(const AVFrame* frame);

	/**
	 * @brief 将画面转换到 dst 中。dst 必须已设置 format/width/height 并分配好缓冲区。
	 * 画面尺寸与 dst 不同时一并缩放。
	 * @return 0 成功，负值失败
	 */
	int toFrame(SDL_Surface* surface, AVFrame* dst);

private:
	SwsContext* m_toSurfaceCtx = nullptr;
	SwsContext* m_toFrameCtx = nullptr;
};
