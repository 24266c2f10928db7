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

#include <memory>

#include "SDL2/SDL.h"

// 播放器对外提供的“可显示画面”统一使用 SDL_Surface（RGB24）
constexpr Uint32 DISPLAY_PIXEL_FORMAT = SDL_PIXELFORMAT_RGB24;

struct SurfaceDeleter {
	void operator()(SDL_Surface* surface) const {
		if (surface) {
			SDL_FreeSurface(surface);
		}
	}
};

// 独占所有权的 SDL_Surface
using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;

/**
 * @brief 创建一个指定尺寸的黑色画面。
 * @return 失败时返回空指针（并输出 SDL 错误信息）。
 */
SurfacePtr createSurface(int width, int height, Uint32 pixelFormat = DISPLAY_PIXEL_FORMAT);

/**
 * @brief 复制一个画面，必要时缩放到指定尺寸、转换到指定像素格式。
 * @param src 源画面，调用者保证在复制期间没有其它线程修改它。
 * @param width/height 目标尺寸，<=0 表示保持源尺寸。
 * @param pixelFormat 目标像素格式，0 表示保持源格式。
 */
SurfacePtr copySurface(SDL_Surface* src, int width = 0, int height = 0, Uint32 pixelFormat = 0);
