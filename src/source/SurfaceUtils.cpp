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

#include "../include/SurfaceUtils.h"
#include <iostream>

using namespace std;

SurfacePtr createSurface(int width, int height, Uint32 pixelFormat) {
	if (width <= 0 || height <= 0) {
		cerr << "SurfaceUtils: Invalid surface size " << width << "x" << height << endl;
		return nullptr;
	}

	SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, width, height,
														  SDL_BITSPERPIXEL(pixelFormat), pixelFormat);
	if (!surface) {
		cerr << "SurfaceUtils: SDL_CreateRGBSurfaceWithFormat failed: " << SDL_GetError() << endl;
		return nullptr;
	}
	// 新建的画面像素为全 0，即黑色
	return SurfacePtr(surface);
}

SurfacePtr copySurface(SDL_Surface* src, int width, int height, Uint32 pixelFormat) {
	if (!src) {
		return nullptr;
	}

	const int dst_w = (width > 0 && height > 0) ? width : src->w;
	const int dst_h = (width > 0 && height > 0) ? height : src->h;
	const Uint32 dst_fmt = pixelFormat != 0 ? pixelFormat : src->format->format;

	// 1. 尺寸相同：SDL_ConvertSurfaceFormat 总是返回一份新的拷贝
	SurfacePtr converted(SDL_ConvertSurfaceFormat(src, dst_fmt, 0));
	if (!converted) {
		cerr << "SurfaceUtils: SDL_ConvertSurfaceFormat failed: " << SDL_GetError() << endl;
		return nullptr;
	}
	if (dst_w == src->w && dst_h == src->h) {
		return converted;
	}

	// 2. 需要缩放：源和目标同一格式，SDL_BlitScaled 走软件拉伸路径
	SurfacePtr scaled = createSurface(dst_w, dst_h, dst_fmt);
	if (!scaled) {
		return nullptr;
	}
	SDL_SetSurfaceBlendMode(converted.get(), SDL_BLENDMODE_NONE);
	if (SDL_BlitScaled(converted.get(), nullptr, scaled.get(), nullptr) < 0) {
		cerr << "SurfaceUtils: SDL_BlitScaled failed: " << SDL_GetError() << endl;
		return nullptr;
	}
	return scaled;
}
