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

#include "../include/VideoFrameConverter.h"
#include <iostream>

extern "C" {
#include <libswscale/swscale.h>
#include <libavutil/error.h>
}

using namespace std;

namespace {
	// SDL 像素格式 -> FFmpeg 像素格式（按内存字节顺序对应）
	AVPixelFormat toAVPixelFormat(Uint32 sdlFormat) {
		switch (sdlFormat) {
		case SDL_PIXELFORMAT_RGB24:  return AV_PIX_FMT_RGB24;
		case SDL_PIXELFORMAT_BGR24:  return AV_PIX_FMT_BGR24;
		case SDL_PIXELFORMAT_RGBA32: return AV_PIX_FMT_RGBA;
		case SDL_PIXELFORMAT_BGRA32: return AV_PIX_FMT_BGRA;
		case SDL_PIXELFORMAT_ARGB32: return AV_PIX_FMT_ARGB;
		case SDL_PIXELFORMAT_ABGR32: return AV_PIX_FMT_ABGR;
		default:                     return AV_PIX_FMT_NONE;
		}
	}
}

VideoFrameConverter::~VideoFrameConverter() {
	sws_freeContext(m_toSurfaceCtx);
	sws_freeContext(m_toFrameCtx);
}

SurfacePtr VideoFrameConverter::toSurface(const AVFrame* frame) {
	if (!frame || frame->width <= 0 || frame->height <= 0) {
		return nullptr;
	}

	SurfacePtr surface = createSurface(frame->width, frame->height, DISPLAY_PIXEL_FORMAT);
	if (!surface) {
		return nullptr;
	}

	m_toSurfaceCtx = sws_getCachedContext(m_toSurfaceCtx,
		frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
		frame->width, frame->height, AV_PIX_FMT_RGB24,
		SWS_BILINEAR, nullptr, nullptr, nullptr);
	if (!m_toSurfaceCtx) {
		cerr << "VideoFrameConverter Error: Could not create SwsContext for pixel format "
			<< frame->format << endl;
		return nullptr;
	}

	uint8_t* dst_data[4] = { static_cast<uint8_t*>(surface->pixels), nullptr, nullptr, nullptr };
	int dst_linesize[4] = { surface->pitch, 0, 0, 0 };
	int ret = sws_scale(m_toSurfaceCtx, frame->data, frame->linesize, 0, frame->height, dst_data, dst_linesize);
	if (ret < 0) {
		char errbuf[AV_ERROR_MAX_STRING_SIZE];
		av_make_error_string(errbuf, AV_ERROR_MAX_STRING_SIZE, ret);
		cerr << "VideoFrameConverter Error: sws_scale failed: " << errbuf << endl;
		return nullptr;
	}
	return surface;
}

int VideoFrameConverter::toFrame(SDL_Surface* surface, AVFrame* dst) {
	if (!surface || !dst || dst->width <= 0 || dst->height <= 0 || !dst->data[0]) {
		return AVERROR(EINVAL);
	}

	const AVPixelFormat src_fmt = toAVPixelFormat(surface->format->format);
	if (src_fmt == AV_PIX_FMT_NONE) {
		cerr << "VideoFrameConverter Error: Unsupported surface format "
			<< SDL_GetPixelFormatName(surface->format->format) << endl;
		return AVERROR(EINVAL);
	}

	m_toFrameCtx = sws_getCachedContext(m_toFrameCtx,
		surface->w, surface->h, src_fmt,
		dst->width, dst->height, static_cast<AVPixelFormat>(dst->format),
		SWS_BILINEAR, nullptr, nullptr, nullptr);
	if (!m_toFrameCtx) {
		cerr << "VideoFrameConverter Error: Could not create SwsContext for encoder format "
			<< dst->format << endl;
		return AVERROR(EINVAL);
	}

	// 编码器可能仍持有上一帧的引用
	int ret = av_frame_make_writable(dst);
	if (ret < 0) {
		return ret;
	}

	if (SDL_MUSTLOCK(surface) && SDL_LockSurface(surface) < 0) {
		cerr << "VideoFrameConverter Error: SDL_LockSurface failed: " << SDL_GetError() << endl;
		return AVERROR(EINVAL);
	}
	const uint8_t* src_data[4] = { static_cast<const uint8_t*>(surface->pixels), nullptr, nullptr, nullptr };
	int src_linesize[4] = { surface->pitch, 0, 0, 0 };
	ret = sws_scale(m_toFrameCtx, src_data, src_linesize, 0, surface->h, dst->data, dst->linesize);
	if (SDL_MUSTLOCK(surface)) {
		SDL_UnlockSurface(surface);
	}
	return ret < 0 ? ret : 0;
}
