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

#include "../include/FrameSlot.h"
#include <iostream>

using namespace std;

bool FrameSlot::reset(int width, int height) {
	SurfacePtr canvas = createSurface(width, height);
	if (!canvas) {
		cerr << "FrameSlot: Could not create initial canvas " << width << "x" << height << endl;
		return false;
	}

	lock_guard<mutex> lock(m_mutex);
	m_surface = std::move(canvas);
	m_fresh = false;
	m_published = 0;
	return true;
}

void FrameSlot::publish(SurfacePtr surface) {
	if (!surface) {
		return;
	}

	SurfacePtr old;
	{
		lock_guard<mutex> lock(m_mutex);
		old = std::move(m_surface);
		m_surface = std::move(surface);
		m_fresh = true;
		++m_published;
	}
	// 旧画面在锁外释放
}

SurfacePtr FrameSlot::get(int width, int height) {
	lock_guard<mutex> lock(m_mutex);
	if (!m_surface) {
		return nullptr;
	}
	m_fresh = false;
	return copySurface(m_surface.get(), width, height);
}

bool FrameSlot::isFresh() const {
	lock_guard<mutex> lock(m_mutex);
	return m_fresh;
}

int64_t FrameSlot::publishedCount() const {
	lock_guard<mutex> lock(m_mutex);
	return m_published;
}
