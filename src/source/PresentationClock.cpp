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

#include "../include/PresentationClock.h"

void PresentationClock::update(double seconds, int64_t index) {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_value.seconds = seconds;
	m_value.index = index;
	m_value.valid = true;
}

void PresentationClock::reset(double seconds, int64_t index) {
	// 与 update 的区别只在语义上：调用者是 Seek 流程而非解码线程
	std::lock_guard<std::mutex> lock(m_mutex);
	m_value.seconds = seconds;
	m_value.index = index;
	m_value.valid = true;
}

void PresentationClock::clear() {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_value = ClockSnapshot();
}

ClockSnapshot PresentationClock::snapshot() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_value;
}

double PresentationClock::seconds() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_value.valid ? m_value.seconds : 0.0;
}

bool PresentationClock::hasValue() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_value.valid;
}
