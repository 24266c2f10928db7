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

#include "../include/PauseGate.h"
#include <chrono>

void PauseGate::set() {
	std::unique_lock<std::mutex> lock(m_mutex);
	m_open = true;
	lock.unlock();
	m_open_cond.notify_all();
}

void PauseGate::clear() {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_open = false;
}

bool PauseGate::isSet() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_open;
}

bool PauseGate::wait() {
	std::unique_lock<std::mutex> lock(m_mutex);
	if (m_open) {
		return false;
	}

	++m_parked;
	m_parked_cond.notify_all();
	m_open_cond.wait(lock, [this] { return m_open; });
	--m_parked;
	return true;
}

bool PauseGate::waitForParked(int count, int timeout_ms) {
	std::unique_lock<std::mutex> lock(m_mutex);
	return m_parked_cond.wait_for(lock, std::chrono::milliseconds(timeout_ms),
								  [this, count] { return m_parked >= count; });
}

int PauseGate::parkedCount() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_parked;
}
