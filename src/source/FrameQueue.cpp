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

#include "../include/FrameQueue.h"
#include <iostream>

using namespace std;

FrameQueue::FrameQueue(size_t max_queue_size):max_size(max_queue_size) {}

FrameQueue::~FrameQueue() {
	clear();
}

bool FrameQueue::push(SurfacePtr surface) {
	if (!surface) {
		cerr << "FrameQueue::push: Input surface is null." << endl;
		return false;
	}

	SurfacePtr evicted;
	std::unique_lock<std::mutex> lock(mutex);

	if (m_abort_request.load()) {
		return false;
	}

	// “满则丢”的滑动窗口机制：丢弃队首（最老的）画面
	if (max_size > 0 && queue.size() >= max_size) {
		evicted = std::move(queue.front());
		queue.pop_front();
		m_dropped++;
	}

	queue.push_back(std::move(surface));

	lock.unlock(); // 在通知前，尽早释放锁
	cond_consumer.notify_one();

	return true;
}

bool FrameQueue::pop(SurfacePtr& surface, int timeout_ms) {
	std::unique_lock<std::mutex> lock(mutex);

	// 当队列为空且未被中止时等待
	while (queue.empty() && !m_abort_request.load()) {
		if (timeout_ms == 0) { // 非阻塞
			return false;
		}
		if (timeout_ms < 0) { // 无限等待
			cond_consumer.wait(lock);
		}
		else {
			// 判断线程的唤醒是否是因为超时
			if (cond_consumer.wait_for(lock, std::chrono::milliseconds(timeout_ms))
				== std::cv_status::timeout) {
				if (queue.empty()) {
					return false; // 等待超时
				}
			}
		}
	}

	if (queue.empty()) {
		return false; // 已中止
	}

	surface = std::move(queue.front());
	queue.pop_front();
	return true;
}

size_t FrameQueue::size() const {
	std::lock_guard<std::mutex> lock(mutex);
	return queue.size();
}

void FrameQueue::clear() {
	std::deque<SurfacePtr> drained;
	{
		std::lock_guard<std::mutex> lock(mutex);
		drained.swap(queue);
	}
	// 画面在锁外释放
}

void FrameQueue::abort() {
	std::unique_lock<std::mutex> lock(mutex);
	m_abort_request.store(true);
	lock.unlock();
	cond_consumer.notify_all(); // 唤醒所有等待的消费者，让他们检查abort标志
}
