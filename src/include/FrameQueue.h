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

#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>	// std::chrono::milliseconds
#include <atomic>
#include <cstdint>

#include "SurfaceUtils.h"

/**
 * @class FrameQueue
 * @brief 录制器使用的有界画面队列。
 *
 * 生产者是宿主的渲染循环，绝不能被阻塞：队列满时丢弃最旧的画面为新画面腾出位置。
 * 消费者是编码线程，以有限的超时等待出队，以便及时观察到停止请求。
 */
class FrameQueue {
private:
	std::deque<SurfacePtr> queue;
	mutable std::mutex mutex;				// mutable 允许在const方法中lock
	std::condition_variable cond_consumer;	// 当队列为空时，消费者等待

	std::atomic<bool> m_abort_request{ false }; // 强制中断标志
	std::atomic<int64_t> m_dropped{ 0 };		// 因队列满而被丢弃的画面数

	size_t max_size = 0;					// 0表示无限制，>0表示队列最大容量

public:
	explicit FrameQueue(size_t max_queue_size = 0);
	~FrameQueue();

	/**
	* @brief 将画面加入队列尾部，接管其所有权。从不阻塞。
	* 队列已满时先丢弃队首（最旧）的画面。
	* @return true - 成功，false - surface为空或队列已中止
	*/
	bool push(SurfacePtr surface);

	/**
	* @brief 从队列头部取出画面
	* @param surface：接收画面的所有权
	* @param timeout_ms：等待超时时间（毫秒），<0:无限等待，0：非阻塞，>0：等待指定时间
	* @return 成功取出返回true，超时、中止或队列为空的非阻塞调用返回false
	*/
	bool pop(SurfacePtr& surface, int timeout_ms = -1);

	size_t size() const;
	size_t capacity() const { return max_size; }

	/**
	* @brief 清空队列中的所有画面
	*/
	void clear();

	/**
	* @brief 强制中断所有等待中的pop，用于停止录制
	*/
	void abort();

	bool is_aborted() const { return m_abort_request.load(); }

	int64_t droppedCount() const { return m_dropped.load(); }

	FrameQueue(const FrameQueue&) = delete;
	FrameQueue& operator=(const FrameQueue&) = delete;
};
