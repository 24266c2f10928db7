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

#include <stdexcept>
#include <string>

// 媒体源错误：文件不存在、无法打开、没有视频流或编解码器不受支持。
// 在构造阶段抛出，不重试。
class SourceError : public std::runtime_error {
public:
	explicit SourceError(const std::string& what) : std::runtime_error(what) {}
};

// 音频设备错误：设备无法打开，或采集缓冲溢出。
class DeviceError : public std::runtime_error {
public:
	explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};
