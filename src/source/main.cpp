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

#include <iostream>
#include <string>
#include <stdexcept>
#include <memory>
#include <vector>
#include <limits> // std::numeric_limits

#include "../include/VideoPlayer.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/log.h>
}

namespace {
    const double SEEK_STEP = 5.0;
    const double VOLUME_STEP = 0.05;
    const double SPEED_STEP = 0.25;
}

/**
* @brief 在程序退出前暂停，等待用户输入，防止控制台窗口闪退
*/
void pause_before_exit() {
    std::cout << "\nPress Enter to exit..." << std::endl;
    std::cin.clear();
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    std::cin.get();
}

/**
 * @brief 移除路径中所有的半角和全角引号（从资源管理器拖入的路径常带引号）。
 */
void remove_all_quotes(std::string& path) {
    const std::vector<std::string> quotes_to_remove = {
        "\"", "'", "“", "”", "‘", "’"
    };

    for (const auto& quote : quotes_to_remove) {
        size_t pos = 0;
        while ((pos = path.find(quote, pos)) != std::string::npos) {
            path.erase(pos, quote.length());
        }
    }
}

// 键盘控制，返回 false 表示退出
bool handle_key(VideoPlayer& player, SDL_Keycode key) {
    switch (key) {
    case SDLK_ESCAPE:
        return false;
    case SDLK_SPACE:
        player.togglePause();
        break;
    case SDLK_LEFT:
        player.rewind(SEEK_STEP);
        break;
    case SDLK_RIGHT:
        player.forward(SEEK_STEP);
        break;
    case SDLK_COMMA:
        player.rewindFrame();
        break;
    case SDLK_PERIOD:
        player.forwardFrame();
        break;
    case SDLK_UP:
        player.increaseVolume(VOLUME_STEP);
        std::cout << "Application: Volume " << player.volume() << std::endl;
        break;
    case SDLK_DOWN:
        player.decreaseVolume(VOLUME_STEP);
        std::cout << "Application: Volume " << player.volume() << std::endl;
        break;
    case SDLK_PLUS:
    case SDLK_EQUALS:
    case SDLK_KP_PLUS:
        player.increasePlaybackSpeed(SPEED_STEP);
        std::cout << "Application: Speed " << player.speed() << "x" << std::endl;
        break;
    case SDLK_MINUS:
    case SDLK_KP_MINUS:
        player.decreasePlaybackSpeed(SPEED_STEP);
        std::cout << "Application: Speed " << player.speed() << "x" << std::endl;
        break;
    default:
        break;
    }
    return true;
}

/**
 * @brief 宿主渲染循环：每次迭代取最新画面并铺满窗口，直到播放结束或用户退出。
 */
int run_host_loop(VideoPlayer& player, const std::string& title) {
    SDL_Window* window = SDL_CreateWindow(title.c_str(), SDL_WINDOWPOS_UNDEFINED, SDL_WINDOWPOS_UNDEFINED,
                                          player.width(), player.height(), SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "Application Error: Could not create window: " << SDL_GetError() << std::endl;
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        std::cerr << "Application Warning: Accelerated renderer unavailable, falling back: " << SDL_GetError() << std::endl;
        renderer = SDL_CreateRenderer(window, -1, 0);
    }
    if (!renderer) {
        std::cerr << "Application Error: Could not create renderer: " << SDL_GetError() << std::endl;
        SDL_DestroyWindow(window);
        return 1;
    }

    player.start();

    bool running = true;
    while (running && !player.isStopped()) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            if (event.type == SDL_QUIT) {
                running = false;
            }
            else if (event.type == SDL_KEYDOWN) {
                running = handle_key(player, event.key.keysym.sym) && running;
            }
        }

        int win_w = 0, win_h = 0;
        SDL_GetWindowSize(window, &win_w, &win_h);
        SurfacePtr frame = player.getFrame(win_w, win_h);
        if (frame) {
            SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer, frame.get());
            if (texture) {
                SDL_RenderClear(renderer);
                SDL_RenderCopy(renderer, texture, nullptr, nullptr);
                SDL_RenderPresent(renderer);
                SDL_DestroyTexture(texture);
            }
        }
        SDL_Delay(10);
    }

    player.stop();
    if (!player.lastError().empty()) {
        std::cerr << "Application: Playback ended with error: " << player.lastError() << std::endl;
    }
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    return player.lastError().empty() ? 0 : 1;
}

int main(int argc, char* argv[]) {
    std::string filepath;

    // 1. 获取并清理路径
    if (argc >= 2) {
        filepath = argv[1];
    }
    else {
        std::cout << "Please enter the path of media file or URL and press Enter:" << std::endl;
        std::getline(std::cin, filepath);
        if (filepath.empty()) {
            std::cerr << "Error: No file path was provided." << std::endl;
            pause_before_exit();
            return 1;
        }
    }
    remove_all_quotes(filepath);

    // 2. 初始化 SDL 与 FFmpeg 网络模块
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_AUDIO | SDL_INIT_TIMER) < 0) {
        std::cerr << "FATAL: Could not initialize SDL. SDL_Error: " << SDL_GetError() << std::endl;
        pause_before_exit();
        return 1;
    }
    av_log_set_level(AV_LOG_ERROR);
    avformat_network_init();

    // 3. 创建播放器并运行宿主循环
    int exit_code = 0;
    try {
        PlayerConfig config;
        VideoPlayer player(filepath, config);
        std::cout << "Application: Space pause, Left/Right seek, ,/. frame step, Up/Down volume, +/- speed, Esc quit." << std::endl;
        exit_code = run_host_loop(player, "syncplayer - " + filepath);
    }
    catch (const SourceError& e) {
        std::cerr << "Source Error: " << e.what() << std::endl;
        exit_code = 1;
    }
    catch (const DeviceError& e) {
        std::cerr << "Device Error: " << e.what() << std::endl;
        exit_code = 1;
    }
    catch (const std::runtime_error& e) {
        std::cerr << "Runtime Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    // 4. 清理并退出
    avformat_network_deinit();
    SDL_Quit();

    if (argc < 2) {
        pause_before_exit();
    }
    return exit_code;
}
