#pragma once
#ifndef THREAD_POOL_H
#define THREAD_POOL_H
#include <vector>
#include <thread>
#include <future>
#include <algorithm>
const static size_t _ghc = std::max<size_t>(1, std::thread::hardware_concurrency());

template <class F, class... Args>
inline auto reallyAsync(F&& f, Args&&... params) {
    return std::async(std::launch::async, std::forward<F>(f), std::forward<Args>(params)...);
}

// fun(chunk, begin, end) over [0, size) split into at most hc contiguous chunks
inline void asyncF(const auto& fun, size_t size, size_t hc = _ghc) {
    if (size == 0) return;
    hc = std::max<size_t>(1, std::min(size, hc));
    std::vector<std::future<void>> vfs;
    vfs.reserve(hc);
    auto len{static_cast<int>(size / hc)};
    auto ts{static_cast<int>(hc - 1)};
    for (int th = 0; th <= ts; ++th) {
        auto begin{th * len};
        auto end{th == ts ? static_cast<int>(size) : begin + len};
        vfs.emplace_back(reallyAsync(fun, th, begin, end));
    }
    for (auto& f : vfs) {
        f.get();
    }
}
#endif
