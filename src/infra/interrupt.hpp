#pragma once

#include <atomic>
#include <csignal>

namespace reflux::infra {

// Выставляется обработчиком SIGINT/SIGTERM. Больше ничего в обработчике не делается.
extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

// Сбрасывает флаг. Нужен тестам и повторному запуску в том же процессе.
inline void reset_interrupted() {
    g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace reflux::infra
