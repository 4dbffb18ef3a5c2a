#pragma once

#include <atomic>

namespace escrow::utils {

/**
 * @brief Флаг отмены длительной операции
 *
 * Владелец вызывает cancel(), исполнитель периодически проверяет isCancelled().
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true); }

    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_;
};

} // namespace escrow::utils
