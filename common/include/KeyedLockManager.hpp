#pragma once

#include "ThreadSafeMap.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Блокировки по ключу сущности (партия товара, банковский счёт)
 *
 * Для каждого ключа - свой timed_mutex. Операции над разными ключами
 * не мешают друг другу, глобальной блокировки нет.
 *
 * Несколько ключей захватываются в отсортированном порядке, поэтому
 * два потока с пересекающимися наборами ключей не могут взаимно заблокироваться.
 *
 * @example
 * ```cpp
 * auto lease = locks->tryAcquire({"Paracetamol#PC101"}, std::chrono::milliseconds(200));
 * if (!lease) {
 *     // не дождались - вызывающий решает, повторять или сдаваться
 * }
 * ```
 *
 * Мьютексы не удаляются: их число ограничено числом партий и счетов.
 */
class KeyedLockManager
{
public:
    /**
     * @brief RAII-владение набором блокировок
     */
    class Lease
    {
    public:
        Lease() = default;

        explicit Lease(std::vector<std::shared_ptr<std::timed_mutex>> held)
            : held_(std::move(held)) {}

        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;

        Lease(Lease &&other) noexcept : held_(std::move(other.held_))
        {
            other.held_.clear();
        }

        Lease &operator=(Lease &&other) noexcept
        {
            if (this != &other)
            {
                release();
                held_ = std::move(other.held_);
                other.held_.clear();
            }
            return *this;
        }

        ~Lease() { release(); }

        std::size_t size() const { return held_.size(); }

    private:
        std::vector<std::shared_ptr<std::timed_mutex>> held_;

        void release()
        {
            // Отпускаем в обратном порядке захвата
            for (auto it = held_.rbegin(); it != held_.rend(); ++it)
            {
                (*it)->unlock();
            }
            held_.clear();
        }
    };

    KeyedLockManager() = default;

    /**
     * @brief Захватить все ключи, ожидая каждый не дольше timeout
     * @return Lease при успехе, std::nullopt если хотя бы один ключ занят дольше timeout
     */
    std::optional<Lease> tryAcquire(std::vector<std::string> keys, std::chrono::milliseconds timeout)
    {
        std::sort(keys.begin(), keys.end());
        keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

        std::vector<std::shared_ptr<std::timed_mutex>> held;
        held.reserve(keys.size());

        for (const auto &key : keys)
        {
            auto mutex = mutexes_.getOrCreate(key, []
                                              { return std::make_shared<std::timed_mutex>(); });
            if (!mutex->try_lock_for(timeout))
            {
                for (auto it = held.rbegin(); it != held.rend(); ++it)
                {
                    (*it)->unlock();
                }
                return std::nullopt;
            }
            held.push_back(std::move(mutex));
        }

        return Lease(std::move(held));
    }

    /**
     * @brief Число известных ключей (для тестов и диагностики)
     */
    std::size_t knownKeys() const { return mutexes_.size(); }

private:
    ThreadSafeMap<std::string, std::timed_mutex> mutexes_;
};
