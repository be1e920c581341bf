#pragma once

#include "ports/output/ILedgerStore.hpp"
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pharmacy::ports::output {

/**
 * @brief Ленивая, конечная, перезапускаемая последовательность записей сущности
 *
 * Страницы подгружаются из ILedgerStore::readPage по мере итерации
 * (keyset-пагинация по (occurred_at, recorded_at, entry_id)).
 * Каждый вызов begin() начинает чтение заново.
 *
 * @example
 * ```cpp
 * LedgerSequence entries(store, "Paracetamol#PC101", std::nullopt, 256);
 * for (const auto& entry : entries) {
 *     quantity += entry.signedAmount;
 * }
 * ```
 */
class LedgerSequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = domain::LedgerEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = const domain::LedgerEntry*;
        using reference = const domain::LedgerEntry&;

        iterator() = default;

        explicit iterator(const LedgerSequence* sequence) : sequence_(sequence) {
            fetch();
        }

        reference operator*() const { return page_[pos_]; }
        pointer operator->() const { return &page_[pos_]; }

        iterator& operator++() {
            ++pos_;
            if (pos_ >= page_.size()) {
                if (page_.size() < sequence_->pageSize_) {
                    // Неполная страница - журнал закончился
                    sequence_ = nullptr;
                    page_.clear();
                } else {
                    cursor_ = domain::LedgerCursor::after(page_.back());
                    fetch();
                }
            }
            return *this;
        }

        iterator operator++(int) {
            iterator copy = *this;
            ++(*this);
            return copy;
        }

        bool operator==(const iterator& other) const {
            if (atEnd() || other.atEnd()) {
                return atEnd() == other.atEnd();
            }
            return sequence_ == other.sequence_ && page_[pos_].entryId == other.page_[other.pos_].entryId;
        }

        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        const LedgerSequence* sequence_ = nullptr;
        std::vector<domain::LedgerEntry> page_;
        std::size_t pos_ = 0;
        std::optional<domain::LedgerCursor> cursor_;

        bool atEnd() const { return sequence_ == nullptr; }

        void fetch() {
            page_ = sequence_->store_->readPage(sequence_->entityKey_, sequence_->asOf_, cursor_, sequence_->pageSize_);
            pos_ = 0;
            if (page_.empty()) {
                sequence_ = nullptr;
            }
        }
    };

    LedgerSequence(std::shared_ptr<ILedgerStore> store,
                   std::string entityKey,
                   std::optional<domain::Timestamp> asOf,
                   std::size_t pageSize)
        : store_(std::move(store))
        , entityKey_(std::move(entityKey))
        , asOf_(std::move(asOf))
        , pageSize_(pageSize == 0 ? 1 : pageSize) {}

    iterator begin() const { return iterator(this); }
    iterator end() const { return iterator(); }

    const std::string& entityKey() const { return entityKey_; }
    const std::optional<domain::Timestamp>& asOf() const { return asOf_; }

    /**
     * @brief Прочитать всё в вектор (для отчётов и HTTP)
     */
    std::vector<domain::LedgerEntry> toVector() const {
        std::vector<domain::LedgerEntry> result;
        for (const auto& entry : *this) {
            result.push_back(entry);
        }
        return result;
    }

private:
    std::shared_ptr<ILedgerStore> store_;
    std::string entityKey_;
    std::optional<domain::Timestamp> asOf_;
    std::size_t pageSize_;
};

} // namespace pharmacy::ports::output
