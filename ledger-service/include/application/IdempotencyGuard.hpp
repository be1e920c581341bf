// include/application/IdempotencyGuard.hpp
#pragma once

#include "domain/Reference.hpp"
#include "ports/output/IIdempotencyRepository.hpp"
#include "ports/output/ILedgerTransaction.hpp"
#include <iostream>
#include <memory>

namespace pharmacy::application {

/**
 * @brief Дедупликация внешних событий по (reference_type, reference_id)
 *
 * claim - атомарный insert-if-absent внутри транзакции append: из двух
 * одновременных заявок на одну ссылку успешна ровно одна, а заявка
 * фиксируется только вместе с записями события. Заявки образуют
 * монотонное множество.
 *
 * Ручные ссылки (MANUAL) и ссылки без id всегда проходят.
 */
class IdempotencyGuard {
public:
    explicit IdempotencyGuard(std::shared_ptr<ports::output::IIdempotencyRepository> repository)
        : repository_(std::move(repository)) {}

    /**
     * @return true если заявка принята, false если событие уже применено
     */
    bool claim(ports::output::ILedgerTransaction& tx, const domain::Reference& reference) {
        if (!reference.isDeduplicated()) {
            return true;
        }
        bool claimed = tx.claimReference(reference.key());
        if (!claimed) {
            std::cout << "[IdempotencyGuard] Already claimed: " << reference.key() << std::endl;
        }
        return claimed;
    }

    bool isClaimed(const domain::Reference& reference) {
        if (!reference.isDeduplicated()) {
            return false;
        }
        return repository_->contains(reference.key());
    }

private:
    std::shared_ptr<ports::output::IIdempotencyRepository> repository_;
};

} // namespace pharmacy::application
