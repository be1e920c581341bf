#pragma once

#include "LedgerDomain.hpp"
#include <string>
#include <stdexcept>

namespace pharmacy::domain {

/**
 * @brief Вид движения в журнале
 *
 * Склад: IN (приход от поставщика), OUT (продажа), ADJUST (ручная корректировка).
 * Деньги: CR (зачисление), DR (списание).
 */
enum class MovementKind {
    IN,
    OUT,
    ADJUST,
    CR,
    DR
};

inline std::string toString(MovementKind kind) {
    switch (kind) {
        case MovementKind::IN:     return "IN";
        case MovementKind::OUT:    return "OUT";
        case MovementKind::ADJUST: return "ADJUST";
        case MovementKind::CR:     return "CR";
        case MovementKind::DR:     return "DR";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline MovementKind movementKindFromString(const std::string& str) {
    if (str == "IN")     return MovementKind::IN;
    if (str == "OUT")    return MovementKind::OUT;
    if (str == "ADJUST") return MovementKind::ADJUST;
    if (str == "CR")     return MovementKind::CR;
    if (str == "DR")     return MovementKind::DR;
    throw std::invalid_argument("Unknown MovementKind: " + str);
}

/**
 * @brief Допустим ли вид движения в данной области
 */
inline bool belongsTo(MovementKind kind, LedgerDomain domain) {
    if (domain == LedgerDomain::CASH) {
        return kind == MovementKind::CR || kind == MovementKind::DR;
    }
    return kind == MovementKind::IN || kind == MovementKind::OUT || kind == MovementKind::ADJUST;
}

} // namespace pharmacy::domain
