#pragma once

#include <string>
#include <stdexcept>

namespace pharmacy::domain {

/**
 * @brief Составной ключ партии: название лекарства + номер партии
 *
 * В журнале партия адресуется строкой "Paracetamol 500mg#PC101".
 */
struct BatchKey {
    std::string medicineName;
    std::string batchNumber;

    std::string entityKey() const {
        return medicineName + "#" + batchNumber;
    }

    /**
     * @throws std::invalid_argument если в ключе нет разделителя
     */
    static BatchKey fromEntityKey(const std::string& key) {
        auto pos = key.rfind('#');
        if (pos == std::string::npos || pos == 0 || pos + 1 == key.size()) {
            throw std::invalid_argument("Invalid batch key: " + key);
        }
        return BatchKey{key.substr(0, pos), key.substr(pos + 1)};
    }

    bool isValid() const {
        return !medicineName.empty() && !batchNumber.empty();
    }

    bool operator==(const BatchKey& other) const {
        return medicineName == other.medicineName && batchNumber == other.batchNumber;
    }

    bool operator<(const BatchKey& other) const {
        if (medicineName != other.medicineName) {
            return medicineName < other.medicineName;
        }
        return batchNumber < other.batchNumber;
    }
};

} // namespace pharmacy::domain
