#pragma once

#include "LedgerEntry.hpp"
#include <vector>
#include <cstddef>

namespace wallet::domain {

/**
 * @brief Страница истории операций (новые первыми)
 */
struct TransactionPage {
    std::vector<LedgerEntry> entries;
    size_t total = 0;       ///< Всего записей у владельца
    size_t page = 1;        ///< Номер страницы, с 1
    size_t limit = 10;
    size_t totalPages = 0;
};

} // namespace wallet::domain
