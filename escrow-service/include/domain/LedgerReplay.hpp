#pragma once

#include "domain/EscrowLedger.hpp"
#include "domain/EscrowPayment.hpp"
#include <vector>
#include <string>
#include <optional>
#include <algorithm>

namespace escrow::domain {

/**
 * @brief Итоги воспроизведения журнала одного платежа
 */
struct LedgerTotals {
    Money released;
    Money refunded;
    std::optional<Money> lastBalanceAfter;
    size_t entryCount = 0;
};

/**
 * @brief Результат сверки журнала с состоянием агрегата
 */
struct ReconciliationResult {
    std::string escrowPaymentId;
    LedgerTotals totals;
    Money expectedReleased;
    Money expectedRefunded;
    Money expectedBalance;
    std::vector<std::string> discrepancies;

    bool consistent() const { return discrepancies.empty(); }
};

/**
 * @brief Воспроизведение журнала: суммы выплат/возвратов и последний balanceAfter
 *
 * Записи упорядочиваются по (createdAt, sequence) независимо от порядка на входе.
 */
class LedgerReplay {
public:
    static LedgerTotals replay(std::vector<LedgerEntry> entries, const std::string& currency) {
        std::sort(entries.begin(), entries.end());

        LedgerTotals totals;
        totals.released = Money::zero(currency);
        totals.refunded = Money::zero(currency);

        for (const auto& entry : entries) {
            if (isReleaseAction(entry.action())) {
                totals.released = totals.released + entry.amount();
            } else if (isRefundAction(entry.action())) {
                totals.refunded = totals.refunded + entry.amount();
            }
            totals.lastBalanceAfter = entry.balanceAfter();
            ++totals.entryCount;
        }
        return totals;
    }

    static ReconciliationResult reconcile(const EscrowPayment& payment,
                                          const std::vector<LedgerEntry>& entries) {
        ReconciliationResult result;
        result.escrowPaymentId = payment.id();
        result.totals = replay(entries, payment.currency());
        result.expectedReleased = payment.releasedAmount();
        result.expectedRefunded = payment.refundedAmount();
        result.expectedBalance = payment.remainingBalance();

        if (result.totals.released != payment.releasedAmount()) {
            result.discrepancies.push_back(
                "released: ledger " + result.totals.released.toString() +
                ", payment " + payment.releasedAmount().toString());
        }
        if (result.totals.refunded != payment.refundedAmount()) {
            result.discrepancies.push_back(
                "refunded: ledger " + result.totals.refunded.toString() +
                ", payment " + payment.refundedAmount().toString());
        }
        if (!result.totals.lastBalanceAfter) {
            result.discrepancies.push_back("ledger is empty");
        } else if (*result.totals.lastBalanceAfter != payment.remainingBalance()) {
            result.discrepancies.push_back(
                "balance: ledger " + result.totals.lastBalanceAfter->toString() +
                ", payment " + payment.remainingBalance().toString());
        }
        return result;
    }
};

} // namespace escrow::domain
