#pragma once

#include "Decimal.hpp"
#include <variant>

namespace ledger::domain {

/**
 * @brief Личный клиент: вся доля принадлежит брокеру
 */
struct SingleBeneficiary {
    Decimal pct;
};

/**
 * @brief Клиент компании: доля делится между брокером и компанией
 */
struct DualBeneficiary {
    Decimal myPct;
    Decimal counterpartyPct;
};

/**
 * @brief Процентное распределение убытка или прибыли
 *
 * Разрешается один раз при открытии снимка и дальше не интерпретируется.
 */
class BeneficiarySplit {
public:
    std::variant<SingleBeneficiary, DualBeneficiary> value;

    BeneficiarySplit() : value(SingleBeneficiary{Decimal::zero()}) {}

    static BeneficiarySplit single(const Decimal& pct) {
        BeneficiarySplit split;
        split.value = SingleBeneficiary{pct};
        return split;
    }

    static BeneficiarySplit dual(const Decimal& myPct, const Decimal& counterpartyPct) {
        BeneficiarySplit split;
        split.value = DualBeneficiary{myPct, counterpartyPct};
        return split;
    }

    bool isDual() const {
        return std::holds_alternative<DualBeneficiary>(value);
    }

    Decimal myPct() const {
        if (auto dual = std::get_if<DualBeneficiary>(&value)) {
            return dual->myPct;
        }
        return std::get<SingleBeneficiary>(value).pct;
    }

    Decimal counterpartyPct() const {
        if (auto dual = std::get_if<DualBeneficiary>(&value)) {
            return dual->counterpartyPct;
        }
        return Decimal::zero();
    }

    Decimal totalPct() const {
        return myPct() + counterpartyPct();
    }

    /**
     * @brief Доли неотрицательны, сумма в (0, 100]
     */
    bool isValid() const {
        if (myPct().isNegative() || counterpartyPct().isNegative()) {
            return false;
        }
        auto total = totalPct();
        return total.isPositive() && total <= Decimal::hundred();
    }

    bool operator==(const BeneficiarySplit& other) const {
        return isDual() == other.isDual()
            && myPct() == other.myPct()
            && counterpartyPct() == other.counterpartyPct();
    }
};

} // namespace ledger::domain
