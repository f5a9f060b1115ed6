#pragma once

#include "domain/BalanceReference.hpp"
#include "domain/Decimal.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ledger::application::engine {

/**
 * @brief Детерминированный settlement_id
 *
 * SHA-256 от (account | balance_reference | amount | snapshot | request_key),
 * первые 16 байт в hex с префиксом "stl-". Одинаковые входные данные
 * всегда дают один и тот же id.
 */
class SettlementIdGenerator {
public:
    static std::string generate(const std::string& accountId,
                                const domain::BalanceReference& reference,
                                const domain::Decimal& amount,
                                const std::string& snapshotId,
                                const std::string& requestKey = "") {
        std::string payload = accountId + "|" + reference.date.toString() + "|" +
                              std::to_string(reference.sequence) + "|" +
                              reference.balance.toString() + "|" + amount.toString() + "|" +
                              snapshotId + "|" + requestKey;

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digestLen = 0;
        if (EVP_Digest(payload.data(), payload.size(), digest, &digestLen, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("SHA-256 digest failed");
        }

        std::ostringstream out;
        out << "stl-";
        for (unsigned int i = 0; i < 16 && i < digestLen; ++i) {
            out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
        }
        return out.str();
    }
};

} // namespace ledger::application::engine
